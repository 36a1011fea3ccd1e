#pragma once

#include <coil/commitment.hpp>
#include <coil/error.hpp>
#include <coil/geometry.hpp>
#include <coil/replay.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace coil {

// Public half of a submission.
struct GameClaim {
    Grid grid;
    std::vector<Position> initial_snake;
    Digest final_state_hash;
    std::size_t score;
    std::size_t final_length;

    bool operator==(GameClaim const&) const = default;
};

// Private half: the food layout and one move per tick.
struct Witness {
    std::vector<Position> food;
    std::vector<Direction> moves;

    bool operator==(Witness const&) const = default;
};

struct Submission {
    GameClaim claim;
    Witness witness;
};

struct Verdict {
    bool accepted;
    std::optional<VerificationError::Kind> error;
    std::string message;
    std::optional<std::size_t> tick;

    explicit operator bool() const { return accepted; }
};

/*
 * Checks a completed replay against the claim, in order: score is a
 * multiple of POINTS_PER_FOOD (InvalidClaim), score (ScoreMismatch),
 * final length (LengthMismatch), commitment hash (HashMismatch).
 * Throws the first violation.
 */
void verify(GameClaim const& claim, ReplayOutcome const& outcome);

/*
 * Replay the witness from the claim's grid and initial snake, then verify.
 * Rejections are reported in the verdict rather than thrown.
 */
Verdict check(GameClaim const& claim, Witness const& witness);

/*
 * Check independent submissions on up to `threads` workers (0 picks the
 * hardware concurrency). Verdicts are returned in submission order.
 */
std::vector<Verdict> check_all(std::span<Submission const> submissions, unsigned threads = 0);

} // namespace coil
