#pragma once

#include <coil/error.hpp>
#include <coil/geometry.hpp>
#include <coil/snake.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace coil {

constexpr std::size_t POINTS_PER_FOOD = 10;

struct ReplayOutcome {
    std::vector<Position> snake; // head to tail
    std::size_t foods_eaten;
    std::size_t score;
    std::size_t final_length;
    std::size_t ticks;

    bool operator==(ReplayOutcome const&) const = default;
};

/*
 * Deterministic re-simulation of one game, one move per step().
 * NotStarted -> Running -> Completed | Failed. Invalid input puts the
 * replayer straight into Failed(InvalidClaim). Terminal states do not change
 * on further steps.
 */
class Replayer {
public:
    enum State {
        NotStarted,
        Running,
        Completed,
        Failed,
    };

    Replayer(
        Grid grid,
        std::span<Position const> initial_snake,
        std::span<Position const> food,
        std::span<Direction const> moves
    );

    /*
     * Applies the next move. Completes after the last move is applied, or on
     * the first step when there are no moves.
     */
    State step();

    // steps until terminal; throws the stored VerificationError when Failed
    ReplayOutcome const& run();

    State state() const { return state_; }
    std::size_t tick() const { return tick_; }
    std::size_t foods_eaten() const { return eaten_; }

    // throw std::logic_error when not Completed / not Failed respectively
    ReplayOutcome const& outcome() const;
    VerificationError const& error() const;

private:
    void fail(VerificationError const& error);
    void check_spawn(std::optional<std::size_t> tick);

    Grid grid_;
    std::optional<Snake> snake_;
    std::vector<Position> food_;
    std::vector<Direction> moves_;
    std::size_t next_food_ = 0;
    std::size_t eaten_ = 0;
    std::size_t tick_ = 0;
    State state_ = NotStarted;
    std::optional<VerificationError> error_;
    std::optional<ReplayOutcome> outcome_;
};

/*
 * Replay a whole game. Throws VerificationError on the first collision or on
 * invalid input.
 */
ReplayOutcome replay(
    std::span<Position const> initial_snake,
    std::span<Position const> food,
    std::span<Direction const> moves,
    int grid_width,
    int grid_height
);

} // namespace coil
