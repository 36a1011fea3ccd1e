#pragma once

#include <coil/error.hpp>
#include <coil/geometry.hpp>
#include <coil/snake.hpp>
#include <coil/verifier.hpp>

#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace coil {

/*
 * Interactive game state for direct host use (UI, recording).
 * Follows the same movement rules as Replayer and records what it needs to
 * export a submission that replays to the same final state.
 *
 * Food may only be placed while none is pending and before the next move
 * after the previous food was eaten (or before the first move). This keeps
 * the recorded food queue equivalent to the replay's queue semantics.
 */
class Game {
public:
    struct Move {
        Direction direction;
        bool food_eaten;
    };

    static constexpr std::size_t INITIAL_LENGTH = 3;
    static constexpr int SPAWN_ATTEMPTS = 100;

    /*
     * Three-segment snake centred on the grid, heading right. Throws
     * VerificationError(InvalidClaim) if the snake does not fit.
     */
    Game(int width, int height);

    // explicit initial snake, head first
    Game(Grid grid, std::span<Position const> initial_snake);

    // true when outside the grid or on any segment except the head
    bool check_collision(Position head) const;

    /*
     * Advances the game by one tick. Returns false once this or an earlier
     * move has ended the game.
     */
    bool step(Direction dir);

    // exact: a multiple of POINTS_PER_FOOD matching the snake's growth
    bool verify_score(std::size_t score) const;

    bool can_place_food() const;

    /*
     * Fails when placement is not allowed now, or the cell is outside the
     * grid or on the snake.
     */
    bool place_food(Position pos);

    /*
     * Tries SPAWN_ATTEMPTS random cells, then the first free cell in
     * row-major order. Empty when placement is not allowed or the board is
     * full.
     */
    std::optional<Position> spawn_food(std::mt19937& rng);

    std::optional<Position> food() const { return food_; }
    bool over() const { return end_.has_value(); }
    std::optional<VerificationError> const& end_reason() const { return end_; }
    std::size_t score() const { return eaten_ * POINTS_PER_FOOD; }
    std::size_t length() const { return snake_.size(); }
    Grid const& grid() const { return snake_.grid(); }
    std::vector<Position> snake() const { return snake_.segments(); }
    std::vector<Move> const& history() const { return history_; }

    /*
     * The recorded game as a submission. A fatal move is not recorded, so
     * the submission describes the last legal state.
     */
    GameClaim claim() const;
    Witness witness() const;

private:
    Snake snake_;
    std::vector<Position> initial_;
    std::vector<Position> food_log_;
    std::optional<Position> food_;
    bool food_window_ = true;
    std::size_t eaten_ = 0;
    std::vector<Move> history_;
    std::optional<VerificationError> end_;
};

} // namespace coil
