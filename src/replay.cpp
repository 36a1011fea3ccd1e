#include <coil/replay.hpp>

#include <sstream>
#include <stdexcept>

namespace coil {

Replayer::Replayer(
    Grid grid,
    std::span<Position const> initial_snake,
    std::span<Position const> food,
    std::span<Direction const> moves
)
: grid_(grid), food_(food.begin(), food.end()), moves_(moves.begin(), moves.end())
{
    try {
        snake_.emplace(grid, initial_snake);
        for (auto & pos : food_) {
            if (!grid_.contains(pos)) {
                std::ostringstream ss;
                ss << "food (" << pos.x << "," << pos.y << ") is outside the grid";
                throw VerificationError(VerificationError::InvalidClaim, ss.str());
            }
        }
        check_spawn({});
    } catch (VerificationError const& e) {
        fail(e);
    }
}

void Replayer::fail(VerificationError const& error)
{
    snake_.reset();
    error_.emplace(error);
    state_ = Failed;
}

// The pending food must not be under the snake when it appears.
void Replayer::check_spawn(std::optional<std::size_t> tick)
{
    if (next_food_ < food_.size() && snake_->occupies(food_[next_food_])) {
        std::ostringstream ss;
        ss << "food " << next_food_ << " spawns on the snake at ("
           << food_[next_food_].x << "," << food_[next_food_].y << ")";
        throw VerificationError(VerificationError::InvalidClaim, ss.str(), tick);
    }
}

Replayer::State Replayer::step()
{
    if (state_ == Completed || state_ == Failed) {
        return state_;
    }
    state_ = Running;

    if (tick_ < moves_.size()) {
        std::optional<Position> pending;
        if (next_food_ < food_.size()) {
            pending = food_[next_food_];
        }
        try {
            if (snake_->advance(moves_[tick_], pending, tick_)) {
                ++ eaten_;
                ++ next_food_;
                check_spawn(tick_);
            }
        } catch (VerificationError const& e) {
            fail(e);
            return state_;
        }
        ++ tick_;
    }

    if (tick_ == moves_.size()) {
        outcome_.emplace(ReplayOutcome{
            snake_->segments(),
            eaten_,
            eaten_ * POINTS_PER_FOOD,
            snake_->size(),
            tick_,
        });
        state_ = Completed;
    }
    return state_;
}

ReplayOutcome const& Replayer::run()
{
    while (step() == Running)
        ;
    if (state_ == Failed) {
        throw *error_;
    }
    return *outcome_;
}

ReplayOutcome const& Replayer::outcome() const
{
    if (state_ != Completed) {
        throw std::logic_error("replay has not completed");
    }
    return *outcome_;
}

VerificationError const& Replayer::error() const
{
    if (state_ != Failed) {
        throw std::logic_error("replay has not failed");
    }
    return *error_;
}

ReplayOutcome replay(
    std::span<Position const> initial_snake,
    std::span<Position const> food,
    std::span<Direction const> moves,
    int grid_width,
    int grid_height
)
{
    Replayer replayer(Grid{grid_width, grid_height}, initial_snake, food, moves);
    return replayer.run();
}

} // namespace coil
