#include <coil/game.hpp>

namespace coil {

namespace {

std::vector<Position> centred_snake(int width, int height)
{
    std::vector<Position> body;
    for (std::size_t i = 0; i < Game::INITIAL_LENGTH; ++ i) {
        body.push_back({width / 2 - (int)i, height / 2});
    }
    return body;
}

}

Game::Game(int width, int height)
: Game(Grid{width, height}, centred_snake(width, height))
{ }

Game::Game(Grid grid, std::span<Position const> initial_snake)
: snake_(grid, initial_snake), initial_(initial_snake.begin(), initial_snake.end())
{ }

bool Game::check_collision(Position head) const
{
    if (!snake_.grid().contains(head)) {
        return true;
    }
    return snake_.occupies(head) && head != snake_.head();
}

bool Game::step(Direction dir)
{
    if (over()) {
        return false;
    }
    try {
        bool eaten = snake_.advance(dir, food_, history_.size());
        history_.push_back({dir, eaten});
        if (eaten) {
            ++ eaten_;
            food_.reset();
        }
        // the next food has to appear on the tick the last one was eaten
        food_window_ = eaten;
    } catch (VerificationError const& e) {
        end_.emplace(e);
        return false;
    }
    return true;
}

bool Game::verify_score(std::size_t score) const
{
    return score % POINTS_PER_FOOD == 0
        && snake_.size() == initial_.size() + score / POINTS_PER_FOOD;
}

bool Game::can_place_food() const
{
    return !over() && !food_ && food_window_;
}

bool Game::place_food(Position pos)
{
    if (!can_place_food() || !snake_.grid().contains(pos) || snake_.occupies(pos)) {
        return false;
    }
    food_ = pos;
    food_log_.push_back(pos);
    return true;
}

std::optional<Position> Game::spawn_food(std::mt19937& rng)
{
    if (!can_place_food()) {
        return {};
    }
    auto const& grid = snake_.grid();
    std::uniform_int_distribution<int> xs(0, grid.width - 1);
    std::uniform_int_distribution<int> ys(0, grid.height - 1);
    for (int attempt = 0; attempt < SPAWN_ATTEMPTS; ++ attempt) {
        Position pos{xs(rng), ys(rng)};
        if (place_food(pos)) {
            return pos;
        }
    }
    for (std::size_t i = 0; i < grid.cells(); ++ i) {
        Position pos = grid.position(i);
        if (place_food(pos)) {
            return pos;
        }
    }
    return {};
}

GameClaim Game::claim() const
{
    auto final_snake = snake_.segments();
    return {
        snake_.grid(),
        initial_,
        commit(final_snake, snake_.grid()),
        score(),
        snake_.size(),
    };
}

Witness Game::witness() const
{
    Witness witness{food_log_, {}};
    witness.moves.reserve(history_.size());
    for (auto & move : history_) {
        witness.moves.push_back(move.direction);
    }
    return witness;
}

} // namespace coil
