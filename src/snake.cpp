#include <coil/snake.hpp>
#include <coil/error.hpp>

#include <sstream>

namespace coil {

namespace {

std::string describe(Position pos)
{
    std::ostringstream ss;
    ss << "(" << pos.x << "," << pos.y << ")";
    return ss.str();
}

}

Snake::Snake(Grid grid, std::span<Position const> body)
: grid_(grid), head_(0), size_(0)
{
    if (grid.width <= 0 || grid.height <= 0) {
        throw VerificationError(VerificationError::InvalidClaim, "grid dimensions must be positive");
    }
    if ((std::size_t)grid.width > MAX_CELLS / (std::size_t)grid.height) {
        throw VerificationError(VerificationError::InvalidClaim, "grid is too large");
    }
    if (body.empty()) {
        throw VerificationError(VerificationError::InvalidClaim, "initial snake is empty");
    }

    ring_.resize(grid.cells());
    occupied_.assign(grid.cells(), false);

    for (std::size_t i = 0; i < body.size(); ++ i) {
        auto pos = body[i];
        if (!grid.contains(pos)) {
            throw VerificationError(VerificationError::InvalidClaim, "initial snake segment " + describe(pos) + " is outside the grid");
        }
        if (occupied_[grid.index(pos)]) {
            throw VerificationError(VerificationError::InvalidClaim, "initial snake overlaps itself at " + describe(pos));
        }
        if (i > 0 && !adjacent(body[i - 1], pos)) {
            throw VerificationError(VerificationError::InvalidClaim, "initial snake is not contiguous at " + describe(pos));
        }
        ring_[i] = (std::uint32_t)grid.index(pos);
        occupied_[grid.index(pos)] = true;
    }
    size_ = body.size();
}

Position Snake::segment(std::size_t i) const
{
    return grid_.position(cell(i));
}

bool Snake::occupies(Position pos) const
{
    return grid_.contains(pos) && occupied_[grid_.index(pos)];
}

std::vector<Position> Snake::segments() const
{
    std::vector<Position> result;
    result.reserve(size_);
    for (std::size_t i = 0; i < size_; ++ i) {
        result.push_back(segment(i));
    }
    return result;
}

bool Snake::advance(Direction dir, std::optional<Position> food, std::size_t tick)
{
    Position next = head() + offset(dir);

    if (!grid_.contains(next)) {
        throw VerificationError(VerificationError::WallCollision, "head leaves the grid at " + describe(next), tick);
    }
    if (size_ >= 2 && next == segment(1)) {
        throw VerificationError(VerificationError::IllegalReversal, "move reverses into " + describe(next), tick);
    }

    bool grow = food && *food == next;
    // the tail cell is free this tick unless the snake grows
    bool vacating = !grow && next == tail();
    if (occupied_[grid_.index(next)] && !vacating) {
        throw VerificationError(VerificationError::SelfCollision, "head runs into the body at " + describe(next), tick);
    }

    if (!grow) {
        occupied_[cell(size_ - 1)] = false;
        -- size_;
    }
    head_ = (head_ + ring_.size() - 1) % ring_.size();
    ring_[head_] = (std::uint32_t)grid_.index(next);
    occupied_[ring_[head_]] = true;
    ++ size_;

    return grow;
}

} // namespace coil
