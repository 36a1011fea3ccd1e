#pragma once

#include <coil/geometry.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace coil {

/*
 * Snake body stored arena-style: a ring of cell indices over a buffer sized to
 * the grid, plus an occupancy array for constant-time collision checks.
 * Each replay run owns its own instance.
 */
class Snake {
public:
    static constexpr std::size_t MAX_CELLS = std::size_t(1) << 20;

    /*
     * Throws VerificationError(InvalidClaim) unless the grid is non-empty and
     * no larger than MAX_CELLS, and the body is non-empty, inside the grid,
     * free of repeated cells and contiguous.
     */
    Snake(Grid grid, std::span<Position const> body);

    Grid const& grid() const { return grid_; }
    std::size_t size() const { return size_; }
    Position head() const { return segment(0); }
    Position tail() const { return segment(size_ - 1); }
    Position segment(std::size_t i) const;
    bool occupies(Position pos) const;

    // head to tail
    std::vector<Position> segments() const;

    /*
     * Moves the head one cell. The tail is kept when the new head lands on
     * `food`, otherwise it vacates the same tick, so the head may enter the
     * old tail cell. Throws VerificationError tagged with `tick` on a wall,
     * a reversal into the second segment, or the body; the snake is left
     * unchanged in that case.
     *
     * Returns true if the food was eaten.
     */
    bool advance(Direction dir, std::optional<Position> food, std::size_t tick);

private:
    std::uint32_t cell(std::size_t i) const
    { return ring_[(head_ + i) % ring_.size()]; }

    Grid grid_;
    std::vector<std::uint32_t> ring_;
    std::vector<bool> occupied_;
    std::size_t head_;
    std::size_t size_;
};

} // namespace coil
