#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace coil {

struct Position {
    int x;
    int y;

    Position operator+(Position const& other) const
    { return {x + other.x, y + other.y}; }
    Position operator-(Position const& other) const
    { return {x - other.x, y - other.y}; }
    bool operator==(Position const&) const = default;
};

enum class Direction : std::uint8_t {
    Up,
    Down,
    Left,
    Right,
};

// y grows downward, so Up is y - 1.
Position offset(Direction dir);

char to_letter(Direction dir);
Direction from_letter(char letter);

std::string to_letters(std::vector<Direction> const& moves);
// Whitespace is skipped; any other character outside "UDLR" throws std::invalid_argument.
std::vector<Direction> from_letters(std::string_view letters);

struct Grid {
    int width;
    int height;

    bool contains(Position pos) const
    { return pos.x >= 0 && pos.x < width && pos.y >= 0 && pos.y < height; }

    // Arena index of a cell; only meaningful for positions the grid contains.
    std::size_t index(Position pos) const
    { return (std::size_t)pos.y * (std::size_t)width + (std::size_t)pos.x; }

    Position position(std::size_t index) const
    { return {(int)(index % (std::size_t)width), (int)(index / (std::size_t)width)}; }

    std::size_t cells() const
    { return (std::size_t)width * (std::size_t)height; }

    bool operator==(Grid const&) const = default;
};

bool adjacent(Position a, Position b);

} // namespace coil
