#include <coil/geometry.hpp>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace coil {

Position offset(Direction dir)
{
    switch (dir) {
    case Direction::Up:
        return {0, -1};
    case Direction::Down:
        return {0, 1};
    case Direction::Left:
        return {-1, 0};
    case Direction::Right:
        return {1, 0};
    }
    throw std::invalid_argument("unknown direction");
}

char to_letter(Direction dir)
{
    switch (dir) {
    case Direction::Up:
        return 'U';
    case Direction::Down:
        return 'D';
    case Direction::Left:
        return 'L';
    case Direction::Right:
        return 'R';
    }
    throw std::invalid_argument("unknown direction");
}

Direction from_letter(char letter)
{
    switch (letter) {
    case 'U':
        return Direction::Up;
    case 'D':
        return Direction::Down;
    case 'L':
        return Direction::Left;
    case 'R':
        return Direction::Right;
    }
    throw std::invalid_argument(std::string("not a direction letter: '") + letter + "'");
}

std::string to_letters(std::vector<Direction> const& moves)
{
    std::string letters;
    letters.reserve(moves.size());
    for (auto dir : moves) {
        letters += to_letter(dir);
    }
    return letters;
}

std::vector<Direction> from_letters(std::string_view letters)
{
    std::vector<Direction> moves;
    moves.reserve(letters.size());
    for (char c : letters) {
        if (std::isspace((unsigned char)c)) {
            continue;
        }
        moves.push_back(from_letter(c));
    }
    return moves;
}

bool adjacent(Position a, Position b)
{
    auto d = a - b;
    return std::abs(d.x) + std::abs(d.y) == 1;
}

} // namespace coil
