#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace slide::core {

inline constexpr int kBoardSize = 4;
inline constexpr int kCellCount = kBoardSize * kBoardSize;
inline constexpr int kEmptyTile = 0;

struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return col < other.col || (col == other.col && row < other.row);
    }
};

enum class Direction { Up, Down, Left, Right };

inline constexpr Direction kAllDirections[4] = {Direction::Up, Direction::Down, Direction::Left,
                                                Direction::Right};

std::string DirectionToString(Direction direction);
std::optional<Direction> DirectionFromString(const std::string& token);

}  // namespace slide::core
