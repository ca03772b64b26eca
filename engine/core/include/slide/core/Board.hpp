#pragma once

#include <array>
#include <vector>

#include "slide/core/Types.hpp"

namespace slide::core {

// A tile value is either empty (0) or a power of two >= 2.
bool IsValidTile(int value) noexcept;

class Board {
public:
    using Cells = std::array<int, kCellCount>;
    using Rows = std::vector<std::vector<int>>;

    Board() = default;

    // Builds a board from row-major values. Throws std::invalid_argument when
    // the grid is not 4x4 or holds a value that is not a valid tile.
    static Board FromRows(const Rows& rows);
    Rows toRows() const;

    static constexpr int cols() noexcept { return kBoardSize; }
    static constexpr int rows() noexcept { return kBoardSize; }

    bool inBounds(int col, int row) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.col, cell.row); }

    int get(int col, int row) const noexcept;
    int get(const Cell& cell) const noexcept { return get(cell.col, cell.row); }

    void set(int col, int row, int value) noexcept;
    void set(const Cell& cell, int value) noexcept { set(cell.col, cell.row, value); }

    bool isEmpty(int col, int row) const noexcept { return get(col, row) == kEmptyTile; }
    bool isEmpty(const Cell& cell) const noexcept { return isEmpty(cell.col, cell.row); }

    void clear() noexcept;

    int emptyCount() const noexcept;
    int occupiedCount() const noexcept { return kCellCount - emptyCount(); }
    int maxTile() const noexcept;
    std::vector<Cell> emptyCells() const;

    const Cells& cells() const noexcept { return cells_; }

    bool operator==(const Board& other) const noexcept { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    static int index(int col, int row) noexcept { return row * kBoardSize + col; }

    Cells cells_{};
};

struct MoveResult {
    struct SlideEvent {
        Cell from{};
        Cell to{};
        int value = kEmptyTile;
        bool merged = false;
    };

    Board board{};
    Direction direction = Direction::Left;
    bool moved = false;
    int score_delta = 0;
    int merge_count = 0;
    std::array<bool, kCellCount> merged{};
    // Every tile that travelled, plus the stationary half of each merge
    // (from == to). Empty when the move was rejected.
    std::vector<SlideEvent> slides;

    bool mergedAt(const Cell& cell) const noexcept;
    std::vector<Cell> mergedCells() const;
};

// Shifts and merges every line toward the leading edge of |direction|. A
// tile produced by a merge does not merge again in the same move.
MoveResult ApplyMove(const Board& board, Direction direction);

bool CanMove(const Board& board, Direction direction);

// True when a move in at least one direction changes the board.
bool AnyMovesAvailable(const Board& board);

// No empty cell and no horizontally or vertically adjacent equal pair.
bool IsLoss(const Board& board);

bool ReachedTarget(const Board& board, int target) noexcept;

}  // namespace slide::core
