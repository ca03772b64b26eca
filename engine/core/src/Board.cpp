#include "slide/core/Board.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace slide::core {

namespace {

// Maps position |step| along line |line| (counted from the leading edge of
// travel) to a board cell.
Cell LineCell(Direction direction, int line, int step) {
    switch (direction) {
        case Direction::Left:
            return Cell{step, line};
        case Direction::Right:
            return Cell{kBoardSize - 1 - step, line};
        case Direction::Up:
            return Cell{line, step};
        case Direction::Down:
            return Cell{line, kBoardSize - 1 - step};
    }
    return Cell{step, line};
}

}  // namespace

std::string DirectionToString(Direction direction) {
    switch (direction) {
        case Direction::Up:
            return "up";
        case Direction::Down:
            return "down";
        case Direction::Left:
            return "left";
        case Direction::Right:
            return "right";
    }
    return "left";
}

std::optional<Direction> DirectionFromString(const std::string& token) {
    if (token == "up") {
        return Direction::Up;
    }
    if (token == "down") {
        return Direction::Down;
    }
    if (token == "left") {
        return Direction::Left;
    }
    if (token == "right") {
        return Direction::Right;
    }
    return std::nullopt;
}

bool IsValidTile(int value) noexcept {
    if (value == kEmptyTile) {
        return true;
    }
    return value >= 2 && (value & (value - 1)) == 0;
}

Board Board::FromRows(const Rows& rows) {
    if (rows.size() != static_cast<std::size_t>(kBoardSize)) {
        throw std::invalid_argument("board must have " + std::to_string(kBoardSize) + " rows, got " +
                                    std::to_string(rows.size()));
    }
    Board board;
    for (int r = 0; r < kBoardSize; ++r) {
        const auto& row = rows[static_cast<std::size_t>(r)];
        if (row.size() != static_cast<std::size_t>(kBoardSize)) {
            throw std::invalid_argument("board row " + std::to_string(r) + " must have " +
                                        std::to_string(kBoardSize) + " cells");
        }
        for (int c = 0; c < kBoardSize; ++c) {
            const int value = row[static_cast<std::size_t>(c)];
            if (!IsValidTile(value)) {
                throw std::invalid_argument("invalid tile value " + std::to_string(value) +
                                            " at column " + std::to_string(c) + ", row " +
                                            std::to_string(r));
            }
            board.set(c, r, value);
        }
    }
    return board;
}

Board::Rows Board::toRows() const {
    Rows rows(static_cast<std::size_t>(kBoardSize), std::vector<int>(kBoardSize, kEmptyTile));
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            rows[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)] = get(c, r);
        }
    }
    return rows;
}

bool Board::inBounds(int col, int row) const noexcept {
    return col >= 0 && col < kBoardSize && row >= 0 && row < kBoardSize;
}

int Board::get(int col, int row) const noexcept {
    return cells_[static_cast<std::size_t>(index(col, row))];
}

void Board::set(int col, int row, int value) noexcept {
    cells_[static_cast<std::size_t>(index(col, row))] = value;
}

void Board::clear() noexcept {
    cells_.fill(kEmptyTile);
}

int Board::emptyCount() const noexcept {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), kEmptyTile));
}

int Board::maxTile() const noexcept {
    return *std::max_element(cells_.begin(), cells_.end());
}

std::vector<Cell> Board::emptyCells() const {
    std::vector<Cell> empty;
    empty.reserve(kCellCount);
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            if (isEmpty(c, r)) {
                empty.push_back(Cell{c, r});
            }
        }
    }
    return empty;
}

bool MoveResult::mergedAt(const Cell& cell) const noexcept {
    if (!board.inBounds(cell)) {
        return false;
    }
    return merged[static_cast<std::size_t>(cell.row * kBoardSize + cell.col)];
}

std::vector<Cell> MoveResult::mergedCells() const {
    std::vector<Cell> cells;
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            if (merged[static_cast<std::size_t>(r * kBoardSize + c)]) {
                cells.push_back(Cell{c, r});
            }
        }
    }
    return cells;
}

MoveResult ApplyMove(const Board& board, Direction direction) {
    MoveResult result;
    result.direction = direction;
    result.slides.reserve(kCellCount);

    for (int line = 0; line < kBoardSize; ++line) {
        std::array<int, kBoardSize> packed{};
        std::array<bool, kBoardSize> packed_merged{};
        std::array<int, kBoardSize> packed_source{};
        int count = 0;

        for (int step = 0; step < kBoardSize; ++step) {
            const Cell from = LineCell(direction, line, step);
            const int value = board.get(from);
            if (value == kEmptyTile) {
                continue;
            }
            const int last = count - 1;
            if (last >= 0 && packed[static_cast<std::size_t>(last)] == value &&
                !packed_merged[static_cast<std::size_t>(last)]) {
                packed[static_cast<std::size_t>(last)] = value * 2;
                packed_merged[static_cast<std::size_t>(last)] = true;
                result.score_delta += value * 2;
                ++result.merge_count;
                result.slides.push_back({from, LineCell(direction, line, last), value, true});
                continue;
            }
            packed[static_cast<std::size_t>(count)] = value;
            packed_source[static_cast<std::size_t>(count)] = step;
            if (step != count) {
                result.slides.push_back({from, LineCell(direction, line, count), value, false});
            }
            ++count;
        }

        for (int step = 0; step < count; ++step) {
            if (packed_merged[static_cast<std::size_t>(step)] &&
                packed_source[static_cast<std::size_t>(step)] == step) {
                const Cell at = LineCell(direction, line, step);
                result.slides.push_back({at, at, packed[static_cast<std::size_t>(step)] / 2, false});
            }
        }

        for (int step = 0; step < kBoardSize; ++step) {
            const Cell to = LineCell(direction, line, step);
            result.board.set(to, packed[static_cast<std::size_t>(step)]);
            result.merged[static_cast<std::size_t>(to.row * kBoardSize + to.col)] =
                packed_merged[static_cast<std::size_t>(step)];
        }
    }

    result.moved = result.board != board;
    if (!result.moved) {
        result.slides.clear();
    }
    return result;
}

bool CanMove(const Board& board, Direction direction) {
    for (int line = 0; line < kBoardSize; ++line) {
        bool seen_gap = false;
        int previous = kEmptyTile;
        for (int step = 0; step < kBoardSize; ++step) {
            const int value = board.get(LineCell(direction, line, step));
            if (value == kEmptyTile) {
                seen_gap = true;
                continue;
            }
            if (seen_gap || value == previous) {
                return true;
            }
            previous = value;
        }
    }
    return false;
}

bool AnyMovesAvailable(const Board& board) {
    if (board.emptyCount() > 0) {
        return true;
    }
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            const int value = board.get(c, r);
            if (c + 1 < kBoardSize && board.get(c + 1, r) == value) {
                return true;
            }
            if (r + 1 < kBoardSize && board.get(c, r + 1) == value) {
                return true;
            }
        }
    }
    return false;
}

bool IsLoss(const Board& board) {
    return !AnyMovesAvailable(board);
}

bool ReachedTarget(const Board& board, int target) noexcept {
    return target > 0 && board.maxTile() >= target;
}

}  // namespace slide::core
