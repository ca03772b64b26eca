#include <cassert>
#include <iostream>
#include <stdexcept>

#include "slide/core/Board.hpp"

using namespace slide::core;

namespace {

Board SingleRow(int a, int b, int c, int d) {
    return Board::FromRows({{a, b, c, d}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
}

bool RowEquals(const Board& board, int row, int a, int b, int c, int d) {
    return board.get(0, row) == a && board.get(1, row) == b && board.get(2, row) == c &&
           board.get(3, row) == d;
}

Board LockedBoard() {
    return Board::FromRows({
        {2, 4, 8, 16},
        {32, 64, 128, 256},
        {2, 4, 8, 16},
        {32, 64, 128, 256},
    });
}

void TestMergesEachPairOnce() {
    auto result = ApplyMove(SingleRow(2, 2, 2, 2), Direction::Left);
    assert(result.moved);
    assert(RowEquals(result.board, 0, 4, 4, 0, 0));
    assert(result.score_delta == 8);
    assert(result.merge_count == 2);
}

void TestMergedTileDoesNotMergeAgain() {
    auto result = ApplyMove(SingleRow(2, 2, 4, 0), Direction::Left);
    assert(RowEquals(result.board, 0, 4, 4, 0, 0));
    assert(result.score_delta == 4);
    assert(result.merge_count == 1);
    assert(result.mergedAt(Cell{0, 0}));
    assert(!result.mergedAt(Cell{1, 0}));
}

void TestMergeAcrossGap() {
    auto result = ApplyMove(SingleRow(4, 0, 4, 8), Direction::Left);
    assert(RowEquals(result.board, 0, 8, 8, 0, 0));
    assert(result.score_delta == 8);
}

void TestMergePriorityFollowsDirection() {
    auto right = ApplyMove(SingleRow(2, 2, 2, 0), Direction::Right);
    assert(RowEquals(right.board, 0, 0, 0, 2, 4));
    assert(right.mergedAt(Cell{3, 0}));

    auto left = ApplyMove(SingleRow(2, 2, 2, 0), Direction::Left);
    assert(RowEquals(left.board, 0, 4, 2, 0, 0));
    assert(left.mergedAt(Cell{0, 0}));
}

void TestVerticalMoves() {
    const Board board = Board::FromRows({
        {2, 0, 0, 0},
        {0, 0, 0, 0},
        {2, 0, 0, 0},
        {4, 0, 0, 8},
    });
    auto up = ApplyMove(board, Direction::Up);
    assert(up.board.get(0, 0) == 4);
    assert(up.board.get(0, 1) == 4);
    assert(up.board.get(0, 2) == 0);
    assert(up.board.get(3, 0) == 8);
    assert(up.score_delta == 4);

    auto down = ApplyMove(board, Direction::Down);
    assert(down.board.get(0, 3) == 4);
    assert(down.board.get(0, 2) == 4);
    assert(down.board.get(0, 1) == 0);
    assert(down.board.get(3, 3) == 8);
    assert(down.score_delta == 4);
}

void TestRejectedMove() {
    const Board board = SingleRow(2, 4, 8, 16);
    auto result = ApplyMove(board, Direction::Left);
    assert(!result.moved);
    assert(result.board == board);
    assert(result.slides.empty());
    assert(result.score_delta == 0);
    assert(!CanMove(board, Direction::Left));
    assert(CanMove(board, Direction::Down));
}

void TestSlideEvents() {
    auto across_gap = ApplyMove(SingleRow(0, 2, 0, 2), Direction::Left);
    assert(RowEquals(across_gap.board, 0, 4, 0, 0, 0));
    assert(across_gap.slides.size() == 2);
    bool saw_merge = false;
    for (const auto& event : across_gap.slides) {
        assert(event.to == (Cell{0, 0}));
        assert(event.value == 2);
        saw_merge = saw_merge || event.merged;
    }
    assert(saw_merge);

    // The tile already in place still gets an event so it can be hidden.
    auto in_place = ApplyMove(SingleRow(2, 2, 0, 0), Direction::Left);
    assert(in_place.slides.size() == 2);
    int stationary = 0;
    for (const auto& event : in_place.slides) {
        if (event.from == event.to) {
            ++stationary;
            assert(!event.merged);
        }
    }
    assert(stationary == 1);
}

void TestLossDetection() {
    const Board locked = LockedBoard();
    assert(IsLoss(locked));
    assert(!AnyMovesAvailable(locked));
    for (Direction direction : kAllDirections) {
        assert(!CanMove(locked, direction));
        assert(!ApplyMove(locked, direction).moved);
    }

    // Full board with one vertical pair is not lost.
    Board pair = locked;
    pair.set(0, 1, 2);
    assert(pair.emptyCount() == 0);
    assert(!IsLoss(pair));
    assert(CanMove(pair, Direction::Up));
    assert(!CanMove(pair, Direction::Left));

    Board board;
    assert(!IsLoss(board));
    assert(board.emptyCount() == kCellCount);
}

void TestFromRowsValidation() {
    bool threw = false;
    try {
        Board::FromRows({{2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        SingleRow(2, 6, 0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Board::FromRows({{2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const Board board = SingleRow(0, 2, 0, 1024);
    assert(Board::FromRows(board.toRows()) == board);
    assert(board.maxTile() == 1024);
    assert(IsValidTile(0) && IsValidTile(2) && IsValidTile(65536));
    assert(!IsValidTile(1) && !IsValidTile(-2) && !IsValidTile(12));
}

void TestReachedTarget() {
    assert(ReachedTarget(SingleRow(2048, 0, 0, 0), 2048));
    assert(ReachedTarget(SingleRow(4096, 0, 0, 0), 2048));
    assert(!ReachedTarget(SingleRow(1024, 1024, 0, 0), 2048));
}

void TestDirectionNames() {
    for (Direction direction : kAllDirections) {
        auto parsed = DirectionFromString(DirectionToString(direction));
        assert(parsed && *parsed == direction);
    }
    assert(!DirectionFromString("sideways"));
}

}  // namespace

int main() {
    TestMergesEachPairOnce();
    TestMergedTileDoesNotMergeAgain();
    TestMergeAcrossGap();
    TestMergePriorityFollowsDirection();
    TestVerticalMoves();
    TestRejectedMove();
    TestSlideEvents();
    TestLossDetection();
    TestFromRowsValidation();
    TestReachedTarget();
    TestDirectionNames();
    std::cout << "All board tests passed.\n";
    return 0;
}
