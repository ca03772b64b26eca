#include <array>
#include <cassert>
#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>

#include "slide/core/Game.hpp"

using namespace slide::core;

namespace {

constexpr std::uint32_t kSeed = 2048;

Board OneMergeFromLoss() {
    return Board::FromRows({
        {8, 8, 32, 64},
        {128, 256, 512, 1024},
        {32, 64, 128, 256},
        {128, 256, 512, 1024},
    });
}

Game::Rules RulesWithTarget(int target) {
    Game::Rules rules;
    rules.win_target = target;
    return rules;
}

void TestNewGameDealsTwoTiles() {
    Game game(Game::Rules{}, kSeed);
    assert(game.board().occupiedCount() == kInitialTiles);
    assert(game.score() == 0);
    assert(game.moves() == 0);
    assert(game.status() == GameStatus::Playing);
    assert(game.maxTile() == game.board().maxTile());

    Game same_seed(Game::Rules{}, kSeed);
    assert(same_seed.board() == game.board());

    game.reset();
    assert(game.board().occupiedCount() == kInitialTiles);
}

void TestSpawnTile() {
    std::mt19937 rng(kSeed);
    Board board;
    for (int i = 0; i < kCellCount; ++i) {
        auto spawn = SpawnTile(board, rng, 1.0);
        assert(spawn.has_value());
        assert(spawn->value == 4);
        assert(board.get(spawn->cell) == 4);
    }
    assert(board.emptyCount() == 0);
    const Board full = board;
    assert(!SpawnTile(board, rng, 0.5).has_value());
    assert(board == full);

    Board twos;
    for (int i = 0; i < 8; ++i) {
        auto spawn = SpawnTile(twos, rng, 0.0);
        assert(spawn && spawn->value == 2);
    }
    assert(twos.occupiedCount() == 8);
}

void TestSpawnDistribution() {
    constexpr int kTrials = 16000;
    std::mt19937 rng(kSeed);
    int fours = 0;
    std::array<int, kCellCount> hits{};
    for (int i = 0; i < kTrials; ++i) {
        Board board;
        auto spawn = SpawnTile(board, rng, FourProbability(Difficulty::Medium));
        assert(spawn.has_value());
        if (spawn->value == 4) {
            ++fours;
        }
        ++hits[static_cast<std::size_t>(spawn->cell.row * kBoardSize + spawn->cell.col)];
    }
    const double rate = static_cast<double>(fours) / kTrials;
    assert(rate > 0.085 && rate < 0.115);
    // 1000 expected per cell; the bounds sit about five standard deviations out.
    for (int count : hits) {
        assert(count > 850 && count < 1150);
    }

    // Only the free cells are candidates.
    Board one_free = Board::FromRows({
        {2, 4, 2, 4},
        {4, 2, 4, 2},
        {2, 4, 0, 4},
        {4, 2, 4, 2},
    });
    for (int i = 0; i < 20; ++i) {
        Board board = one_free;
        auto spawn = SpawnTile(board, rng, FourProbability(Difficulty::Hard));
        assert(spawn && spawn->cell == (Cell{2, 2}));
    }
}

void TestDifficultyOdds() {
    assert(FourProbability(Difficulty::Easy) < FourProbability(Difficulty::Medium));
    assert(FourProbability(Difficulty::Medium) < FourProbability(Difficulty::Hard));
    assert(FourProbability(Difficulty::Medium) == 0.10);
    assert(DifficultyFromString(DifficultyToString(Difficulty::Hard)) == Difficulty::Hard);
    assert(!DifficultyFromString("nightmare"));
}

void TestAcceptedMoveSpawns() {
    const Board start = Board::FromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    Game game(Game::Rules{}, start, kSeed);
    auto turn = game.move(Direction::Left);
    assert(turn.accepted);
    assert(turn.outcome() == Game::Outcome::Continue);
    assert(turn.move.score_delta == 4);
    assert(turn.spawn.has_value());
    assert(game.score() == 4);
    assert(game.moves() == 1);
    assert(game.board().occupiedCount() == 2);
    assert(game.board().get(0, 0) == 4);
    assert(game.board().get(turn.spawn->cell) == turn.spawn->value);
}

void TestRejectedMoveChangesNothing() {
    const Board start = Board::FromRows({{2, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    Game game(Game::Rules{}, start, kSeed);
    auto turn = game.move(Direction::Left);
    assert(!turn.accepted);
    assert(!turn.spawn.has_value());
    assert(game.moves() == 0);
    assert(game.board() == start);
}

void TestWinKeepGoingAndEnd() {
    const Board start = Board::FromRows({{4, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    Game game(RulesWithTarget(8), start, kSeed);
    auto turn = game.move(Direction::Left);
    assert(turn.accepted);
    assert(turn.reached_target);
    assert(turn.outcome() == Game::Outcome::Won);
    assert(game.won());
    assert(game.status() == GameStatus::Won);
    assert(!game.acceptsMoves());
    assert(!game.move(Direction::Right).accepted);

    game.keepGoing();
    assert(game.status() == GameStatus::Continuing);
    assert(game.acceptsMoves());

    bool reported_again = false;
    for (Direction direction : kAllDirections) {
        auto next = game.move(direction);
        reported_again = reported_again || next.reached_target;
    }
    assert(!reported_again);

    if (game.status() != GameStatus::Lost) {
        game.end();
        assert(game.status() == GameStatus::Ended);
    }
    assert(game.finished());
    const auto record = game.record(1700000000);
    assert(record.won);
    assert(record.played_at == 1700000000);
    assert(record.score == game.score());
}

void TestLossAfterFinalMove() {
    Game game(Game::Rules{}, OneMergeFromLoss(), kSeed);
    assert(game.status() == GameStatus::Playing);
    auto turn = game.move(Direction::Left);
    assert(turn.accepted);
    assert(turn.lost);
    assert(game.status() == GameStatus::Lost);
    assert(game.finished());
    assert(!game.move(Direction::Up).accepted);

    game.end();
    assert(game.status() == GameStatus::Lost);

    const auto record = game.record();
    assert(!record.won);
    assert(record.max_tile == 1024);
    assert(record.moves == 1);
    assert(record.score == 16);
}

void TestTargetReachedOnFinalMove() {
    const Board start = Board::FromRows({
        {1024, 1024, 8, 16},
        {16, 32, 64, 128},
        {256, 512, 256, 512},
        {2, 4, 2, 4},
    });
    Game game(Game::Rules{}, start, kSeed);
    auto turn = game.move(Direction::Left);
    assert(turn.accepted);
    assert(turn.reached_target);
    assert(turn.lost);
    assert(turn.outcome() == Game::Outcome::Lost);
    assert(game.status() == GameStatus::Lost);
    assert(game.finished());

    // Keep going cannot revive a lost game.
    game.keepGoing();
    assert(game.status() == GameStatus::Lost);
    assert(!game.acceptsMoves());

    const auto record = game.record();
    assert(record.won);
    assert(record.max_tile == 2048);
    assert(record.score == 2048);
}

void TestTimerOnlyRunsWhilePlaying() {
    Game game(Game::Rules{}, kSeed);
    game.tick(250.0f);
    game.tick(-100.0f);
    assert(game.elapsedMs() == 250.0);

    Game lost(Game::Rules{}, OneMergeFromLoss(), kSeed);
    lost.move(Direction::Left);
    lost.tick(500.0f);
    assert(lost.elapsedMs() == 0.0);
}

void TestInvalidWinTargetFallsBack() {
    assert(Game(RulesWithTarget(100), kSeed).rules().win_target == kDefaultWinTarget);
    assert(Game(RulesWithTarget(4), kSeed).rules().win_target == kDefaultWinTarget);
    assert(Game(RulesWithTarget(512), kSeed).rules().win_target == 512);
}

void TestJsonRestoresSession() {
    Game::Rules rules;
    rules.difficulty = Difficulty::Hard;
    const Board start = Board::FromRows({{2, 2, 8, 0}, {0, 4, 0, 0}, {0, 0, 0, 0}, {16, 0, 0, 0}});
    Game game(rules, start, kSeed);
    game.move(Direction::Left);
    game.tick(1234.0f);

    const Game restored = Game::FromJson(game.ToJson(), kSeed);
    assert(restored.board() == game.board());
    assert(restored.score() == game.score());
    assert(restored.moves() == game.moves());
    assert(restored.maxTile() == game.maxTile());
    assert(restored.elapsedMs() == game.elapsedMs());
    assert(restored.status() == game.status());
    assert(restored.rules().difficulty == Difficulty::Hard);
}

void TestJsonRejectsDamagedSession() {
    Game game(Game::Rules{}, kSeed);

    auto bad_tile = game.ToJson();
    bad_tile["board"][0][0] = 3;
    bool threw = false;
    try {
        Game::FromJson(bad_tile);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto bad_status = game.ToJson();
    bad_status["status"] = "paused";
    threw = false;
    try {
        Game::FromJson(bad_status);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto missing = game.ToJson();
    missing.erase("score");
    threw = false;
    try {
        Game::FromJson(missing);
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);

    // A playing status over a board with no moves left is restored as lost.
    auto stale = Game(Game::Rules{}, OneMergeFromLoss(), kSeed).ToJson();
    stale["board"] = Board::FromRows({
                         {2, 4, 8, 16},
                         {32, 64, 128, 256},
                         {2, 4, 8, 16},
                         {32, 64, 128, 256},
                     }).toRows();
    assert(Game::FromJson(stale, kSeed).status() == GameStatus::Lost);
}

bool Rejects(const Json& json) {
    try {
        Game::FromJson(json, kSeed);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestJsonRejectsContradictoryStatus() {
    const Board open = Board::FromRows({{2, 2, 8, 0}, {0, 4, 0, 0}, {0, 0, 0, 0}, {16, 0, 0, 0}});
    const Json playing = Game(Game::Rules{}, open, kSeed).ToJson();

    auto won_without_tile = playing;
    won_without_tile["status"] = "won";
    assert(Rejects(won_without_tile));

    auto continuing = playing;
    continuing["status"] = "continuing";
    assert(Rejects(continuing));

    auto ended = playing;
    ended["status"] = "ended";
    assert(Rejects(ended));

    auto flagged_won = playing;
    flagged_won["won"] = true;
    flagged_won["status"] = "continuing";
    assert(Rejects(flagged_won));

    auto lost_with_moves = playing;
    lost_with_moves["status"] = "lost";
    assert(Rejects(lost_with_moves));

    const Board target = Board::FromRows({{2048, 0, 0, 0}, {0, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 2}});
    auto target_but_playing = Game(Game::Rules{}, target, kSeed).ToJson();
    target_but_playing["status"] = "playing";
    assert(Rejects(target_but_playing));

    // A real win survives the round trip.
    Game winner(RulesWithTarget(8), Board::FromRows({{4, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}),
                kSeed);
    winner.move(Direction::Left);
    assert(winner.status() == GameStatus::Won);
    const Game restored = Game::FromJson(winner.ToJson(), kSeed);
    assert(restored.status() == GameStatus::Won);
    assert(restored.won());
}

}  // namespace

int main() {
    TestNewGameDealsTwoTiles();
    TestSpawnTile();
    TestSpawnDistribution();
    TestDifficultyOdds();
    TestAcceptedMoveSpawns();
    TestRejectedMoveChangesNothing();
    TestWinKeepGoingAndEnd();
    TestLossAfterFinalMove();
    TestTargetReachedOnFinalMove();
    TestTimerOnlyRunsWhilePlaying();
    TestInvalidWinTargetFallsBack();
    TestJsonRestoresSession();
    TestJsonRejectsDamagedSession();
    TestJsonRejectsContradictoryStatus();
    std::cout << "All game tests passed.\n";
    return 0;
}
