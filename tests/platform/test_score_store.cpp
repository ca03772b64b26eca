#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "slide/platform/ScoreStore.hpp"

using slide::core::Difficulty;
using slide::core::GameRecord;
using slide::platform::ScoreStore;

namespace {

GameRecord MakeRecord(int score, int max_tile, Difficulty difficulty, bool won, std::int64_t played_at) {
    GameRecord record;
    record.score = score;
    record.max_tile = max_tile;
    record.moves = score / 4;
    record.duration_seconds = 60.0;
    record.difficulty = difficulty;
    record.won = won;
    record.played_at = played_at;
    return record;
}

void TestClosedStoreIsInert() {
    ScoreStore store(ScoreStore::kInMemory);
    assert(!store.isOpen());
    assert(!store.RecordGame(MakeRecord(100, 16, Difficulty::Easy, false, 1)));
    assert(store.TopScores(10).empty());
    assert(!store.Stats(Difficulty::Easy).has_value());
    assert(store.BestScore() == 0);
    assert(store.GameCount() == 0);
}

void TestRecordsAndRanksGames() {
    ScoreStore store(ScoreStore::kInMemory);
    assert(store.Open());
    assert(store.Open());

    assert(store.RecordGame(MakeRecord(1200, 128, Difficulty::Easy, false, 10)));
    assert(store.RecordGame(MakeRecord(5400, 512, Difficulty::Medium, false, 20)));
    assert(store.RecordGame(MakeRecord(1200, 128, Difficulty::Hard, false, 5)));
    assert(store.RecordGame(MakeRecord(22000, 2048, Difficulty::Medium, true, 30)));
    assert(store.GameCount() == 4);

    const auto top = store.TopScores(10);
    assert(top.size() == 4);
    assert(top[0].score == 22000);
    assert(top[0].won);
    assert(top[1].score == 5400);
    // Equal scores rank the earlier game first.
    assert(top[2].score == 1200 && top[2].played_at == 5);
    assert(top[3].score == 1200 && top[3].played_at == 10);

    const auto limited = store.TopScores(2);
    assert(limited.size() == 2);
    assert(store.TopScores(0).empty());

    const auto medium = store.TopScores(10, Difficulty::Medium);
    assert(medium.size() == 2);
    for (const auto& entry : medium) {
        assert(entry.difficulty == Difficulty::Medium);
    }
    assert(medium[0].max_tile == 2048);
}

void TestDifficultyStats() {
    ScoreStore store(ScoreStore::kInMemory);
    assert(store.Open());
    assert(store.RecordGame(MakeRecord(3000, 256, Difficulty::Hard, false, 1)));
    assert(store.RecordGame(MakeRecord(9000, 1024, Difficulty::Hard, false, 2)));
    assert(store.RecordGame(MakeRecord(4000, 2048, Difficulty::Hard, true, 3)));

    const auto stats = store.Stats(Difficulty::Hard);
    assert(stats.has_value());
    assert(stats->best_score == 9000);
    assert(stats->best_tile == 2048);
    assert(stats->games_played == 3);
    assert(stats->wins == 1);
    assert(stats->total_moves == (3000 + 9000 + 4000) / 4);
    assert(stats->total_seconds == 180.0);

    assert(!store.Stats(Difficulty::Easy).has_value());
    assert(store.BestScore(Difficulty::Hard) == 9000);
    assert(store.BestScore(Difficulty::Easy) == 0);
    assert(store.BestScore() == 9000);
}

void TestZeroTimestampIsStamped() {
    ScoreStore store(ScoreStore::kInMemory);
    assert(store.Open());
    assert(store.RecordGame(MakeRecord(64, 16, Difficulty::Easy, false, 0)));
    const auto top = store.TopScores(1);
    assert(top.size() == 1);
    assert(top[0].played_at > 0);

    store.Close();
    assert(!store.isOpen());
    assert(store.GameCount() == 0);
}

void TestRecordedFieldsSurvive() {
    ScoreStore store(ScoreStore::kInMemory);
    assert(store.Open());
    GameRecord record = MakeRecord(7321, 1024, Difficulty::Hard, true, 1700000000);
    record.moves = 611;
    record.duration_seconds = 432.5;
    assert(store.RecordGame(record));

    const auto top = store.TopScores(1, Difficulty::Hard);
    assert(top.size() == 1);
    assert(top[0].score == 7321);
    assert(top[0].max_tile == 1024);
    assert(top[0].moves == 611);
    assert(top[0].duration_seconds == 432.5);
    assert(top[0].difficulty == Difficulty::Hard);
    assert(top[0].won);
    assert(top[0].played_at == 1700000000);

    const auto stats = store.Stats(Difficulty::Hard);
    assert(stats && stats->total_moves == 611 && stats->wins == 1);
}

// A reader holding the database makes COMMIT fail with SQLITE_BUSY. The store
// must roll back so the next game can still be recorded.
void TestBusyCommitLeavesStoreUsable() {
    const auto path = std::filesystem::temp_directory_path() / "slide_score_store_busy.db";
    std::error_code ec;
    std::filesystem::remove(path, ec);
    {
        ScoreStore store(path);
        assert(store.Open());

        sqlite3* reader = nullptr;
        assert(sqlite3_open(path.string().c_str(), &reader) == SQLITE_OK);
        assert(sqlite3_exec(reader, "BEGIN; SELECT COUNT(*) FROM games;", nullptr, nullptr, nullptr) == SQLITE_OK);

        assert(!store.RecordGame(MakeRecord(500, 64, Difficulty::Easy, false, 1)));

        assert(sqlite3_exec(reader, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(reader);

        assert(store.RecordGame(MakeRecord(900, 128, Difficulty::Easy, false, 2)));
        assert(store.GameCount() == 1);
        assert(store.BestScore(Difficulty::Easy) == 900);
    }
    std::filesystem::remove(path, ec);
}

}  // namespace

int main() {
    TestClosedStoreIsInert();
    TestRecordsAndRanksGames();
    TestDifficultyStats();
    TestZeroTimestampIsStamped();
    TestRecordedFieldsSurvive();
    TestBusyCommitLeavesStoreUsable();
    std::cout << "All score store tests passed.\n";
    return 0;
}
