#include "slide/platform/ScoreStore.hpp"

#include <SDL2/SDL.h>
#include <sqlite3.h>

#include <ctime>
#include <memory>

namespace slide::platform {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS games (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    score INTEGER NOT NULL,
    max_tile INTEGER NOT NULL,
    moves INTEGER NOT NULL,
    duration_seconds REAL NOT NULL,
    difficulty TEXT NOT NULL,
    won INTEGER NOT NULL DEFAULT 0,
    played_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS games_by_score ON games (score DESC);
CREATE TABLE IF NOT EXISTS high_scores (
    difficulty TEXT PRIMARY KEY,
    best_score INTEGER NOT NULL,
    best_tile INTEGER NOT NULL,
    games_played INTEGER NOT NULL,
    wins INTEGER NOT NULL,
    total_moves INTEGER NOT NULL,
    total_seconds REAL NOT NULL,
    updated_at INTEGER NOT NULL
);
)sql";

constexpr const char* kInsertGame =
    "INSERT INTO games (score, max_tile, moves, duration_seconds, difficulty, won, played_at) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)";

constexpr const char* kUpsertHighScore =
    "INSERT INTO high_scores (difficulty, best_score, best_tile, games_played, wins, total_moves, "
    "total_seconds, updated_at) VALUES (?1, ?2, ?3, 1, ?4, ?5, ?6, ?7) "
    "ON CONFLICT(difficulty) DO UPDATE SET "
    "best_score = MAX(best_score, excluded.best_score), "
    "best_tile = MAX(best_tile, excluded.best_tile), "
    "games_played = games_played + 1, "
    "wins = wins + excluded.wins, "
    "total_moves = total_moves + excluded.total_moves, "
    "total_seconds = total_seconds + excluded.total_seconds, "
    "updated_at = excluded.updated_at";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "sqlite prepare failed: %s", sqlite3_errmsg(db));
        sqlite3_finalize(raw);
        return Statement{};
    }
    return Statement{raw};
}

bool BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    return sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
}

slide::core::Difficulty DifficultyColumn(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return slide::core::Difficulty::Medium;
    }
    auto parsed = slide::core::DifficultyFromString(reinterpret_cast<const char*>(text));
    return parsed.value_or(slide::core::Difficulty::Medium);
}

}  // namespace

ScoreStore::ScoreStore(std::filesystem::path path) : path_(std::move(path)) {}

ScoreStore::~ScoreStore() {
    Close();
}

bool ScoreStore::Open() {
    if (db_) {
        return true;
    }
    const std::string location = path_.string();
    if (sqlite3_open_v2(location.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) !=
        SQLITE_OK) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot open score database %s: %s", location.c_str(),
                    db_ ? sqlite3_errmsg(db_) : "out of memory");
        Close();
        return false;
    }
    sqlite3_busy_timeout(db_, 250);
    if (!CreateSchema()) {
        Close();
        return false;
    }
    return true;
}

void ScoreStore::Close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool ScoreStore::Exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "sqlite exec failed: %s", error ? error : "unknown");
        sqlite3_free(error);
        return false;
    }
    return true;
}

bool ScoreStore::CreateSchema() {
    return Exec(kSchema);
}

bool ScoreStore::RecordGame(const slide::core::GameRecord& record) {
    if (!db_) {
        return false;
    }
    const std::int64_t played_at =
        record.played_at != 0 ? record.played_at : static_cast<std::int64_t>(std::time(nullptr));
    const std::string difficulty = slide::core::DifficultyToString(record.difficulty);

    if (!Exec("BEGIN IMMEDIATE")) {
        return false;
    }

    bool ok = false;
    {
        Statement insert = Prepare(db_, kInsertGame);
        Statement upsert = Prepare(db_, kUpsertHighScore);
        if (insert && upsert) {
            const bool bound =
                sqlite3_bind_int(insert.get(), 1, record.score) == SQLITE_OK &&
                sqlite3_bind_int(insert.get(), 2, record.max_tile) == SQLITE_OK &&
                sqlite3_bind_int(insert.get(), 3, record.moves) == SQLITE_OK &&
                sqlite3_bind_double(insert.get(), 4, record.duration_seconds) == SQLITE_OK &&
                BindText(insert.get(), 5, difficulty) &&
                sqlite3_bind_int(insert.get(), 6, record.won ? 1 : 0) == SQLITE_OK &&
                sqlite3_bind_int64(insert.get(), 7, played_at) == SQLITE_OK &&
                BindText(upsert.get(), 1, difficulty) &&
                sqlite3_bind_int(upsert.get(), 2, record.score) == SQLITE_OK &&
                sqlite3_bind_int(upsert.get(), 3, record.max_tile) == SQLITE_OK &&
                sqlite3_bind_int(upsert.get(), 4, record.won ? 1 : 0) == SQLITE_OK &&
                sqlite3_bind_int64(upsert.get(), 5, record.moves) == SQLITE_OK &&
                sqlite3_bind_double(upsert.get(), 6, record.duration_seconds) == SQLITE_OK &&
                sqlite3_bind_int64(upsert.get(), 7, played_at) == SQLITE_OK;

            ok = bound && sqlite3_step(insert.get()) == SQLITE_DONE && sqlite3_step(upsert.get()) == SQLITE_DONE;
            if (!ok) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Recording game failed: %s", sqlite3_errmsg(db_));
            }
        }
    }

    if (ok && Exec("COMMIT")) {
        return true;
    }
    // A failed COMMIT keeps the transaction open and would block every later BEGIN.
    if (!sqlite3_get_autocommit(db_) && !Exec("ROLLBACK")) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Rollback failed: %s", sqlite3_errmsg(db_));
    }
    return false;
}

std::vector<ScoreEntry> ScoreStore::TopScores(int limit,
                                              std::optional<slide::core::Difficulty> difficulty) const {
    std::vector<ScoreEntry> entries;
    if (!db_ || limit <= 0) {
        return entries;
    }
    const char* sql = difficulty
                          ? "SELECT id, score, max_tile, moves, duration_seconds, difficulty, won, played_at "
                            "FROM games WHERE difficulty = ?2 ORDER BY score DESC, played_at ASC, id ASC LIMIT ?1"
                          : "SELECT id, score, max_tile, moves, duration_seconds, difficulty, won, played_at "
                            "FROM games ORDER BY score DESC, played_at ASC, id ASC LIMIT ?1";
    Statement stmt = Prepare(db_, sql);
    if (!stmt) {
        return entries;
    }
    const bool bound = sqlite3_bind_int(stmt.get(), 1, limit) == SQLITE_OK &&
                       (!difficulty || BindText(stmt.get(), 2, slide::core::DifficultyToString(*difficulty)));
    if (!bound) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Reading scores failed: %s", sqlite3_errmsg(db_));
        return entries;
    }
    entries.reserve(static_cast<std::size_t>(limit));
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ScoreEntry entry;
        entry.id = sqlite3_column_int64(stmt.get(), 0);
        entry.score = sqlite3_column_int(stmt.get(), 1);
        entry.max_tile = sqlite3_column_int(stmt.get(), 2);
        entry.moves = sqlite3_column_int(stmt.get(), 3);
        entry.duration_seconds = sqlite3_column_double(stmt.get(), 4);
        entry.difficulty = DifficultyColumn(stmt.get(), 5);
        entry.won = sqlite3_column_int(stmt.get(), 6) != 0;
        entry.played_at = sqlite3_column_int64(stmt.get(), 7);
        entries.push_back(entry);
    }
    if (rc != SQLITE_DONE) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Reading scores failed: %s", sqlite3_errmsg(db_));
    }
    return entries;
}

std::optional<DifficultyStats> ScoreStore::Stats(slide::core::Difficulty difficulty) const {
    if (!db_) {
        return std::nullopt;
    }
    Statement stmt = Prepare(db_,
                             "SELECT best_score, best_tile, games_played, wins, total_moves, total_seconds "
                             "FROM high_scores WHERE difficulty = ?1");
    if (!stmt) {
        return std::nullopt;
    }
    if (!BindText(stmt.get(), 1, slide::core::DifficultyToString(difficulty)) ||
        sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    DifficultyStats stats;
    stats.difficulty = difficulty;
    stats.best_score = sqlite3_column_int(stmt.get(), 0);
    stats.best_tile = sqlite3_column_int(stmt.get(), 1);
    stats.games_played = sqlite3_column_int(stmt.get(), 2);
    stats.wins = sqlite3_column_int(stmt.get(), 3);
    stats.total_moves = sqlite3_column_int64(stmt.get(), 4);
    stats.total_seconds = sqlite3_column_double(stmt.get(), 5);
    return stats;
}

int ScoreStore::BestScore(std::optional<slide::core::Difficulty> difficulty) const {
    if (!db_) {
        return 0;
    }
    Statement stmt = Prepare(db_, difficulty
                                      ? "SELECT COALESCE(MAX(best_score), 0) FROM high_scores WHERE difficulty = ?1"
                                      : "SELECT COALESCE(MAX(best_score), 0) FROM high_scores");
    if (!stmt) {
        return 0;
    }
    if (difficulty && !BindText(stmt.get(), 1, slide::core::DifficultyToString(*difficulty))) {
        return 0;
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int ScoreStore::GameCount() const {
    if (!db_) {
        return 0;
    }
    Statement stmt = Prepare(db_, "SELECT COUNT(*) FROM games");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

}  // namespace slide::platform
