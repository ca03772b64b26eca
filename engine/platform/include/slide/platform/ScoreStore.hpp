#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "slide/core/Game.hpp"

struct sqlite3;

namespace slide::platform {

struct ScoreEntry {
    std::int64_t id = 0;
    int score = 0;
    int max_tile = 0;
    int moves = 0;
    double duration_seconds = 0.0;
    slide::core::Difficulty difficulty = slide::core::Difficulty::Medium;
    bool won = false;
    std::int64_t played_at = 0;
};

// Aggregate row kept per difficulty in the high_scores table.
struct DifficultyStats {
    slide::core::Difficulty difficulty = slide::core::Difficulty::Medium;
    int best_score = 0;
    int best_tile = 0;
    int games_played = 0;
    int wins = 0;
    std::int64_t total_moves = 0;
    double total_seconds = 0.0;
};

// SQLite-backed record of finished games. Every call after a failed Open()
// is a logged no-op so the game keeps running without persistence.
class ScoreStore {
public:
    static constexpr const char* kInMemory = ":memory:";

    explicit ScoreStore(std::filesystem::path path);
    ~ScoreStore();

    ScoreStore(const ScoreStore&) = delete;
    ScoreStore& operator=(const ScoreStore&) = delete;

    bool Open();
    void Close();
    bool isOpen() const noexcept { return db_ != nullptr; }

    // Inserts the game and folds it into the difficulty aggregate inside one
    // transaction. A zero played_at is stamped with the current time.
    bool RecordGame(const slide::core::GameRecord& record);

    std::vector<ScoreEntry> TopScores(int limit,
                                      std::optional<slide::core::Difficulty> difficulty = std::nullopt) const;
    std::optional<DifficultyStats> Stats(slide::core::Difficulty difficulty) const;
    int BestScore(std::optional<slide::core::Difficulty> difficulty = std::nullopt) const;
    int GameCount() const;

    const std::filesystem::path& path() const { return path_; }

private:
    bool Exec(const char* sql);
    bool CreateSchema();

    std::filesystem::path path_;
    sqlite3* db_ = nullptr;
};

}  // namespace slide::platform
