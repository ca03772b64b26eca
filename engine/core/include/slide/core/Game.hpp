#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "slide/core/Board.hpp"
#include "slide/core/Json.hpp"

namespace slide::core {

enum class Difficulty { Easy, Medium, Hard };

inline constexpr int kDefaultWinTarget = 2048;
inline constexpr int kMinWinTarget = 8;
inline constexpr int kInitialTiles = 2;

// Probability that a spawned tile is a 4 rather than a 2.
double FourProbability(Difficulty difficulty) noexcept;
std::string DifficultyToString(Difficulty difficulty);
std::optional<Difficulty> DifficultyFromString(const std::string& token);

// Power of two no smaller than kMinWinTarget.
bool IsValidWinTarget(int target) noexcept;

struct SpawnResult {
    Cell cell{};
    int value = kEmptyTile;
};

// Places a 2 or a 4 in a uniformly chosen empty cell. Returns nullopt and
// leaves the board untouched when no cell is empty.
std::optional<SpawnResult> SpawnTile(Board& board, std::mt19937& rng, double four_probability);

enum class GameStatus {
    Playing,
    Won,         // target reached, waiting for keep-going or end
    Continuing,  // playing on after a win
    Lost,
    Ended        // player ended the game after winning
};

std::string GameStatusToString(GameStatus status);
std::optional<GameStatus> GameStatusFromString(const std::string& token);

struct GameRecord {
    int score = 0;
    int max_tile = 0;
    int moves = 0;
    double duration_seconds = 0.0;
    Difficulty difficulty = Difficulty::Medium;
    bool won = false;
    std::int64_t played_at = 0;
};

class Game {
public:
    struct Rules {
        Difficulty difficulty = Difficulty::Medium;
        int win_target = kDefaultWinTarget;
    };

    enum class Outcome { Continue, Won, Lost };

    struct TurnResult {
        bool accepted = false;
        MoveResult move{};
        std::optional<SpawnResult> spawn;
        bool reached_target = false;
        bool lost = false;

        // A move can reach the target and leave no moves at once; the game is
        // over then, so the loss wins.
        Outcome outcome() const noexcept {
            if (lost) {
                return Outcome::Lost;
            }
            return reached_target ? Outcome::Won : Outcome::Continue;
        }
    };

    Game();
    explicit Game(const Rules& rules, std::uint32_t seed = std::random_device{}());
    // Starts from |board| instead of the two random opening tiles.
    Game(const Rules& rules, const Board& board, std::uint32_t seed = std::random_device{}());

    // Clears statistics and deals a fresh opening board.
    void reset();

    TurnResult move(Direction direction);

    // Adds play time while the game is running. Paused screens do not tick.
    void tick(float delta_ms) noexcept;

    void keepGoing() noexcept;
    void end() noexcept;

    const Board& board() const noexcept { return board_; }
    const Rules& rules() const noexcept { return rules_; }
    int score() const noexcept { return score_; }
    int moves() const noexcept { return moves_; }
    int maxTile() const noexcept { return max_tile_; }
    double elapsedMs() const noexcept { return elapsed_ms_; }
    double durationSeconds() const noexcept { return elapsed_ms_ / 1000.0; }
    GameStatus status() const noexcept { return status_; }
    bool won() const noexcept { return won_; }
    bool finished() const noexcept {
        return status_ == GameStatus::Lost || status_ == GameStatus::Ended;
    }
    bool acceptsMoves() const noexcept {
        return status_ == GameStatus::Playing || status_ == GameStatus::Continuing;
    }

    GameRecord record(std::int64_t played_at = 0) const;

    std::mt19937& rng() noexcept { return rng_; }

    Json ToJson() const;
    // Throws on missing or malformed fields, including invalid board values.
    static Game FromJson(const Json& json, std::uint32_t seed = std::random_device{}());

private:
    void refreshStatus();

    Rules rules_{};
    Board board_{};
    int score_ = 0;
    int moves_ = 0;
    int max_tile_ = 0;
    double elapsed_ms_ = 0.0;
    GameStatus status_ = GameStatus::Playing;
    bool won_ = false;
    std::mt19937 rng_{};
};

}  // namespace slide::core
