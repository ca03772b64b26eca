#include "slide/core/Game.hpp"

#include <algorithm>
#include <stdexcept>

namespace slide::core {

double FourProbability(Difficulty difficulty) noexcept {
    switch (difficulty) {
        case Difficulty::Easy:
            return 0.05;
        case Difficulty::Medium:
            return 0.10;
        case Difficulty::Hard:
            return 0.15;
    }
    return 0.10;
}

std::string DifficultyToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return "easy";
        case Difficulty::Medium:
            return "medium";
        case Difficulty::Hard:
            return "hard";
    }
    return "medium";
}

std::optional<Difficulty> DifficultyFromString(const std::string& token) {
    if (token == "easy") {
        return Difficulty::Easy;
    }
    if (token == "medium") {
        return Difficulty::Medium;
    }
    if (token == "hard") {
        return Difficulty::Hard;
    }
    return std::nullopt;
}

bool IsValidWinTarget(int target) noexcept {
    return target >= kMinWinTarget && IsValidTile(target);
}

std::optional<SpawnResult> SpawnTile(Board& board, std::mt19937& rng, double four_probability) {
    const auto empty = board.emptyCells();
    if (empty.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, empty.size() - 1);
    std::bernoulli_distribution four(std::clamp(four_probability, 0.0, 1.0));
    SpawnResult spawn;
    spawn.cell = empty[pick(rng)];
    spawn.value = four(rng) ? 4 : 2;
    board.set(spawn.cell, spawn.value);
    return spawn;
}

std::string GameStatusToString(GameStatus status) {
    switch (status) {
        case GameStatus::Playing:
            return "playing";
        case GameStatus::Won:
            return "won";
        case GameStatus::Continuing:
            return "continuing";
        case GameStatus::Lost:
            return "lost";
        case GameStatus::Ended:
            return "ended";
    }
    return "playing";
}

std::optional<GameStatus> GameStatusFromString(const std::string& token) {
    if (token == "playing") {
        return GameStatus::Playing;
    }
    if (token == "won") {
        return GameStatus::Won;
    }
    if (token == "continuing") {
        return GameStatus::Continuing;
    }
    if (token == "lost") {
        return GameStatus::Lost;
    }
    if (token == "ended") {
        return GameStatus::Ended;
    }
    return std::nullopt;
}

Game::Game() : Game(Rules{}) {}

Game::Game(const Rules& rules, std::uint32_t seed) : rules_(rules), rng_(seed) {
    if (!IsValidWinTarget(rules_.win_target)) {
        rules_.win_target = kDefaultWinTarget;
    }
    reset();
}

Game::Game(const Rules& rules, const Board& board, std::uint32_t seed)
    : rules_(rules), board_(board), rng_(seed) {
    if (!IsValidWinTarget(rules_.win_target)) {
        rules_.win_target = kDefaultWinTarget;
    }
    max_tile_ = board_.maxTile();
    refreshStatus();
}

void Game::reset() {
    board_.clear();
    score_ = 0;
    moves_ = 0;
    elapsed_ms_ = 0.0;
    won_ = false;
    status_ = GameStatus::Playing;
    for (int i = 0; i < kInitialTiles; ++i) {
        SpawnTile(board_, rng_, FourProbability(rules_.difficulty));
    }
    max_tile_ = board_.maxTile();
}

void Game::refreshStatus() {
    won_ = won_ || ReachedTarget(board_, rules_.win_target);
    status_ = won_ ? GameStatus::Continuing : GameStatus::Playing;
    if (IsLoss(board_)) {
        status_ = GameStatus::Lost;
    }
}

Game::TurnResult Game::move(Direction direction) {
    TurnResult turn;
    if (!acceptsMoves()) {
        return turn;
    }
    turn.move = ApplyMove(board_, direction);
    if (!turn.move.moved) {
        return turn;
    }

    turn.accepted = true;
    board_ = turn.move.board;
    score_ += turn.move.score_delta;
    ++moves_;

    if (!won_ && ReachedTarget(board_, rules_.win_target)) {
        won_ = true;
        turn.reached_target = true;
        status_ = GameStatus::Won;
    }

    turn.spawn = SpawnTile(board_, rng_, FourProbability(rules_.difficulty));
    max_tile_ = std::max(max_tile_, board_.maxTile());

    if (IsLoss(board_)) {
        status_ = GameStatus::Lost;
        turn.lost = true;
    }
    return turn;
}

void Game::tick(float delta_ms) noexcept {
    if (!acceptsMoves() || delta_ms <= 0.0f) {
        return;
    }
    elapsed_ms_ += static_cast<double>(delta_ms);
}

void Game::keepGoing() noexcept {
    if (status_ == GameStatus::Won) {
        status_ = GameStatus::Continuing;
    }
}

void Game::end() noexcept {
    if (status_ == GameStatus::Lost) {
        return;
    }
    status_ = GameStatus::Ended;
}

GameRecord Game::record(std::int64_t played_at) const {
    GameRecord record;
    record.score = score_;
    record.max_tile = max_tile_;
    record.moves = moves_;
    record.duration_seconds = durationSeconds();
    record.difficulty = rules_.difficulty;
    record.won = won_;
    record.played_at = played_at;
    return record;
}

Json Game::ToJson() const {
    Json json;
    json["board"] = board_.toRows();
    json["score"] = score_;
    json["moves"] = moves_;
    json["max_tile"] = max_tile_;
    json["elapsed_ms"] = elapsed_ms_;
    json["difficulty"] = DifficultyToString(rules_.difficulty);
    json["win_target"] = rules_.win_target;
    json["status"] = GameStatusToString(status_);
    json["won"] = won_;
    return json;
}

Game Game::FromJson(const Json& json, std::uint32_t seed) {
    Rules rules;
    const auto difficulty = DifficultyFromString(json.at("difficulty").get<std::string>());
    if (!difficulty) {
        throw std::invalid_argument("unknown difficulty in saved game");
    }
    rules.difficulty = *difficulty;
    rules.win_target = json.at("win_target").get<int>();

    Board board = Board::FromRows(json.at("board").get<Board::Rows>());
    Game game(rules, board, seed);

    game.score_ = json.at("score").get<int>();
    game.moves_ = json.at("moves").get<int>();
    game.elapsed_ms_ = json.at("elapsed_ms").get<double>();
    if (game.score_ < 0 || game.moves_ < 0 || game.elapsed_ms_ < 0.0) {
        throw std::invalid_argument("negative statistics in saved game");
    }
    game.max_tile_ = std::max(json.value("max_tile", 0), board.maxTile());
    game.won_ = json.value("won", false) || game.won_;

    const auto status = GameStatusFromString(json.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown status in saved game");
    }
    game.status_ = *status;
    if (game.won_ && game.max_tile_ < game.rules_.win_target) {
        throw std::invalid_argument("saved game is marked won below the target tile");
    }
    const bool after_win = game.status_ == GameStatus::Won || game.status_ == GameStatus::Continuing ||
                           game.status_ == GameStatus::Ended;
    if (after_win && !game.won_) {
        throw std::invalid_argument("saved status " + GameStatusToString(game.status_) + " without a win");
    }
    if (game.status_ == GameStatus::Playing && game.won_) {
        throw std::invalid_argument("saved game reached the target but is still playing");
    }
    if (game.status_ == GameStatus::Lost && !IsLoss(board)) {
        throw std::invalid_argument("saved game is lost but moves remain");
    }
    if (game.status_ != GameStatus::Lost && IsLoss(board)) {
        game.status_ = GameStatus::Lost;
    }
    return game;
}

}  // namespace slide::core
