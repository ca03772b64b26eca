#include <cassert>
#include <iostream>
#include <stdexcept>

#include "slide/core/GameConfig.hpp"
#include "slide/core/SavePayload.hpp"

using namespace slide::core;

namespace {

void TestConfigDefaults() {
    GameConfig config;
    assert(!config.fullscreen());
    assert(config.theme == Theme::Dark);
    assert(config.difficulty == Difficulty::Medium);
    assert(config.win_target == kDefaultWinTarget);
    assert(config.rules().win_target == kDefaultWinTarget);

    const auto from_garbage = GameConfig::FromJson(Json::array({1, 2, 3}));
    assert(from_garbage.resolution == config.resolution);
}

void TestConfigRoundTrip() {
    GameConfig config;
    config.display_mode = "fullscreen";
    config.resolution = {{1280, 1024}};
    config.theme = Theme::Light;
    config.particle_effects = false;
    config.sound_volume = 0.25f;
    config.difficulty = Difficulty::Easy;
    config.win_target = 4096;
    config.rumble_on = false;

    const auto restored = GameConfig::Deserialize(config.Serialize());
    assert(restored.fullscreen());
    assert(restored.resolution == config.resolution);
    assert(restored.theme == Theme::Light);
    assert(!restored.particle_effects);
    assert(restored.sound_volume == 0.25f);
    assert(restored.difficulty == Difficulty::Easy);
    assert(restored.win_target == 4096);
    assert(!restored.rumble_on);
    assert(restored.rules().difficulty == Difficulty::Easy);
}

void TestConfigIgnoresBadValues() {
    Json json;
    json["display_mode"] = "borderless";
    json["screen_width"] = 99999;
    json["screen_height"] = "tall";
    json["theme"] = "neon";
    json["sound_volume"] = 3.5;
    json["difficulty"] = 2;
    json["win_target"] = 1000;
    json["rumble_on"] = "yes";

    const auto config = GameConfig::FromJson(json);
    const GameConfig defaults;
    assert(config.display_mode == defaults.display_mode);
    assert(config.resolution[0] == 7680);
    assert(config.resolution[1] == defaults.resolution[1]);
    assert(config.theme == defaults.theme);
    assert(config.sound_volume == 1.0f);
    assert(config.difficulty == defaults.difficulty);
    assert(config.win_target == kDefaultWinTarget);
    assert(config.rumble_on == defaults.rumble_on);

    bool threw = false;
    try {
        GameConfig::Deserialize("{ not json");
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
}

Game SampleGame() {
    Game::Rules rules;
    rules.difficulty = Difficulty::Easy;
    rules.win_target = 1024;
    const Board start = Board::FromRows({{2, 2, 4, 0}, {0, 0, 0, 0}, {8, 0, 0, 0}, {0, 0, 0, 16}});
    Game game(rules, start, 7);
    game.move(Direction::Left);
    game.tick(5000.0f);
    return game;
}

void TestSavePayloadRestoresGame() {
    const Game game = SampleGame();
    const auto payload = SavePayload::FromGame(game, 1700000123);
    assert(payload.mode == kClassicMode);
    assert(payload.timestamp() == 1700000123);
    assert(payload.meta["score"].get<int>() == game.score());

    const auto from_text = SavePayload::Deserialize(payload.Serialize()).ToGame(7);
    assert(from_text.board() == game.board());
    assert(from_text.score() == game.score());

    const auto bytes = payload.SerializeBinary();
    assert(!bytes.empty());
    const auto from_binary = SavePayload::DeserializeBinary(bytes);
    assert(from_binary.timestamp() == 1700000123);
    const Game restored = from_binary.ToGame(7);
    assert(restored.board() == game.board());
    assert(restored.moves() == game.moves());
    assert(restored.elapsedMs() == game.elapsedMs());
    assert(restored.rules().difficulty == Difficulty::Easy);
    assert(restored.rules().win_target == 1024);
}

void TestSavePayloadRejectsForeignSaves() {
    auto payload = SavePayload::FromGame(SampleGame(), 1);

    auto future = payload;
    future.version = kSavePayloadVersion + 1;
    bool threw = false;
    try {
        future.ToGame();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto other_mode = payload;
    other_mode.mode = "timed";
    threw = false;
    try {
        other_mode.ToGame();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto empty = payload;
    empty.data = Json::object();
    threw = false;
    try {
        empty.ToGame();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        SavePayload::DeserializeBinary({0xc1});
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);

    assert(SavePayload{}.timestamp() == 0);
}

}  // namespace

int main() {
    TestConfigDefaults();
    TestConfigRoundTrip();
    TestConfigIgnoresBadValues();
    TestSavePayloadRestoresGame();
    TestSavePayloadRejectsForeignSaves();
    std::cout << "All config tests passed.\n";
    return 0;
}
