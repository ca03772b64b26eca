#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_ttf.h>
#include <SDL2/SDL_image.h>

#include "slide/app/AssetFS.hpp"
#include "slide/app/ConfigFile.hpp"
#include "slide/core/Game.hpp"
#include "slide/core/GameConfig.hpp"
#include "slide/core/SavePayload.hpp"
#include "slide/platform/AudioSystem.hpp"
#include "slide/platform/ScoreStore.hpp"
#include "slide/platform/SdlInput.hpp"
#include "slide/platform/SdlSaveService.hpp"
#include "slide/render/SceneRenderer.hpp"
#include "slide/ui/Screens.hpp"

using slide::app::AssetPath;
using slide::app::FileExists;
using slide::core::Cell;
using slide::core::Direction;
using slide::core::Game;
using slide::core::GameConfig;
using slide::core::GameStatus;
using slide::platform::AudioSystem;
using slide::platform::Command;
using slide::platform::InputDevice;
using slide::platform::InputEvent;
using slide::platform::InputEventType;
using slide::platform::ScoreStore;
using slide::platform::SdlInput;
using slide::platform::SdlSaveService;
using slide::render::Animation;
using slide::render::BoardRenderData;
using slide::render::ComputeLayout;
using slide::render::DestroyFonts;
using slide::render::LoadFonts;
using slide::render::Notification;
using slide::render::PanelInfo;
using slide::render::Particle;
using Layout = slide::render::Layout;
using Fonts = slide::render::Fonts;

namespace {

constexpr int kLogicalWidth = 800;
constexpr int kLogicalHeight = 900;
constexpr int kMinWindowWidth = 420;
constexpr int kMinWindowHeight = 480;
constexpr float kRumbleStrength = 0.6f;
constexpr Uint32 kRumbleDurationMs = 250;

enum class AppScreen { MainMenu, Settings, HighScores, Gameplay };

// Everything drawn on top of the logical board for the current game.
struct BoardView {
    std::vector<Animation> animations;
    std::set<Cell> hidden_cells;
    std::vector<Particle> particles;
    std::vector<Notification> notifications;

    void finishAnimations() {
        animations.clear();
        hidden_cells.clear();
    }

    void clear() {
        finishAnimations();
        particles.clear();
        notifications.clear();
    }
};

std::int64_t Now() {
    return static_cast<std::int64_t>(std::time(nullptr));
}

void ApplyWindowIcon(SDL_Window* window) {
    if (!window) {
        return;
    }
    std::filesystem::path path = AssetPath("icon.png");
    if (!FileExists(path)) {
        return;
    }
    SDL_Surface* icon = IMG_Load(path.string().c_str());
    if (!icon) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load window icon: %s", IMG_GetError());
        return;
    }
    SDL_SetWindowIcon(window, icon);
    SDL_FreeSurface(icon);
}

float ComputeUiScale(int window_w, int window_h) {
    if (window_w <= 0 || window_h <= 0) {
        return 1.0f;
    }
    const float scale_w = static_cast<float>(window_w) / static_cast<float>(kLogicalWidth);
    const float scale_h = static_cast<float>(window_h) / static_cast<float>(kLogicalHeight);
    return std::clamp(std::min(scale_w, scale_h), 0.6f, 3.0f);
}

void QueueTurnAnimations(BoardView& view,
                         const Layout& layout,
                         const Game::TurnResult& turn,
                         const GameConfig& config,
                         std::mt19937& rng) {
    using namespace slide::render;
    view.finishAnimations();
    for (const auto& event : turn.move.slides) {
        view.hidden_cells.insert(event.to);
        const bool reveal = !event.merged && event.from != event.to;
        view.animations.push_back(
            MakeSlideAnimation(layout, event.from, event.to, event.value, reveal, kSlideDurationMs));
    }
    for (const Cell& cell : turn.move.mergedCells()) {
        const int value = turn.move.board.get(cell);
        view.hidden_cells.insert(cell);
        view.animations.push_back(MakePopAnimation(layout, cell, value, kSlideDurationMs, kPopDurationMs));
        if (config.particle_effects) {
            EmitMergeParticles(view.particles, layout, cell, value, config.theme, rng);
        }
    }
    if (turn.spawn) {
        view.hidden_cells.insert(turn.spawn->cell);
        view.animations.push_back(MakeSpawnAnimation(layout, turn.spawn->cell, turn.spawn->value,
                                                     kSlideDurationMs, kSpawnDurationMs));
    }
}

int LargestMerge(const slide::core::MoveResult& move) {
    int largest = 0;
    for (const Cell& cell : move.mergedCells()) {
        largest = std::max(largest, move.board.get(cell));
    }
    return largest;
}

std::string StatusText(const Game& game) {
    const std::string target = std::to_string(game.rules().win_target);
    switch (game.status()) {
        case GameStatus::Playing:
            return "Join the tiles to reach " + target;
        case GameStatus::Won:
            return "You reached " + target + "!";
        case GameStatus::Continuing:
            return "Keep going! Best tile " + std::to_string(game.maxTile());
        case GameStatus::Lost:
            return "No moves left";
        case GameStatus::Ended:
            return "Game ended";
    }
    return {};
}

std::vector<std::string> ControlLines(bool using_controller) {
    if (using_controller) {
        return {"D-Pad / Stick: slide", "Y: new game", "Back: mute", "Start: pause"};
    }
    return {"Arrows / WASD: slide", "N: new game", "M: mute", "Esc: pause"};
}

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_GAMECONTROLLER) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }
    SDL_SetHint(SDL_HINT_VIDEO_MINIMIZE_ON_FOCUS_LOSS, "0");

    const int img_flags = IMG_INIT_PNG;
    int img_result = IMG_Init(img_flags);
    bool img_ready = (img_result & img_flags) == img_flags;
    if (!img_ready) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    SdlSaveService saves;
    if (!saves.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Save directory unavailable, progress will not persist");
    }
    GameConfig config = slide::app::LoadConfig(saves);

    AudioSystem audio;
    bool audio_ready = audio.Initialize(config.sound_volume);
    if (!audio_ready) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Audio disabled");
    }

    auto release_libraries = [&]() {
        if (audio_ready) {
            audio.Shutdown();
        }
        if (img_result != 0) {
            IMG_Quit();
        }
        TTF_Quit();
        SDL_Quit();
    };

    SDL_Rect usable_bounds;
    if (SDL_GetDisplayUsableBounds(0, &usable_bounds) != 0) {
        usable_bounds = SDL_Rect{0, 0, kLogicalWidth, kLogicalHeight};
    }
    const int base_width = std::clamp(config.resolution[0], kMinWindowWidth, std::max(kMinWindowWidth, usable_bounds.w));
    const int base_height =
        std::clamp(config.resolution[1], kMinWindowHeight, std::max(kMinWindowHeight, usable_bounds.h));

    Uint32 window_flags = SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI | SDL_WINDOW_RESIZABLE;
    SDL_Window* window = SDL_CreateWindow("Slide 2048", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, base_width,
                                          base_height, window_flags);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        release_libraries();
        return 1;
    }
    if (img_ready) {
        ApplyWindowIcon(window);
    }
    SDL_SetWindowMinimumSize(window, kMinWindowWidth, kMinWindowHeight);

    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        release_libraries();
        return 1;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    bool fullscreen = false;
    auto apply_window_mode = [&](bool want_fullscreen) -> bool {
        if (want_fullscreen == fullscreen) {
            return true;
        }
        if (SDL_SetWindowFullscreen(window, want_fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to %s fullscreen: %s",
                        want_fullscreen ? "enter" : "exit", SDL_GetError());
            return false;
        }
        if (!want_fullscreen) {
            SDL_SetWindowSize(window, base_width, base_height);
            SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
        }
        fullscreen = want_fullscreen;
        return true;
    };
    if (config.fullscreen() && !apply_window_mode(true)) {
        config.display_mode = "windowed";
    }

    float font_scale = ComputeUiScale(base_width, base_height);
    Fonts fonts = LoadFonts(font_scale);
    if (!slide::render::FontsComplete(fonts)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to load required fonts.");
        DestroyFonts(fonts);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        release_libraries();
        return 1;
    }

    ScoreStore scores(saves.root() / "scores.db");
    const bool store_ready = scores.Open();
    if (!store_ready) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "High scores disabled");
    }

    SdlInput input;
    if (!input.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SdlInput initialization failed: %s", SDL_GetError());
    }

    std::mt19937 effects_rng{std::random_device{}()};
    Game game(config.rules());
    BoardView view;
    bool recorded = false;
    int best_score = 0;
    bool pause_active = false;
    bool result_active = false;

    slide::ui::MenuState menu_state;
    slide::ui::SettingsState settings_state;
    slide::ui::HighScoresState high_scores_state;
    slide::ui::ResultState result_state;
    slide::ui::PauseState pause_state;

    AppScreen current_screen = AppScreen::MainMenu;
    InputDevice last_device = input.HasControllers() ? InputDevice::Controller : InputDevice::MouseKeyboard;

    auto set_window_title = [&](const std::string& text) { SDL_SetWindowTitle(window, text.c_str()); };

    auto refresh_best = [&]() {
        best_score = store_ready ? scores.BestScore(game.rules().difficulty) : 0;
    };

    auto rumble = [&]() {
        if (config.rumble_on) {
            input.RumbleControllers(kRumbleStrength, kRumbleDurationMs);
        }
    };

    auto open_main_menu = [&]() {
        current_screen = AppScreen::MainMenu;
        pause_active = false;
        result_active = false;
        menu_state.continue_available = saves.HasAutoSave();
        menu_state.selected = 0;
        set_window_title("Slide 2048 - Main Menu");
    };

    auto show_result = [&](slide::ui::ResultKind kind, bool new_best) {
        result_state = slide::ui::ResultState{};
        result_state.kind = kind;
        result_state.score = game.score();
        result_state.max_tile = game.maxTile();
        result_state.moves = game.moves();
        result_state.elapsed_ms = game.elapsedMs();
        result_state.win_target = game.rules().win_target;
        result_state.new_best = new_best;
        result_active = true;
    };

    // Persists a finished game once and drops the autosave it came from.
    auto record_game = [&]() -> bool {
        if (recorded) {
            return false;
        }
        recorded = true;
        const bool new_best = game.score() > best_score;
        if (store_ready && !scores.RecordGame(game.record(Now()))) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Game result was not saved");
        }
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Game over: score %d, tile %d, %d moves, %.0fs (%s)",
                    game.score(), game.maxTile(), game.moves(), game.durationSeconds(),
                    slide::core::DifficultyToString(game.rules().difficulty).c_str());
        saves.DeleteAutoSave();
        refresh_best();
        return new_best;
    };

    auto autosave_game = [&]() {
        if (current_screen != AppScreen::Gameplay || game.finished() || recorded) {
            return;
        }
        auto payload = slide::core::SavePayload::FromGame(game, Now());
        if (!saves.AutoSave(payload.SerializeBinary())) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Autosave failed");
        }
    };

    auto load_autosave = [&]() -> std::optional<Game> {
        std::vector<std::uint8_t> bytes;
        if (!saves.LoadAutoSave(bytes)) {
            return std::nullopt;
        }
        try {
            auto payload = slide::core::SavePayload::DeserializeBinary(bytes);
            Game restored = payload.ToGame();
            if (restored.finished()) {
                throw std::invalid_argument("saved game is already over");
            }
            return restored;
        } catch (const std::exception& ex) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Discarding corrupt autosave: %s", ex.what());
            saves.DeleteAutoSave();
        }
        return std::nullopt;
    };

    auto enter_gameplay = [&]() {
        view.clear();
        pause_active = false;
        result_active = false;
        current_screen = AppScreen::Gameplay;
        refresh_best();
        set_window_title("Slide 2048 - " + slide::core::DifficultyToString(game.rules().difficulty));
    };

    // A session that already reached the target counts as a finished game
    // when it is replaced.
    auto abandon_session = [&]() {
        if (!recorded && game.won() && !game.finished()) {
            game.end();
            record_game();
        }
    };

    auto start_new_game = [&]() {
        if (current_screen == AppScreen::Gameplay) {
            abandon_session();
        } else if (auto previous = load_autosave()) {
            game = std::move(*previous);
            recorded = false;
            abandon_session();
        }
        saves.DeleteAutoSave();
        game = Game(config.rules());
        recorded = false;
        enter_gameplay();
    };

    auto resume_game = [&]() -> bool {
        auto restored = load_autosave();
        if (!restored) {
            menu_state.continue_available = false;
            return false;
        }
        game = std::move(*restored);
        recorded = false;
        enter_gameplay();
        if (game.status() == GameStatus::Won) {
            show_result(slide::ui::ResultKind::Won, false);
        }
        return true;
    };

    auto refresh_high_scores = [&]() {
        high_scores_state.store_available = store_ready;
        if (!store_ready) {
            high_scores_state.entries.clear();
            high_scores_state.stats.reset();
            return;
        }
        high_scores_state.entries = scores.TopScores(slide::ui::kHighScoreRows, high_scores_state.filter);
        high_scores_state.stats.reset();
        if (high_scores_state.filter) {
            high_scores_state.stats = scores.Stats(*high_scores_state.filter);
        }
    };

    auto apply_settings = [&](const GameConfig& updated) {
        const bool display_changed = updated.fullscreen() != config.fullscreen();
        config = updated;
        if (audio_ready) {
            audio.SetVolume(config.sound_volume);
        }
        if (display_changed && !apply_window_mode(config.fullscreen())) {
            config.display_mode = fullscreen ? "fullscreen" : "windowed";
            settings_state.config.display_mode = config.display_mode;
        }
    };

    auto play_turn = [&](Direction direction, const Layout& layout) {
        view.finishAnimations();
        if (!game.acceptsMoves()) {
            return;
        }
        Game::TurnResult turn = game.move(direction);
        if (!turn.accepted) {
            if (audio_ready) {
                audio.PlayInvalid();
            }
            return;
        }
        QueueTurnAnimations(view, layout, turn, config, effects_rng);
        const slide::render::Palette& palette = slide::render::PaletteFor(config.theme);
        if (turn.move.score_delta > 0) {
            slide::render::PushNotification(view.notifications, "+" + std::to_string(turn.move.score_delta),
                                            palette.accent);
        }
        if (audio_ready) {
            if (turn.move.merge_count > 0) {
                audio.PlayMerge(LargestMerge(turn.move));
            } else {
                audio.PlaySlide();
            }
        }
        if (turn.reached_target) {
            slide::render::PushNotification(view.notifications, std::to_string(game.rules().win_target) + "!",
                                            palette.accent, slide::render::kNotificationDurationMs * 1.5f);
        }
        switch (turn.outcome()) {
            case Game::Outcome::Won:
                if (audio_ready) {
                    audio.PlayWin();
                }
                rumble();
                show_result(slide::ui::ResultKind::Won, false);
                break;
            case Game::Outcome::Lost: {
                if (audio_ready) {
                    audio.PlayGameOver();
                }
                rumble();
                const bool new_best = record_game();
                show_result(slide::ui::ResultKind::Lost, new_best);
                break;
            }
            case Game::Outcome::Continue:
                break;
        }
    };

    open_main_menu();
    if (audio_ready) {
        audio.StartMusicLoop();
    }

    bool running = true;
    Uint64 last_counter = SDL_GetPerformanceCounter();
    const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());

    while (running) {
        int current_w = 0;
        int current_h = 0;
        SDL_GetWindowSize(window, &current_w, &current_h);

        const float desired_font_scale = ComputeUiScale(current_w, current_h);
        if (std::abs(desired_font_scale - font_scale) > 0.05f) {
            Fonts new_fonts = LoadFonts(desired_font_scale);
            if (slide::render::FontsComplete(new_fonts)) {
                DestroyFonts(fonts);
                fonts = new_fonts;
                font_scale = desired_font_scale;
            } else {
                DestroyFonts(new_fonts);
            }
        }

        const int panel_px = static_cast<int>(std::lround(340.0f * font_scale));
        const int margin_px = static_cast<int>(std::lround(28.0f * font_scale));
        const Layout layout = ComputeLayout(current_w, current_h, panel_px, margin_px);

        auto polled_events = input.Poll();
        for (const auto& evt : polled_events) {
            if (evt.type == InputEventType::Quit) {
                autosave_game();
                running = false;
                break;
            }

            if (evt.type == InputEventType::PointerMove || evt.type == InputEventType::PointerDown ||
                evt.type == InputEventType::Command) {
                if (evt.device != last_device) {
                    last_device = evt.device;
                    SDL_ShowCursor(last_device == InputDevice::Controller ? SDL_DISABLE : SDL_ENABLE);
                }
            }

            if (current_screen == AppScreen::MainMenu) {
                switch (slide::ui::HandleMenuEvent(menu_state, evt)) {
                    case slide::ui::MenuAction::Continue:
                        if (audio_ready) {
                            audio.PlayClick();
                        }
                        resume_game();
                        break;
                    case slide::ui::MenuAction::NewGame:
                        if (audio_ready) {
                            audio.PlayClick();
                        }
                        start_new_game();
                        break;
                    case slide::ui::MenuAction::HighScores:
                        if (audio_ready) {
                            audio.PlayClick();
                        }
                        high_scores_state.filter = config.difficulty;
                        refresh_high_scores();
                        current_screen = AppScreen::HighScores;
                        set_window_title("Slide 2048 - High Scores");
                        break;
                    case slide::ui::MenuAction::Settings:
                        if (audio_ready) {
                            audio.PlayClick();
                        }
                        settings_state = slide::ui::SettingsState{};
                        settings_state.config = config;
                        current_screen = AppScreen::Settings;
                        set_window_title("Slide 2048 - Settings");
                        break;
                    case slide::ui::MenuAction::Quit:
                        running = false;
                        break;
                    case slide::ui::MenuAction::None:
                        break;
                }
                if (!running) {
                    break;
                }
                continue;
            }

            if (current_screen == AppScreen::Settings) {
                switch (slide::ui::HandleSettingsEvent(settings_state, evt)) {
                    case slide::ui::SettingsAction::Changed:
                        if (audio_ready) {
                            audio.PlayClick();
                        }
                        apply_settings(settings_state.config);
                        break;
                    case slide::ui::SettingsAction::Back:
                        slide::app::SaveConfig(saves, config);
                        open_main_menu();
                        break;
                    case slide::ui::SettingsAction::None:
                        break;
                }
                continue;
            }

            if (current_screen == AppScreen::HighScores) {
                switch (slide::ui::HandleHighScoresEvent(high_scores_state, evt)) {
                    case slide::ui::HighScoresAction::FilterChanged:
                        refresh_high_scores();
                        break;
                    case slide::ui::HighScoresAction::Back:
                        open_main_menu();
                        break;
                    case slide::ui::HighScoresAction::None:
                        break;
                }
                continue;
            }

            // Gameplay
            if (result_active) {
                switch (slide::ui::HandleResultEvent(result_state, evt)) {
                    case slide::ui::ResultAction::KeepGoing:
                        game.keepGoing();
                        result_active = false;
                        break;
                    case slide::ui::ResultAction::EndGame: {
                        game.end();
                        const bool new_best = record_game();
                        show_result(slide::ui::ResultKind::Ended, new_best);
                        break;
                    }
                    case slide::ui::ResultAction::NewGame:
                        start_new_game();
                        break;
                    case slide::ui::ResultAction::MainMenu:
                        open_main_menu();
                        break;
                    case slide::ui::ResultAction::None:
                        break;
                }
                continue;
            }

            if (pause_active) {
                switch (slide::ui::HandlePauseEvent(pause_state, evt)) {
                    case slide::ui::PauseAction::Resume:
                        pause_active = false;
                        break;
                    case slide::ui::PauseAction::MainMenu:
                        autosave_game();
                        open_main_menu();
                        break;
                    case slide::ui::PauseAction::Quit:
                        autosave_game();
                        running = false;
                        break;
                    case slide::ui::PauseAction::None:
                        break;
                }
                if (!running) {
                    break;
                }
                continue;
            }

            if (evt.type == InputEventType::FocusLost) {
                pause_state = slide::ui::PauseState{};
                pause_active = true;
                continue;
            }
            if (evt.type != InputEventType::Command) {
                continue;
            }
            switch (evt.command) {
                case Command::Move:
                    if (!evt.repeat) {
                        play_turn(evt.direction, layout);
                    }
                    break;
                case Command::Back:
                case Command::Pause:
                    pause_state = slide::ui::PauseState{};
                    pause_active = true;
                    break;
                case Command::NewGame:
                    start_new_game();
                    break;
                case Command::ToggleMute:
                    if (audio_ready) {
                        audio.SetMuted(!audio.muted());
                        slide::render::PushNotification(view.notifications, audio.muted() ? "Muted" : "Sound on",
                                                        slide::render::PaletteFor(config.theme).text_primary);
                    }
                    break;
                case Command::Confirm:
                case Command::None:
                    break;
            }
        }

        if (!running) {
            break;
        }

        Uint64 now = SDL_GetPerformanceCounter();
        const float delta_ms = static_cast<float>((now - last_counter) * 1000.0 / frequency);
        last_counter = now;

        const bool render_using_controller = (last_device == InputDevice::Controller);

        if (current_screen == AppScreen::MainMenu) {
            slide::ui::RenderMenu(renderer, fonts, current_w, current_h, menu_state, render_using_controller);
            SDL_RenderPresent(renderer);
            continue;
        }

        if (current_screen == AppScreen::Settings) {
            slide::ui::RenderSettings(renderer, fonts, current_w, current_h, settings_state,
                                      render_using_controller);
            SDL_RenderPresent(renderer);
            continue;
        }

        if (current_screen == AppScreen::HighScores) {
            slide::ui::RenderHighScores(renderer, fonts, current_w, current_h, high_scores_state,
                                        render_using_controller);
            SDL_RenderPresent(renderer);
            continue;
        }

        if (!pause_active && !result_active) {
            game.tick(delta_ms);
        }
        slide::render::UpdateAnimations(view.animations, view.hidden_cells, delta_ms);
        slide::render::UpdateParticles(view.particles, delta_ms);
        slide::render::UpdateNotifications(view.notifications, delta_ms);

        slide::render::ClearBackground(renderer, config.theme);
        BoardRenderData board_render{game.board(), view.hidden_cells, config.theme};
        slide::render::DrawBoard(renderer, board_render, layout, fonts);
        slide::render::DrawAnimations(renderer, view.animations, layout, fonts, config.theme);
        slide::render::DrawParticles(renderer, view.particles);
        slide::render::DrawNotifications(renderer, view.notifications, layout, fonts);

        PanelInfo panel;
        panel.score = game.score();
        panel.best = std::max(best_score, game.score());
        panel.moves = game.moves();
        panel.elapsed_ms = game.elapsedMs();
        panel.max_tile = game.maxTile();
        panel.difficulty = slide::core::DifficultyToString(game.rules().difficulty);
        panel.status = StatusText(game);
        panel.controls = ControlLines(render_using_controller);
        panel.theme = config.theme;
        slide::render::DrawPanel(renderer, layout, fonts, panel);

        if (result_active) {
            slide::ui::RenderResultOverlay(renderer, fonts, current_w, current_h, result_state,
                                           render_using_controller);
        } else if (pause_active) {
            slide::ui::RenderPauseMenu(renderer, fonts, current_w, current_h, pause_state, render_using_controller);
        }

        SDL_RenderPresent(renderer);
    }

    input.Shutdown();
    scores.Close();
    SDL_ShowCursor(SDL_ENABLE);

    DestroyFonts(fonts);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    release_libraries();
    return 0;
}
