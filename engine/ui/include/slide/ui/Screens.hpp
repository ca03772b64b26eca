#pragma once

#include <SDL2/SDL.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "slide/core/GameConfig.hpp"
#include "slide/platform/InputEvents.hpp"
#include "slide/platform/ScoreStore.hpp"
#include "slide/render/SceneRenderer.hpp"

namespace slide::ui {

inline constexpr int kHighScoreRows = 10;
inline constexpr float kVolumeStep = 0.1f;

struct MenuState {
    int selected = 0;
    bool continue_available = false;
    std::vector<SDL_Rect> button_bounds;
};

enum class MenuAction { None, Continue, NewGame, HighScores, Settings, Quit };

MenuAction HandleMenuEvent(MenuState& state, const slide::platform::InputEvent& evt);
void RenderMenu(SDL_Renderer* renderer,
                const slide::render::Fonts& fonts,
                int window_width,
                int window_height,
                MenuState& state,
                bool using_controller);

enum class SettingsEntry { Difficulty, Theme, Particles, Volume, DisplayMode, Rumble, Back };

inline constexpr std::array<SettingsEntry, 7> kSettingsEntries{{
    SettingsEntry::Difficulty,
    SettingsEntry::Theme,
    SettingsEntry::Particles,
    SettingsEntry::Volume,
    SettingsEntry::DisplayMode,
    SettingsEntry::Rumble,
    SettingsEntry::Back,
}};

struct SettingsState {
    slide::core::GameConfig config;
    int selected = 0;
    std::array<SDL_Rect, kSettingsEntries.size()> entry_bounds{};
};

enum class SettingsAction { None, Changed, Back };

// Steps |entry| of |config| by |delta|. Returns false for entries with no value.
bool AdjustSetting(slide::core::GameConfig& config, SettingsEntry entry, int delta);
std::string SettingLabel(const slide::core::GameConfig& config, SettingsEntry entry);

SettingsAction HandleSettingsEvent(SettingsState& state, const slide::platform::InputEvent& evt);
void RenderSettings(SDL_Renderer* renderer,
                    const slide::render::Fonts& fonts,
                    int window_width,
                    int window_height,
                    SettingsState& state,
                    bool using_controller);

struct HighScoresState {
    std::optional<slide::core::Difficulty> filter;
    std::vector<slide::platform::ScoreEntry> entries;
    std::optional<slide::platform::DifficultyStats> stats;
    bool store_available = true;
};

enum class HighScoresAction { None, FilterChanged, Back };

// Cycles All -> Easy -> Medium -> Hard -> All.
void CycleScoreFilter(HighScoresState& state, int delta);

HighScoresAction HandleHighScoresEvent(HighScoresState& state, const slide::platform::InputEvent& evt);
void RenderHighScores(SDL_Renderer* renderer,
                      const slide::render::Fonts& fonts,
                      int window_width,
                      int window_height,
                      const HighScoresState& state,
                      bool using_controller);

enum class ResultKind { Won, Lost, Ended };

struct ResultState {
    ResultKind kind = ResultKind::Lost;
    int score = 0;
    int max_tile = 0;
    int moves = 0;
    double elapsed_ms = 0.0;
    int win_target = slide::core::kDefaultWinTarget;
    bool new_best = false;
    int selected = 0;
    std::array<SDL_Rect, 2> button_bounds{};
};

enum class ResultAction { None, KeepGoing, EndGame, NewGame, MainMenu };

ResultAction HandleResultEvent(ResultState& state, const slide::platform::InputEvent& evt);
// Drawn over the board; does not clear the frame.
void RenderResultOverlay(SDL_Renderer* renderer,
                         const slide::render::Fonts& fonts,
                         int window_width,
                         int window_height,
                         ResultState& state,
                         bool using_controller);

struct PauseState {
    int selected = 0;
    std::array<SDL_Rect, 3> button_bounds{};
};

enum class PauseAction { None, Resume, MainMenu, Quit };

PauseAction HandlePauseEvent(PauseState& state, const slide::platform::InputEvent& evt);
void RenderPauseMenu(SDL_Renderer* renderer,
                     const slide::render::Fonts& fonts,
                     int window_width,
                     int window_height,
                     PauseState& state,
                     bool using_controller);

}  // namespace slide::ui
