#include "slide/ui/Screens.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace slide::ui {

namespace {

using slide::core::Direction;
using slide::platform::Command;
using slide::platform::InputEvent;
using slide::platform::InputEventType;
using slide::platform::PointerButton;

struct UiMetrics {
    int window_w = 0;
    int window_h = 0;
    float scale = 1.0f;
};

constexpr float kReferenceWidth = 800.0f;
constexpr float kReferenceHeight = 900.0f;

const SDL_Color kBackground{36, 34, 32, 255};
const SDL_Color kOverlayDim{0, 0, 0, 150};
const SDL_Color kPanelFill{58, 54, 50, 240};
const SDL_Color kPanelBorder{119, 110, 101, 255};
const SDL_Color kButtonFill{82, 76, 70, 255};
const SDL_Color kButtonHighlight{237, 194, 46, 255};
const SDL_Color kButtonText{40, 36, 30, 255};
const SDL_Color kTextPrimary{249, 246, 242, 255};
const SDL_Color kTextSecondary{187, 173, 160, 255};
const SDL_Color kTextAccent{246, 124, 95, 255};
const SDL_Color kHintBarFill{28, 26, 24, 255};

// Step a move command makes along a list: -1, +1, or 0 for the cross axis.
int ListStep(const InputEvent& evt, bool horizontal) {
    if (!evt.isMove()) {
        return 0;
    }
    switch (evt.direction) {
        case Direction::Left:
            return horizontal ? -1 : 0;
        case Direction::Right:
            return horizontal ? +1 : 0;
        case Direction::Up:
            return horizontal ? 0 : -1;
        case Direction::Down:
            return horizontal ? 0 : +1;
    }
    return 0;
}

bool PointInRect(const SDL_Rect& rect, int x, int y) {
    return x >= rect.x && x < rect.x + rect.w && y >= rect.y && y < rect.y + rect.h;
}

int WrapIndex(int value, int count) {
    if (count <= 0) {
        return 0;
    }
    value %= count;
    if (value < 0) {
        value += count;
    }
    return value;
}

int ClampSelection(int selected, int count) {
    if (count <= 0) {
        return 0;
    }
    return std::clamp(selected, 0, count - 1);
}

UiMetrics ComputeUiMetrics(int window_w, int window_h) {
    UiMetrics metrics;
    metrics.window_w = std::max(window_w, 1);
    metrics.window_h = std::max(window_h, 1);
    const float scale_w = static_cast<float>(metrics.window_w) / kReferenceWidth;
    const float scale_h = static_cast<float>(metrics.window_h) / kReferenceHeight;
    metrics.scale = std::max(0.5f, std::min(scale_w, scale_h));
    return metrics;
}

int UiPx(const UiMetrics& metrics, float logical_px) {
    return static_cast<int>(std::round(logical_px * metrics.scale));
}

SDL_Rect PanelCentered(const UiMetrics& metrics,
                       float logical_width,
                       float logical_height,
                       float logical_offset_y = 0.0f) {
    const int width = std::min(UiPx(metrics, logical_width), metrics.window_w);
    const int height = std::min(UiPx(metrics, logical_height), metrics.window_h);
    SDL_Rect rect{};
    rect.w = width;
    rect.h = height;
    rect.x = (metrics.window_w - width) / 2;
    rect.y = ((metrics.window_h - height) / 2) + UiPx(metrics, logical_offset_y);
    return rect;
}

int TextWidth(TTF_Font* font, const std::string& text) {
    if (!font || text.empty()) {
        return 0;
    }
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) == 0) {
        return w;
    }
    return 0;
}

std::string FitTextToWidth(TTF_Font* font, const std::string& text, int max_width) {
    if (!font || text.empty() || max_width <= 0) {
        return text;
    }
    if (TextWidth(font, text) <= max_width) {
        return text;
    }
    static constexpr const char* kEllipsis = "...";
    const int ellipsis_width = TextWidth(font, kEllipsis);
    if (ellipsis_width >= max_width) {
        return ".";
    }
    std::string trimmed;
    for (char ch : text) {
        trimmed.push_back(ch);
        if (TextWidth(font, trimmed) + ellipsis_width > max_width) {
            trimmed.pop_back();
            break;
        }
    }
    if (trimmed.empty()) {
        return kEllipsis;
    }
    trimmed += kEllipsis;
    return trimmed;
}

void DrawPanel(SDL_Renderer* renderer,
               const SDL_Rect& rect,
               const SDL_Color& fill,
               const SDL_Color& border) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, fill.r, fill.g, fill.b, fill.a);
    SDL_RenderFillRect(renderer, &rect);
    SDL_SetRenderDrawColor(renderer, border.r, border.g, border.b, border.a);
    SDL_RenderDrawRect(renderer, &rect);
}

void DimBackground(SDL_Renderer* renderer, const UiMetrics& metrics) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, kOverlayDim.r, kOverlayDim.g, kOverlayDim.b, kOverlayDim.a);
    SDL_Rect full{0, 0, metrics.window_w, metrics.window_h};
    SDL_RenderFillRect(renderer, &full);
}

void ClearScreen(SDL_Renderer* renderer) {
    SDL_SetRenderDrawColor(renderer, kBackground.r, kBackground.g, kBackground.b, 255);
    SDL_RenderClear(renderer);
}

void RenderText(SDL_Renderer* renderer,
                TTF_Font* font,
                int x,
                int y,
                const std::string& text,
                SDL_Color color) {
    if (!renderer || !font || text.empty()) {
        return;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    SDL_Rect dst{x, y, surface->w, surface->h};
    SDL_FreeSurface(surface);
    if (!texture) {
        return;
    }
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    SDL_DestroyTexture(texture);
}

void RenderFittedText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      int x,
                      int y,
                      int max_width,
                      const std::string& text,
                      SDL_Color color) {
    RenderText(renderer, font, x, y, FitTextToWidth(font, text, max_width), color);
}

void RenderCenteredText(SDL_Renderer* renderer,
                        TTF_Font* font,
                        int window_width,
                        int y,
                        const std::string& text,
                        SDL_Color color) {
    if (!font || text.empty()) {
        return;
    }
    int width = TextWidth(font, text);
    int x = (window_width - width) / 2;
    RenderText(renderer, font, x, y, text, color);
}

void DrawControlHint(SDL_Renderer* renderer,
                     const slide::render::Fonts& fonts,
                     const UiMetrics& metrics,
                     const SDL_Rect& panel,
                     const std::string& text) {
    if (text.empty()) {
        return;
    }
    TTF_Font* font = fonts.small ? fonts.small : fonts.body;
    if (!font) {
        return;
    }
    RenderFittedText(renderer,
                     font,
                     panel.x + UiPx(metrics, 8.0f),
                     panel.y + panel.h + UiPx(metrics, 14.0f),
                     panel.w - UiPx(metrics, 16.0f),
                     text,
                     kTextSecondary);
}

void DrawInfoBar(SDL_Renderer* renderer,
                 const slide::render::Fonts& fonts,
                 const UiMetrics& metrics,
                 const std::string& text) {
    const int height = UiPx(metrics, 44.0f);
    SDL_Rect bar{UiPx(metrics, 40.0f),
                 metrics.window_h - height - UiPx(metrics, 24.0f),
                 metrics.window_w - UiPx(metrics, 80.0f),
                 height};
    DrawPanel(renderer, bar, kHintBarFill, kPanelBorder);
    TTF_Font* font = fonts.small ? fonts.small : fonts.body;
    if (!font) {
        return;
    }
    const std::string fitted = FitTextToWidth(font, text, bar.w - UiPx(metrics, 24.0f));
    const int text_h = TTF_FontHeight(font);
    RenderText(renderer,
               font,
               bar.x + (bar.w - TextWidth(font, fitted)) / 2,
               bar.y + (bar.h - text_h) / 2,
               fitted,
               kTextSecondary);
}

// Draws a column of buttons inside |panel| starting at |top| and records
// each button rectangle into |bounds|.
void DrawButtonColumn(SDL_Renderer* renderer,
                      TTF_Font* font,
                      const UiMetrics& metrics,
                      const SDL_Rect& panel,
                      int top,
                      const std::vector<std::string>& labels,
                      int selected,
                      SDL_Rect* bounds) {
    const int button_height = UiPx(metrics, 58.0f);
    const int button_gap = UiPx(metrics, 14.0f);
    const int button_left = panel.x + UiPx(metrics, 36.0f);
    const int button_width = panel.w - UiPx(metrics, 72.0f);
    int y = top;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        SDL_Rect rect{button_left, y, button_width, button_height};
        bounds[i] = rect;
        const bool is_selected = selected == static_cast<int>(i);
        DrawPanel(renderer, rect, is_selected ? kButtonHighlight : kButtonFill, kPanelBorder);
        if (font) {
            const int text_h = TTF_FontHeight(font);
            RenderFittedText(renderer,
                             font,
                             rect.x + UiPx(metrics, 20.0f),
                             rect.y + (rect.h - text_h) / 2,
                             rect.w - UiPx(metrics, 40.0f),
                             labels[i],
                             is_selected ? kButtonText : kTextPrimary);
        }
        y += button_height + button_gap;
    }
}

enum class NavResult { None, Activate, Back };

// Shared list navigation: pointer hover and click over |bounds|, move
// commands along the list axis, confirm and back. |horizontal| lays the list
// out left to right.
NavResult NavigateList(const InputEvent& evt, int& selected, int count, const SDL_Rect* bounds, bool horizontal) {
    selected = ClampSelection(selected, count);
    auto hit = [&](int x, int y) -> int {
        for (int i = 0; i < count; ++i) {
            if (PointInRect(bounds[i], x, y)) {
                return i;
            }
        }
        return -1;
    };

    switch (evt.type) {
        case InputEventType::PointerMove: {
            const int index = hit(evt.x, evt.y);
            if (index >= 0) {
                selected = index;
            }
            break;
        }
        case InputEventType::PointerDown:
            if (evt.button == PointerButton::Primary) {
                const int index = hit(evt.x, evt.y);
                if (index >= 0) {
                    selected = index;
                    return NavResult::Activate;
                }
            } else if (evt.button == PointerButton::Secondary) {
                return NavResult::Back;
            }
            break;
        case InputEventType::Command:
            if (const int step = ListStep(evt, horizontal)) {
                selected = WrapIndex(selected + step, count);
            } else if (evt.command == Command::Confirm) {
                return NavResult::Activate;
            } else if (evt.command == Command::Back || evt.command == Command::Pause) {
                return NavResult::Back;
            }
            break;
        default:
            break;
    }
    return NavResult::None;
}

std::vector<MenuAction> MenuEntries(const MenuState& state) {
    std::vector<MenuAction> entries;
    if (state.continue_available) {
        entries.push_back(MenuAction::Continue);
    }
    entries.push_back(MenuAction::NewGame);
    entries.push_back(MenuAction::HighScores);
    entries.push_back(MenuAction::Settings);
    entries.push_back(MenuAction::Quit);
    return entries;
}

std::string MenuLabel(MenuAction action) {
    switch (action) {
        case MenuAction::Continue:
            return "Continue";
        case MenuAction::NewGame:
            return "New Game";
        case MenuAction::HighScores:
            return "High Scores";
        case MenuAction::Settings:
            return "Settings";
        case MenuAction::Quit:
            return "Quit";
        default:
            return {};
    }
}

std::string MenuDescription(MenuAction action) {
    switch (action) {
        case MenuAction::Continue:
            return "Resume the game you left";
        case MenuAction::NewGame:
            return "Start a fresh board";
        case MenuAction::HighScores:
            return "Best games per difficulty";
        case MenuAction::Settings:
            return "Difficulty, theme, sound and display";
        case MenuAction::Quit:
            return "Close the game";
        default:
            return {};
    }
}

std::string FilterLabel(const std::optional<slide::core::Difficulty>& filter) {
    if (!filter) {
        return "All";
    }
    std::string label = slide::core::DifficultyToString(*filter);
    if (!label.empty()) {
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    }
    return label;
}

std::string FormatDate(std::int64_t timestamp) {
    const std::time_t when = static_cast<std::time_t>(timestamp);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &when);
#else
    localtime_r(&when, &local);
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local) == 0) {
        return "-";
    }
    return buffer;
}

std::string OnOff(bool value) {
    return value ? "On" : "Off";
}

}  // namespace

MenuAction HandleMenuEvent(MenuState& state, const InputEvent& evt) {
    const std::vector<MenuAction> entries = MenuEntries(state);
    const int count = static_cast<int>(entries.size());
    state.button_bounds.resize(entries.size());
    NavResult nav = NavigateList(evt, state.selected, count, state.button_bounds.data(), false);
    if (nav == NavResult::Activate) {
        return entries[static_cast<std::size_t>(state.selected)];
    }
    if (nav == NavResult::Back) {
        return MenuAction::Quit;
    }
    return MenuAction::None;
}

void RenderMenu(SDL_Renderer* renderer,
                const slide::render::Fonts& fonts,
                int window_width,
                int window_height,
                MenuState& state,
                bool using_controller) {
    const std::vector<MenuAction> entries = MenuEntries(state);
    state.selected = ClampSelection(state.selected, static_cast<int>(entries.size()));
    state.button_bounds.resize(entries.size());

    UiMetrics metrics = ComputeUiMetrics(window_width, window_height);
    ClearScreen(renderer);

    SDL_Rect panel = PanelCentered(metrics, 520.0f, 480.0f, 30.0f);
    DrawPanel(renderer, panel, kPanelFill, kPanelBorder);

    TTF_Font* title_font = fonts.tile_large ? fonts.tile_large : fonts.heading;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;
    if (title_font) {
        RenderCenteredText(renderer, title_font, window_width,
                           panel.y - TTF_FontHeight(title_font) - UiPx(metrics, 24.0f), "2048", kButtonHighlight);
    }

    std::vector<std::string> labels;
    labels.reserve(entries.size());
    for (MenuAction action : entries) {
        labels.push_back(MenuLabel(action));
    }
    DrawButtonColumn(renderer, body_font, metrics, panel, panel.y + UiPx(metrics, 36.0f), labels, state.selected,
                     state.button_bounds.data());

    const std::string control_hint =
        using_controller ? "D-Pad/Stick move | A select | B quit" : "Mouse click | Enter select | Esc quit";
    DrawControlHint(renderer, fonts, metrics, panel, control_hint);
    DrawInfoBar(renderer, fonts, metrics, MenuDescription(entries[static_cast<std::size_t>(state.selected)]));
}

bool AdjustSetting(slide::core::GameConfig& config, SettingsEntry entry, int delta) {
    using slide::core::Difficulty;
    using slide::core::Theme;
    if (delta == 0) {
        return false;
    }
    switch (entry) {
        case SettingsEntry::Difficulty: {
            const int next = WrapIndex(static_cast<int>(config.difficulty) + delta, 3);
            config.difficulty = static_cast<Difficulty>(next);
            return true;
        }
        case SettingsEntry::Theme:
            config.theme = config.theme == Theme::Dark ? Theme::Light : Theme::Dark;
            return true;
        case SettingsEntry::Particles:
            config.particle_effects = !config.particle_effects;
            return true;
        case SettingsEntry::Volume: {
            const float steps = std::round(config.sound_volume / kVolumeStep) + static_cast<float>(delta);
            config.sound_volume = std::clamp(steps * kVolumeStep, 0.0f, 1.0f);
            return true;
        }
        case SettingsEntry::DisplayMode:
            config.display_mode = config.fullscreen() ? "windowed" : "fullscreen";
            return true;
        case SettingsEntry::Rumble:
            config.rumble_on = !config.rumble_on;
            return true;
        case SettingsEntry::Back:
            return false;
    }
    return false;
}

std::string SettingLabel(const slide::core::GameConfig& config, SettingsEntry entry) {
    switch (entry) {
        case SettingsEntry::Difficulty:
            return "Difficulty: " + FilterLabel(config.difficulty);
        case SettingsEntry::Theme:
            return std::string("Theme: ") + (config.theme == slide::core::Theme::Dark ? "Dark" : "Light");
        case SettingsEntry::Particles:
            return "Particles: " + OnOff(config.particle_effects);
        case SettingsEntry::Volume:
            return "Volume: " + std::to_string(static_cast<int>(std::lround(config.sound_volume * 100.0f))) + "%";
        case SettingsEntry::DisplayMode:
            return std::string("Display: ") + (config.fullscreen() ? "Fullscreen" : "Windowed");
        case SettingsEntry::Rumble:
            return "Rumble: " + OnOff(config.rumble_on);
        case SettingsEntry::Back:
            return "Back";
    }
    return {};
}

SettingsAction HandleSettingsEvent(SettingsState& state, const InputEvent& evt) {
    const int count = static_cast<int>(kSettingsEntries.size());
    state.selected = ClampSelection(state.selected, count);
    const SettingsEntry current = kSettingsEntries[static_cast<std::size_t>(state.selected)];

    auto adjust = [&](SettingsEntry entry, int delta) -> SettingsAction {
        return AdjustSetting(state.config, entry, delta) ? SettingsAction::Changed : SettingsAction::None;
    };

    if (const int step = ListStep(evt, true)) {
        return adjust(current, step);
    }
    if (evt.type == InputEventType::PointerDown && evt.button == PointerButton::Secondary) {
        // Right click on a value steps it backwards; elsewhere it leaves the screen.
        for (int i = 0; i < count; ++i) {
            const SettingsEntry entry = kSettingsEntries[static_cast<std::size_t>(i)];
            if (entry != SettingsEntry::Back &&
                PointInRect(state.entry_bounds[static_cast<std::size_t>(i)], evt.x, evt.y)) {
                state.selected = i;
                return adjust(entry, -1);
            }
        }
    }

    NavResult nav = NavigateList(evt, state.selected, count, state.entry_bounds.data(), false);
    if (nav == NavResult::Back) {
        return SettingsAction::Back;
    }
    if (nav == NavResult::Activate) {
        const SettingsEntry entry = kSettingsEntries[static_cast<std::size_t>(state.selected)];
        if (entry == SettingsEntry::Back) {
            return SettingsAction::Back;
        }
        return adjust(entry, +1);
    }
    return SettingsAction::None;
}

void RenderSettings(SDL_Renderer* renderer,
                    const slide::render::Fonts& fonts,
                    int window_width,
                    int window_height,
                    SettingsState& state,
                    bool using_controller) {
    const int count = static_cast<int>(kSettingsEntries.size());
    state.selected = ClampSelection(state.selected, count);
    UiMetrics metrics = ComputeUiMetrics(window_width, window_height);
    ClearScreen(renderer);

    SDL_Rect panel = PanelCentered(metrics, 560.0f, 560.0f, -10.0f);
    DrawPanel(renderer, panel, kPanelFill, kPanelBorder);

    TTF_Font* title_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;
    if (title_font) {
        RenderCenteredText(renderer, title_font, window_width,
                           panel.y - TTF_FontHeight(title_font) - UiPx(metrics, 12.0f), "Settings", kTextPrimary);
    }

    std::vector<std::string> labels;
    labels.reserve(kSettingsEntries.size());
    for (SettingsEntry entry : kSettingsEntries) {
        labels.push_back(SettingLabel(state.config, entry));
    }
    DrawButtonColumn(renderer, body_font, metrics, panel, panel.y + UiPx(metrics, 20.0f), labels, state.selected,
                     state.entry_bounds.data());

    const std::string control_hint =
        using_controller ? "D-Pad up/down move | left/right change | B back"
                         : "Arrows move and change | click to change | Esc back";
    DrawControlHint(renderer, fonts, metrics, panel, control_hint);

    std::string info;
    switch (kSettingsEntries[static_cast<std::size_t>(state.selected)]) {
        case SettingsEntry::Difficulty:
            info = "Chance of a 4 tile: easy 5%, medium 10%, hard 15%. Applies to new games.";
            break;
        case SettingsEntry::Theme:
            info = "Colour scheme for the board and tiles";
            break;
        case SettingsEntry::Particles:
            info = "Particle bursts when tiles merge";
            break;
        case SettingsEntry::Volume:
            info = "Master volume for music and effects";
            break;
        case SettingsEntry::DisplayMode:
            info = "Switch between windowed and fullscreen";
            break;
        case SettingsEntry::Rumble:
            info = "Controller rumble on win and game over";
            break;
        case SettingsEntry::Back:
            info = "Save settings and return to the menu";
            break;
    }
    DrawInfoBar(renderer, fonts, metrics, info);
}

void CycleScoreFilter(HighScoresState& state, int delta) {
    // Index 0 is every difficulty, 1..3 map to Easy..Hard.
    const int current = state.filter ? static_cast<int>(*state.filter) + 1 : 0;
    const int next = WrapIndex(current + delta, 4);
    if (next == 0) {
        state.filter.reset();
    } else {
        state.filter = static_cast<slide::core::Difficulty>(next - 1);
    }
}

HighScoresAction HandleHighScoresEvent(HighScoresState& state, const InputEvent& evt) {
    auto cycle = [&](int delta) {
        CycleScoreFilter(state, delta);
        return HighScoresAction::FilterChanged;
    };

    if (const int step = ListStep(evt, true)) {
        return cycle(step);
    }
    switch (evt.type) {
        case InputEventType::Command:
            if (evt.command == Command::Back || evt.command == Command::Confirm || evt.command == Command::Pause) {
                return HighScoresAction::Back;
            }
            break;
        case InputEventType::PointerDown:
            if (evt.button == PointerButton::Primary) {
                return cycle(+1);
            }
            if (evt.button == PointerButton::Secondary) {
                return HighScoresAction::Back;
            }
            break;
        default:
            break;
    }
    return HighScoresAction::None;
}

void RenderHighScores(SDL_Renderer* renderer,
                      const slide::render::Fonts& fonts,
                      int window_width,
                      int window_height,
                      const HighScoresState& state,
                      bool using_controller) {
    UiMetrics metrics = ComputeUiMetrics(window_width, window_height);
    ClearScreen(renderer);

    SDL_Rect panel = PanelCentered(metrics, 700.0f, 620.0f, -10.0f);
    DrawPanel(renderer, panel, kPanelFill, kPanelBorder);

    TTF_Font* title_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;
    TTF_Font* small_font = fonts.small ? fonts.small : body_font;
    if (title_font) {
        RenderCenteredText(renderer, title_font, window_width,
                           panel.y - TTF_FontHeight(title_font) - UiPx(metrics, 12.0f),
                           "High Scores - " + FilterLabel(state.filter), kTextPrimary);
    }

    const int left = panel.x + UiPx(metrics, 28.0f);
    const int inner_width = panel.w - UiPx(metrics, 56.0f);
    int y = panel.y + UiPx(metrics, 20.0f);
    const int line_height = body_font ? TTF_FontHeight(body_font) + UiPx(metrics, 8.0f) : UiPx(metrics, 30.0f);

    if (!state.store_available) {
        RenderFittedText(renderer, body_font, left, y, inner_width, "Score database unavailable", kTextAccent);
        DrawControlHint(renderer, fonts, metrics, panel, using_controller ? "B back" : "Esc back");
        return;
    }

    if (state.stats) {
        const auto& stats = *state.stats;
        const double avg_moves =
            stats.games_played > 0 ? static_cast<double>(stats.total_moves) / stats.games_played : 0.0;
        char summary[160];
        std::snprintf(summary, sizeof(summary), "Games %d   Wins %d   Best tile %d   Avg moves %.0f   Played %s",
                      stats.games_played, stats.wins, stats.best_tile, avg_moves,
                      slide::render::FormatDuration(stats.total_seconds * 1000.0).c_str());
        RenderFittedText(renderer, small_font, left, y, inner_width, summary, kTextSecondary);
        y += line_height;
    }

    // rank, score, tile, moves, time, date
    const std::array<float, 6> columns{{0.0f, 0.1f, 0.32f, 0.48f, 0.63f, 0.8f}};
    auto column_x = [&](std::size_t index) { return left + static_cast<int>(inner_width * columns[index]); };
    const std::array<const char*, 6> headers{{"#", "Score", "Tile", "Moves", "Time", "Date"}};
    for (std::size_t i = 0; i < headers.size(); ++i) {
        RenderText(renderer, small_font, column_x(i), y, headers[i], kTextSecondary);
    }
    y += line_height;

    if (state.entries.empty()) {
        RenderFittedText(renderer, body_font, left, y, inner_width, "No games recorded yet", kTextPrimary);
    }

    int rank = 1;
    for (const auto& entry : state.entries) {
        if (rank > kHighScoreRows) {
            break;
        }
        const SDL_Color color = entry.won ? kButtonHighlight : kTextPrimary;
        RenderText(renderer, body_font, column_x(0), y, std::to_string(rank), color);
        RenderText(renderer, body_font, column_x(1), y, std::to_string(entry.score), color);
        RenderText(renderer, body_font, column_x(2), y, std::to_string(entry.max_tile), color);
        RenderText(renderer, body_font, column_x(3), y, std::to_string(entry.moves), color);
        RenderText(renderer, body_font, column_x(4), y,
                   slide::render::FormatDuration(entry.duration_seconds * 1000.0), color);
        RenderText(renderer, body_font, column_x(5), y, FormatDate(entry.played_at), color);
        y += line_height;
        ++rank;
    }

    const std::string control_hint =
        using_controller ? "D-Pad left/right filter | B back" : "Left/Right or click filter | Esc back";
    DrawControlHint(renderer, fonts, metrics, panel, control_hint);
}

ResultAction HandleResultEvent(ResultState& state, const InputEvent& evt) {
    NavResult nav = NavigateList(evt, state.selected, 2, state.button_bounds.data(), true);
    if (state.kind == ResultKind::Won) {
        if (nav == NavResult::Activate) {
            return state.selected == 0 ? ResultAction::KeepGoing : ResultAction::EndGame;
        }
        if (nav == NavResult::Back) {
            return ResultAction::KeepGoing;
        }
        return ResultAction::None;
    }
    if (nav == NavResult::Activate) {
        return state.selected == 0 ? ResultAction::NewGame : ResultAction::MainMenu;
    }
    if (nav == NavResult::Back) {
        return ResultAction::MainMenu;
    }
    if (evt.is(Command::NewGame)) {
        return ResultAction::NewGame;
    }
    return ResultAction::None;
}

void RenderResultOverlay(SDL_Renderer* renderer,
                         const slide::render::Fonts& fonts,
                         int window_width,
                         int window_height,
                         ResultState& state,
                         bool using_controller) {
    state.selected = ClampSelection(state.selected, 2);
    UiMetrics metrics = ComputeUiMetrics(window_width, window_height);
    DimBackground(renderer, metrics);

    SDL_Rect panel = PanelCentered(metrics, 520.0f, 340.0f);
    DrawPanel(renderer, panel, kPanelFill, kPanelBorder);

    TTF_Font* title_font = fonts.tile_medium ? fonts.tile_medium : fonts.heading;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;

    std::string title;
    std::array<std::string, 2> labels;
    switch (state.kind) {
        case ResultKind::Won:
            title = "You made " + std::to_string(state.win_target) + "!";
            labels = {{"Keep Going", "End Game"}};
            break;
        case ResultKind::Lost:
            title = "Game Over";
            labels = {{"New Game", "Main Menu"}};
            break;
        case ResultKind::Ended:
            title = "Game Ended";
            labels = {{"New Game", "Main Menu"}};
            break;
    }

    int y = panel.y + UiPx(metrics, 24.0f);
    if (title_font) {
        RenderCenteredText(renderer, title_font, window_width, y, title,
                           state.kind == ResultKind::Lost ? kTextAccent : kButtonHighlight);
        y += TTF_FontHeight(title_font) + UiPx(metrics, 12.0f);
    }
    if (body_font) {
        const std::string stats = "Score " + std::to_string(state.score) + "   Tile " +
                                  std::to_string(state.max_tile) + "   Moves " + std::to_string(state.moves) +
                                  "   " + slide::render::FormatDuration(state.elapsed_ms);
        RenderCenteredText(renderer, body_font, window_width, y, stats, kTextPrimary);
        y += TTF_FontHeight(body_font) + UiPx(metrics, 6.0f);
        if (state.new_best) {
            RenderCenteredText(renderer, body_font, window_width, y, "New best score!", kButtonHighlight);
        }
    }

    const int button_gap = UiPx(metrics, 20.0f);
    const int button_width = (panel.w - UiPx(metrics, 72.0f) - button_gap) / 2;
    const int button_height = UiPx(metrics, 58.0f);
    const int button_top = panel.y + panel.h - button_height - UiPx(metrics, 28.0f);
    for (int i = 0; i < 2; ++i) {
        SDL_Rect rect{panel.x + UiPx(metrics, 36.0f) + i * (button_width + button_gap), button_top, button_width,
                      button_height};
        state.button_bounds[static_cast<std::size_t>(i)] = rect;
        const bool selected = state.selected == i;
        DrawPanel(renderer, rect, selected ? kButtonHighlight : kButtonFill, kPanelBorder);
        if (body_font) {
            const std::string& label = labels[static_cast<std::size_t>(i)];
            RenderText(renderer, body_font, rect.x + (rect.w - TextWidth(body_font, label)) / 2,
                       rect.y + (rect.h - TTF_FontHeight(body_font)) / 2, label,
                       selected ? kButtonText : kTextPrimary);
        }
    }

    const std::string control_hint =
        using_controller ? "D-Pad left/right choose | A confirm" : "Left/Right choose | Enter confirm";
    DrawControlHint(renderer, fonts, metrics, panel, control_hint);
}

PauseAction HandlePauseEvent(PauseState& state, const InputEvent& evt) {
    NavResult nav = NavigateList(evt, state.selected, 3, state.button_bounds.data(), false);
    if (nav == NavResult::Back) {
        return PauseAction::Resume;
    }
    if (nav != NavResult::Activate) {
        return PauseAction::None;
    }
    switch (state.selected) {
        case 0:
            return PauseAction::Resume;
        case 1:
            return PauseAction::MainMenu;
        default:
            return PauseAction::Quit;
    }
}

void RenderPauseMenu(SDL_Renderer* renderer,
                     const slide::render::Fonts& fonts,
                     int window_width,
                     int window_height,
                     PauseState& state,
                     bool using_controller) {
    state.selected = ClampSelection(state.selected, 3);
    UiMetrics metrics = ComputeUiMetrics(window_width, window_height);
    DimBackground(renderer, metrics);

    SDL_Rect panel = PanelCentered(metrics, 440.0f, 330.0f);
    DrawPanel(renderer, panel, kPanelFill, kPanelBorder);

    TTF_Font* title_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;
    int top = panel.y + UiPx(metrics, 20.0f);
    if (title_font) {
        RenderCenteredText(renderer, title_font, window_width, top, "Paused", kTextPrimary);
        top += TTF_FontHeight(title_font) + UiPx(metrics, 16.0f);
    }
    DrawButtonColumn(renderer, body_font, metrics, panel, top, {"Resume", "Main Menu", "Quit"}, state.selected,
                     state.button_bounds.data());

    const std::string control_hint =
        using_controller ? "D-Pad move | A select | B resume" : "Enter select | Esc resume";
    DrawControlHint(renderer, fonts, metrics, panel, control_hint);
}

}  // namespace slide::ui
