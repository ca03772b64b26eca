#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "slide/core/Board.hpp"
#include "slide/core/GameConfig.hpp"

namespace slide::render {

struct Layout {
    float board_left{};
    float board_top{};
    float board_size{};
    float cell_size{};
    float cell_gap{};
    float panel_left{};
    float panel_top{};
    float panel_width{};
    float panel_height{};
    float panel_wrap{};
    bool panel_beside = false;
};

struct Color {
    Uint8 r{255};
    Uint8 g{255};
    Uint8 b{255};
    Uint8 a{255};
};

struct Palette {
    Color background{};
    Color board{};
    Color empty_cell{};
    Color text_primary{};
    Color text_secondary{};
    Color score_box{};
    Color score_text{};
    Color accent{};
};

const Palette& PaletteFor(slide::core::Theme theme);
Color TileColor(int value, slide::core::Theme theme);
Color TileTextColor(int value, slide::core::Theme theme);

struct Animation {
    enum class Type { Slide, Pop, Spawn };

    Type type = Type::Slide;
    float duration_ms = 0.0f;
    float delay_ms = 0.0f;
    float elapsed_ms = 0.0f;
    float size_start = 1.0f;
    float size_end = 1.0f;
    float start_x = 0.0f;
    float start_y = 0.0f;
    float end_x = 0.0f;
    float end_y = 0.0f;
    int value = slide::core::kEmptyTile;
    std::optional<slide::core::Cell> reveal_cell;

    bool started() const;
    bool finished() const;
    float progress() const;
    float ease() const;
};

struct Particle {
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    float size = 4.0f;
    float life_ms = 0.0f;
    float max_life_ms = 1.0f;
    Color color{};
};

struct Notification {
    std::string text;
    Color color{};
    float elapsed_ms = 0.0f;
    float duration_ms = 0.0f;
};

struct Fonts {
    TTF_Font* heading = nullptr;
    TTF_Font* body = nullptr;
    TTF_Font* small = nullptr;
    TTF_Font* tile_large = nullptr;
    TTF_Font* tile_medium = nullptr;
    TTF_Font* tile_small = nullptr;
};

struct BoardRenderData {
    const slide::core::Board& board;
    const std::set<slide::core::Cell>& hidden_cells;
    slide::core::Theme theme = slide::core::Theme::Dark;
};

struct PanelInfo {
    int score = 0;
    int best = 0;
    int moves = 0;
    double elapsed_ms = 0.0;
    int max_tile = 0;
    std::string difficulty;
    std::string status;
    std::vector<std::string> controls;
    slide::core::Theme theme = slide::core::Theme::Dark;
};

inline constexpr float kSlideDurationMs = 110.0f;
inline constexpr float kPopDurationMs = 150.0f;
inline constexpr float kSpawnDurationMs = 150.0f;
inline constexpr float kNotificationDurationMs = 1100.0f;
inline constexpr std::size_t kMaxParticles = 400;

Layout ComputeLayout(int window_w,
                     int window_h,
                     int panel_extent_px = 340,
                     int margin_px = 28);

SDL_FPoint CellCenter(const Layout& layout, const slide::core::Cell& cell);

Fonts LoadFonts(float scale);
void DestroyFonts(Fonts& fonts);
bool FontsComplete(const Fonts& fonts);

Animation MakeSlideAnimation(const Layout& layout,
                             const slide::core::Cell& from,
                             const slide::core::Cell& to,
                             int value,
                             bool reveal_destination,
                             float duration_ms);
Animation MakePopAnimation(const Layout& layout,
                           const slide::core::Cell& cell,
                           int value,
                           float delay_ms,
                           float duration_ms);
Animation MakeSpawnAnimation(const Layout& layout,
                             const slide::core::Cell& cell,
                             int value,
                             float delay_ms,
                             float duration_ms);

// Advances every animation and reveals the cell of each one that finishes.
void UpdateAnimations(std::vector<Animation>& animations,
                      std::set<slide::core::Cell>& hidden_cells,
                      float delta_ms);

void EmitMergeParticles(std::vector<Particle>& particles,
                        const Layout& layout,
                        const slide::core::Cell& cell,
                        int value,
                        slide::core::Theme theme,
                        std::mt19937& rng);
void UpdateParticles(std::vector<Particle>& particles, float delta_ms);

void PushNotification(std::vector<Notification>& notifications,
                      std::string text,
                      Color color,
                      float duration_ms = kNotificationDurationMs);
void UpdateNotifications(std::vector<Notification>& notifications, float delta_ms);

std::string FormatDuration(double ms);

void ClearBackground(SDL_Renderer* renderer, slide::core::Theme theme);
void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout,
               const Fonts& fonts);
void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout,
                    const Fonts& fonts,
                    slide::core::Theme theme);
void DrawParticles(SDL_Renderer* renderer, const std::vector<Particle>& particles);
void DrawNotifications(SDL_Renderer* renderer,
                       const std::vector<Notification>& notifications,
                       const Layout& layout,
                       const Fonts& fonts);
void DrawPanel(SDL_Renderer* renderer,
               const Layout& layout,
               const Fonts& fonts,
               const PanelInfo& panel);

}  // namespace slide::render
