#include "slide/render/SceneRenderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <utility>

#include "slide/app/AssetFS.hpp"

namespace slide::render {

namespace {

using slide::core::Theme;

constexpr float kPi = 3.14159265f;

TTF_Font* LoadFontFromCandidates(const std::vector<std::filesystem::path>& candidates,
                                 int point_size) {
    for (const auto& candidate : candidates) {
        if (!slide::app::FileExists(candidate)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(candidate.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "TTF_OpenFont(%s) failed: %s", candidate.string().c_str(),
                    TTF_GetError());
    }
    return nullptr;
}

// Classic tile colours, indexed by log2(value) - 1, for 2 through 2048.
const std::array<Color, 11> kDarkTiles{{
    Color{238, 228, 218, 255},
    Color{237, 224, 200, 255},
    Color{242, 177, 121, 255},
    Color{245, 149, 99, 255},
    Color{246, 124, 95, 255},
    Color{246, 94, 59, 255},
    Color{237, 207, 114, 255},
    Color{237, 204, 97, 255},
    Color{237, 200, 80, 255},
    Color{237, 197, 63, 255},
    Color{237, 194, 46, 255},
}};

const std::array<Color, 11> kLightTiles{{
    Color{205, 193, 180, 255},
    Color{232, 217, 196, 255},
    Color{237, 177, 121, 255},
    Color{245, 149, 99, 255},
    Color{246, 124, 95, 255},
    Color{246, 94, 59, 255},
    Color{237, 207, 114, 255},
    Color{237, 204, 97, 255},
    Color{237, 200, 80, 255},
    Color{237, 197, 63, 255},
    Color{237, 194, 46, 255},
}};

const Color kSuperTile{60, 58, 50, 255};

const Palette kDarkPalette{
    Color{50, 50, 50, 255},
    Color{92, 86, 80, 255},
    Color{120, 112, 104, 255},
    Color{240, 236, 228, 255},
    Color{176, 170, 160, 255},
    Color{72, 68, 64, 255},
    Color{250, 248, 239, 255},
    Color{237, 194, 46, 255},
};

const Palette kLightPalette{
    Color{250, 248, 239, 255},
    Color{187, 173, 160, 255},
    Color{205, 193, 180, 140},
    Color{119, 110, 101, 255},
    Color{143, 122, 102, 255},
    Color{187, 173, 160, 255},
    Color{255, 255, 255, 255},
    Color{246, 124, 95, 255},
};

int TileRank(int value) {
    int rank = 0;
    while (value > 1) {
        value >>= 1;
        ++rank;
    }
    return rank;
}

SDL_Color ToSdl(Color color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

SDL_FRect MakeRect(float center_x, float center_y, float half) {
    return SDL_FRect{center_x - half, center_y - half, half * 2.0f, half * 2.0f};
}

void FillRect(SDL_Renderer* renderer, const SDL_FRect& rect, Color color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRectF(renderer, &rect);
}

int RenderTextLine(SDL_Renderer* renderer,
                   TTF_Font* font,
                   int x,
                   int y,
                   const std::string& text,
                   SDL_Color color,
                   int* out_width = nullptr) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        int h = surface->h;
        SDL_FreeSurface(surface);
        return h;
    }
    SDL_Rect dst{x, y, surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);

    if (out_width) {
        *out_width = surface->w;
    }
    int height = surface->h;
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
    return height;
}

int RenderWrappedText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      int x,
                      int y,
                      const std::string& text,
                      SDL_Color color,
                      int wrap_width) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface =
        TTF_RenderUTF8_Blended_Wrapped(font, text.c_str(), color, static_cast<Uint32>(wrap_width));
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        int h = surface->h;
        SDL_FreeSurface(surface);
        return h;
    }
    SDL_Rect dst{x, y, surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    int height = surface->h;
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
    return height;
}

// Draws |text| centred on (cx, cy) at |scale|, using color.a as the texture alpha.
void RenderTextCentered(SDL_Renderer* renderer,
                        TTF_Font* font,
                        float cx,
                        float cy,
                        const std::string& text,
                        SDL_Color color,
                        float scale = 1.0f) {
    if (!font || text.empty() || scale <= 0.0f) {
        return;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (texture) {
        SDL_SetTextureAlphaMod(texture, color.a);
        const float w = static_cast<float>(surface->w) * scale;
        const float h = static_cast<float>(surface->h) * scale;
        SDL_FRect dst{cx - w * 0.5f, cy - h * 0.5f, w, h};
        SDL_RenderCopyF(renderer, texture, nullptr, &dst);
        SDL_DestroyTexture(texture);
    }
    SDL_FreeSurface(surface);
}

std::pair<int, int> MeasureText(TTF_Font* font, const std::string& text) {
    if (!font || text.empty()) {
        return {0, 0};
    }
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) != 0) {
        return {0, 0};
    }
    return {w, h};
}

TTF_Font* TileFont(const Fonts& fonts, int value) {
    const int digits = static_cast<int>(std::to_string(value).size());
    TTF_Font* font = fonts.tile_small;
    if (digits <= 2) {
        font = fonts.tile_large;
    } else if (digits == 3) {
        font = fonts.tile_medium;
    }
    if (!font) {
        font = fonts.body;
    }
    return font;
}

void DrawTile(SDL_Renderer* renderer,
              const Fonts& fonts,
              Theme theme,
              float cx,
              float cy,
              float half,
              int value,
              float scale,
              Uint8 alpha) {
    if (half <= 0.0f) {
        return;
    }
    Color fill = TileColor(value, theme);
    fill.a = alpha;
    FillRect(renderer, MakeRect(cx, cy, half), fill);
    SDL_Color text = ToSdl(TileTextColor(value, theme));
    text.a = alpha;
    RenderTextCentered(renderer, TileFont(fonts, value), cx, cy, std::to_string(value), text, scale);
}

int ScaledFontSize(int base_size, float scale) {
    int scaled = static_cast<int>(std::lround(static_cast<double>(base_size) * scale));
    if (scaled <= 0) {
        scaled = base_size;
    }
    return std::max(10, scaled);
}

void DrawScoreBox(SDL_Renderer* renderer,
                  const Fonts& fonts,
                  const Palette& palette,
                  const SDL_FRect& box,
                  const std::string& label,
                  int value) {
    FillRect(renderer, box, palette.score_box);
    SDL_Color label_color = ToSdl(palette.text_secondary);
    SDL_Color value_color = ToSdl(palette.score_text);
    TTF_Font* label_font = fonts.small ? fonts.small : fonts.body;
    TTF_Font* value_font = fonts.heading ? fonts.heading : fonts.body;
    RenderTextCentered(renderer, label_font, box.x + box.w * 0.5f, box.y + box.h * 0.28f, label, label_color);
    RenderTextCentered(renderer, value_font, box.x + box.w * 0.5f, box.y + box.h * 0.66f,
                       std::to_string(value), value_color);
}

void DrawPanelBeside(SDL_Renderer* renderer,
                     const Layout& layout,
                     const Fonts& fonts,
                     const PanelInfo& panel) {
    const Palette& palette = PaletteFor(panel.theme);
    const SDL_Color heading_color = ToSdl(palette.text_primary);
    const SDL_Color detail_color = ToSdl(palette.text_secondary);

    TTF_Font* heading_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.small;
    TTF_Font* small_font = fonts.small ? fonts.small : fonts.body;

    int x = static_cast<int>(layout.panel_left);
    int y = static_cast<int>(layout.panel_top);
    const int wrap_width = std::max(40, static_cast<int>(layout.panel_wrap));

    auto add_line = [&](TTF_Font* font, const std::string& text, SDL_Color color, int spacing) {
        if (!font || text.empty()) {
            return;
        }
        int height = RenderTextLine(renderer, font, x, y, text, color);
        y += height + spacing;
    };

    auto label_value = [&](const std::string& label, const std::string& value) {
        add_line(body_font, label + " " + value, heading_color, 8);
    };

    add_line(fonts.tile_large ? fonts.tile_large : heading_font, "2048", ToSdl(palette.accent), 12);

    const float box_gap = 12.0f;
    const float box_w = (layout.panel_width - box_gap) * 0.5f;
    const float box_h = std::max(56.0f, layout.cell_size * 0.55f);
    DrawScoreBox(renderer, fonts, palette, SDL_FRect{layout.panel_left, static_cast<float>(y), box_w, box_h},
                 "SCORE", panel.score);
    DrawScoreBox(renderer, fonts, palette,
                 SDL_FRect{layout.panel_left + box_w + box_gap, static_cast<float>(y), box_w, box_h}, "BEST",
                 panel.best);
    y += static_cast<int>(box_h) + 20;

    add_line(heading_font, "Session:", heading_color, 6);
    label_value("MOVES:", std::to_string(panel.moves));
    label_value("TIME:", FormatDuration(panel.elapsed_ms));
    label_value("MAX TILE:", std::to_string(panel.max_tile));
    label_value("DIFFICULTY:", panel.difficulty);
    y += 10;

    add_line(heading_font, "Status:", heading_color, 6);
    if (body_font) {
        int height = RenderWrappedText(renderer, body_font, x, y, panel.status.empty() ? "Ready" : panel.status,
                                       heading_color, wrap_width);
        y += height + 16;
    }

    add_line(heading_font, "Controls:", heading_color, 6);
    for (const auto& line : panel.controls) {
        if (!small_font) {
            break;
        }
        int height = RenderWrappedText(renderer, small_font, x, y, line, detail_color, wrap_width);
        y += height + 4;
    }
}

void DrawPanelHeader(SDL_Renderer* renderer,
                     const Layout& layout,
                     const Fonts& fonts,
                     const PanelInfo& panel) {
    const Palette& palette = PaletteFor(panel.theme);
    const SDL_Color primary = ToSdl(palette.text_primary);
    const SDL_Color detail = ToSdl(palette.text_secondary);
    TTF_Font* title_font = fonts.tile_large ? fonts.tile_large : fonts.heading;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.small;
    TTF_Font* small_font = fonts.small ? fonts.small : fonts.body;

    const int x = static_cast<int>(layout.panel_left);
    int y = static_cast<int>(layout.panel_top);

    const float box_gap = 10.0f;
    const float box_w = std::min(140.0f, layout.panel_width * 0.22f);
    const float box_h = std::min(72.0f, layout.panel_height * 0.4f);
    const float boxes_left = layout.panel_left + layout.panel_width - box_w * 2.0f - box_gap;
    DrawScoreBox(renderer, fonts, palette, SDL_FRect{boxes_left, layout.panel_top, box_w, box_h}, "SCORE",
                 panel.score);
    DrawScoreBox(renderer, fonts, palette, SDL_FRect{boxes_left + box_w + box_gap, layout.panel_top, box_w, box_h},
                 "BEST", panel.best);

    RenderTextLine(renderer, title_font, x, y, "2048", ToSdl(palette.accent));
    y = static_cast<int>(layout.panel_top + box_h) + 10;

    const std::string stats = "Moves " + std::to_string(panel.moves) + "   Time " +
                              FormatDuration(panel.elapsed_ms) + "   Max " + std::to_string(panel.max_tile) +
                              "   " + panel.difficulty;
    y += RenderTextLine(renderer, body_font, x, y, stats, primary) + 4;
    y += RenderTextLine(renderer, body_font, x, y, panel.status.empty() ? "Ready" : panel.status, primary) + 4;
    if (!panel.controls.empty()) {
        RenderTextLine(renderer, small_font, x, y, panel.controls.front(), detail);
    }
}

}  // namespace

const Palette& PaletteFor(Theme theme) {
    return theme == Theme::Light ? kLightPalette : kDarkPalette;
}

Color TileColor(int value, Theme theme) {
    const int rank = TileRank(value);
    const auto& tiles = theme == Theme::Light ? kLightTiles : kDarkTiles;
    if (rank < 1) {
        return PaletteFor(theme).empty_cell;
    }
    if (rank > static_cast<int>(tiles.size())) {
        return kSuperTile;
    }
    return tiles[static_cast<std::size_t>(rank - 1)];
}

Color TileTextColor(int value, Theme /*theme*/) {
    if (value <= 4) {
        return Color{119, 110, 101, 255};
    }
    return Color{249, 246, 242, 255};
}

bool Animation::started() const {
    return elapsed_ms >= delay_ms;
}

bool Animation::finished() const {
    return elapsed_ms >= delay_ms + duration_ms;
}

float Animation::progress() const {
    if (!started()) {
        return 0.0f;
    }
    if (duration_ms <= 0.0f) {
        return 1.0f;
    }
    const float t = (elapsed_ms - delay_ms) / duration_ms;
    return std::clamp(t, 0.0f, 1.0f);
}

float Animation::ease() const {
    const float t = progress();
    return t * t * (3.0f - 2.0f * t);
}

Layout ComputeLayout(int window_w, int window_h, int panel_extent_px, int margin_px) {
    const float width = static_cast<float>(std::max(window_w, 1));
    const float height = static_cast<float>(std::max(window_h, 1));
    const float margin = std::max(static_cast<float>(margin_px), std::min(width, height) * 0.025f);

    Layout layout{};
    layout.panel_beside = width >= height * 1.15f;
    if (layout.panel_beside) {
        const float panel_width = std::max(static_cast<float>(panel_extent_px), width * 0.26f);
        const float available_w = std::max(0.0f, width - panel_width - margin * 3.0f);
        const float available_h = std::max(0.0f, height - margin * 2.0f);
        layout.board_size = std::min(available_w, available_h);
        layout.board_left = margin;
        layout.board_top = (height - layout.board_size) * 0.5f;
        layout.panel_left = layout.board_left + layout.board_size + margin;
        layout.panel_top = layout.board_top;
        layout.panel_width = panel_width;
        layout.panel_height = layout.board_size;
    } else {
        const float panel_height = std::min(static_cast<float>(panel_extent_px) * 0.6f, height * 0.25f);
        const float available_w = std::max(0.0f, width - margin * 2.0f);
        const float available_h = std::max(0.0f, height - panel_height - margin * 3.0f);
        layout.board_size = std::min(available_w, available_h);
        layout.board_left = (width - layout.board_size) * 0.5f;
        layout.panel_left = layout.board_left;
        layout.panel_top = margin;
        layout.panel_width = layout.board_size;
        layout.panel_height = panel_height;
        layout.board_top = layout.panel_top + panel_height + margin;
    }
    const float n = static_cast<float>(slide::core::kBoardSize);
    layout.cell_gap = std::max(4.0f, layout.board_size * 0.03f);
    layout.cell_size = std::max(0.0f, (layout.board_size - layout.cell_gap * (n + 1.0f)) / n);
    layout.panel_wrap = layout.panel_width - std::max(16.0f, layout.panel_width * 0.05f);
    return layout;
}

SDL_FPoint CellCenter(const Layout& layout, const slide::core::Cell& cell) {
    SDL_FPoint point;
    const float stride = layout.cell_size + layout.cell_gap;
    point.x = layout.board_left + layout.cell_gap + cell.col * stride + layout.cell_size * 0.5f;
    point.y = layout.board_top + layout.cell_gap + cell.row * stride + layout.cell_size * 0.5f;
    return point;
}

Fonts LoadFonts(float scale) {
    std::vector<std::filesystem::path> search_paths = {
        slide::app::AssetPath("fonts/ClearSans-Bold.ttf"),
        slide::app::AssetPath("fonts/RobotoMono-Bold.ttf"),
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/Library/Fonts/Arial Bold.ttf",
        "C:/Windows/Fonts/arialbd.ttf",
    };

    Fonts fonts;
    fonts.heading = LoadFontFromCandidates(search_paths, ScaledFontSize(26, scale));
    fonts.body = LoadFontFromCandidates(search_paths, ScaledFontSize(20, scale));
    fonts.small = LoadFontFromCandidates(search_paths, ScaledFontSize(15, scale));
    fonts.tile_large = LoadFontFromCandidates(search_paths, ScaledFontSize(52, scale));
    fonts.tile_medium = LoadFontFromCandidates(search_paths, ScaledFontSize(42, scale));
    fonts.tile_small = LoadFontFromCandidates(search_paths, ScaledFontSize(32, scale));
    return fonts;
}

void DestroyFonts(Fonts& fonts) {
    for (TTF_Font** font : {&fonts.heading, &fonts.body, &fonts.small, &fonts.tile_large, &fonts.tile_medium,
                            &fonts.tile_small}) {
        if (*font) {
            TTF_CloseFont(*font);
            *font = nullptr;
        }
    }
}

bool FontsComplete(const Fonts& fonts) {
    return fonts.heading && fonts.body && fonts.small && fonts.tile_large && fonts.tile_medium &&
           fonts.tile_small;
}

Animation MakeSlideAnimation(const Layout& layout,
                             const slide::core::Cell& from,
                             const slide::core::Cell& to,
                             int value,
                             bool reveal_destination,
                             float duration_ms) {
    Animation anim;
    anim.type = Animation::Type::Slide;
    anim.duration_ms = duration_ms;
    SDL_FPoint from_pt = CellCenter(layout, from);
    SDL_FPoint to_pt = CellCenter(layout, to);
    anim.start_x = from_pt.x;
    anim.start_y = from_pt.y;
    anim.end_x = to_pt.x;
    anim.end_y = to_pt.y;
    anim.value = value;
    if (reveal_destination) {
        anim.reveal_cell = to;
    }
    return anim;
}

Animation MakePopAnimation(const Layout& layout,
                           const slide::core::Cell& cell,
                           int value,
                           float delay_ms,
                           float duration_ms) {
    Animation anim;
    anim.type = Animation::Type::Pop;
    anim.duration_ms = duration_ms;
    anim.delay_ms = delay_ms;
    SDL_FPoint pos = CellCenter(layout, cell);
    anim.start_x = anim.end_x = pos.x;
    anim.start_y = anim.end_y = pos.y;
    anim.size_start = 1.2f;
    anim.size_end = 1.0f;
    anim.value = value;
    anim.reveal_cell = cell;
    return anim;
}

Animation MakeSpawnAnimation(const Layout& layout,
                             const slide::core::Cell& cell,
                             int value,
                             float delay_ms,
                             float duration_ms) {
    Animation anim;
    anim.type = Animation::Type::Spawn;
    anim.duration_ms = duration_ms;
    anim.delay_ms = delay_ms;
    SDL_FPoint pos = CellCenter(layout, cell);
    anim.start_x = anim.end_x = pos.x;
    anim.start_y = anim.end_y = pos.y;
    anim.size_start = 0.1f;
    anim.size_end = 1.0f;
    anim.value = value;
    anim.reveal_cell = cell;
    return anim;
}

void UpdateAnimations(std::vector<Animation>& animations,
                      std::set<slide::core::Cell>& hidden_cells,
                      float delta_ms) {
    for (auto& anim : animations) {
        anim.elapsed_ms += delta_ms;
    }

    auto it = animations.begin();
    while (it != animations.end()) {
        if (it->finished()) {
            if (it->reveal_cell) {
                hidden_cells.erase(*it->reveal_cell);
            }
            it = animations.erase(it);
        } else {
            ++it;
        }
    }
}

void EmitMergeParticles(std::vector<Particle>& particles,
                        const Layout& layout,
                        const slide::core::Cell& cell,
                        int value,
                        Theme theme,
                        std::mt19937& rng) {
    const int count = std::min(24, 6 + TileRank(value) * 2);
    if (particles.size() + static_cast<std::size_t>(count) > kMaxParticles) {
        return;
    }
    std::uniform_real_distribution<float> angle(0.0f, 2.0f * kPi);
    std::uniform_real_distribution<float> speed(0.05f, 0.22f);
    std::uniform_real_distribution<float> life(260.0f, 520.0f);
    const SDL_FPoint center = CellCenter(layout, cell);
    const Color color = TileColor(value, theme);
    for (int i = 0; i < count; ++i) {
        Particle p;
        const float a = angle(rng);
        const float s = speed(rng) * std::max(1.0f, layout.cell_size / 100.0f);
        p.x = center.x;
        p.y = center.y;
        p.vx = std::cos(a) * s;
        p.vy = std::sin(a) * s;
        p.size = std::max(3.0f, layout.cell_size * 0.05f);
        p.max_life_ms = life(rng);
        p.life_ms = p.max_life_ms;
        p.color = color;
        particles.push_back(p);
    }
}

void UpdateParticles(std::vector<Particle>& particles, float delta_ms) {
    for (auto& p : particles) {
        p.life_ms -= delta_ms;
        p.x += p.vx * delta_ms;
        p.y += p.vy * delta_ms;
        p.vy += 0.0004f * delta_ms;
    }
    particles.erase(std::remove_if(particles.begin(), particles.end(),
                                   [](const Particle& p) { return p.life_ms <= 0.0f; }),
                    particles.end());
}

void PushNotification(std::vector<Notification>& notifications,
                      std::string text,
                      Color color,
                      float duration_ms) {
    Notification note;
    note.text = std::move(text);
    note.color = color;
    note.duration_ms = duration_ms;
    notifications.push_back(std::move(note));
    if (notifications.size() > 4) {
        notifications.erase(notifications.begin());
    }
}

void UpdateNotifications(std::vector<Notification>& notifications, float delta_ms) {
    for (auto& note : notifications) {
        note.elapsed_ms += delta_ms;
    }
    notifications.erase(std::remove_if(notifications.begin(), notifications.end(),
                                       [](const Notification& n) { return n.elapsed_ms >= n.duration_ms; }),
                        notifications.end());
}

std::string FormatDuration(double ms) {
    if (ms < 0.0) {
        ms = 0.0;
    }
    const long total_seconds = static_cast<long>(ms / 1000.0);
    const long hours = total_seconds / 3600;
    const long minutes = (total_seconds / 60) % 60;
    const long seconds = total_seconds % 60;
    char buffer[24];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld:%02ld", hours, minutes, seconds);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%02ld:%02ld", minutes, seconds);
    }
    return buffer;
}

void ClearBackground(SDL_Renderer* renderer, Theme theme) {
    const Color bg = PaletteFor(theme).background;
    SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, 255);
    SDL_RenderClear(renderer);
}

void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout,
               const Fonts& fonts) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    const Palette& palette = PaletteFor(board_data.theme);
    FillRect(renderer, SDL_FRect{layout.board_left, layout.board_top, layout.board_size, layout.board_size},
             palette.board);

    const float half = layout.cell_size * 0.5f;
    for (int r = 0; r < slide::core::kBoardSize; ++r) {
        for (int c = 0; c < slide::core::kBoardSize; ++c) {
            const slide::core::Cell cell{c, r};
            const SDL_FPoint center = CellCenter(layout, cell);
            FillRect(renderer, MakeRect(center.x, center.y, half), palette.empty_cell);

            if (board_data.hidden_cells.find(cell) != board_data.hidden_cells.end()) {
                continue;
            }
            const int value = board_data.board.get(cell);
            if (value == slide::core::kEmptyTile) {
                continue;
            }
            DrawTile(renderer, fonts, board_data.theme, center.x, center.y, half, value, 1.0f, 255);
        }
    }
}

void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout,
                    const Fonts& fonts,
                    Theme theme) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    const float base_half = layout.cell_size * 0.5f;

    // Slides first so that pops and spawns land on top of them.
    for (int pass = 0; pass < 2; ++pass) {
        for (const auto& anim : animations) {
            const bool is_slide = anim.type == Animation::Type::Slide;
            if ((pass == 0) != is_slide) {
                continue;
            }
            if (!anim.started()) {
                if (is_slide) {
                    DrawTile(renderer, fonts, theme, anim.start_x, anim.start_y, base_half, anim.value, 1.0f, 255);
                }
                continue;
            }
            const float ease = anim.ease();
            const float x = anim.start_x + (anim.end_x - anim.start_x) * ease;
            const float y = anim.start_y + (anim.end_y - anim.start_y) * ease;
            const float size = anim.size_start + (anim.size_end - anim.size_start) * ease;
            DrawTile(renderer, fonts, theme, x, y, base_half * size, anim.value, size, 255);
        }
    }
}

void DrawParticles(SDL_Renderer* renderer, const std::vector<Particle>& particles) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    for (const auto& p : particles) {
        const float t = std::clamp(p.life_ms / p.max_life_ms, 0.0f, 1.0f);
        Color color = p.color;
        color.a = static_cast<Uint8>(255.0f * t);
        FillRect(renderer, MakeRect(p.x, p.y, p.size * (0.5f + 0.5f * t)), color);
    }
}

void DrawNotifications(SDL_Renderer* renderer,
                       const std::vector<Notification>& notifications,
                       const Layout& layout,
                       const Fonts& fonts) {
    TTF_Font* font = fonts.heading ? fonts.heading : fonts.body;
    const float cx = layout.board_left + layout.board_size * 0.5f;
    float cy = layout.board_top + layout.board_size * 0.35f;
    for (const auto& note : notifications) {
        const float t = note.duration_ms > 0.0f ? std::clamp(note.elapsed_ms / note.duration_ms, 0.0f, 1.0f) : 1.0f;
        SDL_Color color = ToSdl(note.color);
        color.a = static_cast<Uint8>(255.0f * (1.0f - t * t));
        RenderTextCentered(renderer, font, cx, cy - t * layout.cell_size * 0.6f, note.text, color, 1.0f + 0.2f * t);
        cy += static_cast<float>(MeasureText(font, note.text).second) + 6.0f;
    }
}

void DrawPanel(SDL_Renderer* renderer,
               const Layout& layout,
               const Fonts& fonts,
               const PanelInfo& panel) {
    if (layout.panel_beside) {
        DrawPanelBeside(renderer, layout, fonts, panel);
    } else {
        DrawPanelHeader(renderer, layout, fonts, panel);
    }
}

}  // namespace slide::render
