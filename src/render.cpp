#include "render.hpp"

#include "ui_font.hpp"
#include "version.hpp"
#include "view.hpp"

#include <algorithm>
#include <iostream>

namespace {

constexpr int LINE_H = (7 + 1) * 2 + 2;
constexpr int CHAR_W = (5 + 1) * 2;

} // namespace

Renderer::Renderer(int tileSize, bool vsync)
    : tile(tileSize), vsyncEnabled(vsync) {
    panelX = Game::MAP_W * tile + 12;
    winW = panelX + PANEL_COLS * CHAR_W + 8;
    hintY = Game::MAP_H * tile + 8;
    winH = std::max(hintY + LINE_H + 8, 28 * LINE_H);
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(DWARFSLAYER_APPNAME) + " v" + DWARFSLAYER_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Keep a fixed "virtual" resolution and let SDL scale the final output.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP);
}

void Renderer::render(const Game& game, const KeyBinds& binds) {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, 8, 8, 12, 255);
    SDL_RenderClear(renderer);

    drawMap(game);
    drawPanel(game);
    drawHint(binds);

    if (game.isGameOver()) {
        drawOverlay(gameOverLines(game));
    } else if (game.isHelpOpen()) {
        drawOverlay(helpLines(binds));
    } else if (game.isInventoryOpen()) {
        drawOverlay(inventoryLines(game));
    }

    SDL_RenderPresent(renderer);
}

void Renderer::drawMap(const Game& game) {
    const Dungeon& d = game.dungeon();
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            const CellView c = viewCell(game, x, y);
            if (c.light == CellLight::Hidden) continue;

            const int px = x * tile;
            const int py = y * tile;

            // Lit floor gets a faint backdrop so the view cone reads at a glance.
            if (c.light == CellLight::Visible && c.role != CellRole::Wall) {
                SDL_Rect bg{px, py, tile, tile};
                SDL_SetRenderDrawColor(renderer, 24, 22, 18, 255);
                SDL_RenderFillRect(renderer, &bg);
            }

            drawCellGlyph(renderer, px, py, tile, cellColor(c), c.glyph);
        }
    }
}

void Renderer::drawPanel(const Game& game) {
    const int maxLines = std::max(1, (winH - 16) / LINE_H);
    const std::vector<PanelLine> lines = sidePanelLines(game, maxLines);

    int y = 8;
    for (const auto& ln : lines) {
        std::string text = ln.text;
        if (static_cast<int>(text.size()) > PANEL_COLS) text.resize(static_cast<size_t>(PANEL_COLS));
        drawText5x7(renderer, panelX, y, TEXT_SCALE, messageColor(ln.kind), text);
        y += LINE_H;
    }
}

void Renderer::drawHint(const KeyBinds& binds) {
    const Color gray{150, 150, 150, 255};
    drawText5x7(renderer, 8, hintY, 1, gray, helpHint(binds));
}

void Renderer::drawOverlay(const std::vector<std::string>& lines) {
    size_t widest = 0;
    for (const auto& l : lines) widest = std::max(widest, l.size());

    const int w = static_cast<int>(widest) * CHAR_W + 32;
    const int h = static_cast<int>(lines.size()) * LINE_H + 24;
    const int mapW = Game::MAP_W * tile;
    const int mapH = Game::MAP_H * tile;
    SDL_Rect box{std::max(0, (mapW - w) / 2), std::max(0, (mapH - h) / 2), w, h};

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 220);
    SDL_RenderFillRect(renderer, &box);
    SDL_SetRenderDrawColor(renderer, 200, 180, 120, 255);
    SDL_RenderDrawRect(renderer, &box);

    const Color white{240, 240, 240, 255};
    int y = box.y + 12;
    for (const auto& l : lines) {
        drawText5x7(renderer, box.x + 16, y, TEXT_SCALE, white, l);
        y += LINE_H;
    }
}
