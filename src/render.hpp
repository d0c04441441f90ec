#pragma once

#include "sdl.hpp"

#include "game.hpp"
#include "keybinds.hpp"

#include <string>
#include <vector>

// SDL2 window frontend: the map is drawn as 5x7 bitmap glyphs on a grid of
// square cells, with the stats/log panel to the right and the key hint below.
class Renderer {
public:
    Renderer(int tileSize, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init();
    void shutdown();

    void render(const Game& game, const KeyBinds& binds);

    void toggleFullscreen();

private:
    static constexpr int PANEL_COLS = 44;
    static constexpr int TEXT_SCALE = 2;

    int tile = 16;
    int winW = 0;
    int winH = 0;
    int panelX = 0;
    int hintY = 0;
    bool vsyncEnabled = true;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    void drawMap(const Game& game);
    void drawPanel(const Game& game);
    void drawHint(const KeyBinds& binds);
    void drawOverlay(const std::vector<std::string>& lines);
};
