#pragma once

#include "game.hpp"
#include "keybinds.hpp"

#include <string>
#include <vector>

struct screen; // curses SCREEN

// ncurses terminal frontend. The map takes the left MAP_W columns, the stats
// and newest-first log sit to its right and the key hint runs along the bottom.
class TermRenderer {
public:
    TermRenderer() = default;
    ~TermRenderer();

    TermRenderer(const TermRenderer&) = delete;
    TermRenderer& operator=(const TermRenderer&) = delete;

    // False when the terminal cannot be set up (unknown TERM, no tty).
    bool init();
    void shutdown();

    void render(const Game& game, const KeyBinds& binds);

    // Blocks for the next key press, translated to a frontend-neutral code.
    // Returns KEY_CODE_NONE for keys with no meaning here (and for resizes).
    KeyCode readKey();

private:
    screen* scr = nullptr;
    bool initialized = false;
    bool hasColor = false;

    void drawMap(const Game& game);
    void drawPanel(const Game& game);
    void drawHint(const KeyBinds& binds);
    void drawOverlay(const std::vector<std::string>& lines);
};
