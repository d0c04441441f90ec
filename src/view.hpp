#pragma once

#include "common.hpp"
#include "game.hpp"
#include "keybinds.hpp"

#include <string>
#include <vector>

// Frontend-neutral description of what the player sees. Both the terminal and
// the SDL frontend draw from these so they agree on glyphs, fog and panel text.

enum class CellLight : uint8_t {
    Hidden = 0,  // never seen: drawn blank
    Remembered,  // explored but out of sight: terrain only, dimmed
    Visible,
};

enum class CellRole : uint8_t {
    Nothing = 0,
    Wall,
    Floor,
    Stairs,
    Player,
    Enemy,
    Potion,
};

struct CellView {
    char glyph = ' ';
    CellLight light = CellLight::Hidden;
    CellRole role = CellRole::Nothing;
};

// Entities and items are only shown on currently visible cells; remembered
// cells show terrain. The player's own cell is always visible.
CellView viewCell(const Game& game, int x, int y);

// A line of panel text plus the color class used to draw it.
struct PanelLine {
    std::string text;
    MessageKind kind = MessageKind::Info;
};

// Title, stats, potion count and the newest-first message log, trimmed to
// `maxLines` lines (the help hint is not included).
std::vector<PanelLine> sidePanelLines(const Game& game, int maxLines);

// One-line key hint shown under the map.
std::string helpHint(const KeyBinds& binds);

std::vector<std::string> inventoryLines(const Game& game);
std::vector<std::string> helpLines(const KeyBinds& binds);
std::vector<std::string> gameOverLines(const Game& game);

// Suggested RGB for a message kind / cell (SDL frontend; curses maps to pairs).
Color messageColor(MessageKind kind);
Color cellColor(const CellView& c);
