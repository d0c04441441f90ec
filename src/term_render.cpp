#include "term_render.hpp"

#include "view.hpp"

#include <algorithm>

// After the standard headers: curses defines function-like macros (erase, move).
#include <curses.h>

namespace {

enum ColorPair : short {
    PAIR_DEFAULT = 1,
    PAIR_WALL,
    PAIR_FLOOR,
    PAIR_REMEMBERED,
    PAIR_PLAYER,
    PAIR_ENEMY,
    PAIR_POTION,
    PAIR_STAIRS,
    PAIR_COMBAT,
    PAIR_LOOT,
    PAIR_SYSTEM,
    PAIR_WARNING,
    PAIR_SUCCESS,
};

constexpr int PANEL_X = Game::MAP_W + 2;

short pairForCell(const CellView& c) {
    if (c.light == CellLight::Remembered) return PAIR_REMEMBERED;
    switch (c.role) {
        case CellRole::Wall:   return PAIR_WALL;
        case CellRole::Floor:  return PAIR_FLOOR;
        case CellRole::Stairs: return PAIR_STAIRS;
        case CellRole::Player: return PAIR_PLAYER;
        case CellRole::Enemy:  return PAIR_ENEMY;
        case CellRole::Potion: return PAIR_POTION;
        default:               return PAIR_DEFAULT;
    }
}

short pairForKind(MessageKind k) {
    switch (k) {
        case MessageKind::Combat:  return PAIR_COMBAT;
        case MessageKind::Loot:    return PAIR_LOOT;
        case MessageKind::System:  return PAIR_SYSTEM;
        case MessageKind::Warning: return PAIR_WARNING;
        case MessageKind::Success: return PAIR_SUCCESS;
        default:                   return PAIR_DEFAULT;
    }
}

} // namespace

TermRenderer::~TermRenderer() {
    shutdown();
}

bool TermRenderer::init() {
    if (initialized) return true;

    // initscr() exits the process on failure; newterm() reports it instead.
    scr = newterm(nullptr, stdout, stdin);
    if (!scr) return false;
    set_term(scr);

    cbreak();
    noecho();
    nonl();
    intrflush(stdscr, FALSE);
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    hasColor = has_colors();
    if (hasColor) {
        start_color();
        use_default_colors();
        init_pair(PAIR_DEFAULT, COLOR_WHITE, -1);
        init_pair(PAIR_WALL, COLOR_YELLOW, -1);
        init_pair(PAIR_FLOOR, COLOR_WHITE, -1);
        init_pair(PAIR_REMEMBERED, COLOR_BLUE, -1);
        init_pair(PAIR_PLAYER, COLOR_WHITE, -1);
        init_pair(PAIR_ENEMY, COLOR_RED, -1);
        init_pair(PAIR_POTION, COLOR_CYAN, -1);
        init_pair(PAIR_STAIRS, COLOR_WHITE, -1);
        init_pair(PAIR_COMBAT, COLOR_RED, -1);
        init_pair(PAIR_LOOT, COLOR_YELLOW, -1);
        init_pair(PAIR_SYSTEM, COLOR_CYAN, -1);
        init_pair(PAIR_WARNING, COLOR_MAGENTA, -1);
        init_pair(PAIR_SUCCESS, COLOR_GREEN, -1);
    }

    // Must call refresh() for ncurses to update COLS and LINES.
    refresh();
    initialized = true;
    return true;
}

void TermRenderer::shutdown() {
    if (!initialized) return;
    curs_set(1);
    endwin();
    delscreen(scr);
    scr = nullptr;
    initialized = false;
}

KeyCode TermRenderer::readKey() {
    const int ch = getch();
    switch (ch) {
        case ERR: return KEY_CODE_ESCAPE; // input closed
        case KEY_UP: return KEY_CODE_UP;
        case KEY_DOWN: return KEY_CODE_DOWN;
        case KEY_LEFT: return KEY_CODE_LEFT;
        case KEY_RIGHT: return KEY_CODE_RIGHT;
        case KEY_ENTER:
        case '\r':
        case '\n': return KEY_CODE_ENTER;
        case 27: return KEY_CODE_ESCAPE;
        default: break;
    }
    if (ch > 0 && ch < 127) return ch;
    return KEY_CODE_NONE;
}

void TermRenderer::render(const Game& game, const KeyBinds& binds) {
    erase();

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

    refresh();
}

void TermRenderer::drawMap(const Game& game) {
    const Dungeon& d = game.dungeon();
    for (int y = 0; y < d.height && y < LINES; ++y) {
        for (int x = 0; x < d.width && x < COLS; ++x) {
            const CellView c = viewCell(game, x, y);
            if (c.light == CellLight::Hidden) continue;

            attr_t a = (c.light == CellLight::Visible) ? A_BOLD : A_DIM;
            if (hasColor) a |= COLOR_PAIR(pairForCell(c));
            attron(a);
            mvaddch(y, x, static_cast<chtype>(static_cast<unsigned char>(c.glyph)));
            attroff(a);
        }
    }
}

void TermRenderer::drawPanel(const Game& game) {
    const int width = COLS - PANEL_X;
    if (width <= 0) return;

    const int maxLines = std::max(1, LINES - 2);
    const std::vector<PanelLine> lines = sidePanelLines(game, maxLines);

    int y = 0;
    for (const auto& ln : lines) {
        const attr_t a = hasColor ? COLOR_PAIR(pairForKind(ln.kind)) : A_NORMAL;
        attron(a);
        mvaddnstr(y, PANEL_X, ln.text.c_str(), width);
        attroff(a);
        ++y;
    }
}

void TermRenderer::drawHint(const KeyBinds& binds) {
    const int y = std::min(LINES - 1, Game::MAP_H + 1);
    if (y < 0) return;
    attron(A_DIM);
    mvaddnstr(y, 0, helpHint(binds).c_str(), COLS);
    attroff(A_DIM);
}

void TermRenderer::drawOverlay(const std::vector<std::string>& lines) {
    int widest = 0;
    for (const auto& l : lines) widest = std::max(widest, static_cast<int>(l.size()));

    const int w = widest + 4;
    const int h = static_cast<int>(lines.size()) + 2;
    const int x0 = std::max(0, (Game::MAP_W - w) / 2);
    const int y0 = std::max(0, (Game::MAP_H - h) / 2);

    for (int y = y0; y < y0 + h && y < LINES; ++y) {
        mvhline(y, x0, ' ', std::min(w, COLS - x0));
    }

    attron(A_BOLD);
    mvhline(y0, x0, '-', std::min(w, COLS - x0));
    mvhline(y0 + h - 1, x0, '-', std::min(w, COLS - x0));
    attroff(A_BOLD);

    int y = y0 + 1;
    for (const auto& l : lines) {
        mvaddnstr(y, x0 + 2, l.c_str(), std::max(0, COLS - x0 - 2));
        ++y;
    }
}
