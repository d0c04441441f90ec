#include "cli.hpp"
#include "game.hpp"
#include "keybinds.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

// Built-in autopilot used when no --script is given: drinks when low, fights
// whatever blocks the way and otherwise walks the shortest path to the stairs.
Action autopilot(const Game& game) {
    const Player& p = game.player();
    const Dungeon& d = game.dungeon();

    if (p.hp * 3 <= p.hpMax && p.potions > 0) return Action::Potion;
    if (d.isStairs(p.pos.x, p.pos.y)) return Action::Descend;

    static const struct { int dx, dy; Action a; } STEPS[] = {
        {0, -1, Action::Up}, {0, 1, Action::Down}, {-1, 0, Action::Left}, {1, 0, Action::Right},
    };

    for (const auto& s : STEPS) {
        if (game.monsterAt(p.pos.x + s.dx, p.pos.y + s.dy)) return s.a;
    }

    const std::vector<int> dist = d.distanceMap(d.stairsDown);
    Action best = Action::Rest;
    int bestD = dist[static_cast<size_t>(p.pos.y * d.width + p.pos.x)];
    for (const auto& s : STEPS) {
        const int nx = p.pos.x + s.dx;
        const int ny = p.pos.y + s.dy;
        if (!d.inBounds(nx, ny)) continue;
        const int v = dist[static_cast<size_t>(ny * d.width + nx)];
        if (v >= 0 && (bestD < 0 || v < bestD)) {
            bestD = v;
            best = s.a;
        }
    }
    return best;
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "dwarfslayer_sim", true);
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        printVersion();
        return 0;
    }

    uint32_t maxTurns = 200;
    std::string script;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;
        if (a == "--turns") {
            if (!argValue(i, argc, argv, v) || !parseU32(v, maxTurns)) {
                std::cerr << "Invalid --turns value\n";
                return 2;
            }
        } else if (a == "--script") {
            if (!argValue(i, argc, argv, script)) {
                std::cerr << "Missing --script value\n";
                return 2;
            }
        } else if (a == "--seed" || a == "--config") {
            ++i; // parsed below
        } else if (a == "--reset-settings") {
            // parsed below
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage(argv[0], true);
            return 2;
        }
    }

    const LaunchOptions opts = parseLaunchOptions(argc, argv);
    if (opts.badSeed) {
        std::cerr << "Invalid --seed value\n";
        return 2;
    }

    const Settings settings = prepareSettings(opts);
    KeyBinds keyBinds = KeyBinds::defaults();
    keyBinds.loadOverridesFromIni(opts.settingsPath);

    Game game;
    game.setConfig(toGameConfig(settings));
    game.newGame(opts.seed ? *opts.seed : 1u);

    // Guards against scripts made only of turn-free keys.
    const uint64_t maxSteps = static_cast<uint64_t>(maxTurns) * 8u + 64u;
    uint64_t steps = 0;
    size_t cursor = 0;

    while (!game.isGameOver() && !game.quitRequested() && game.turns() < maxTurns && steps < maxSteps) {
        ++steps;
        Action act = Action::None;
        if (script.empty()) {
            act = autopilot(game);
        } else {
            const KeyCode key = static_cast<unsigned char>(script[cursor]);
            cursor = (cursor + 1) % script.size();
            act = keyBinds.mapKey(key);
        }
        game.handleAction(act);
    }

    const Player& p = game.player();
    std::cout << "seed=" << game.seed()
              << " turns=" << game.turns()
              << " depth=" << game.depth()
              << " level=" << p.level
              << " hp=" << p.hp << "/" << p.hpMax
              << " kills=" << game.kills()
              << " explored=" << game.dungeon().exploredCount()
              << " result=" << (game.isGameOver() ? "dead" : (game.quitRequested() ? "quit" : "alive"))
              << "\n";
    return 0;
}
