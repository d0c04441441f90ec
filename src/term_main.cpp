#include <iostream>
#include <string>

#include "cli.hpp"
#include "game.hpp"
#include "keybinds.hpp"
#include "settings.hpp"
#include "term_render.hpp"

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "dwarfslayer", false);
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        printVersion();
        return 0;
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
    game.newGame(opts.seed ? *opts.seed : randomSeed());

    {
        TermRenderer term;
        if (!term.init()) {
            std::cerr << "Could not initialise the terminal\n";
            return 1;
        }

        term.render(game, keyBinds);
        for (;;) {
            const KeyCode key = term.readKey();
            if (game.isGameOver()) {
                if (key != KEY_CODE_NONE) break;
                continue;
            }

            game.handleAction(keyBinds.mapKey(key));
            if (game.quitRequested()) break;
            term.render(game, keyBinds);
        }
    }

    // Back in normal terminal mode.
    std::cout << game.config().playerName << ": depth " << game.depth()
              << ", level " << game.player().level
              << ", " << game.kills() << " kills, "
              << game.turns() << " turns, seed " << game.seed() << "\n";
    if (game.isGameOver() && !game.endCause().empty()) {
        std::cout << game.endCause() << "\n";
    }
    return 0;
}
