#include "sdl.hpp"

#include <iostream>
#include <string>

#include "cli.hpp"
#include "game.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

namespace {

KeyCode translateKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_UP: return KEY_CODE_UP;
        case SDLK_DOWN: return KEY_CODE_DOWN;
        case SDLK_LEFT: return KEY_CODE_LEFT;
        case SDLK_RIGHT: return KEY_CODE_RIGHT;
        case SDLK_ESCAPE: return KEY_CODE_ESCAPE;
        case SDLK_RETURN:
        case SDLK_KP_ENTER: return KEY_CODE_ENTER;
        default: break;
    }
    if (key > 0 && key < 127) return static_cast<KeyCode>(key);
    return KEY_CODE_NONE;
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "dwarfslayer_sdl", false);
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

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    int rc = 0;
    {
        Renderer renderer(settings.tileSize, true);
        if (!renderer.init()) {
            SDL_Quit();
            return 1;
        }

        Game game;
        game.setConfig(toGameConfig(settings));
        game.newGame(opts.seed ? *opts.seed : randomSeed());

        // SDL also delivers '>' as SHIFT + '.', which the text event reports directly.
        SDL_StartTextInput();
        renderer.render(game, keyBinds);

        bool running = true;
        while (running) {
            SDL_Event ev;
            if (!SDL_WaitEvent(&ev)) {
                std::cerr << "SDL_WaitEvent failed: " << SDL_GetError() << "\n";
                rc = 1;
                break;
            }

            KeyCode key = KEY_CODE_NONE;
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;
                case SDL_KEYDOWN:
                    if (ev.key.keysym.sym == SDLK_F11) {
                        renderer.toggleFullscreen();
                        break;
                    }
                    // Printable keys arrive through SDL_TEXTINPUT.
                    if (ev.key.keysym.sym < 32 || ev.key.keysym.sym >= 127) {
                        key = translateKey(ev.key.keysym.sym);
                    }
                    break;
                case SDL_TEXTINPUT:
                    if (ev.text.text[0] != '\0' && ev.text.text[1] == '\0') {
                        key = static_cast<unsigned char>(ev.text.text[0]);
                    }
                    break;
                default:
                    break;
            }

            if (key != KEY_CODE_NONE) {
                if (game.isGameOver()) {
                    running = false;
                } else {
                    game.handleAction(keyBinds.mapKey(key));
                    if (game.quitRequested()) running = false;
                }
            }

            if (running) renderer.render(game, keyBinds);
        }

        SDL_StopTextInput();
        renderer.shutdown();

        std::cout << "Depth " << game.depth() << ", level " << game.player().level
                  << ", " << game.turns() << " turns, seed " << game.seed() << "\n";
    }

    SDL_Quit();
    return rc;
}
