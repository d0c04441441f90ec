#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "game.hpp"

// Configurable keybindings loaded from dwarfslayer_settings.ini.
//
// The binding format is:
//   bind_<action> = key[, key, ...]
//
// Each key can be:
//   - a single character: w, ., ?, >
//   - a named key: up, down, left, right, period, greater, space, enter, escape, question
//
// Key codes are frontend-neutral: printable keys use their (lower-case) character
// code and the arrow keys use the KEY_CODE_* values below. Each frontend translates
// its native key events (curses KEY_UP, SDLK_UP, ...) into these codes.

using KeyCode = int;

constexpr KeyCode KEY_CODE_NONE   = 0;
constexpr KeyCode KEY_CODE_ENTER  = '\n';
constexpr KeyCode KEY_CODE_ESCAPE = 27;
constexpr KeyCode KEY_CODE_UP     = 0x101;
constexpr KeyCode KEY_CODE_DOWN   = 0x102;
constexpr KeyCode KEY_CODE_LEFT   = 0x103;
constexpr KeyCode KEY_CODE_RIGHT  = 0x104;

struct ActionHash {
    size_t operator()(Action a) const noexcept { return static_cast<size_t>(a); }
};

class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    Action mapKey(KeyCode key) const;

    // Human-readable bindings for the help overlay (action name -> key list).
    std::vector<std::pair<std::string, std::string>> describeAll() const;
    std::string describeAction(Action a) const;

    static std::string keyToString(KeyCode key);

    // Exposed for tests.
    static std::optional<Action> parseActionName(const std::string& bindKey);
    static std::vector<KeyCode> parseKeyList(const std::string& value);
    static KeyCode parseKeyCode(const std::string& keyName);

    // Letters are matched case-insensitively.
    static KeyCode normalizeKey(KeyCode key);

private:
    std::unordered_map<Action, std::vector<KeyCode>, ActionHash> binds;

    static std::string trim(std::string s);
    static std::string toLower(std::string s);
    static std::vector<std::string> split(const std::string& s, char delim);
};
