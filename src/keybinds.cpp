#include "keybinds.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {

struct ActionName {
    Action action;
    const char* name;
};

// Also the display order of the help overlay.
constexpr ActionName ACTION_NAMES[] = {
    {Action::Up,        "up"},
    {Action::Down,      "down"},
    {Action::Left,      "left"},
    {Action::Right,     "right"},
    {Action::Wait,      "wait"},
    {Action::Rest,      "rest"},
    {Action::Potion,    "potion"},
    {Action::Descend,   "descend"},
    {Action::Inventory, "inventory"},
    {Action::Help,      "help"},
    {Action::Quit,      "quit"},
};

} // namespace

std::string KeyBinds::trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string KeyBinds::toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> KeyBinds::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

KeyCode KeyBinds::normalizeKey(KeyCode key) {
    if (key >= 'A' && key <= 'Z') return key - 'A' + 'a';
    if (key == '\r') return KEY_CODE_ENTER;
    return key;
}

KeyCode KeyBinds::parseKeyCode(const std::string& keyNameIn) {
    // Single characters are taken verbatim (before lower-casing the name).
    const std::string raw = trim(keyNameIn);
    if (raw.size() == 1) {
        return normalizeKey(static_cast<unsigned char>(raw[0]));
    }

    const std::string keyName = toLower(raw);
    if (keyName.empty()) return KEY_CODE_NONE;

    if (keyName == "up") return KEY_CODE_UP;
    if (keyName == "down") return KEY_CODE_DOWN;
    if (keyName == "left") return KEY_CODE_LEFT;
    if (keyName == "right") return KEY_CODE_RIGHT;

    if (keyName == "enter" || keyName == "return") return KEY_CODE_ENTER;
    if (keyName == "escape" || keyName == "esc") return KEY_CODE_ESCAPE;
    if (keyName == "space") return ' ';

    if (keyName == "period" || keyName == "dot") return '.';
    if (keyName == "greater") return '>';
    if (keyName == "less") return '<';
    if (keyName == "comma") return ',';
    if (keyName == "question") return '?';
    if (keyName == "slash") return '/';

    return KEY_CODE_NONE;
}

std::vector<KeyCode> KeyBinds::parseKeyList(const std::string& valueIn) {
    std::string value = trim(valueIn);
    if (value.empty()) return {};
    std::string vLow = toLower(value);
    if (vLow == "none" || vLow == "unbound" || vLow == "disabled") return {};

    std::vector<KeyCode> out;
    // A lone ',' is a key, not a separator.
    if (value == ",") {
        out.push_back(',');
        return out;
    }
    for (const auto& part : split(value, ',')) {
        const KeyCode k = parseKeyCode(part);
        if (k != KEY_CODE_NONE) out.push_back(k);
    }
    return out;
}

std::optional<Action> KeyBinds::parseActionName(const std::string& bindKeyIn) {
    std::string key = trim(toLower(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    std::string name = key.substr(5);

    for (const auto& an : ACTION_NAMES) {
        if (name == an.name) return an.action;
    }

    // Aliases
    if (name == "quaff" || name == "drink") return Action::Potion;
    if (name == "stairs_down" || name == "stairsdown") return Action::Descend;
    if (name == "inv") return Action::Inventory;

    return std::nullopt;
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&](Action a, KeyCode key) {
        kb.binds[a].push_back(key);
    };

    // Movement
    add(Action::Up, 'w');
    add(Action::Up, KEY_CODE_UP);

    add(Action::Down, 's');
    add(Action::Down, KEY_CODE_DOWN);

    add(Action::Left, 'a');
    add(Action::Left, KEY_CODE_LEFT);

    add(Action::Right, 'd');
    add(Action::Right, KEY_CODE_RIGHT);

    // Actions
    add(Action::Wait, '.');
    add(Action::Rest, 'r');
    add(Action::Potion, 'p');
    add(Action::Descend, '>');

    // UI / meta
    add(Action::Inventory, 'i');
    add(Action::Help, '?');
    add(Action::Quit, 'q');
    add(Action::Quit, KEY_CODE_ESCAPE);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        // Strip comments ('#' and ';' cannot be bound directly)
        auto commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (key.empty()) continue;

        auto act = parseActionName(key);
        if (!act.has_value()) continue;

        binds[*act] = parseKeyList(val);
    }
}

Action KeyBinds::mapKey(KeyCode keyIn) const {
    const KeyCode key = normalizeKey(keyIn);
    if (key == KEY_CODE_NONE) return Action::None;

    for (const auto& an : ACTION_NAMES) {
        auto it = binds.find(an.action);
        if (it == binds.end()) continue;
        if (std::find(it->second.begin(), it->second.end(), key) != it->second.end()) {
            return an.action;
        }
    }
    return Action::None;
}

std::string KeyBinds::keyToString(KeyCode key) {
    switch (key) {
        case KEY_CODE_UP: return "UP";
        case KEY_CODE_DOWN: return "DOWN";
        case KEY_CODE_LEFT: return "LEFT";
        case KEY_CODE_RIGHT: return "RIGHT";
        case KEY_CODE_ENTER: return "ENTER";
        case KEY_CODE_ESCAPE: return "ESC";
        case ' ': return "SPACE";
        default: break;
    }
    if (key > 32 && key < 127) {
        return std::string(1, static_cast<char>(std::toupper(key)));
    }
    return "?";
}

std::string KeyBinds::describeAction(Action a) const {
    auto it = binds.find(a);
    if (it == binds.end() || it->second.empty()) return "NONE";

    std::string out;
    for (size_t i = 0; i < it->second.size(); ++i) {
        if (i > 0) out += "/";
        out += keyToString(it->second[i]);
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> KeyBinds::describeAll() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& an : ACTION_NAMES) {
        out.emplace_back(toUpper(an.name), describeAction(an.action));
    }
    return out;
}
