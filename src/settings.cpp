#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string t = trim(v);
        const int n = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = n;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "player_name") {
            if (!val.empty()) s.playerName = toUpper(val.substr(0, 16));
        } else if (key == "fov_radius") {
            int v = 0;
            if (parseInt(val, v)) s.fovRadius = std::clamp(v, 3, 20);
        } else if (key == "activation_range") {
            int v = 0;
            if (parseInt(val, v)) s.activationRange = std::clamp(v, 0, 60);
        } else if (key == "auto_descend") {
            bool b = false;
            if (parseBool(val, b)) s.autoDescend = b;
        } else if (key == "enemies_per_floor") {
            int v = 0;
            if (parseInt(val, v)) s.enemiesPerFloor = std::clamp(v, 0, 40);
        } else if (key == "potions_per_floor") {
            int v = 0;
            if (parseInt(val, v)) s.potionsPerFloor = std::clamp(v, 0, 20);
        } else if (key == "tile_size") {
            int v = 0;
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 8, 48);
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Dwarf Slayer settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Shown in the side panel and on the final screen.
player_name = SLAYER

# Sight radius in tiles: 3..20
fov_radius = 8

# Enemies farther than this (in tiles) stay idle until woken.
# 0 makes every enemy on the floor act every turn. Range 0..60.
activation_range = 12

# true = walking onto the stairs descends immediately.
auto_descend = false

# Per-floor population
enemies_per_floor = 12
potions_per_floor = 7

# SDL window only: pixel size of one map cell (8..48)
tile_size = 16

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<action> = key[, key, ...]
#
# Keys are single characters or names:
#   up, down, left, right, period, greater, space, enter, escape, question
#
# Set a binding to "none" to disable it.
# -----------------------------------------------------------------------------

bind_up = w, up
bind_down = s, down
bind_left = a, left
bind_right = d, right
bind_wait = period
bind_rest = r
bind_potion = p
bind_descend = greater
bind_quit = q, escape
bind_inventory = i
bind_help = question
)INI";

    return true;
}

GameConfig toGameConfig(const Settings& s) {
    GameConfig c;
    c.playerName = s.playerName;
    c.fovRadius = s.fovRadius;
    c.activationRange = s.activationRange;
    c.autoDescend = s.autoDescend;
    c.enemiesPerFloor = s.enemiesPerFloor;
    c.potionsPerFloor = s.potionsPerFloor;
    return c;
}
