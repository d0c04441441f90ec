#pragma once

#include <string>

#include "game.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The file is created in the working directory on first run.
struct Settings {
    // Shown in the side panel and on the final screen.
    std::string playerName = "SLAYER";

    // Sight radius in tiles (3..20).
    int fovRadius = 8;

    // Enemies farther than this stay idle until woken (0 = always active).
    int activationRange = 12;

    // Step onto the stairs to descend, without pressing '>'.
    bool autoDescend = false;

    int enemiesPerFloor = 12;
    int potionsPerFloor = 7;

    // SDL window only.
    int tileSize = 16;
};

constexpr const char* DEFAULT_SETTINGS_FILE = "dwarfslayer_settings.ini";

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Unknown keys are ignored and out-of-range integers are clamped.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

GameConfig toGameConfig(const Settings& s);
