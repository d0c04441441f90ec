#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "settings.hpp"

// Command-line helpers shared by the terminal, window and headless executables.

bool hasFlag(int argc, char** argv, const char* flag);
std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt);

// Accepts decimal or 0x-prefixed hex up to 0xFFFFFFFF. Returns nullopt if
// absent, negative, too large or malformed.
std::optional<uint32_t> parseSeedArg(int argc, char** argv);

// Settings path, seed and reset flag as given on the command line.
struct LaunchOptions {
    std::string settingsPath = DEFAULT_SETTINGS_FILE;
    std::optional<uint32_t> seed;
    bool resetSettings = false;
    bool badSeed = false;
};

LaunchOptions parseLaunchOptions(int argc, char** argv);

// Writes a default settings file when missing (or when resetSettings is set),
// then loads it. A file that cannot be written is reported and defaults are used.
Settings prepareSettings(const LaunchOptions& opts);

// Non-deterministic seed for a fresh run.
uint32_t randomSeed();

void printUsage(const char* exe, bool headless);
void printVersion();
