#include "cli.hpp"

#include "rng.hpp"
#include "version.hpp"

#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    const std::optional<std::string> s = parseStringArg(argc, argv, "--seed");
    // stoul would accept "-1" (wrapping) and skip leading blanks.
    if (!s || s->empty() || !std::isdigit(static_cast<unsigned char>((*s)[0]))) return std::nullopt;
    try {
        size_t used = 0;
        const unsigned long long v = std::stoull(*s, &used, 0);
        if (used != s->size() || v > 0xFFFFFFFFull) return std::nullopt;
        return static_cast<uint32_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

LaunchOptions parseLaunchOptions(int argc, char** argv) {
    LaunchOptions o;
    if (auto p = parseStringArg(argc, argv, "--config")) {
        if (!p->empty()) o.settingsPath = *p;
    }
    o.seed = parseSeedArg(argc, argv);
    o.badSeed = !o.seed.has_value() && hasFlag(argc, argv, "--seed");
    o.resetSettings = hasFlag(argc, argv, "--reset-settings");
    return o;
}

Settings prepareSettings(const LaunchOptions& opts) {
    bool exists = false;
    {
        std::ifstream probe(opts.settingsPath);
        exists = static_cast<bool>(probe);
    }

    if (opts.resetSettings || !exists) {
        if (!writeDefaultSettings(opts.settingsPath)) {
            std::cerr << "Could not write settings file: " << opts.settingsPath << " (using defaults)\n";
            return Settings{};
        }
    }
    return loadSettings(opts.settingsPath);
}

uint32_t randomSeed() {
    std::random_device rd;
    const auto ticks = static_cast<uint32_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return hashCombine(rd(), ticks);
}

void printVersion() {
    std::cout << DWARFSLAYER_APPNAME << " " << DWARFSLAYER_VERSION << "\n";
}

void printUsage(const char* exe, bool headless) {
    std::cout
        << DWARFSLAYER_APPNAME << " " << DWARFSLAYER_VERSION << "\n"
        << "Usage: " << (exe ? exe : "dwarfslayer") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Start the run with a specific seed\n"
        << "  --config <path>      Settings file (default: " << DEFAULT_SETTINGS_FILE << ")\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n";
    if (headless) {
        std::cout
            << "  --turns <n>          Stop after N turns (default: 200)\n"
            << "  --script <keys>      Key sequence to play, e.g. \"ddddr.p\" (repeats)\n";
    }
    std::cout
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}
