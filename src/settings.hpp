#pragma once

#include <string>
#include <vector>

#include "level_gen.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// Read by both tools; command-line flags override it.
struct Settings {
    // Level size
    int mapWidth = 80;   // 40..200
    int mapHeight = 43;  // 24..120

    // Generators to draw from (empty = all).
    std::vector<BuilderKind> builders;
    // Names from the `builders` key that matched no generator.
    std::vector<std::string> unknownBuilders;

    // Wave function collapse re-derivation
    int wfcOneIn = 3;         // 0 disables; otherwise 1..20
    int wfcChunkSize = 8;     // 4..16
    int wfcMaxAttempts = 64;  // solver runs per level (1..1000)

    int maxBuildAttempts = 8; // 1..64

    // Viewer
    int tileSize = 12;  // 4..32
    int frameMs = 30;   // history playback delay (0..1000)
    bool vsync = true;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

LevelGenOptions levelGenOptionsFrom(const Settings& s);
