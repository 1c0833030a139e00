#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

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
        const int parsed = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
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

        if (key == "map_width") {
            int v = 0;
            if (parseInt(val, v)) s.mapWidth = std::clamp(v, 40, 200);
        } else if (key == "map_height") {
            int v = 0;
            if (parseInt(val, v)) s.mapHeight = std::clamp(v, 24, 120);
        } else if (key == "builders") {
            s.builders.clear();
            s.unknownBuilders.clear();
            if (toLower(val) == "all") continue;
            for (const std::string& raw : splitList(val, ',')) {
                const std::string name = trim(raw);
                if (name.empty()) continue;
                BuilderKind k = BuilderKind::SimpleRooms;
                if (parseBuilderKind(name, k)) {
                    if (std::find(s.builders.begin(), s.builders.end(), k) == s.builders.end()) s.builders.push_back(k);
                } else {
                    s.unknownBuilders.push_back(name);
                }
            }
        } else if (key == "wfc_one_in") {
            int v = 0;
            if (parseInt(val, v)) {
                if (v <= 0) s.wfcOneIn = 0;
                else s.wfcOneIn = std::clamp(v, 1, 20);
            }
        } else if (key == "wfc_chunk_size") {
            int v = 0;
            if (parseInt(val, v)) s.wfcChunkSize = std::clamp(v, 4, 16);
        } else if (key == "wfc_max_attempts") {
            int v = 0;
            if (parseInt(val, v)) s.wfcMaxAttempts = std::clamp(v, 1, 1000);
        } else if (key == "max_build_attempts") {
            int v = 0;
            if (parseInt(val, v)) s.maxBuildAttempts = std::clamp(v, 1, 64);
        } else if (key == "tile_size") {
            int v = 0;
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 4, 32);
        } else if (key == "frame_ms") {
            int v = 0;
            if (parseInt(val, v)) s.frameMs = std::clamp(v, 0, 1000);
        } else if (key == "vsync") {
            bool b = true;
            if (parseBool(val, b)) s.vsync = b;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Undercroft level generation settings
#
# Lines are: key = value
# Comments start with # or ;
#
# Command-line flags override anything set here.

# Level size
# map_width: 40..200, map_height: 24..120
map_width = 80
map_height = 43

# Generators to pick from: "all" or a comma list, e.g.
#   builders = simple_rooms, bsp_dungeon, cellular_automata
# Run `undercroft_headless --list-builders` for every name.
builders = all

# Wave function collapse re-derivation
# wfc_one_in: 0 disables; otherwise a 1-in-N chance per level (1..20)
wfc_one_in = 3
# wfc_chunk_size: pattern size in tiles (4..16)
wfc_chunk_size = 8
# wfc_max_attempts: solver runs before giving up on a level (1..1000)
wfc_max_attempts = 64

# Whole-level retries when a generator fails (1..64)
max_build_attempts = 8

# Viewer
# tile_size: pixels per tile (4..32)
tile_size = 12
# frame_ms: delay between history frames (0..1000)
frame_ms = 30
vsync = true
)INI";

    return static_cast<bool>(f);
}

LevelGenOptions levelGenOptionsFrom(const Settings& s) {
    LevelGenOptions o;
    o.width = s.mapWidth;
    o.height = s.mapHeight;
    o.kinds = s.builders;
    o.wfcOneIn = s.wfcOneIn;
    o.wfcMode = (s.wfcOneIn <= 0) ? WfcMode::Never : WfcMode::Random;
    o.wfcChunkSize = s.wfcChunkSize;
    o.wfcMaxAttempts = s.wfcMaxAttempts;
    o.maxBuildAttempts = s.maxBuildAttempts;
    return o;
}
