#include "level_gen.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Generates levels without a window and prints a summary per level.\n\n"
        << "Options:\n"
        << "  --seed <n>              First RNG seed (default: 1). Level i uses seed+i.\n"
        << "  --depth <n>             Dungeon depth (1..99). Default: 1.\n"
        << "  --count <n>             Number of levels to generate (1..10000). Default: 1.\n"
        << "  --builder <name>        Always use this generator (see --list-builders).\n"
        << "  --wfc <auto|always|never>  Wave function collapse re-derivation mode.\n"
        << "  --settings <path>       Settings INI to load (default: none).\n"
        << "  --write-settings <path> Write a commented default settings file and exit.\n"
        << "  --ascii                 Print each level as ASCII.\n"
        << "  --json-report <path>    Write a JSON summary report (useful for CI).\n"
        << "  --list-builders         Print every generator name and exit.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

struct LevelReport {
    uint32_t seed = 0;
    bool ok = false;
    std::string error;

    std::string builder;
    std::string kindId;
    bool wfc = false;
    int attempts = 0;
    int floorTiles = 0;
    Vec2i start;
    Vec2i exit;
    std::map<std::string, int> spawns;
    std::vector<std::string> warnings;
};

static std::string asciiMap(const Grid& g, Vec2i start) {
    std::string out;
    out.reserve(static_cast<size_t>((g.width + 1) * g.height));
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            out.push_back((x == start.x && y == start.y) ? '@' : tileGlyph(g.at(x, y)));
        }
        out.push_back('\n');
    }
    return out;
}

static bool writeJsonReport(const std::string& path,
                            const std::vector<LevelReport>& reports,
                            int depth,
                            const LevelGenOptions& opt,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path;
        return false;
    }

    size_t okCount = 0;
    for (const auto& r : reports) if (r.ok) ++okCount;

    f << "{\n";
    f << "  \"tool\": \"UndercroftHeadless\",\n";
    f << "  \"version\": \"" << jsonEscape(UNDERCROFT_VERSION) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"width\": " << opt.width << ",\n";
    f << "    \"height\": " << opt.height << ",\n";
    f << "    \"depth\": " << depth << ",\n";
    f << "    \"wfc\": \"" << wfcModeName(opt.wfcMode) << "\",\n";
    f << "    \"wfcOneIn\": " << opt.wfcOneIn << ",\n";
    f << "    \"maxBuildAttempts\": " << opt.maxBuildAttempts << "\n";
    f << "  },\n";
    f << "  \"summary\": {\n";
    f << "    \"total\": " << reports.size() << ",\n";
    f << "    \"ok\": " << okCount << ",\n";
    f << "    \"failed\": " << (reports.size() - okCount) << "\n";
    f << "  },\n";
    f << "  \"levels\": [\n";

    for (size_t i = 0; i < reports.size(); ++i) {
        const auto& r = reports[i];
        f << "    {\n";
        f << "      \"seed\": " << r.seed << ",\n";
        f << "      \"ok\": " << (r.ok ? "true" : "false") << ",\n";
        f << "      \"attempts\": " << r.attempts;

        if (r.ok) {
            f << ",\n";
            f << "      \"builder\": \"" << jsonEscape(r.builder) << "\",\n";
            f << "      \"kind\": \"" << jsonEscape(r.kindId) << "\",\n";
            f << "      \"wfc\": " << (r.wfc ? "true" : "false") << ",\n";
            f << "      \"floorTiles\": " << r.floorTiles << ",\n";
            f << "      \"start\": [" << r.start.x << ", " << r.start.y << "],\n";
            f << "      \"exit\": [" << r.exit.x << ", " << r.exit.y << "],\n";
            f << "      \"spawns\": {";
            size_t n = 0;
            for (const auto& kv : r.spawns) {
                f << (n++ ? ", " : "") << "\"" << jsonEscape(kv.first) << "\": " << kv.second;
            }
            f << "}";
        } else {
            f << ",\n";
            f << "      \"error\": \"" << jsonEscape(r.error) << "\"";
        }

        if (!r.warnings.empty()) {
            f << ",\n";
            f << "      \"warnings\": [";
            for (size_t w = 0; w < r.warnings.size(); ++w) {
                f << (w ? ", " : "") << "\"" << jsonEscape(r.warnings[w]) << "\"";
            }
            f << "]";
        }
        f << "\n";

        f << "    }";
        if (i + 1 < reports.size()) f << ",";
        f << "\n";
    }

    f << "  ]\n";
    f << "}\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    uint32_t seed = 1;
    uint32_t depth = 1;
    uint32_t count = 1;
    std::string builderName;
    std::string wfcArg;
    std::string settingsPath;
    std::string jsonReport;
    bool ascii = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << UNDERCROFT_APPNAME << " " << UNDERCROFT_VERSION << "\n";
            return 0;
        } else if (a == "--list-builders") {
            for (BuilderKind k : allBuilderKinds()) {
                const auto b = makeBuilder(k, 80, 43, 1);
                std::cout << std::left << std::setw(28) << builderKindName(k) << b->name() << "\n";
            }
            return 0;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
        } else if (a == "--depth") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--depth requires a value\n";
                return 2;
            }
            if (!parseU32(v, depth) || depth < 1 || depth > 99) {
                std::cerr << "Invalid --depth: " << v << "\n";
                return 2;
            }
        } else if (a == "--count") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--count requires a value\n";
                return 2;
            }
            if (!parseU32(v, count) || count < 1 || count > 10000) {
                std::cerr << "Invalid --count: " << v << "\n";
                return 2;
            }
        } else if (a == "--builder") {
            if (!argValue(i, argc, argv, builderName)) {
                std::cerr << "--builder requires a name\n";
                return 2;
            }
        } else if (a == "--wfc") {
            if (!argValue(i, argc, argv, wfcArg)) {
                std::cerr << "--wfc requires auto, always or never\n";
                return 2;
            }
        } else if (a == "--settings") {
            if (!argValue(i, argc, argv, settingsPath)) {
                std::cerr << "--settings requires a path\n";
                return 2;
            }
        } else if (a == "--write-settings") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-settings requires a path\n";
                return 2;
            }
            if (!writeDefaultSettings(v)) {
                std::cerr << "Failed to write settings: " << v << "\n";
                return 1;
            }
            std::cout << "Wrote " << v << "\n";
            return 0;
        } else if (a == "--ascii") {
            ascii = true;
        } else if (a == "--json-report") {
            if (!argValue(i, argc, argv, jsonReport)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    Settings settings;
    if (!settingsPath.empty()) {
        std::ifstream existing(settingsPath);
        if (!existing) {
            std::cerr << "Settings file not found: " << settingsPath << "\n";
            return 2;
        }
        settings = loadSettings(settingsPath);
        for (const std::string& n : settings.unknownBuilders) {
            std::cerr << "Warning: unknown builder in settings: " << n << "\n";
        }
    }

    LevelGenOptions opt = levelGenOptionsFrom(settings);
    if (!builderName.empty()) {
        if (!parseBuilderKind(builderName, opt.forcedKind)) {
            std::cerr << "Unknown builder: " << builderName << " (try --list-builders)\n";
            return 2;
        }
        opt.forceKind = true;
    }
    if (!wfcArg.empty() && !parseWfcMode(wfcArg, opt.wfcMode)) {
        std::cerr << "Invalid --wfc: " << wfcArg << "\n";
        return 2;
    }

    std::vector<LevelReport> reports;
    reports.reserve(count);
    int failed = 0;

    for (uint32_t i = 0; i < count; ++i) {
        LevelReport r;
        r.seed = seed + i;

        RNG rng(r.seed);
        GeneratedLevel level;
        std::string err;

        auto onSpawn = [&](SpawnKind kind, int, int) {
            ++r.spawns[spawnKindName(kind)];
        };

        r.ok = generateLevel(rng, static_cast<int>(depth), opt, onSpawn, level, &err);
        r.attempts = level.attempts;
        r.warnings = level.warnings;

        if (!r.ok) {
            ++failed;
            r.error = err;
            std::cerr << "[seed " << r.seed << "] FAILED: " << err << "\n";
            reports.push_back(std::move(r));
            continue;
        }

        r.builder = level.builderName;
        r.kindId = builderKindName(level.kind);
        r.wfc = level.wfcDerived;
        r.floorTiles = level.map.countTiles(TileKind::Floor);
        r.start = level.start;
        r.exit = level.exit;

        int spawnTotal = 0;
        for (const auto& kv : r.spawns) spawnTotal += kv.second;

        std::cout << "[seed " << r.seed << "] depth " << depth
                  << "  " << r.builder
                  << "  floor " << r.floorTiles
                  << "  start (" << r.start.x << "," << r.start.y << ")"
                  << "  exit (" << r.exit.x << "," << r.exit.y << ")"
                  << "  spawns " << spawnTotal;
        if (r.attempts > 1) std::cout << "  attempts " << r.attempts;
        std::cout << "\n";

        for (const std::string& w : r.warnings) std::cerr << "  warning: " << w << "\n";
        if (ascii) std::cout << asciiMap(level.map, level.start) << "\n";

        reports.push_back(std::move(r));
    }

    if (!jsonReport.empty()) {
        std::string err;
        if (!writeJsonReport(jsonReport, reports, static_cast<int>(depth), opt, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
    }

    if (failed > 0) {
        std::cerr << failed << " of " << count << " level(s) failed.\n";
        return 1;
    }
    return 0;
}
