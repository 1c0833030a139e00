#define SDL_MAIN_HANDLED
#include <SDL.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "level_gen.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseU32Arg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            try {
                unsigned long v = std::stoul(argv[i + 1], nullptr, 0);
                return static_cast<uint32_t>(v);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << UNDERCROFT_APPNAME << " " << UNDERCROFT_VERSION << "\n"
        << "Usage: " << (exe ? exe : "undercroft_viewer") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           First level seed (default: time based)\n"
        << "  --depth <n>          Dungeon depth (1..99, default 1)\n"
        << "  --builder <name>     Always use this generator\n"
        << "  --wfc <mode>         auto, always or never\n"
        << "  --settings <path>    Settings INI to load (default: undercroft_settings.ini)\n"
        << "  --version            Print version and exit\n"
        << "  --help               Show this help\n\n"
        << "Keys:\n"
        << "  Space  next level    R  replay build history    Esc  quit\n";
}

namespace {

// One generated level plus every intermediate map the builder reported.
struct ViewedLevel {
    uint32_t seed = 0;
    bool ok = false;
    std::string status;
    GeneratedLevel level;
    std::vector<Grid> history;
};

ViewedLevel generateViewed(uint32_t seed, int depth, LevelGenOptions opts) {
    ViewedLevel v;
    v.seed = seed;

    opts.onSnapshot = [&v](const Grid& g) { v.history.push_back(g); };

    int spawnCount = 0;
    auto onSpawn = [&spawnCount](SpawnKind, int, int) { ++spawnCount; };

    RNG rng(seed);
    std::string err;
    v.ok = generateLevel(rng, depth, opts, onSpawn, v.level, &err);

    if (!v.ok) {
        std::cerr << "[seed " << seed << "] FAILED: " << err << "\n";
        v.status = "seed " + std::to_string(seed) + " - failed";
        return v;
    }

    for (const std::string& w : v.level.warnings) std::cerr << "  warning: " << w << "\n";
    std::cout << "[seed " << seed << "] " << v.level.builderName
              << "  frames " << v.history.size()
              << "  spawns " << spawnCount << "\n";

    v.status = "seed " + std::to_string(seed) + " - " + v.level.builderName;
    return v;
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << UNDERCROFT_APPNAME << " " << UNDERCROFT_VERSION << "\n";
        return 0;
    }

    const std::string settingsPath = parseStringArg(argc, argv, "--settings").value_or("undercroft_settings.ini");
    const Settings settings = loadSettings(settingsPath);
    for (const std::string& n : settings.unknownBuilders) {
        std::cerr << "Warning: unknown builder in settings: " << n << "\n";
    }

    LevelGenOptions opts = levelGenOptionsFrom(settings);
    if (auto b = parseStringArg(argc, argv, "--builder")) {
        if (!parseBuilderKind(*b, opts.forcedKind)) {
            std::cerr << "Unknown builder: " << *b << "\n";
            return 2;
        }
        opts.forceKind = true;
    }
    if (auto w = parseStringArg(argc, argv, "--wfc")) {
        if (!parseWfcMode(*w, opts.wfcMode)) {
            std::cerr << "Invalid --wfc: " << *w << "\n";
            return 2;
        }
    }

    int depth = 1;
    if (auto d = parseU32Arg(argc, argv, "--depth")) {
        if (*d < 1 || *d > 99) {
            std::cerr << "Invalid --depth: " << *d << "\n";
            return 2;
        }
        depth = static_cast<int>(*d);
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    uint32_t seed = parseU32Arg(argc, argv, "--seed").value_or(static_cast<uint32_t>(SDL_GetTicks()) ^ 0xA5A5F00Du);

    {
        MapView view(opts.width, opts.height, settings.tileSize, settings.vsync);
        if (!view.init()) {
            SDL_Quit();
            return 1;
        }

        ViewedLevel current = generateViewed(seed, depth, opts);
        view.setTitle(current.status);

        size_t frame = 0;
        uint32_t lastFrameMs = SDL_GetTicks();
        bool running = true;

        while (running) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                switch (ev.type) {
                    case SDL_QUIT:
                        running = false;
                        break;

                    case SDL_KEYDOWN: {
                        if (ev.key.repeat != 0) break;
                        const SDL_Keycode key = ev.key.keysym.sym;
                        if (key == SDLK_ESCAPE) {
                            running = false;
                        } else if (key == SDLK_SPACE) {
                            ++seed;
                            current = generateViewed(seed, depth, opts);
                            view.setTitle(current.status);
                            frame = 0;
                        } else if (key == SDLK_r) {
                            frame = 0;
                            lastFrameMs = SDL_GetTicks();
                        }
                        break;
                    }

                    default:
                        break;
                }
            }

            const uint32_t now = SDL_GetTicks();
            const bool playing = frame < current.history.size();
            if (playing) {
                view.render(current.history[frame], Vec2i{ -1, -1 });
                if (now - lastFrameMs >= static_cast<uint32_t>(settings.frameMs)) {
                    ++frame;
                    lastFrameMs = now;
                    view.setTitle(current.status + " - frame " + std::to_string(frame) + "/" +
                                  std::to_string(current.history.size()));
                }
            } else if (current.ok) {
                view.render(current.level.map, current.level.start);
            } else {
                view.render(Grid(opts.width, opts.height, depth, TileKind::Void), Vec2i{ -1, -1 });
            }

            SDL_Delay(playing ? 1 : 16);
        }
    }

    SDL_Quit();
    return 0;
}
