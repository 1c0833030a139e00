#include "level_gen.hpp"

#include "map_builders.hpp"

#include <algorithm>
#include <utility>

namespace {

struct KindInfo {
    BuilderKind kind;
    const char* id;
};

constexpr KindInfo KIND_INFO[] = {
    {BuilderKind::SimpleRooms,             "simple_rooms"},
    {BuilderKind::BspDungeon,              "bsp_dungeon"},
    {BuilderKind::BspInterior,             "bsp_interior"},
    {BuilderKind::CellularAutomata,        "cellular_automata"},
    {BuilderKind::DrunkardOpenArea,        "drunkard_open_area"},
    {BuilderKind::DrunkardOpenHalls,       "drunkard_open_halls"},
    {BuilderKind::DrunkardWindingPassages, "drunkard_winding_passages"},
    {BuilderKind::DrunkardFatPassages,     "drunkard_fat_passages"},
    {BuilderKind::DrunkardFearfulSymmetry, "drunkard_fearful_symmetry"},
    {BuilderKind::Maze,                    "maze"},
    {BuilderKind::DlaWalkInwards,          "dla_walk_inwards"},
    {BuilderKind::DlaWalkOutwards,         "dla_walk_outwards"},
    {BuilderKind::DlaCentralAttractor,     "dla_central_attractor"},
    {BuilderKind::DlaInsectoid,            "dla_insectoid"},
    {BuilderKind::VoronoiPythagoras,       "voronoi_pythagoras"},
    {BuilderKind::VoronoiManhattan,        "voronoi_manhattan"},
    {BuilderKind::VoronoiChebyshev,        "voronoi_chebyshev"},
};

bool rollForWfc(RNG& rng, const LevelGenOptions& opts) {
    switch (opts.wfcMode) {
        case WfcMode::Always: return true;
        case WfcMode::Never:  return false;
        case WfcMode::Random:
        default:
            if (opts.wfcOneIn <= 0) return false;
            return rng.rollDice(1, opts.wfcOneIn) == 1;
    }
}

} // namespace

const std::vector<BuilderKind>& allBuilderKinds() {
    static const std::vector<BuilderKind> kinds = [] {
        std::vector<BuilderKind> v;
        for (const KindInfo& k : KIND_INFO) v.push_back(k.kind);
        return v;
    }();
    return kinds;
}

const char* builderKindName(BuilderKind k) {
    for (const KindInfo& info : KIND_INFO) {
        if (info.kind == k) return info.id;
    }
    return "unknown";
}

bool parseBuilderKind(const std::string& s, BuilderKind& out) {
    const std::string id = toLowerAscii(s);
    for (const KindInfo& info : KIND_INFO) {
        if (id == info.id) {
            out = info.kind;
            return true;
        }
    }
    return false;
}

const char* wfcModeName(WfcMode m) {
    switch (m) {
        case WfcMode::Random: return "auto";
        case WfcMode::Always: return "always";
        case WfcMode::Never:  return "never";
        default:              return "unknown";
    }
}

bool parseWfcMode(const std::string& s, WfcMode& out) {
    const std::string v = toLowerAscii(s);
    if (v == "auto" || v == "random") { out = WfcMode::Random; return true; }
    if (v == "always" || v == "on")   { out = WfcMode::Always; return true; }
    if (v == "never" || v == "off")   { out = WfcMode::Never; return true; }
    return false;
}

std::unique_ptr<MapBuilder> makeBuilder(BuilderKind k, int w, int h, int depth) {
    switch (k) {
        case BuilderKind::SimpleRooms:             return std::make_unique<SimpleRoomsBuilder>(w, h, depth);
        case BuilderKind::BspDungeon:              return std::make_unique<BspDungeonBuilder>(w, h, depth);
        case BuilderKind::BspInterior:             return std::make_unique<BspInteriorBuilder>(w, h, depth);
        case BuilderKind::CellularAutomata:        return std::make_unique<CellularAutomataBuilder>(w, h, depth);
        case BuilderKind::DrunkardOpenArea:        return std::make_unique<DrunkardWalkBuilder>(w, h, depth, DrunkardSettings::openArea());
        case BuilderKind::DrunkardOpenHalls:       return std::make_unique<DrunkardWalkBuilder>(w, h, depth, DrunkardSettings::openHalls());
        case BuilderKind::DrunkardWindingPassages: return std::make_unique<DrunkardWalkBuilder>(w, h, depth, DrunkardSettings::windingPassages());
        case BuilderKind::DrunkardFatPassages:     return std::make_unique<DrunkardWalkBuilder>(w, h, depth, DrunkardSettings::fatPassages());
        case BuilderKind::DrunkardFearfulSymmetry: return std::make_unique<DrunkardWalkBuilder>(w, h, depth, DrunkardSettings::fearfulSymmetry());
        case BuilderKind::Maze:                    return std::make_unique<MazeBuilder>(w, h, depth);
        case BuilderKind::DlaWalkInwards:          return std::make_unique<DlaBuilder>(w, h, depth, DlaSettings::walkInwards());
        case BuilderKind::DlaWalkOutwards:         return std::make_unique<DlaBuilder>(w, h, depth, DlaSettings::walkOutwards());
        case BuilderKind::DlaCentralAttractor:     return std::make_unique<DlaBuilder>(w, h, depth, DlaSettings::centralAttractor());
        case BuilderKind::DlaInsectoid:            return std::make_unique<DlaBuilder>(w, h, depth, DlaSettings::insectoid());
        case BuilderKind::VoronoiPythagoras:       return std::make_unique<VoronoiBuilder>(w, h, depth, DistanceMetric::Pythagoras);
        case BuilderKind::VoronoiManhattan:        return std::make_unique<VoronoiBuilder>(w, h, depth, DistanceMetric::Manhattan);
        case BuilderKind::VoronoiChebyshev:        return std::make_unique<VoronoiBuilder>(w, h, depth, DistanceMetric::Chebyshev);
    }
    return std::make_unique<SimpleRoomsBuilder>(w, h, depth);
}

std::unique_ptr<MapBuilder> makeWfcBuilder(std::unique_ptr<MapBuilder> source, int w, int h, int depth,
                                           int chunkSize, int maxSolverRuns) {
    return std::make_unique<WfcBuilder>(w, h, depth, std::move(source), chunkSize, maxSolverRuns);
}

bool generateLevel(RNG& rng, int depth, const LevelGenOptions& opts, const SpawnFn& spawn,
                   GeneratedLevel& out, std::string* err) {
    out = GeneratedLevel{};
    depth = std::max(1, depth);

    const std::vector<BuilderKind>& pool = opts.kinds.empty() ? allBuilderKinds() : opts.kinds;
    const int maxAttempts = std::max(1, opts.maxBuildAttempts);

    std::string lastErr;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        out.attempts = attempt;

        BuilderKind kind = opts.forcedKind;
        if (!opts.forceKind) {
            kind = pool[static_cast<size_t>(rng.rollDice(1, static_cast<int>(pool.size())) - 1)];
        }
        const bool useWfc = rollForWfc(rng, opts);

        std::unique_ptr<MapBuilder> builder = makeBuilder(kind, opts.width, opts.height, depth);
        if (opts.onSnapshot) builder->setSnapshotObserver(opts.onSnapshot);
        if (useWfc) {
            builder = makeWfcBuilder(std::move(builder), opts.width, opts.height, depth,
                                     opts.wfcChunkSize, opts.wfcMaxAttempts);
            if (opts.onSnapshot) builder->setSnapshotObserver(opts.onSnapshot);
        }

        std::string buildErr;
        if (!builder->build(rng, &buildErr)) {
            lastErr = buildErr;
            out.warnings.push_back("attempt " + std::to_string(attempt) + " [" +
                                   buildFailureName(builder->lastFailure()) + "] " + buildErr);
            continue;
        }

        builder->spawn(rng, spawn);

        out.map = builder->getMap();
        out.start = builder->getStartingPosition();
        out.exit = builder->getExitPosition();
        out.kind = kind;
        out.builderName = builder->name();
        out.wfcDerived = useWfc;
        return true;
    }

    if (err) {
        *err = "level generation failed after " + std::to_string(maxAttempts) + " attempt(s): " + lastErr;
    }
    return false;
}
