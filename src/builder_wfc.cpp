#include "map_builders.hpp"

#include "wfc.hpp"

#include <algorithm>
#include <utility>

WfcBuilder::WfcBuilder(int w, int h, int d, std::unique_ptr<MapBuilder> src, int chunk, int maxRuns)
    : MapBuilder(w, h, d), source(std::move(src)), chunkSize(std::max(1, chunk)), maxSolverRuns(std::max(1, maxRuns)) {}

std::string WfcBuilder::name() const {
    return "Waveform Collapse (" + (source ? source->name() : std::string("none")) + ")";
}

bool WfcBuilder::buildImpl(RNG& rng, std::string* err) {
    if (!source) return fail(BuildFailure::BadSource, "no source builder", err);

    std::string srcErr;
    if (!source->build(rng, &srcErr)) {
        return fail(source->lastFailure(), "source failed: " + srcErr, err);
    }

    Grid src = source->getMap();
    for (TileKind& t : src.tiles) {
        if (t == TileKind::StairsDown) t = TileKind::Floor;
    }
    map = src;
    takeSnapshot();

    const std::vector<wfc::Pattern> patterns = wfc::buildPatterns(src, chunkSize, true, true);
    if (patterns.empty()) {
        return fail(BuildFailure::BadSource,
                    "source map is smaller than one " + std::to_string(chunkSize) + "x" + std::to_string(chunkSize) + " chunk", err);
    }
    const std::vector<wfc::MapChunk> constraints = wfc::patternsToConstraints(patterns, chunkSize);

    for (runs = 1; runs <= maxSolverRuns; ++runs) {
        map.fill(TileKind::Wall);

        wfc::Solver solver(constraints, chunkSize, map);
        while (!solver.iteration(map, rng)) {
            takeSnapshot();
        }
        takeSnapshot();

        if (solver.possible()) break;
    }
    if (runs > maxSolverRuns) {
        runs = maxSolverRuns;
        return fail(BuildFailure::WfcUnsolvable,
                    "no solution in " + std::to_string(maxSolverRuns) + " solver runs", err);
    }

    // Flipped chunks can put floor on the map edge, and patterns from a
    // Void-based source can leave floor touching void at chunk seams.
    wallOuterRing(map);
    wallUpExposedVoid(map);

    if (!findStartNearCenter(map, start)) {
        return fail(BuildFailure::NoStart, "no floor west of the map center", err);
    }

    return finishWithRegions(rng, err);
}
