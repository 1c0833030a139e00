#include "map_builder.hpp"

#include "builder_common.hpp"
#include "connectivity.hpp"

const char* buildFailureName(BuildFailure f) {
    switch (f) {
        case BuildFailure::None:          return "none";
        case BuildFailure::NoRooms:       return "no_rooms";
        case BuildFailure::NoStart:       return "no_start";
        case BuildFailure::NoExit:        return "no_exit";
        case BuildFailure::IterationCap:  return "iteration_cap";
        case BuildFailure::WfcUnsolvable: return "wfc_unsolvable";
        case BuildFailure::BadSource:     return "bad_source";
        default:                          return "unknown";
    }
}

MapBuilder::MapBuilder(int w, int h, int d)
    : width(w), height(h), depth(d), map(w, h, d, TileKind::Wall) {}

bool MapBuilder::build(RNG& rng, std::string* err) {
    if (built) {
        if (!result && err) *err = std::string(name()) + ": " + buildFailureName(failure);
        return result;
    }

    built = true;
    failure = BuildFailure::None;
    result = buildImpl(rng, err);
    if (result) {
        map.populateBlocked();
        takeSnapshot();
    }
    return result;
}

void MapBuilder::spawn(RNG& rng, const SpawnFn& fn) const {
    if (!succeeded()) return;

    if (!rooms.empty()) {
        for (size_t i = 1; i < rooms.size(); ++i) {
            spawnRoom(map, rooms[i], rng, depth, fn);
        }
        return;
    }

    for (const auto& kv : regions) {
        spawnRegion(map, kv.second, rng, depth, fn);
    }
}

void MapBuilder::takeSnapshot() {
    if (observer) observer(map.snapshot());
}

bool MapBuilder::fail(BuildFailure f, const std::string& msg, std::string* err) {
    failure = f;
    if (err) *err = name() + ": " + msg;
    return false;
}

bool MapBuilder::finishWithRegions(RNG& rng, std::string* err) {
    if (!map.inBounds(start.x, start.y) || map.at(start.x, start.y) != TileKind::Floor) {
        return fail(BuildFailure::NoStart, "start position is not a floor tile", err);
    }

    const int exitIdx = pruneUnreachableReturningFarthest(map, map.index(start.x, start.y));
    takeSnapshot();
    if (exitIdx < 0) {
        return fail(BuildFailure::NoExit, "no floor reachable from the start", err);
    }

    exit = map.posOf(exitIdx);
    map.tiles[static_cast<size_t>(exitIdx)] = TileKind::StairsDown;
    takeSnapshot();

    regions = buildNoiseRegions(map, rng);
    return true;
}

bool MapBuilder::finishWithRooms(std::string* err) {
    if (rooms.size() < 2) {
        return fail(BuildFailure::NoRooms, "placed " + std::to_string(rooms.size()) + " room(s), need 2", err);
    }

    wallUpExposedVoid(map);

    start = rooms.front().center();
    exit = rooms.back().center();
    if (start == exit) {
        return fail(BuildFailure::NoExit, "first and last room share a center", err);
    }

    map.at(exit.x, exit.y) = TileKind::StairsDown;
    map.populateBlocked();
    takeSnapshot();
    return true;
}
