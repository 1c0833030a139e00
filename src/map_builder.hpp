#pragma once

#include "grid.hpp"
#include "regions.hpp"
#include "rng.hpp"
#include "spawner.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Why a build attempt was rejected. The orchestrator retries any of these
// with a fresh builder on the same random stream.
enum class BuildFailure : uint8_t {
    None = 0,
    NoRooms,        // fewer than two rooms could be placed
    NoStart,        // no Floor tile found walking left from the center
    NoExit,         // nothing reachable from the start after pruning
    IterationCap,   // a walker/digger loop ran past its cap
    WfcUnsolvable,  // every solver run hit a contradiction
    BadSource,      // WFC source map produced no usable patterns
};

const char* buildFailureName(BuildFailure f);

// Receives a copy of the in-progress map at notable points of a build.
using SnapshotFn = std::function<void(const Grid&)>;

// One level-generation algorithm.
//
// build() runs the algorithm once; later calls return the first result.
// After a successful build:
//   - getMap() is a fresh copy of the finished grid (safe to mutate).
//   - getStartingPosition() is a Floor tile from which every remaining Floor
//     tile is reachable.
//   - getExitPosition() is the single StairsDown tile.
//   - spawn() scatters entities over the builder's rooms or regions.
class MapBuilder {
public:
    MapBuilder(int width, int height, int depth);
    virtual ~MapBuilder() = default;

    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    bool build(RNG& rng, std::string* err = nullptr);

    bool isBuilt() const { return built; }
    bool succeeded() const { return built && failure == BuildFailure::None; }
    BuildFailure lastFailure() const { return failure; }

    Grid getMap() const { return map.frozen(); }
    Vec2i getStartingPosition() const { return start; }
    Vec2i getExitPosition() const { return exit; }

    const std::vector<Rect>& getRooms() const { return rooms; }
    const RegionMap& getRegions() const { return regions; }

    // Rooms-based builders scatter into every room but the first (the player
    // starts there); the rest scatter into each noise region.
    void spawn(RNG& rng, const SpawnFn& fn) const;

    virtual std::string name() const = 0;

    void setSnapshotObserver(SnapshotFn fn) { observer = std::move(fn); }

protected:
    virtual bool buildImpl(RNG& rng, std::string* err) = 0;

    void takeSnapshot();
    bool fail(BuildFailure f, const std::string& msg, std::string* err);

    // Region-style finish: prune from `start`, put the stairs on the farthest
    // tile, then partition the floor into noise regions.
    bool finishWithRegions(RNG& rng, std::string* err);

    // Room-style finish: start at the first room center, stairs at the last.
    bool finishWithRooms(std::string* err);

    int width = 0;
    int height = 0;
    int depth = 1;

    Grid map;
    Vec2i start{ -1, -1 };
    Vec2i exit{ -1, -1 };

    std::vector<Rect> rooms;
    RegionMap regions;

private:
    SnapshotFn observer;
    bool built = false;
    bool result = false;
    BuildFailure failure = BuildFailure::None;
};
