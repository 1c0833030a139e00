#include "builder_common.hpp"
#include "connectivity.hpp"
#include "level_gen.hpp"
#include "map_builders.hpp"
#include "noise.hpp"
#include "regions.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "spawner.hpp"
#include "wfc.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <queue>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Every walkable tile reachable (8-way) from `start`?
bool allWalkableReachable(const Grid& g, Vec2i start) {
    if (!g.inBounds(start.x, start.y) || !isWalkableKind(g.at(start.x, start.y))) return false;

    std::vector<uint8_t> visited(static_cast<size_t>(g.size()), 0);
    std::queue<Vec2i> q;
    q.push(start);
    visited[static_cast<size_t>(g.index(start.x, start.y))] = 1;

    const int dirs[8][2] = {
        {1,0},{-1,0},{0,1},{0,-1},
        {1,1},{1,-1},{-1,1},{-1,-1}
    };

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop();
        for (const auto& d : dirs) {
            const int nx = p.x + d[0];
            const int ny = p.y + d[1];
            if (!g.inBounds(nx, ny)) continue;
            const size_t ni = static_cast<size_t>(g.index(nx, ny));
            if (visited[ni] || !isWalkableKind(g.tiles[ni])) continue;
            visited[ni] = 1;
            q.push({nx, ny});
        }
    }

    for (int i = 0; i < g.size(); ++i) {
        if (isWalkableKind(g.tiles[static_cast<size_t>(i)]) && !visited[static_cast<size_t>(i)]) return false;
    }
    return true;
}

// Serves a hand-made map. With a start it also runs the region-style finish.
class FixedMapBuilder : public MapBuilder {
public:
    explicit FixedMapBuilder(Grid g)
        : MapBuilder(g.width, g.height, g.depth), source(std::move(g)) {}
    FixedMapBuilder(Grid g, Vec2i startAt)
        : MapBuilder(g.width, g.height, g.depth), source(std::move(g)), finish(true), fixedStart(startAt) {}

    std::string name() const override { return "Fixed Map"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override {
        map = source;
        if (!finish) return true;
        start = fixedStart;
        return finishWithRegions(rng, err);
    }

private:
    Grid source;
    bool finish = false;
    Vec2i fixedStart{ -1, -1 };
};

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.rollDice(2, 6);
        expect(r >= 2 && r <= 12, "RNG rollDice(2,6) out of bounds");
    }
    expect(rng.rollDice(0, 6) == 0, "rollDice with no dice should be 0");
}

void test_grid_and_rect_basics() {
    Grid g(10, 6, 2);
    expect(g.size() == 60, "Grid size");
    expect(g.depth == 2, "Grid depth");
    expect(g.countTiles(TileKind::Wall) == 60, "Grid default fill is Wall");
    expect(g.index(3, 2) == 23, "Grid index row-major");
    expect(g.posOf(23) == Vec2i{3, 2}, "Grid posOf inverts index");
    expect(!g.inBounds(10, 0) && !g.inBounds(0, -1) && g.inBounds(9, 5), "Grid inBounds");

    g.at(4, 4) = TileKind::Floor;
    g.populateBlocked();
    expect(g.blocked[static_cast<size_t>(g.index(4, 4))] == 0, "Floor is not blocked");
    expect(g.blocked[static_cast<size_t>(g.index(0, 0))] == 1, "Wall is blocked");

    const Grid snap = g.snapshot();
    expect(snap.revealed[0] == 1 && snap.visible[0] == 1, "Snapshot is fully revealed");

    const Grid frozen = g.frozen();
    expect(frozen.revealed[0] == 0 && frozen.visible[0] == 0, "Frozen copy starts unrevealed");
    expect(frozen.tiles == g.tiles, "Frozen copy keeps tiles");

    g.tileContent[5].push_back(42);
    g.clearContentIndex();
    expect(g.tileContent.size() == 60 && g.tileContent[5].empty(), "Content index cleared");
    expect(std::string(tileKindName(TileKind::StairsDown)) == "StairsDown", "Tile kind name");
    expect(tileGlyph(TileKind::Wall) == '#' && tileGlyph(TileKind::Floor) == '.', "Tile glyphs");

    const Rect r = Rect::fromSize(2, 3, 5, 4);
    expect(r.x2 == 7 && r.y2 == 7, "Rect fromSize extents");
    expect(r.width() == 5 && r.height() == 4, "Rect width/height");
    expect(r.center() == Vec2i{4, 5}, "Rect center");
    expect(r.contains(7, 7) && !r.contains(8, 7), "Rect contains is inclusive");

    const Rect touching = Rect::fromSize(7, 3, 3, 3);
    const Rect apart = Rect::fromSize(9, 3, 3, 3);
    expect(r.intersects(touching), "Rects sharing an edge intersect");
    expect(!r.intersects(apart), "Separated rects do not intersect");
    expect(r.intersects(apart, 1), "Margin makes near rects intersect");
}

void test_prune_walls_pocket() {
    Grid g(10, 10, 1, TileKind::Wall);
    for (int y = 1; y <= 3; ++y) {
        for (int x = 1; x <= 3; ++x) g.at(x, y) = TileKind::Floor;
    }
    g.at(7, 7) = TileKind::Floor;

    const int exitIdx = pruneUnreachableReturningFarthest(g, g.index(1, 1));
    expect(g.at(7, 7) == TileKind::Wall, "Unreachable pocket should be walled");
    expect(g.countTiles(TileKind::Floor) == 9, "Reachable room kept");
    expect(exitIdx == g.index(3, 3), "Farthest tile is the diagonal corner");
    expect(g.blocked[static_cast<size_t>(g.index(7, 7))] == 1, "Blocked recomputed after pruning");
}

void test_prune_cost_cap() {
    Grid g(260, 3, 1, TileKind::Wall);
    for (int x = 1; x <= 258; ++x) g.at(x, 1) = TileKind::Floor;

    const int exitIdx = pruneUnreachableReturningFarthest(g, g.index(1, 1));
    expect(g.at(201, 1) == TileKind::Floor, "Tile at cost 200 is kept");
    expect(g.at(202, 1) == TileKind::Wall, "Tile past the cost cap is walled");
    expect(exitIdx == g.index(201, 1), "Farthest tile stops at the cost cap");

    const std::vector<float> dist = dijkstraDistanceMap(g, g.index(1, 1));
    expect(dist[static_cast<size_t>(g.index(0, 0))] == unreachedDistance(), "Walls stay unreached");
}

void test_prune_no_exit() {
    Grid g(5, 5, 1, TileKind::Wall);
    g.at(2, 2) = TileKind::Floor;
    expect(pruneUnreachableReturningFarthest(g, g.index(2, 2)) == -1, "Lone start tile has no exit");
    expect(g.at(2, 2) == TileKind::Floor, "Start itself is kept");
}

void test_regions_cover_floor() {
    Grid g(40, 30, 1, TileKind::Floor);
    const RegionMap regions = buildNoiseRegionsSeeded(g, 1234u);

    std::vector<int> seen(static_cast<size_t>(g.size()), 0);
    for (const auto& kv : regions) {
        expect(!kv.second.empty(), "Region should not be empty");
        expect(std::is_sorted(kv.second.begin(), kv.second.end()), "Region tiles ascending");
        for (int idx : kv.second) ++seen[static_cast<size_t>(idx)];
    }

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const int n = seen[static_cast<size_t>(g.index(x, y))];
            const bool interior = x > 0 && y > 0 && x < g.width - 1 && y < g.height - 1;
            if (interior) {
                expect(n == 1, "Interior floor tile in exactly one region");
            } else {
                expect(n == 0, "Border tiles are never in a region");
            }
        }
    }
    expect(regions.size() > 1, "A 40x30 floor splits into several regions");

    const RegionMap again = buildNoiseRegionsSeeded(g, 1234u);
    expect(again == regions, "Regions are deterministic per seed");
}

void test_spawn_tables() {
    const std::vector<SpawnEntry> d1 = roomSpawnTable(1);
    expect(d1.size() == 11, "Depth 1 table drops zero-weight entries");
    for (const SpawnEntry& e : d1) {
        expect(e.kind != SpawnKind::LongSword && e.kind != SpawnKind::TowerShield, "No heavy gear at depth 1");
    }
    expect(roomSpawnTable(3).size() == 13, "Depth 3 table has every entry");

    Grid g(10, 10, 1, TileKind::Floor);
    RNG rng(5u);
    int calls = 0;
    spawnRegion(g, {}, rng, 5, [&](SpawnKind, int, int) { ++calls; });
    expect(calls == 0, "Empty area spawns nothing");

    std::vector<int> area;
    for (int i = 0; i < 50; ++i) area.push_back(i);

    std::vector<int> tiles;
    spawnRegion(g, area, rng, 10, [&](SpawnKind, int x, int y) { tiles.push_back(g.index(x, y)); });
    expect(tiles.size() >= 7 && tiles.size() <= 13, "Depth 10 batch size in range");
    expect(std::is_sorted(tiles.begin(), tiles.end()), "Spawns arrive in ascending tile order");
    expect(std::adjacent_find(tiles.begin(), tiles.end()) == tiles.end(), "Spawn tiles are distinct");
    for (int t : tiles) expect(t >= 0 && t < 50, "Spawn tile comes from the area");
}

void test_builder_kind_names() {
    expect(allBuilderKinds().size() == 17, "17 registered generators");

    std::set<std::string> names;
    for (BuilderKind k : allBuilderKinds()) {
        const std::string id = builderKindName(k);
        names.insert(id);

        BuilderKind parsed = BuilderKind::SimpleRooms;
        expect(parseBuilderKind(id, parsed) && parsed == k, "Builder id round trip: " + id);
    }
    expect(names.size() == 17, "Builder ids are unique");

    BuilderKind k = BuilderKind::SimpleRooms;
    expect(parseBuilderKind("BSP_Interior", k) && k == BuilderKind::BspInterior, "Builder ids are case-insensitive");
    expect(!parseBuilderKind("nonsense", k), "Unknown builder id rejected");

    WfcMode m = WfcMode::Random;
    expect(parseWfcMode("always", m) && m == WfcMode::Always, "Parse wfc always");
    expect(parseWfcMode("never", m) && m == WfcMode::Never, "Parse wfc never");
    expect(!parseWfcMode("sometimes", m), "Reject unknown wfc mode");
}

void check_built_level(const MapBuilder& b, const std::string& label) {
    const Grid g = b.getMap();
    expect(g.width == 80 && g.height == 43, label + ": map size");
    expect(static_cast<int>(g.tiles.size()) == 80 * 43, label + ": tile count");
    expect(g.countTiles(TileKind::Placeholder) == 0, label + ": no placeholder tiles left");
    expect(g.countTiles(TileKind::StairsDown) == 1, label + ": exactly one exit");

    const Vec2i start = b.getStartingPosition();
    const Vec2i exit = b.getExitPosition();
    expect(g.inBounds(start.x, start.y) && g.at(start.x, start.y) == TileKind::Floor, label + ": start is floor");
    expect(g.inBounds(exit.x, exit.y) && g.at(exit.x, exit.y) == TileKind::StairsDown, label + ": exit is the stairs");
    expect(allWalkableReachable(g, start), label + ": every walkable tile reachable from start");

    bool ringSolid = true;
    for (int x = 0; x < g.width; ++x) {
        if (isWalkableKind(g.at(x, 0)) || isWalkableKind(g.at(x, g.height - 1))) ringSolid = false;
    }
    for (int y = 0; y < g.height; ++y) {
        if (isWalkableKind(g.at(0, y)) || isWalkableKind(g.at(g.width - 1, y))) ringSolid = false;
    }
    expect(ringSolid, label + ": outer ring has no walkable tile");
}

void test_every_builder() {
    for (BuilderKind k : allBuilderKinds()) {
        for (uint32_t seed = 1; seed <= 3; ++seed) {
            const std::string label = std::string(builderKindName(k)) + " seed " + std::to_string(seed);
            RNG rng(seed);
            auto b = makeBuilder(k, 80, 43, 1);
            std::string err;
            const bool ok = b->build(rng, &err);
            expect(ok, label + ": build failed: " + err);
            if (!ok) continue;
            check_built_level(*b, label);
        }
    }
}

void test_simple_rooms_no_room_space() {
    // Every room spans at least 7 of the 11 usable columns and rows, so a
    // second room always overlaps the first.
    RNG rng(1u);
    SimpleRoomsBuilder b(12, 12, 1);
    std::string err;
    expect(!b.build(rng, &err), "Simple rooms on a 12x12 map fails");
    expect(b.lastFailure() == BuildFailure::NoRooms, "12x12 simple rooms reports no_rooms");
    expect(b.getRooms().size() == 1, "Only the first room fits");
    expect(err.find("Simple Rooms: ") == 0, "Failure message names the builder");
    expect(!b.succeeded() && b.isBuilt(), "Failed build is still marked built");

    std::string again;
    expect(!b.build(rng, &again), "Second build returns the cached failure");
    expect(again.find("no_rooms") != std::string::npos, "Cached failure names its kind");
}

void test_drunkard_iteration_cap() {
    // Walkers are clamped to x,y in 2..3 on a 5x5 map, so at most four
    // tiles can be dug against a target of twelve.
    RNG rng(1u);
    DrunkardWalkBuilder b(5, 5, 1, DrunkardSettings::openArea());
    std::string err;
    expect(!b.build(rng, &err), "Drunkard walk on a 5x5 map fails");
    expect(b.lastFailure() == BuildFailure::IterationCap, "5x5 drunkard walk reports iteration_cap");
    expect(err.find("25 diggers") != std::string::npos, "Digger cap is width*height: " + err);
}

void test_region_finish_failures() {
    Grid lone(5, 5, 1, TileKind::Wall);
    lone.at(2, 2) = TileKind::Floor;
    {
        RNG rng(1u);
        FixedMapBuilder b(lone, Vec2i{2, 2});
        std::string err;
        expect(!b.build(rng, &err), "Lone floor tile fails the region finish");
        expect(b.lastFailure() == BuildFailure::NoExit, "Lone floor tile reports no_exit");
    }
    {
        RNG rng(1u);
        FixedMapBuilder b(lone, Vec2i{0, 0});
        std::string err;
        expect(!b.build(rng, &err), "Start on a wall fails the region finish");
        expect(b.lastFailure() == BuildFailure::NoStart, "Start on a wall reports no_start");
    }
}

void test_build_runs_once_and_map_is_copy() {
    RNG rng(7u);
    CellularAutomataBuilder b(80, 43, 1);
    const bool first = b.build(rng);
    expect(first, "Cellular automata build");
    if (!first) return;

    const Vec2i start = b.getStartingPosition();
    const Grid before = b.getMap();
    expect(b.build(rng) == first, "Second build returns the cached result");
    expect(b.getStartingPosition() == start, "Second build does not regenerate");

    Grid copy = b.getMap();
    copy.fill(TileKind::Void);
    expect(b.getMap().tiles == before.tiles, "Mutating getMap() leaves the builder untouched");
    expect(b.getRooms().empty(), "Cave builder has no rooms");
    expect(!b.getRegions().empty(), "Cave builder partitions into regions");
}

void test_simple_rooms_layout() {
    RNG rng(11u);
    SimpleRoomsBuilder b(80, 43, 1);
    expect(b.build(rng), "Simple rooms build");
    if (!b.succeeded()) return;

    const std::vector<Rect>& rooms = b.getRooms();
    expect(rooms.size() >= 2, "At least two rooms");
    for (size_t i = 0; i < rooms.size(); ++i) {
        for (size_t j = i + 1; j < rooms.size(); ++j) {
            expect(!rooms[i].intersects(rooms[j]), "Rooms do not overlap");
        }
    }
    expect(b.getStartingPosition() == rooms.front().center(), "Start at first room center");
    expect(b.getExitPosition() == rooms.back().center(), "Exit at last room center");

    // No walkable tile may touch Void.
    const Grid g = b.getMap();
    bool sealed = true;
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (g.at(x, y) != TileKind::Void) continue;
            for (int dy = -1; dy <= 1; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (g.inBounds(x + dx, y + dy) && isWalkableKind(g.at(x + dx, y + dy))) sealed = false;
                }
            }
        }
    }
    expect(sealed, "Rooms and corridors are walled off from the void");

    RNG spawnRng(3u);
    b.spawn(spawnRng, [&](SpawnKind, int x, int y) {
        expect(!rooms.front().contains(x, y), "Nothing spawns in the starting room");
        expect(g.at(x, y) == TileKind::Floor, "Spawns land on floor");
    });
}

void test_cellular_start_is_floor() {
    for (uint32_t seed = 20; seed < 25; ++seed) {
        RNG rng(seed);
        CellularAutomataBuilder b(80, 43, 1);
        if (!b.build(rng)) continue;
        const Grid g = b.getMap();
        const Vec2i s = b.getStartingPosition();
        expect(s.y == 43 / 2, "Cave start on the center row");
        expect(g.at(s.x, s.y) == TileKind::Floor, "Cave start is floor");
    }
}

void test_drunkard_presets() {
    DrunkardWalkBuilder b(80, 43, 1, DrunkardSettings::fearfulSymmetry());
    const DrunkardSettings& ds = b.drunkardSettings();
    expect(ds.spawnMode == DrunkSpawnMode::Random && ds.lifetime == 100, "Fearful symmetry walkers");
    expect(ds.symmetry == Symmetry::Both && ds.brushSize == 1, "Fearful symmetry brush");
    expect(b.name() == "Drunkard Walk (" + ds.label + ")", "Drunkard name carries the preset");

    expect(DrunkardSettings::fatPassages().brushSize == 2, "Fat passages use a wide brush");
    expect(DrunkardSettings::openArea().floorPercent > DrunkardSettings::windingPassages().floorPercent,
           "Open area digs more floor than winding passages");
}

void test_wfc_all_floor_source() {
    Grid src(8, 8, 1, TileKind::Floor);
    const std::vector<wfc::Pattern> patterns = wfc::buildPatterns(src, 8, false, true);
    expect(patterns.size() == 1, "Uniform source gives one pattern");
    expect(wfc::buildPatterns(src, 8, true, true).size() == 1, "Flips of a uniform source dedupe away");
    if (patterns.empty()) return;

    const std::vector<wfc::MapChunk> c = wfc::patternsToConstraints(patterns, 8);
    expect(c[0].hasExits, "Open pattern has exits");
    for (int d = 0; d < 4; ++d) {
        const auto& side = c[0].exits[static_cast<size_t>(d)];
        expect(side.size() == 8 && std::all_of(side.begin(), side.end(), [](bool b) { return b; }),
               "Every border cell is an exit");
        expect(c[0].compatibleWith[static_cast<size_t>(d)] == std::vector<int>{0}, "Open pattern fits itself");
    }
}

void test_wfc_flips_and_dedupe() {
    Grid src(4, 4, 1, TileKind::Wall);
    src.at(0, 0) = TileKind::Floor;

    const std::vector<wfc::Pattern> raw = wfc::buildPatterns(src, 4, true, false);
    expect(raw.size() == 4, "Flips give four patterns per chunk");
    if (raw.size() == 4) {
        expect(raw[0][0] == TileKind::Floor, "Unflipped pattern keeps the corner");
        expect(raw[1][3] == TileKind::Floor, "Horizontal flip mirrors to the top-right");
        expect(raw[2][12] == TileKind::Floor, "Vertical flip mirrors to the bottom-left");
        expect(raw[3][15] == TileKind::Floor, "Both-axis flip mirrors to the bottom-right");
    }

    Grid big(24, 16, 1, TileKind::Wall);
    RNG rng(99u);
    for (TileKind& t : big.tiles) {
        if (rng.chance(0.5f)) t = TileKind::Floor;
    }
    const std::vector<wfc::Pattern> all = wfc::buildPatterns(big, 4, true, false);
    expect(all.size() == 4u * 6u * 4u, "Flip count is four per chunk");

    const std::vector<wfc::Pattern> unique = wfc::buildPatterns(big, 4, true, true);
    expect(unique.size() <= all.size(), "Dedupe never adds patterns");
    expect(std::is_sorted(unique.begin(), unique.end()), "Deduped patterns are ordered");
    expect(std::adjacent_find(unique.begin(), unique.end()) == unique.end(), "Deduped patterns are unique");

    expect(wfc::buildPatterns(big, 4, true, true) == unique, "Dedupe is stable across runs");

    const std::set<wfc::Pattern> asSet(all.begin(), all.end());
    expect(asSet.size() == unique.size(), "Dedupe keeps every distinct pattern");

    Grid tiny(3, 3, 1, TileKind::Floor);
    expect(wfc::buildPatterns(tiny, 4, true, true).empty(), "Source smaller than a chunk has no patterns");
}

void test_wfc_compatibility_rule() {
    wfc::Pattern open(4, TileKind::Floor);
    wfc::Pattern closed(4, TileKind::Wall);
    wfc::Pattern half = {TileKind::Floor, TileKind::Wall, TileKind::Floor, TileKind::Wall};

    const wfc::MapChunk o = wfc::computePatternExits(open, 2);
    const wfc::MapChunk c = wfc::computePatternExits(closed, 2);
    const wfc::MapChunk h = wfc::computePatternExits(half, 2);

    expect(!c.hasExits, "Solid pattern has no exits");
    expect(wfc::chunksCompatible(c, o, wfc::EAST), "Closed side accepts anything");
    expect(wfc::chunksCompatible(o, c, wfc::EAST), "Anything accepts a closed side");
    expect(wfc::chunksCompatible(o, o, wfc::EAST), "Identical open sides match");
    // h is open on its west column only.
    expect(wfc::chunksCompatible(o, h, wfc::EAST), "Open east meets h's fully open west");
    expect(wfc::chunksCompatible(h, o, wfc::EAST), "h's closed east side accepts anything");
    expect(!wfc::chunksCompatible(o, h, wfc::NORTH), "Mismatched open bitmaps are rejected");
}

void test_wfc_solver_fills_single_pattern() {
    const std::vector<wfc::Pattern> patterns = {wfc::Pattern(16, TileKind::Wall)};
    const std::vector<wfc::MapChunk> c = wfc::patternsToConstraints(patterns, 4);

    Grid map(16, 12, 1, TileKind::Void);
    wfc::Solver solver(c, 4, map);
    RNG rng(1u);
    int steps = 0;
    while (!solver.iteration(map, rng)) ++steps;

    expect(steps == 12, "One iteration per chunk slot");
    expect(solver.possible(), "Self-compatible pattern always solves");
    expect(map.countTiles(TileKind::Wall) == 16 * 12, "Every slot stamped");
    for (int cy = 0; cy < solver.chunksY(); ++cy) {
        for (int cx = 0; cx < solver.chunksX(); ++cx) {
            expect(solver.chunkAt(cx, cy) == 0, "Slot holds the only pattern");
        }
    }
}

void test_wfc_solver_contradiction() {
    const std::vector<wfc::Pattern> patterns = {
        {TileKind::Floor, TileKind::Wall, TileKind::Wall, TileKind::Floor},
    };
    const std::vector<wfc::MapChunk> c = wfc::patternsToConstraints(patterns, 2);
    expect(c[0].compatibleWith[wfc::EAST].empty(), "Diagonal pattern cannot sit beside itself");

    Grid map(4, 2, 1, TileKind::Wall);
    wfc::Solver solver(c, 2, map);
    RNG rng(2u);
    expect(!solver.iteration(map, rng), "First slot always fills");
    expect(solver.iteration(map, rng), "Second slot ends the run");
    expect(!solver.possible(), "Run reports a contradiction");
}

void test_wfc_solver_respects_constraints() {
    RNG srcRng(4u);
    CellularAutomataBuilder source(80, 43, 1);
    expect(source.build(srcRng), "WFC source builds");
    if (!source.succeeded()) return;

    const std::vector<wfc::Pattern> patterns = wfc::buildPatterns(source.getMap(), 8, true, true);
    const std::vector<wfc::MapChunk> c = wfc::patternsToConstraints(patterns, 8);

    for (uint32_t seed = 1; seed <= 10; ++seed) {
        Grid map(80, 43, 1, TileKind::Wall);
        wfc::Solver solver(c, 8, map);
        RNG rng(seed);
        while (!solver.iteration(map, rng)) {}
        if (!solver.possible()) continue;

        for (int cy = 0; cy < solver.chunksY(); ++cy) {
            for (int cx = 0; cx < solver.chunksX(); ++cx) {
                const int here = solver.chunkAt(cx, cy);
                expect(here >= 0, "Solved run fills every slot");
                if (here < 0) continue;
                if (cx + 1 < solver.chunksX() && solver.chunkAt(cx + 1, cy) >= 0) {
                    expect(wfc::chunksCompatible(c[static_cast<size_t>(here)],
                                                 c[static_cast<size_t>(solver.chunkAt(cx + 1, cy))], wfc::EAST),
                           "East neighbours compatible");
                }
                if (cy + 1 < solver.chunksY() && solver.chunkAt(cx, cy + 1) >= 0) {
                    expect(wfc::chunksCompatible(c[static_cast<size_t>(here)],
                                                 c[static_cast<size_t>(solver.chunkAt(cx, cy + 1))], wfc::SOUTH),
                           "South neighbours compatible");
                }
            }
        }
    }
}

void test_wfc_builder() {
    bool anyOk = false;
    for (uint32_t seed = 1; seed <= 4 && !anyOk; ++seed) {
        RNG rng(seed);
        WfcBuilder b(80, 43, 1, makeBuilder(BuilderKind::CellularAutomata, 80, 43, 1), 8, 64);
        std::string err;
        if (!b.build(rng, &err)) continue;
        anyOk = true;
        expect(b.name() == "Waveform Collapse (Cellular Automata)", "WFC builder name wraps its source");
        expect(b.sourceBuilder().succeeded(), "WFC source was built");
        expect(b.solverRuns() >= 1 && b.solverRuns() <= 64, "Solver runs within budget");
        check_built_level(b, "wfc seed " + std::to_string(seed));
    }
    expect(anyOk, "WFC builder succeeds for some seed in 1..4");
}

void test_wfc_builder_bad_source() {
    {
        RNG rng(1u);
        WfcBuilder b(4, 4, 1, std::make_unique<FixedMapBuilder>(Grid(4, 4, 1, TileKind::Floor)), 8, 4);
        std::string err;
        expect(!b.build(rng, &err), "Source smaller than one chunk fails");
        expect(b.lastFailure() == BuildFailure::BadSource, "Tiny source reports bad_source");
        expect(b.sourceBuilder().succeeded(), "Tiny source itself built");
        expect(b.solverRuns() == 0, "Solver never ran on a bad source");
    }
    {
        RNG rng(1u);
        WfcBuilder b(16, 16, 1, nullptr);
        std::string err;
        expect(!b.build(rng, &err), "Missing source fails");
        expect(b.lastFailure() == BuildFailure::BadSource, "Missing source reports bad_source");
        expect(b.name() == "Waveform Collapse (none)", "Missing source name");
    }
    {
        // An all-wall source solves trivially but leaves nowhere to start.
        RNG rng(1u);
        WfcBuilder b(16, 16, 1, std::make_unique<FixedMapBuilder>(Grid(16, 16, 1, TileKind::Wall)), 8, 4);
        std::string err;
        expect(!b.build(rng, &err), "All-wall source fails");
        expect(b.lastFailure() == BuildFailure::NoStart, "All-wall source reports no_start");
        expect(b.solverRuns() == 1, "All-wall source solves on the first run");
    }
}

void test_wfc_builder_unsolvable() {
    // Tiling one 2x2 chunk with a single wall corner gives four flipped
    // patterns. A slot whose west and north neighbours both hold the
    // wall-bottom-right pattern has no candidate, so greedy runs over a
    // 30x30 slot grid contradict.
    Grid src(60, 60, 1, TileKind::Floor);
    for (int y = 1; y < 60; y += 2) {
        for (int x = 1; x < 60; x += 2) src.at(x, y) = TileKind::Wall;
    }
    expect(wfc::buildPatterns(src, 2, true, true).size() == 4, "Corner chunk has four flipped patterns");

    int failed = 0;
    for (uint32_t seed = 1; seed <= 5; ++seed) {
        RNG rng(seed);
        WfcBuilder b(60, 60, 1, std::make_unique<FixedMapBuilder>(src), 2, 1);
        std::string err;
        if (b.build(rng, &err)) continue;
        ++failed;
        const std::string label = "unsolvable seed " + std::to_string(seed);
        expect(b.lastFailure() == BuildFailure::WfcUnsolvable, label + ": reports wfc_unsolvable: " + err);
        expect(b.solverRuns() == 1, label + ": one solver run allowed");
        expect(err.find("1 solver runs") != std::string::npos, label + ": message carries the budget");
    }
    expect(failed > 0, "Single-run solver contradicts for some seed in 1..5");
}

void test_wfc_solver_borrows_constraints() {
    static_assert(!std::is_constructible<wfc::Solver, std::vector<wfc::MapChunk>&&, int, const Grid&>::value,
                  "Solver must not bind a temporary constraint set");
    static_assert(std::is_constructible<wfc::Solver, const std::vector<wfc::MapChunk>&, int, const Grid&>::value,
                  "Solver borrows an lvalue constraint set");

    Grid map(8, 8, 1, TileKind::Wall);
    wallOuterRing(map);
    expect(map.countTiles(TileKind::Wall) == 64, "Walling a solid map changes nothing");

    Grid open(6, 5, 1, TileKind::Floor);
    open.at(0, 0) = TileKind::StairsDown;
    open.at(3, 0) = TileKind::Void;
    wallOuterRing(open);
    expect(open.countTiles(TileKind::Floor) == 4 * 3, "Only the interior stays floor");
    expect(open.at(0, 0) == TileKind::Wall, "Stairs on the edge are walled");
    expect(open.at(3, 0) == TileKind::Void, "Void on the edge is left alone");
}

void test_generate_level_reproducible() {
    using SpawnCall = std::tuple<int, int, int>;

    LevelGenOptions opts;
    opts.wfcMode = WfcMode::Never;

    auto run = [&](uint32_t seed, GeneratedLevel& out, std::vector<SpawnCall>& calls) {
        RNG rng(seed);
        std::string err;
        const bool ok = generateLevel(rng, 2, opts, [&](SpawnKind k, int x, int y) {
            calls.emplace_back(static_cast<int>(k), x, y);
        }, out, &err);
        expect(ok, "generateLevel failed: " + err);
        return ok;
    };

    GeneratedLevel a;
    GeneratedLevel b;
    std::vector<SpawnCall> ca;
    std::vector<SpawnCall> cb;
    if (!run(314u, a, ca) || !run(314u, b, cb)) return;

    expect(a.map.tiles == b.map.tiles, "Same seed gives the same tiles");
    expect(a.start == b.start && a.exit == b.exit, "Same seed gives the same start and exit");
    expect(a.kind == b.kind && a.builderName == b.builderName, "Same seed picks the same generator");
    expect(ca == cb, "Same seed gives the same spawn calls");
    expect(!a.wfcDerived, "WFC disabled");
    expect(a.map.at(a.exit.x, a.exit.y) == TileKind::StairsDown, "Level exit is the stairs");
    expect(allWalkableReachable(a.map, a.start), "Generated level is connected");
}

void test_generate_level_snapshots_and_forcing() {
    LevelGenOptions opts;
    opts.forceKind = true;
    opts.forcedKind = BuilderKind::Maze;
    opts.wfcMode = WfcMode::Never;

    int frames = 0;
    opts.onSnapshot = [&](const Grid& g) {
        ++frames;
        expect(g.width == opts.width && g.height == opts.height, "Snapshot has the map size");
    };

    RNG rng(8u);
    GeneratedLevel level;
    std::string err;
    expect(generateLevel(rng, 1, opts, nullptr, level, &err), "Forced maze level: " + err);
    expect(level.kind == BuilderKind::Maze, "Forced kind is used");
    expect(frames > 0, "Snapshot observer sees the build");
}

void test_generate_level_forced_wfc() {
    LevelGenOptions opts;
    opts.forceKind = true;
    opts.forcedKind = BuilderKind::CellularAutomata;
    opts.wfcMode = WfcMode::Always;
    opts.maxBuildAttempts = 16;

    RNG rng(21u);
    GeneratedLevel level;
    std::string err;
    const bool ok = generateLevel(rng, 1, opts, nullptr, level, &err);
    expect(ok, "Forced WFC level: " + err);
    if (!ok) return;

    expect(level.wfcDerived, "Level marked as WFC-derived");
    expect(level.builderName.rfind("Waveform Collapse (", 0) == 0, "WFC builder name");
    expect(level.map.countTiles(TileKind::StairsDown) == 1, "WFC level has one exit");
    expect(allWalkableReachable(level.map, level.start), "WFC level is connected");
    expect(static_cast<int>(level.warnings.size()) == level.attempts - 1, "One warning per rejected attempt");
}

void test_generate_level_warns_per_attempt() {
    LevelGenOptions opts;
    opts.width = 12;
    opts.height = 12;
    opts.forceKind = true;
    opts.forcedKind = BuilderKind::SimpleRooms;
    opts.wfcMode = WfcMode::Never;
    opts.maxBuildAttempts = 3;

    RNG rng(5u);
    GeneratedLevel level;
    std::string err;
    expect(!generateLevel(rng, 1, opts, nullptr, level, &err), "12x12 rooms level cannot be generated");
    expect(!err.empty(), "Exhausted retries report an error");
    expect(err.find("3 attempt(s)") != std::string::npos, "Error carries the attempt count: " + err);
    expect(level.attempts == 3, "Every attempt was used");
    expect(level.warnings.size() == 3, "One warning per rejected attempt");
    for (size_t i = 0; i < level.warnings.size(); ++i) {
        const std::string& w = level.warnings[i];
        expect(w.find("attempt " + std::to_string(i + 1) + " ") == 0, "Warning numbered by attempt: " + w);
        expect(w.find("[no_rooms]") != std::string::npos, "Warning names the failure kind: " + w);
    }
}

void test_cellular_noise() {
    for (int i = 0; i < 200; ++i) {
        const float x = static_cast<float>(i % 20) * 1.7f;
        const float y = static_cast<float>(i / 20) * 2.3f;
        const float v = cellularNoise(77u, x, y, 0.08f);
        expect(v >= -1.0f && v <= 1.0f, "Cellular noise stays in [-1, 1]");
        expect(v == cellularNoise(77u, x, y, 0.08f), "Cellular noise is deterministic");

        const CellularSample s = cellularSample(77u, x, y, 0.08f);
        expect(s.distance >= 0.0f, "Feature distance is non-negative");
        const int ix = static_cast<int>(std::floor(static_cast<double>(x) * static_cast<double>(0.08f)));
        expect(std::abs(s.cellX - ix) <= 1, "Feature cell is a lattice neighbour");
    }

    // Points sharing a nearest feature share a value.
    const CellularSample a = cellularSample(9u, 10.0f, 10.0f, 0.05f);
    const CellularSample b = cellularSample(9u, 10.2f, 10.1f, 0.05f);
    if (a.cellX == b.cellX && a.cellY == b.cellY) {
        expect(cellularNoise(9u, 10.0f, 10.0f, 0.05f) == cellularNoise(9u, 10.2f, 10.1f, 0.05f),
               "Same feature cell gives the same value");
    }
}

void test_settings_load_and_clamp() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "undercroft_test_settings.ini";

    {
        std::ofstream f(path);
        f << "# test\n";
        f << "map_width = 500\n";
        f << "map_height = 10 ; too small\n";
        f << "builders = maze, bogus, Simple_Rooms, maze\n";
        f << "wfc_one_in = 0\n";
        f << "wfc_chunk_size = 6\n";
        f << "frame_ms = abc\n";
        f << "vsync = off\n";
        f << "mystery_key = 5\n";
        f << "not a key value line\n";
    }

    const Settings s = loadSettings(path.string());
    expect(s.mapWidth == 200, "map_width clamped to 200");
    expect(s.mapHeight == 24, "map_height clamped to 24");
    expect(s.builders.size() == 2, "Builder list deduped, unknown dropped");
    if (s.builders.size() == 2) {
        expect(s.builders[0] == BuilderKind::Maze && s.builders[1] == BuilderKind::SimpleRooms, "Builder order kept");
    }
    expect(s.unknownBuilders == std::vector<std::string>{"bogus"}, "Unknown builder reported");
    expect(s.wfcOneIn == 0, "wfc_one_in 0 disables WFC");
    expect(s.wfcChunkSize == 6, "wfc_chunk_size parsed");
    expect(s.frameMs == 30, "Bad frame_ms keeps default");
    expect(!s.vsync, "vsync off parsed");

    const LevelGenOptions o = levelGenOptionsFrom(s);
    expect(o.wfcMode == WfcMode::Never, "Disabled WFC maps to Never");
    expect(o.width == 200 && o.height == 24, "Options carry the map size");

    const Settings missing = loadSettings((fs::temp_directory_path() / "undercroft_no_such_file.ini").string());
    expect(missing.mapWidth == 80 && missing.builders.empty(), "Missing file gives defaults");

    expect(writeDefaultSettings(path.string()), "Write default settings");
    const Settings defaults = loadSettings(path.string());
    expect(defaults.mapWidth == 80 && defaults.mapHeight == 43, "Default file round trips size");
    expect(defaults.wfcOneIn == 3 && defaults.builders.empty(), "Default file round trips WFC and builders");

    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running Undercroft tests...\n";

    test_rng_reproducible();
    test_grid_and_rect_basics();
    test_prune_walls_pocket();
    test_prune_cost_cap();
    test_prune_no_exit();
    test_regions_cover_floor();
    test_cellular_noise();
    test_spawn_tables();
    test_builder_kind_names();

    test_every_builder();
    test_simple_rooms_no_room_space();
    test_drunkard_iteration_cap();
    test_region_finish_failures();
    test_build_runs_once_and_map_is_copy();
    test_simple_rooms_layout();
    test_cellular_start_is_floor();
    test_drunkard_presets();

    test_wfc_all_floor_source();
    test_wfc_flips_and_dedupe();
    test_wfc_compatibility_rule();
    test_wfc_solver_fills_single_pattern();
    test_wfc_solver_contradiction();
    test_wfc_solver_respects_constraints();
    test_wfc_builder();
    test_wfc_builder_bad_source();
    test_wfc_builder_unsolvable();
    test_wfc_solver_borrows_constraints();

    test_generate_level_reproducible();
    test_generate_level_snapshots_and_forcing();
    test_generate_level_forced_wfc();
    test_generate_level_warns_per_attempt();

    test_settings_load_and_clamp();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
