#include "map_builders.hpp"

#include <utility>
#include <vector>

// ------------------------------------------------------------
// Cellular automata caves.
// ------------------------------------------------------------

CellularAutomataBuilder::CellularAutomataBuilder(int w, int h, int d) : MapBuilder(w, h, d) {}

bool CellularAutomataBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            const int roll = rng.rollDice(1, 100);
            map.at(x, y) = (roll > FLOOR_ROLL_THRESHOLD) ? TileKind::Floor : TileKind::Wall;
        }
    }
    takeSnapshot();

    for (int pass = 0; pass < SMOOTHING_PASSES; ++pass) {
        std::vector<TileKind> next = map.tiles;

        for (int y = 1; y < height - 1; ++y) {
            for (int x = 1; x < width - 1; ++x) {
                int walls = 0;
                for (int dy = -1; dy <= 1; ++dy) {
                    for (int dx = -1; dx <= 1; ++dx) {
                        if (dx == 0 && dy == 0) continue;
                        if (map.at(x + dx, y + dy) == TileKind::Wall) ++walls;
                    }
                }

                next[static_cast<size_t>(map.index(x, y))] =
                    (walls > 4 || walls == 0) ? TileKind::Wall : TileKind::Floor;
            }
        }

        map.tiles = std::move(next);
        takeSnapshot();
    }

    if (!findStartNearCenter(map, start)) {
        return fail(BuildFailure::NoStart, "no floor west of the map center", err);
    }
    takeSnapshot();

    return finishWithRegions(rng, err);
}
