#include "map_builders.hpp"

#include <utility>

DlaSettings DlaSettings::walkInwards() {
    DlaSettings s;
    s.label = "Walk Inwards";
    s.algorithm = DlaAlgorithm::WalkInwards;
    s.brushSize = 1;
    return s;
}

DlaSettings DlaSettings::walkOutwards() {
    DlaSettings s;
    s.label = "Walk Outwards";
    s.algorithm = DlaAlgorithm::WalkOutwards;
    s.brushSize = 2;
    return s;
}

DlaSettings DlaSettings::centralAttractor() {
    DlaSettings s;
    s.label = "Central Attractor";
    s.algorithm = DlaAlgorithm::CentralAttractor;
    s.brushSize = 2;
    return s;
}

DlaSettings DlaSettings::insectoid() {
    DlaSettings s = centralAttractor();
    s.label = "Insectoid";
    s.symmetry = Symmetry::Horizontal;
    return s;
}

DlaBuilder::DlaBuilder(int w, int h, int d, DlaSettings s)
    : MapBuilder(w, h, d), settings(std::move(s)) {}

bool DlaBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    start = { width / 2, height / 2 };
    takeSnapshot();

    // Seed blob: the center and its four neighbours.
    map.at(start.x, start.y) = TileKind::Floor;
    map.at(start.x - 1, start.y) = TileKind::Floor;
    map.at(start.x + 1, start.y) = TileKind::Floor;
    map.at(start.x, start.y - 1) = TileKind::Floor;
    map.at(start.x, start.y + 1) = TileKind::Floor;

    const int desired = static_cast<int>(settings.floorPercent * static_cast<float>(map.size()));
    const int maxWalkers = map.size() * 4;
    const int maxSteps = map.size() * 16;

    auto stagger = [&](Vec2i& p) {
        switch (rng.rollDice(1, 4)) {
            case 1: if (p.x > 2) --p.x; break;
            case 2: if (p.x < width - 2) ++p.x; break;
            case 3: if (p.y > 2) --p.y; break;
            default: if (p.y < height - 2) ++p.y; break;
        }
    };

    auto randomInterior = [&]() {
        Vec2i p;
        p.x = rng.rollDice(1, width - 3) + 1;
        p.y = rng.rollDice(1, height - 3) + 1;
        return p;
    };

    int floorCount = map.countTiles(TileKind::Floor);
    int walkers = 0;

    while (floorCount < desired) {
        if (walkers >= maxWalkers) {
            return fail(BuildFailure::IterationCap,
                        "gave up after " + std::to_string(walkers) + " walkers", err);
        }
        ++walkers;

        int steps = 0;
        switch (settings.algorithm) {
            case DlaAlgorithm::WalkInwards: {
                // Wander until touching the existing floor, then stick where we were.
                Vec2i p = randomInterior();
                Vec2i prev = p;
                while (map.at(p.x, p.y) == TileKind::Wall) {
                    if (++steps > maxSteps) {
                        return fail(BuildFailure::IterationCap, "walker exceeded its step budget", err);
                    }
                    prev = p;
                    stagger(p);
                }
                paintSymmetric(map, settings.symmetry, settings.brushSize, prev.x, prev.y);
                break;
            }
            case DlaAlgorithm::WalkOutwards: {
                // Wander out of the blob and stick at the first wall.
                Vec2i p = start;
                while (map.at(p.x, p.y) == TileKind::Floor) {
                    if (++steps > maxSteps) {
                        return fail(BuildFailure::IterationCap, "walker exceeded its step budget", err);
                    }
                    stagger(p);
                }
                paintSymmetric(map, settings.symmetry, settings.brushSize, p.x, p.y);
                break;
            }
            case DlaAlgorithm::CentralAttractor: {
                // Fly straight at the center and stick just before the floor.
                Vec2i p = randomInterior();
                Vec2i prev = p;
                const std::vector<Vec2i> path = bresenhamLine(p, start);
                size_t next = 0;
                while (map.at(p.x, p.y) == TileKind::Wall && next < path.size()) {
                    prev = p;
                    p = path[next++];
                }
                paintSymmetric(map, settings.symmetry, settings.brushSize, prev.x, prev.y);
                break;
            }
        }

        takeSnapshot();
        floorCount = map.countTiles(TileKind::Floor);
    }

    return finishWithRegions(rng, err);
}
