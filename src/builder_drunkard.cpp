#include "map_builders.hpp"

#include <utility>

DrunkardSettings DrunkardSettings::openArea() {
    DrunkardSettings s;
    s.label = "Open Area";
    s.spawnMode = DrunkSpawnMode::StartingPoint;
    s.lifetime = 400;
    s.floorPercent = 0.5f;
    return s;
}

DrunkardSettings DrunkardSettings::openHalls() {
    DrunkardSettings s;
    s.label = "Open Halls";
    s.spawnMode = DrunkSpawnMode::Random;
    s.lifetime = 400;
    s.floorPercent = 0.5f;
    return s;
}

DrunkardSettings DrunkardSettings::windingPassages() {
    DrunkardSettings s;
    s.label = "Winding Passages";
    s.spawnMode = DrunkSpawnMode::StartingPoint;
    s.lifetime = 100;
    s.floorPercent = 0.4f;
    return s;
}

DrunkardSettings DrunkardSettings::fatPassages() {
    DrunkardSettings s = windingPassages();
    s.label = "Fat Passages";
    s.brushSize = 2;
    return s;
}

DrunkardSettings DrunkardSettings::fearfulSymmetry() {
    DrunkardSettings s;
    s.label = "Fearful Symmetry";
    s.spawnMode = DrunkSpawnMode::Random;
    s.lifetime = 100;
    s.floorPercent = 0.4f;
    s.symmetry = Symmetry::Both;
    return s;
}

DrunkardWalkBuilder::DrunkardWalkBuilder(int w, int h, int d, DrunkardSettings s)
    : MapBuilder(w, h, d), settings(std::move(s)) {}

bool DrunkardWalkBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    start = { width / 2, height / 2 };
    map.at(start.x, start.y) = TileKind::Floor;

    const int desired = static_cast<int>(settings.floorPercent * static_cast<float>(map.size()));
    const int maxDiggers = map.size();

    int floorCount = map.countTiles(TileKind::Floor);
    int diggers = 0;

    while (floorCount < desired) {
        if (diggers >= maxDiggers) {
            return fail(BuildFailure::IterationCap,
                        "gave up after " + std::to_string(diggers) + " diggers", err);
        }

        Vec2i p = start;
        if (diggers > 0 && settings.spawnMode == DrunkSpawnMode::Random) {
            p.x = rng.rollDice(1, width - 3) + 1;
            p.y = rng.rollDice(1, height - 3) + 1;
        }

        bool dug = false;
        for (int life = settings.lifetime; life > 0; --life) {
            if (map.at(p.x, p.y) == TileKind::Wall) dug = true;
            paintSymmetric(map, settings.symmetry, settings.brushSize, p.x, p.y);
            // Trail marker so history playback shows this digger's path.
            map.at(p.x, p.y) = TileKind::Placeholder;

            switch (rng.rollDice(1, 4)) {
                case 1: if (p.x > 2) --p.x; break;
                case 2: if (p.x < width - 2) ++p.x; break;
                case 3: if (p.y > 2) --p.y; break;
                default: if (p.y < height - 2) ++p.y; break;
            }
        }

        if (dug) takeSnapshot();
        ++diggers;

        for (TileKind& t : map.tiles) {
            if (t == TileKind::Placeholder) t = TileKind::Floor;
        }
        floorCount = map.countTiles(TileKind::Floor);
    }

    return finishWithRegions(rng, err);
}
