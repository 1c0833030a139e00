#include "map_builders.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <vector>

const char* distanceMetricName(DistanceMetric m) {
    switch (m) {
        case DistanceMetric::Pythagoras: return "Pythagoras";
        case DistanceMetric::Manhattan:  return "Manhattan";
        case DistanceMetric::Chebyshev:  return "Chebyshev";
        default:                         return "Unknown";
    }
}

namespace {

float metricDistance(DistanceMetric m, int x0, int y0, int x1, int y1) {
    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    switch (m) {
        case DistanceMetric::Manhattan: return static_cast<float>(dx + dy);
        case DistanceMetric::Chebyshev: return static_cast<float>(std::max(dx, dy));
        case DistanceMetric::Pythagoras:
        default:
            return static_cast<float>(dx * dx + dy * dy);
    }
}

} // namespace

VoronoiBuilder::VoronoiBuilder(int w, int h, int d, DistanceMetric m)
    : MapBuilder(w, h, d), metric(m) {}

bool VoronoiBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    // Distinct seed points. Capped so a tiny map can't spin forever.
    const int seedCount = std::min(SEED_COUNT, (width - 1) * (height - 1));
    std::vector<Vec2i> seeds;
    seeds.reserve(static_cast<size_t>(seedCount));
    int draws = 0;
    while (static_cast<int>(seeds.size()) < seedCount) {
        if (++draws > map.size() * 8) {
            return fail(BuildFailure::IterationCap, "could not place distinct seed points", err);
        }
        const Vec2i p{ rng.rollDice(1, width - 1), rng.rollDice(1, height - 1) };
        if (std::find(seeds.begin(), seeds.end(), p) == seeds.end()) seeds.push_back(p);
    }

    // Nearest seed per tile; ties keep the lower seed index.
    std::vector<int> membership(static_cast<size_t>(map.size()), 0);
    for (int i = 0; i < map.size(); ++i) {
        const Vec2i p = map.posOf(i);
        float best = std::numeric_limits<float>::max();
        int bestSeed = 0;
        for (size_t s = 0; s < seeds.size(); ++s) {
            const float d = metricDistance(metric, p.x, p.y, seeds[s].x, seeds[s].y);
            if (d < best) {
                best = d;
                bestSeed = static_cast<int>(s);
            }
        }
        membership[static_cast<size_t>(i)] = bestSeed;
    }

    // Cell interiors become floor; tiles on a boundary between cells stay wall.
    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            const int mine = membership[static_cast<size_t>(map.index(x, y))];
            int foreign = 0;
            if (membership[static_cast<size_t>(map.index(x - 1, y))] != mine) ++foreign;
            if (membership[static_cast<size_t>(map.index(x + 1, y))] != mine) ++foreign;
            if (membership[static_cast<size_t>(map.index(x, y - 1))] != mine) ++foreign;
            if (membership[static_cast<size_t>(map.index(x, y + 1))] != mine) ++foreign;

            if (foreign < 2) map.at(x, y) = TileKind::Floor;
        }
        takeSnapshot();
    }

    if (!findStartNearCenter(map, start)) {
        return fail(BuildFailure::NoStart, "no floor west of the map center", err);
    }

    return finishWithRegions(rng, err);
}
