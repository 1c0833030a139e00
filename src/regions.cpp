#include "regions.hpp"

#include "noise.hpp"

RegionMap buildNoiseRegions(const Grid& grid, RNG& rng) {
    const uint32_t seed = static_cast<uint32_t>(rng.rollDice(1, 65536));
    return buildNoiseRegionsSeeded(grid, seed);
}

RegionMap buildNoiseRegionsSeeded(const Grid& grid, uint32_t noiseSeed) {
    RegionMap regions;

    for (int y = 1; y < grid.height - 1; ++y) {
        for (int x = 1; x < grid.width - 1; ++x) {
            if (grid.at(x, y) != TileKind::Floor) continue;

            const float v = cellularNoise(noiseSeed, static_cast<float>(x), static_cast<float>(y),
                                          kRegionNoiseFrequency);
            const int bucket = static_cast<int>(v * 10240.0f);
            regions[bucket].push_back(grid.index(x, y));
        }
    }

    return regions;
}
