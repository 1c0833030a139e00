#pragma once

#include "grid.hpp"
#include "rng.hpp"

#include <map>
#include <vector>

// Region id -> Floor tile indices (ascending). Ordered by id so spawn order
// is stable for a given seed.
using RegionMap = std::map<int, std::vector<int>>;

constexpr float kRegionNoiseFrequency = 0.08f;

// Groups interior Floor tiles (1..w-2, 1..h-2) by a quantized cellular noise
// bucket. The noise seed is a d65536 roll taken from `rng`.
RegionMap buildNoiseRegions(const Grid& grid, RNG& rng);

// Same grouping with an explicit noise seed.
RegionMap buildNoiseRegionsSeeded(const Grid& grid, uint32_t noiseSeed);
