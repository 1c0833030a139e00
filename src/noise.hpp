#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include "rng.hpp"

// --- Deterministic cellular (Worley) noise ------------------------------------
//
// Feature points are jittered per lattice cell from an integer hash, so the
// field is stable for a given seed and needs no allocation.

inline uint32_t hashCoord(uint32_t seed, int x, int y) {
    uint32_t h = seed;
    h = hashCombine(h, static_cast<uint32_t>(x));
    h = hashCombine(h, static_cast<uint32_t>(y));
    return hash32(h);
}

// Nearest feature point under the "natural" metric (squared Euclidean plus
// Manhattan), which gives rounder cells than Manhattan alone.
struct CellularSample {
    float distance = 0.0f;
    int cellX = 0; // lattice cell owning that feature point
    int cellY = 0;
};

inline CellularSample cellularSample(uint32_t seed, float x, float y, float frequency) {
    const double fx = static_cast<double>(x) * static_cast<double>(frequency);
    const double fy = static_cast<double>(y) * static_cast<double>(frequency);

    const int ix = static_cast<int>(std::floor(fx));
    const int iy = static_cast<int>(std::floor(fy));

    const float lx = static_cast<float>(fx - static_cast<double>(ix));
    const float ly = static_cast<float>(fy - static_cast<double>(iy));

    CellularSample s;
    s.distance = std::numeric_limits<float>::infinity();
    s.cellX = ix;
    s.cellY = iy;

    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const int cx = ix + dx;
            const int cy = iy + dy;

            const float px = rand01(hashCoord(seed, cx, cy));
            const float py = rand01(hashCoord(seed ^ 0xB5297A4Du, cx, cy));

            const float vx = static_cast<float>(dx) + px - lx;
            const float vy = static_cast<float>(dy) + py - ly;
            const float d = (vx * vx + vy * vy) + (std::fabs(vx) + std::fabs(vy));

            if (d < s.distance) {
                s.distance = d;
                s.cellX = cx;
                s.cellY = cy;
            }
        }
    }

    return s;
}

// Cell-value noise: a stable value in [-1, 1] shared by every point whose
// nearest feature point is the same.
inline float cellularNoise(uint32_t seed, float x, float y, float frequency) {
    const CellularSample s = cellularSample(seed, x, y, frequency);
    const float v = rand01(hashCoord(seed ^ 0x68E31DA4u, s.cellX, s.cellY));
    return std::clamp(v * 2.0f - 1.0f, -1.0f, 1.0f);
}
