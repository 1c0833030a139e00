#pragma once

#include "grid.hpp"

#include <vector>

// Reachability over the 8-way tile graph (cardinal step 1.0, diagonal sqrt(2)).
//
// Walkable tiles are those not marked in grid.blocked; callers must run
// populateBlocked() first (pruneUnreachableReturningFarthest does it itself).

constexpr float kMaxReachCost = 200.0f;

// Sentinel for tiles the search never reached.
float unreachedDistance();

// Single-source distances from `startIdx`. Tiles whose accumulated cost would
// exceed `maxCost` are left at unreachedDistance().
std::vector<float> dijkstraDistanceMap(const Grid& grid, int startIdx, float maxCost = kMaxReachCost);

// Converts every Floor tile the search can't reach into Wall and returns the
// index of the reachable Floor tile farthest from start (lowest index on
// ties). Returns -1 if no Floor tile other than start is reachable.
int pruneUnreachableReturningFarthest(Grid& grid, int startIdx);
