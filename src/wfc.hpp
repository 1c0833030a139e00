#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "grid.hpp"
#include "rng.hpp"

// ------------------------------------------------------------
// Chunk-based Wave Function Collapse.
//
// A finished map is cut into CxC tile patterns. Each pattern records which
// border cells are open (Floor) on each side, and from that which patterns
// may sit next to it. The solver then fills a fresh map chunk by chunk,
// always extending from already-placed neighbours.
//
// Notes:
// - Direction order everywhere is North, South, West, East.
// - The solver never backtracks; a contradiction ends the run with
//   possible() == false and the caller starts a new run.
// ------------------------------------------------------------

namespace wfc {

enum Dir : int { NORTH = 0, SOUTH = 1, WEST = 2, EAST = 3 };

inline int oppositeDir(int d) {
    switch (d) {
        case NORTH: return SOUTH;
        case SOUTH: return NORTH;
        case WEST:  return EAST;
        default:    return WEST;
    }
}

using Pattern = std::vector<TileKind>;

struct MapChunk {
    Pattern pattern;
    // exits[d][i]: border cell i on side d is Floor.
    std::array<std::vector<bool>, 4> exits;
    bool hasExits = true;
    // compatibleWith[d]: patterns allowed on side d of this one.
    std::array<std::vector<int>, 4> compatibleWith;
};

// Cuts `source` into non-overlapping chunks (partial edge chunks are skipped).
// includeFlips adds the horizontal, vertical and both-axis mirrors of every
// chunk. dedupe collapses identical patterns into a sorted unique set.
std::vector<Pattern> buildPatterns(const Grid& source, int chunkSize, bool includeFlips, bool dedupe);

// Exit bitmaps for one pattern.
MapChunk computePatternExits(const Pattern& pattern, int chunkSize);

// Patterns A and B may touch across A's side `dir` when either facing side
// is fully closed, or both facing exit bitmaps are identical.
bool chunksCompatible(const MapChunk& a, const MapChunk& b, int dir);

std::vector<MapChunk> patternsToConstraints(const std::vector<Pattern>& patterns, int chunkSize);

// Writes `pattern` at chunk (chunkX, chunkY) of `map`.
void stampPattern(Grid& map, const Pattern& pattern, int chunkSize, int chunkX, int chunkY);

class Solver {
public:
    // `constraints` is borrowed and must outlive the solver.
    Solver(const std::vector<MapChunk>& constraints, int chunkSize, const Grid& map);
    Solver(std::vector<MapChunk>&& constraints, int chunkSize, const Grid& map) = delete;

    // Places one chunk. Returns true once the run is over, either because
    // every slot is filled or because a contradiction was hit.
    bool iteration(Grid& map, RNG& rng);

    bool possible() const { return isPossible; }
    int chunksX() const { return chunksWide; }
    int chunksY() const { return chunksHigh; }

    // Pattern index at a chunk slot, -1 while empty.
    int chunkAt(int cx, int cy) const { return chunks[static_cast<size_t>(cy * chunksWide + cx)]; }

private:
    struct Outstanding {
        int index = 0;
        int filledNeighbours = 0;
    };

    int filledNeighbourCount(int cx, int cy) const;

    const std::vector<MapChunk>& constraints;
    int chunkSize = 8;
    int chunksWide = 0;
    int chunksHigh = 0;
    std::vector<int> chunks;
    std::vector<Outstanding> remaining;
    bool isPossible = true;
};

} // namespace wfc
