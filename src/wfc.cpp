#include "wfc.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace wfc {

namespace {

inline int tileIdxInChunk(int chunkSize, int x, int y) {
    return y * chunkSize + x;
}

bool anyOpen(const std::vector<bool>& side) {
    return std::find(side.begin(), side.end(), true) != side.end();
}

} // namespace

std::vector<Pattern> buildPatterns(const Grid& source, int chunkSize, bool includeFlips, bool dedupe) {
    std::vector<Pattern> patterns;
    if (chunkSize <= 0) return patterns;

    const int chunksX = source.width / chunkSize;
    const int chunksY = source.height / chunkSize;

    for (int cy = 0; cy < chunksY; ++cy) {
        for (int cx = 0; cx < chunksX; ++cx) {
            const int x0 = cx * chunkSize;
            const int y0 = cy * chunkSize;
            const int x1 = x0 + chunkSize; // exclusive
            const int y1 = y0 + chunkSize;

            auto cut = [&](bool flipX, bool flipY) {
                Pattern p;
                p.reserve(static_cast<size_t>(chunkSize * chunkSize));
                for (int y = y0; y < y1; ++y) {
                    for (int x = x0; x < x1; ++x) {
                        const int sx = flipX ? (x0 + x1 - 1 - x) : x;
                        const int sy = flipY ? (y0 + y1 - 1 - y) : y;
                        p.push_back(source.at(sx, sy));
                    }
                }
                patterns.push_back(std::move(p));
            };

            cut(false, false);
            if (includeFlips) {
                cut(true, false);
                cut(false, true);
                cut(true, true);
            }
        }
    }

    if (dedupe) {
        std::set<Pattern> unique(patterns.begin(), patterns.end());
        patterns.assign(unique.begin(), unique.end());
    }

    return patterns;
}

MapChunk computePatternExits(const Pattern& pattern, int chunkSize) {
    MapChunk chunk;
    chunk.pattern = pattern;
    for (auto& side : chunk.exits) side.assign(static_cast<size_t>(chunkSize), false);

    int open = 0;
    auto isFloor = [&](int x, int y) {
        return pattern[static_cast<size_t>(tileIdxInChunk(chunkSize, x, y))] == TileKind::Floor;
    };

    for (int i = 0; i < chunkSize; ++i) {
        if (isFloor(i, 0))             { chunk.exits[NORTH][static_cast<size_t>(i)] = true; ++open; }
        if (isFloor(i, chunkSize - 1)) { chunk.exits[SOUTH][static_cast<size_t>(i)] = true; ++open; }
        if (isFloor(0, i))             { chunk.exits[WEST][static_cast<size_t>(i)] = true; ++open; }
        if (isFloor(chunkSize - 1, i)) { chunk.exits[EAST][static_cast<size_t>(i)] = true; ++open; }
    }

    chunk.hasExits = (open > 0);
    return chunk;
}

bool chunksCompatible(const MapChunk& a, const MapChunk& b, int dir) {
    const std::vector<bool>& mine = a.exits[static_cast<size_t>(dir)];
    const std::vector<bool>& theirs = b.exits[static_cast<size_t>(oppositeDir(dir))];

    // A solid side accepts anything.
    if (!anyOpen(mine) || !anyOpen(theirs)) return true;
    return mine == theirs;
}

std::vector<MapChunk> patternsToConstraints(const std::vector<Pattern>& patterns, int chunkSize) {
    std::vector<MapChunk> constraints;
    constraints.reserve(patterns.size());
    for (const Pattern& p : patterns) constraints.push_back(computePatternExits(p, chunkSize));

    for (size_t i = 0; i < constraints.size(); ++i) {
        for (size_t j = 0; j < constraints.size(); ++j) {
            for (int d = 0; d < 4; ++d) {
                if (chunksCompatible(constraints[i], constraints[j], d)) {
                    constraints[i].compatibleWith[static_cast<size_t>(d)].push_back(static_cast<int>(j));
                }
            }
        }
    }

    return constraints;
}

void stampPattern(Grid& map, const Pattern& pattern, int chunkSize, int chunkX, int chunkY) {
    const int x0 = chunkX * chunkSize;
    const int y0 = chunkY * chunkSize;
    size_t i = 0;
    for (int y = y0; y < y0 + chunkSize; ++y) {
        for (int x = x0; x < x0 + chunkSize; ++x) {
            if (i < pattern.size() && map.inBounds(x, y)) map.at(x, y) = pattern[i];
            ++i;
        }
    }
}

Solver::Solver(const std::vector<MapChunk>& constraintSet, int chunk, const Grid& map)
    : constraints(constraintSet), chunkSize(chunk) {
    chunksWide = (chunkSize > 0) ? map.width / chunkSize : 0;
    chunksHigh = (chunkSize > 0) ? map.height / chunkSize : 0;
    chunks.assign(static_cast<size_t>(chunksWide * chunksHigh), -1);

    remaining.reserve(chunks.size());
    for (int i = 0; i < chunksWide * chunksHigh; ++i) remaining.push_back({i, 0});
}

int Solver::filledNeighbourCount(int cx, int cy) const {
    int n = 0;
    if (cx > 0 && chunkAt(cx - 1, cy) >= 0) ++n;
    if (cx < chunksWide - 1 && chunkAt(cx + 1, cy) >= 0) ++n;
    if (cy > 0 && chunkAt(cx, cy - 1) >= 0) ++n;
    if (cy < chunksHigh - 1 && chunkAt(cx, cy + 1) >= 0) ++n;
    return n;
}

bool Solver::iteration(Grid& map, RNG& rng) {
    if (remaining.empty()) return true;
    if (constraints.empty()) {
        isPossible = false;
        return true;
    }

    bool anyNeighbours = false;
    for (Outstanding& r : remaining) {
        r.filledNeighbours = filledNeighbourCount(r.index % chunksWide, r.index / chunksWide);
        if (r.filledNeighbours > 0) anyNeighbours = true;
    }
    std::stable_sort(remaining.begin(), remaining.end(), [](const Outstanding& a, const Outstanding& b) {
        return a.filledNeighbours > b.filledNeighbours;
    });

    const int pick = anyNeighbours ? 0 : rng.range(0, static_cast<int>(remaining.size()) - 1);
    const int slot = remaining[static_cast<size_t>(pick)].index;
    remaining.erase(remaining.begin() + pick);

    const int cx = slot % chunksWide;
    const int cy = slot / chunksWide;

    // Each filled neighbour contributes the list of patterns it accepts on
    // the side facing this slot.
    std::vector<const std::vector<int>*> options;
    if (cx > 0 && chunkAt(cx - 1, cy) >= 0) {
        options.push_back(&constraints[static_cast<size_t>(chunkAt(cx - 1, cy))].compatibleWith[EAST]);
    }
    if (cx < chunksWide - 1 && chunkAt(cx + 1, cy) >= 0) {
        options.push_back(&constraints[static_cast<size_t>(chunkAt(cx + 1, cy))].compatibleWith[WEST]);
    }
    if (cy > 0 && chunkAt(cx, cy - 1) >= 0) {
        options.push_back(&constraints[static_cast<size_t>(chunkAt(cx, cy - 1))].compatibleWith[SOUTH]);
    }
    if (cy < chunksHigh - 1 && chunkAt(cx, cy + 1) >= 0) {
        options.push_back(&constraints[static_cast<size_t>(chunkAt(cx, cy + 1))].compatibleWith[NORTH]);
    }

    int chosen = -1;
    if (options.empty()) {
        chosen = rng.range(0, static_cast<int>(constraints.size()) - 1);
    } else {
        std::vector<int> candidates;
        for (int c : *options.front()) {
            bool everywhere = true;
            for (size_t o = 1; o < options.size(); ++o) {
                const std::vector<int>& list = *options[o];
                if (std::find(list.begin(), list.end(), c) == list.end()) {
                    everywhere = false;
                    break;
                }
            }
            if (everywhere) candidates.push_back(c);
        }

        if (candidates.empty()) {
            isPossible = false;
            return true;
        }

        const int k = (candidates.size() == 1) ? 0 : rng.range(0, static_cast<int>(candidates.size()) - 1);
        chosen = candidates[static_cast<size_t>(k)];
    }

    chunks[static_cast<size_t>(slot)] = chosen;
    stampPattern(map, constraints[static_cast<size_t>(chosen)].pattern, chunkSize, cx, cy);
    return false;
}

} // namespace wfc
