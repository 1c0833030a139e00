#pragma once
#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

enum class TileKind : uint8_t {
    Void = 0,
    // Transient marker for a drunkard's trail. Never survives a build.
    Placeholder,
    Wall,
    Floor,
    StairsDown,
};

const char* tileKindName(TileKind k);

// ASCII glyph used by the headless dump and tests.
char tileGlyph(TileKind k);

inline bool isWalkableKind(TileKind k) {
    return k == TileKind::Floor || k == TileKind::StairsDown;
}

// Axis-aligned rectangle, x2/y2 are one past the last column/row for rooms
// built through fromSize().
struct Rect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    static Rect fromSize(int x, int y, int w, int h) {
        Rect r;
        r.x1 = x;
        r.y1 = y;
        r.x2 = x + w;
        r.y2 = y + h;
        return r;
    }

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }

    Vec2i center() const { return { (x1 + x2) / 2, (y1 + y2) / 2 }; }

    bool contains(int x, int y) const {
        return x >= x1 && x <= x2 && y >= y1 && y <= y2;
    }

    // Inclusive overlap test. `margin` grows both rectangles so rooms keep
    // that many tiles of separation.
    bool intersects(const Rect& o, int margin = 0) const {
        return x1 - margin <= o.x2 + margin && x2 + margin >= o.x1 - margin &&
               y1 - margin <= o.y2 + margin && y2 + margin >= o.y1 - margin;
    }
};

class Grid {
public:
    int width = 0;
    int height = 0;
    int depth = 1;

    std::vector<TileKind> tiles;
    std::vector<uint8_t> revealed;
    std::vector<uint8_t> visible;
    std::vector<uint8_t> blocked;

    // Occupant entity ids per tile. Owned by the runtime; generation leaves it empty.
    std::vector<std::vector<int>> tileContent;

    Grid() = default;
    Grid(int w, int h, int depth, TileKind fill = TileKind::Wall);

    int index(int x, int y) const { return y * width + x; }
    Vec2i posOf(int idx) const { return { idx % width, idx / width }; }
    int size() const { return width * height; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    TileKind& at(int x, int y) { return tiles[static_cast<size_t>(index(x, y))]; }
    TileKind at(int x, int y) const { return tiles[static_cast<size_t>(index(x, y))]; }

    void fill(TileKind k);

    // blocked[i] = tile is Wall or Void.
    void populateBlocked();
    void clearContentIndex();

    bool isVoidOrWall(int x, int y) const;
    int countTiles(TileKind k) const;

    // Copy for history playback: everything revealed and visible.
    Grid snapshot() const;

    // Copy handed to the runtime: fresh revealed/visible, blocked recomputed,
    // no occupants.
    Grid frozen() const;
};
