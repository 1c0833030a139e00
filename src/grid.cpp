#include "grid.hpp"

#include <algorithm>

const char* tileKindName(TileKind k) {
    switch (k) {
        case TileKind::Void:        return "Void";
        case TileKind::Placeholder: return "Placeholder";
        case TileKind::Wall:        return "Wall";
        case TileKind::Floor:       return "Floor";
        case TileKind::StairsDown:  return "StairsDown";
        default:                    return "Unknown";
    }
}

char tileGlyph(TileKind k) {
    switch (k) {
        case TileKind::Void:        return ' ';
        case TileKind::Placeholder: return '?';
        case TileKind::Wall:        return '#';
        case TileKind::Floor:       return '.';
        case TileKind::StairsDown:  return '>';
        default:                    return '!';
    }
}

Grid::Grid(int w, int h, int d, TileKind fillKind)
    : width(w), height(h), depth(d) {
    const size_t n = static_cast<size_t>(std::max(0, w * h));
    tiles.assign(n, fillKind);
    revealed.assign(n, 0);
    visible.assign(n, 0);
    blocked.assign(n, 0);
    tileContent.assign(n, {});
}

void Grid::fill(TileKind k) {
    std::fill(tiles.begin(), tiles.end(), k);
}

void Grid::populateBlocked() {
    blocked.resize(tiles.size());
    for (size_t i = 0; i < tiles.size(); ++i) {
        const TileKind k = tiles[i];
        blocked[i] = (k == TileKind::Wall || k == TileKind::Void) ? 1 : 0;
    }
}

void Grid::clearContentIndex() {
    tileContent.assign(tiles.size(), {});
}

bool Grid::isVoidOrWall(int x, int y) const {
    const TileKind k = at(x, y);
    return k == TileKind::Void || k == TileKind::Wall;
}

int Grid::countTiles(TileKind k) const {
    return static_cast<int>(std::count(tiles.begin(), tiles.end(), k));
}

Grid Grid::snapshot() const {
    Grid g;
    g.width = width;
    g.height = height;
    g.depth = depth;
    g.tiles = tiles;
    g.revealed.assign(tiles.size(), 1);
    g.visible.assign(tiles.size(), 1);
    g.populateBlocked();
    g.tileContent.assign(tiles.size(), {});
    return g;
}

Grid Grid::frozen() const {
    Grid g;
    g.width = width;
    g.height = height;
    g.depth = depth;
    g.tiles = tiles;
    g.revealed.assign(tiles.size(), 0);
    g.visible.assign(tiles.size(), 0);
    g.populateBlocked();
    g.tileContent.assign(tiles.size(), {});
    return g;
}
