#include "builder_common.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

void wallUnlessWalkable(Grid& map, int x, int y) {
    if (!map.inBounds(x, y)) return;
    TileKind& t = map.at(x, y);
    if (!isWalkableKind(t)) t = TileKind::Wall;
}

void carveFloor(Grid& map, int x, int y) {
    if (!map.inBounds(x, y)) return;
    map.at(x, y) = TileKind::Floor;
}

void applyBrush(Grid& map, int brushSize, int x, int y) {
    auto paintOne = [&](int px, int py) {
        if (px < 1 || py < 1 || px > map.width - 2 || py > map.height - 2) return;
        map.at(px, py) = TileKind::Floor;
    };

    if (brushSize <= 1) {
        paintOne(x, y);
        return;
    }

    const int half = brushSize / 2;
    for (int by = y - half; by < y + half; ++by) {
        for (int bx = x - half; bx < x + half; ++bx) {
            paintOne(bx, by);
        }
    }
}

} // namespace

void applyRoomToMap(Grid& map, const Rect& room) {
    for (int y = room.y1; y <= room.y2; ++y) {
        for (int x = room.x1; x <= room.x2; ++x) {
            if (!map.inBounds(x, y)) continue;
            const bool border = (y == room.y1 || y == room.y2 || x == room.x1 || x == room.x2);
            if (border) {
                wallUnlessWalkable(map, x, y);
            } else {
                map.at(x, y) = TileKind::Floor;
            }
        }
    }
}

void applyHorizontalTunnel(Grid& map, int x1, int x2, int y) {
    for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) {
        carveFloor(map, x, y);
        wallUnlessWalkable(map, x, y - 1);
        wallUnlessWalkable(map, x, y + 1);
    }
}

void applyVerticalTunnel(Grid& map, int y1, int y2, int x) {
    for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) {
        carveFloor(map, x, y);
        wallUnlessWalkable(map, x - 1, y);
        wallUnlessWalkable(map, x + 1, y);
    }
}

void drawCorridor(Grid& map, int x1, int y1, int x2, int y2) {
    int x = x1;
    int y = y1;
    carveFloor(map, x, y);

    while (x != x2 || y != y2) {
        if (x < x2) ++x;
        else if (x > x2) --x;
        else if (y < y2) ++y;
        else if (y > y2) --y;

        carveFloor(map, x, y);
    }
}

void paintSymmetric(Grid& map, Symmetry mode, int brushSize, int x, int y) {
    const int cx = map.width / 2;
    const int cy = map.height / 2;

    switch (mode) {
        case Symmetry::None:
            applyBrush(map, brushSize, x, y);
            break;
        case Symmetry::Horizontal:
            if (x == cx) {
                applyBrush(map, brushSize, x, y);
            } else {
                const int dx = std::abs(cx - x);
                applyBrush(map, brushSize, cx + dx, y);
                applyBrush(map, brushSize, cx - dx, y);
            }
            break;
        case Symmetry::Vertical:
            if (y == cy) {
                applyBrush(map, brushSize, x, y);
            } else {
                const int dy = std::abs(cy - y);
                applyBrush(map, brushSize, x, cy + dy);
                applyBrush(map, brushSize, x, cy - dy);
            }
            break;
        case Symmetry::Both:
            if (x == cx && y == cy) {
                applyBrush(map, brushSize, x, y);
            } else {
                const int dx = std::abs(cx - x);
                applyBrush(map, brushSize, cx + dx, y);
                applyBrush(map, brushSize, cx - dx, y);
                const int dy = std::abs(cy - y);
                applyBrush(map, brushSize, x, cy + dy);
                applyBrush(map, brushSize, x, cy - dy);
            }
            break;
    }
}

std::vector<Vec2i> bresenhamLine(Vec2i a, Vec2i b) {
    std::vector<Vec2i> pts;

    int x0 = a.x;
    int y0 = a.y;
    const int dx = std::abs(b.x - x0);
    const int sx = (x0 < b.x) ? 1 : -1;
    const int dy = -std::abs(b.y - y0);
    const int sy = (y0 < b.y) ? 1 : -1;
    int err = dx + dy;

    while (true) {
        pts.push_back({x0, y0});
        if (x0 == b.x && y0 == b.y) break;
        const int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }

    return pts;
}

bool findStartNearCenter(const Grid& map, Vec2i& out) {
    const int y = map.height / 2;
    for (int x = map.width / 2; x >= 0; --x) {
        if (map.at(x, y) == TileKind::Floor) {
            out = {x, y};
            return true;
        }
    }
    return false;
}

void wallUpExposedVoid(Grid& map) {
    std::vector<int> toWall;
    for (int y = 0; y < map.height; ++y) {
        for (int x = 0; x < map.width; ++x) {
            if (map.at(x, y) != TileKind::Void) continue;

            bool exposed = false;
            for (int dy = -1; dy <= 1 && !exposed; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (dx == 0 && dy == 0) continue;
                    const int nx = x + dx;
                    const int ny = y + dy;
                    if (!map.inBounds(nx, ny)) continue;
                    if (isWalkableKind(map.at(nx, ny))) {
                        exposed = true;
                        break;
                    }
                }
            }
            if (exposed) toWall.push_back(map.index(x, y));
        }
    }

    for (int i : toWall) map.tiles[static_cast<size_t>(i)] = TileKind::Wall;
}

void wallOuterRing(Grid& map) {
    if (map.width <= 0 || map.height <= 0) return;
    auto seal = [&](int x, int y) {
        if (isWalkableKind(map.at(x, y))) map.at(x, y) = TileKind::Wall;
    };
    for (int x = 0; x < map.width; ++x) {
        seal(x, 0);
        seal(x, map.height - 1);
    }
    for (int y = 0; y < map.height; ++y) {
        seal(0, y);
        seal(map.width - 1, y);
    }
}
