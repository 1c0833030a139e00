#include "map_builders.hpp"

#include <algorithm>
#include <cstdlib>

// ------------------------------------------------------------
// Simple rooms: rejection-sampled rectangles joined by L-shaped tunnels.
// ------------------------------------------------------------

SimpleRoomsBuilder::SimpleRoomsBuilder(int w, int h, int d) : MapBuilder(w, h, d) {}

bool SimpleRoomsBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Void);

    for (int attempt = 0; attempt < MAX_ROOMS; ++attempt) {
        const int w = rng.range(MIN_SIZE, MAX_SIZE);
        const int h = rng.range(MIN_SIZE, MAX_SIZE);
        const int x = rng.rollDice(1, width - w - 1) - 1;
        const int y = rng.rollDice(1, height - h - 1) - 1;
        const Rect room = Rect::fromSize(x, y, w, h);

        bool ok = true;
        for (const Rect& other : rooms) {
            if (room.intersects(other)) {
                ok = false;
                break;
            }
        }
        if (!ok) continue;

        applyRoomToMap(map, room);

        if (!rooms.empty()) {
            const Vec2i a = rooms.back().center();
            const Vec2i b = room.center();
            if (rng.range(0, 1) == 1) {
                applyHorizontalTunnel(map, a.x, b.x, a.y);
                applyVerticalTunnel(map, a.y, b.y, b.x);
            } else {
                applyVerticalTunnel(map, a.y, b.y, a.x);
                applyHorizontalTunnel(map, a.x, b.x, b.y);
            }
        }

        rooms.push_back(room);
        takeSnapshot();
    }

    return finishWithRooms(err);
}

// ------------------------------------------------------------
// BSP dungeon: rooms dropped into quadrant subdivisions, then linked in
// left-to-right order.
// ------------------------------------------------------------

BspDungeonBuilder::BspDungeonBuilder(int w, int h, int d) : MapBuilder(w, h, d) {}

void BspDungeonBuilder::addSubrects(const Rect& r) {
    const int halfW = std::max(r.width() / 2, 1);
    const int halfH = std::max(r.height() / 2, 1);

    rects.push_back(Rect::fromSize(r.x1, r.y1, halfW, halfH));
    rects.push_back(Rect::fromSize(r.x1, r.y1 + halfH, halfW, halfH));
    rects.push_back(Rect::fromSize(r.x1 + halfW, r.y1, halfW, halfH));
    rects.push_back(Rect::fromSize(r.x1 + halfW, r.y1 + halfH, halfW, halfH));
}

Rect BspDungeonBuilder::randomSubRect(const Rect& r, RNG& rng) const {
    const int w = std::max(3, rng.rollDice(1, std::min(r.width(), 10)) - 1) + 1;
    const int h = std::max(3, rng.rollDice(1, std::min(r.height(), 10)) - 1) + 1;

    Rect out = r;
    out.x1 += rng.rollDice(1, 6) - 1;
    out.y1 += rng.rollDice(1, 6) - 1;
    out.x2 = out.x1 + w;
    out.y2 = out.y1 + h;
    return out;
}

bool BspDungeonBuilder::isPossible(const Rect& r) const {
    // Two tiles of clearance on every side, inside the outer wall ring.
    for (int y = r.y1 - 2; y <= r.y2 + 2; ++y) {
        for (int x = r.x1 - 2; x <= r.x2 + 2; ++x) {
            if (x < 1 || y < 1 || x > width - 2 || y > height - 2) return false;
            if (!map.isVoidOrWall(x, y)) return false;
        }
    }
    return true;
}

bool BspDungeonBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Void);

    rects.clear();
    const Rect first = Rect::fromSize(2, 2, width - 5, height - 5);
    rects.push_back(first);
    addSubrects(first);

    for (int attempt = 0; attempt < PLACEMENT_ATTEMPTS; ++attempt) {
        const Rect leaf = rects[static_cast<size_t>(rng.rollDice(1, static_cast<int>(rects.size())) - 1)];
        const Rect candidate = randomSubRect(leaf, rng);

        if (isPossible(candidate)) {
            applyRoomToMap(map, candidate);
            rooms.push_back(candidate);
            addSubrects(leaf);
            takeSnapshot();
        }
    }

    std::stable_sort(rooms.begin(), rooms.end(), [](const Rect& a, const Rect& b) { return a.x1 < b.x1; });

    for (size_t i = 0; i + 1 < rooms.size(); ++i) {
        const Rect& room = rooms[i];
        const Rect& next = rooms[i + 1];

        const int sx = room.x1 + (rng.rollDice(1, std::abs(room.x1 - room.x2)) - 1);
        const int sy = room.y1 + (rng.rollDice(1, std::abs(room.y1 - room.y2)) - 1);
        const int ex = next.x1 + (rng.rollDice(1, std::abs(next.x1 - next.x2)) - 1);
        const int ey = next.y1 + (rng.rollDice(1, std::abs(next.y1 - next.y2)) - 1);

        drawCorridor(map, sx, sy, ex, ey);
        takeSnapshot();
    }

    return finishWithRooms(err);
}

// ------------------------------------------------------------
// BSP interior: the whole map is split into touching rooms separated by
// single walls.
// ------------------------------------------------------------

BspInteriorBuilder::BspInteriorBuilder(int w, int h, int d) : MapBuilder(w, h, d) {}

void BspInteriorBuilder::addSubrects(const Rect& r, RNG& rng) {
    // The rect being split is always the most recently pushed one.
    if (!rects.empty()) rects.pop_back();

    const int w = r.width();
    const int h = r.height();
    const int halfW = w / 2;
    const int halfH = h / 2;

    if (rng.rollDice(1, 4) <= 2) {
        const Rect a = Rect::fromSize(r.x1, r.y1, halfW - 1, h);
        rects.push_back(a);
        if (halfW > MIN_ROOM_SIZE) addSubrects(a, rng);

        const Rect b = Rect::fromSize(r.x1 + halfW, r.y1, halfW, h);
        rects.push_back(b);
        if (halfW > MIN_ROOM_SIZE) addSubrects(b, rng);
    } else {
        const Rect a = Rect::fromSize(r.x1, r.y1, w, halfH - 1);
        rects.push_back(a);
        if (halfH > MIN_ROOM_SIZE) addSubrects(a, rng);

        const Rect b = Rect::fromSize(r.x1, r.y1 + halfH, w, halfH);
        rects.push_back(b);
        if (halfH > MIN_ROOM_SIZE) addSubrects(b, rng);
    }
}

bool BspInteriorBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    rects.clear();
    const Rect first = Rect::fromSize(1, 1, width - 2, height - 2);
    rects.push_back(first);
    addSubrects(first, rng);

    rooms = rects;
    for (const Rect& r : rooms) {
        for (int y = r.y1; y < r.y2; ++y) {
            for (int x = r.x1; x < r.x2; ++x) {
                if (map.inBounds(x, y)) map.at(x, y) = TileKind::Floor;
            }
        }
        takeSnapshot();
    }

    for (size_t i = 0; i + 1 < rooms.size(); ++i) {
        const Rect& room = rooms[i];
        const Rect& next = rooms[i + 1];

        const int sx = room.x1 + (rng.rollDice(1, std::abs(room.x1 - room.x2)) - 1);
        const int sy = room.y1 + (rng.rollDice(1, std::abs(room.y1 - room.y2)) - 1);
        const int ex = next.x1 + (rng.rollDice(1, std::abs(next.x1 - next.x2)) - 1);
        const int ey = next.y1 + (rng.rollDice(1, std::abs(next.y1 - next.y2)) - 1);

        drawCorridor(map, sx, sy, ex, ey);
        takeSnapshot();
    }

    return finishWithRooms(err);
}
