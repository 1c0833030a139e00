#pragma once

#include "common.hpp"
#include "grid.hpp"

#include <cstdint>
#include <vector>

// Shared carving helpers for the map builders.

enum class Symmetry : uint8_t {
    None = 0,
    Horizontal,
    Vertical,
    Both,
};

// Room with a Wall border (x1..x2, y1..y2 inclusive) and Floor inside.
// Border tiles that are already Floor (corridors) are kept.
void applyRoomToMap(Grid& map, const Rect& room);

// Straight one-tile corridors, flanked by Wall wherever the flank is not
// already walkable.
void applyHorizontalTunnel(Grid& map, int x1, int x2, int y);
void applyVerticalTunnel(Grid& map, int y1, int y2, int x);

// Steps x toward the target first, then y, turning every tile on the way
// (both ends included) into Floor.
void drawCorridor(Grid& map, int x1, int y1, int x2, int y2);

// Floor brush of `brushSize` (1 = single tile) centered at (x, y), mirrored
// around the map center per `mode`. The outer ring of the map is never
// painted.
void paintSymmetric(Grid& map, Symmetry mode, int brushSize, int x, int y);

// Points on the line from a to b, both ends included.
std::vector<Vec2i> bresenhamLine(Vec2i a, Vec2i b);

// Walks left from the map center until it finds Floor. Returns false when the
// row has no Floor left of (and including) the center.
bool findStartNearCenter(const Grid& map, Vec2i& out);

// Turns every Void tile that touches (8-way) a walkable tile into Wall.
void wallUpExposedVoid(Grid& map);

// Turns walkable tiles on the outermost row/column into Wall.
void wallOuterRing(Grid& map);
