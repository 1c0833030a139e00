#include "map_builders.hpp"

#include <cstdint>
#include <vector>

namespace {

enum MazeWall : int { TOP = 0, RIGHT = 1, BOTTOM = 2, LEFT = 3 };

struct MazeCell {
    int row = 0;
    int col = 0;
    bool walls[4] = { true, true, true, true };
    bool visited = false;
};

// Perfect maze over a half-resolution cell lattice. Each cell maps to the
// tile (2*(col+1), 2*(row+1)); open walls become the tile between cells.
class MazeGrid {
public:
    MazeGrid(int rowCount, int colCount) : rows(rowCount), cols(colCount) {
        cells.reserve(static_cast<size_t>(rows * cols));
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                MazeCell cell;
                cell.row = r;
                cell.col = c;
                cells.push_back(cell);
            }
        }
    }

    void generate(RNG& rng) {
        if (cells.empty()) return;

        std::vector<int> stack;
        int current = 0;

        while (true) {
            cells[static_cast<size_t>(current)].visited = true;
            const int next = findNext(current, rng);
            if (next >= 0) {
                cells[static_cast<size_t>(next)].visited = true;
                stack.push_back(current);
                removeWalls(current, next);
                current = next;
            } else if (!stack.empty()) {
                current = stack.back();
                stack.pop_back();
            } else {
                break;
            }
        }
    }

    void copyToMap(Grid& map) const {
        for (const MazeCell& cell : cells) {
            const int x = (cell.col + 1) * 2;
            const int y = (cell.row + 1) * 2;
            if (!map.inBounds(x, y)) continue;

            map.at(x, y) = TileKind::Floor;
            if (!cell.walls[TOP] && map.inBounds(x, y - 1)) map.at(x, y - 1) = TileKind::Floor;
            if (!cell.walls[RIGHT] && map.inBounds(x + 1, y)) map.at(x + 1, y) = TileKind::Floor;
            if (!cell.walls[BOTTOM] && map.inBounds(x, y + 1)) map.at(x, y + 1) = TileKind::Floor;
            if (!cell.walls[LEFT] && map.inBounds(x - 1, y)) map.at(x - 1, y) = TileKind::Floor;
        }
    }

private:
    int cellIndex(int row, int col) const {
        if (row < 0 || col < 0 || row >= rows || col >= cols) return -1;
        return row * cols + col;
    }

    int findNext(int current, RNG& rng) const {
        const MazeCell& c = cells[static_cast<size_t>(current)];
        const int candidates[4] = {
            cellIndex(c.row - 1, c.col),
            cellIndex(c.row, c.col + 1),
            cellIndex(c.row + 1, c.col),
            cellIndex(c.row, c.col - 1),
        };

        std::vector<int> open;
        for (int i : candidates) {
            if (i >= 0 && !cells[static_cast<size_t>(i)].visited) open.push_back(i);
        }

        if (open.empty()) return -1;
        if (open.size() == 1) return open[0];
        return open[static_cast<size_t>(rng.rollDice(1, static_cast<int>(open.size())) - 1)];
    }

    void removeWalls(int a, int b) {
        MazeCell& ca = cells[static_cast<size_t>(a)];
        MazeCell& cb = cells[static_cast<size_t>(b)];
        const int dx = ca.col - cb.col;
        const int dy = ca.row - cb.row;

        if (dx == 1) { ca.walls[LEFT] = false; cb.walls[RIGHT] = false; }
        else if (dx == -1) { ca.walls[RIGHT] = false; cb.walls[LEFT] = false; }
        else if (dy == 1) { ca.walls[TOP] = false; cb.walls[BOTTOM] = false; }
        else if (dy == -1) { ca.walls[BOTTOM] = false; cb.walls[TOP] = false; }
    }

    int rows = 0;
    int cols = 0;
    std::vector<MazeCell> cells;
};

} // namespace

MazeBuilder::MazeBuilder(int w, int h, int d) : MapBuilder(w, h, d) {}

bool MazeBuilder::buildImpl(RNG& rng, std::string* err) {
    map.fill(TileKind::Wall);

    MazeGrid maze(height / 2 - 2, width / 2 - 2);
    maze.generate(rng);
    maze.copyToMap(map);
    takeSnapshot();

    start = { 2, 2 };
    return finishWithRegions(rng, err);
}
