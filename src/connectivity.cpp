#include "connectivity.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace {

constexpr int DIRS8[8][2] = {
    {1,0},{-1,0},{0,1},{0,-1},
    {1,1},{1,-1},{-1,1},{-1,-1}
};

using Node = std::pair<float, int>; // (cost, idx)

} // namespace

float unreachedDistance() {
    return std::numeric_limits<float>::max();
}

std::vector<float> dijkstraDistanceMap(const Grid& grid, int startIdx, float maxCost) {
    const float INF = unreachedDistance();
    std::vector<float> dist(static_cast<size_t>(grid.size()), INF);
    if (startIdx < 0 || startIdx >= grid.size()) return dist;

    const float diag = std::sqrt(2.0f);

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> pq;
    dist[static_cast<size_t>(startIdx)] = 0.0f;
    pq.push({0.0f, startIdx});

    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();

        const float costHere = cur.first;
        const int i = cur.second;
        if (costHere > dist[static_cast<size_t>(i)]) continue;

        const Vec2i p = grid.posOf(i);
        for (const auto& d : DIRS8) {
            const int nx = p.x + d[0];
            const int ny = p.y + d[1];
            if (!grid.inBounds(nx, ny)) continue;

            const int ni = grid.index(nx, ny);
            if (grid.blocked[static_cast<size_t>(ni)]) continue;

            const float step = (d[0] != 0 && d[1] != 0) ? diag : 1.0f;
            const float nc = costHere + step;
            if (nc > maxCost) continue;

            if (nc < dist[static_cast<size_t>(ni)]) {
                dist[static_cast<size_t>(ni)] = nc;
                pq.push({nc, ni});
            }
        }
    }

    return dist;
}

int pruneUnreachableReturningFarthest(Grid& grid, int startIdx) {
    grid.populateBlocked();

    const float INF = unreachedDistance();
    const std::vector<float> dist = dijkstraDistanceMap(grid, startIdx, kMaxReachCost);

    int exitIdx = -1;
    float exitDist = 0.0f;

    for (int i = 0; i < grid.size(); ++i) {
        TileKind& t = grid.tiles[static_cast<size_t>(i)];
        if (t != TileKind::Floor) continue;

        const float d = dist[static_cast<size_t>(i)];
        if (d == INF) {
            t = TileKind::Wall;
            continue;
        }
        if (i != startIdx && d > exitDist) {
            exitDist = d;
            exitIdx = i;
        }
    }

    grid.populateBlocked();
    return exitIdx;
}
