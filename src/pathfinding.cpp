#include "pathfinding.hpp"

#include <algorithm>
#include <deque>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

constexpr int DIRS8[8][2] = {
    {1,0},{-1,0},{0,1},{0,-1},
    {1,1},{1,-1},{-1,1},{-1,-1}
};

} // namespace

std::vector<int> stepsToTarget(
    int width,
    int height,
    Vec2i target,
    const PassableFn& passable,
    const DiagonalOkFn& diagonalOk,
    int maxCost)
{
    std::vector<int> dist(static_cast<size_t>(std::max(0, width) * std::max(0, height)), -1);
    if (width <= 0 || height <= 0) return dist;
    if (!inBounds(width, height, target.x, target.y)) return dist;

    // The target itself is usually occupied (the player), so it is seeded
    // regardless of passable().
    dist[static_cast<size_t>(idxOf(width, target.x, target.y))] = 0;

    std::deque<Vec2i> q;
    q.push_back(target);

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        const int costHere = dist[static_cast<size_t>(idxOf(width, p.x, p.y))];
        if (maxCost >= 0 && costHere >= maxCost) continue;

        for (const auto& dv : DIRS8) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            if (!passable(nx, ny)) continue;

            if (dv[0] != 0 && dv[1] != 0) {
                // Reverse move: neighbor -> current, so flip the direction.
                if (diagonalOk && !diagonalOk(nx, ny, -dv[0], -dv[1])) continue;
            }

            int& slot = dist[static_cast<size_t>(idxOf(width, nx, ny))];
            if (slot >= 0) continue;
            slot = costHere + 1;
            q.push_back({nx, ny});
        }
    }

    return dist;
}

bool diagonalPassable(const Dungeon& dung, const Vec2i& from, int dx, int dy) {
    if (dx == 0 || dy == 0) return true;
    const bool o1 = dung.isWalkable(from.x + dx, from.y);
    const bool o2 = dung.isWalkable(from.x, from.y + dy);
    return o1 || o2;
}
