#pragma once

#include "common.hpp"
#include "dungeon.hpp"

#include <functional>
#include <vector>

// Distance fields for 8-way grid movement, used by enemy AI.
//
// Conventions:
//   - passable(x,y) should return true if the tile can be entered (ignoring
//     entities).
//   - diagonalOk(fromX,fromY,dx,dy) is called only for diagonal moves, where
//     (dx,dy) is one of (+/-1,+/-1). Return false to prevent corner-cutting.

using PassableFn   = std::function<bool(int x, int y)>;
using DiagonalOkFn = std::function<bool(int fromX, int fromY, int dx, int dy)>;

// Builds a "steps-to-target" map, where cost[i] is the minimum number of
// moves needed to reach `target` from tile i.
//
// Unreachable tiles are -1.
//
// If maxCost >= 0, the search is truncated (tiles farther than maxCost
// remain -1).
std::vector<int> stepsToTarget(
    int width,
    int height,
    Vec2i target,
    const PassableFn& passable,
    const DiagonalOkFn& diagonalOk,
    int maxCost = -1);

// Prevents corner-cutting through two blocked orthogonal tiles.
bool diagonalPassable(const Dungeon& dung, const Vec2i& from, int dx, int dy);

inline bool isAdjacent8(const Vec2i& a, const Vec2i& b) {
    const int dx = std::abs(a.x - b.x);
    const int dy = std::abs(a.y - b.y);
    return (dx <= 1 && dy <= 1 && (dx + dy) != 0);
}
