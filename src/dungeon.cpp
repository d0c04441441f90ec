#include "dungeon.hpp"

#include <algorithm>
#include <deque>
#include <functional>

namespace {

void fillWalls(Dungeon& d) {
    for (auto& t : d.tiles) {
        t.type = TileType::Wall;
        t.visible = false;
        t.explored = false;
    }
}

void carveFloor(Dungeon& d, int x, int y) {
    // Never carve the outer border.
    if (x <= 0 || y <= 0 || x >= d.width - 1 || y >= d.height - 1) return;
    d.at(x, y).type = TileType::Floor;
}

void carveRoom(Dungeon& d, const Room& r) {
    for (int y = r.y; y < r.y2(); ++y) {
        for (int x = r.x; x < r.x2(); ++x) {
            carveFloor(d, x, y);
        }
    }
}

void carveH(Dungeon& d, int x1, int x2, int y) {
    if (x2 < x1) std::swap(x1, x2);
    for (int x = x1; x <= x2; ++x) carveFloor(d, x, y);
}

void carveV(Dungeon& d, int y1, int y2, int x) {
    if (y2 < y1) std::swap(y1, y2);
    for (int y = y1; y <= y2; ++y) carveFloor(d, x, y);
}

// L-shaped corridor between room centers.
void connectRooms(Dungeon& d, const Room& a, const Room& b, RNG& rng) {
    const int ax = a.cx();
    const int ay = a.cy();
    const int bx = b.cx();
    const int by = b.cy();

    if (rng.chance(0.5f)) {
        carveH(d, ax, bx, ay);
        carveV(d, ay, by, bx);
    } else {
        carveV(d, ay, by, ax);
        carveH(d, ax, bx, by);
    }
}

void placeRooms(Dungeon& d, RNG& rng, const DungeonGenParams& params) {
    // Rooms must fit inside the border with at least one wall to spare.
    const int maxSide = std::max(1, std::min({params.roomMax, d.width - 3, d.height - 3}));
    const int minSide = clampi(params.roomMin, 1, maxSide);

    for (int i = 0; i < params.maxRooms; ++i) {
        Room r;
        r.w = rng.range(minSide, maxSide);
        r.h = rng.range(minSide, maxSide);
        r.x = rng.range(1, d.width - r.w - 2);
        r.y = rng.range(1, d.height - r.h - 2);

        bool rejected = false;
        for (const Room& o : d.rooms) {
            if (r.touches(o)) { rejected = true; break; }
        }
        if (rejected) continue;

        carveRoom(d, r);
        if (!d.rooms.empty()) {
            connectRooms(d, d.rooms.back(), r, rng);
        }
        d.rooms.push_back(r);
    }
}

void placeStairs(Dungeon& d) {
    const Room& first = d.rooms.front();
    const Room& last = d.rooms.back();
    d.start = { first.cx(), first.cy() };
    d.stairsDown = { last.cx(), last.cy() };
    d.at(d.stairsDown.x, d.stairsDown.y).type = TileType::StairsDown;
}

// Deterministic two-room layout used only if random placement keeps failing
// (e.g. on very small maps).
void fallbackLayout(Dungeon& d, RNG& rng) {
    fillWalls(d);
    d.rooms.clear();

    const int side = std::max(1, std::min(3, std::min(d.width, d.height) / 2 - 2));
    Room a{ 1, 1, side, side };
    Room b{ d.width - 1 - side, d.height - 1 - side, side, side };
    carveRoom(d, a);
    carveRoom(d, b);
    connectRooms(d, a, b, rng);
    d.rooms.push_back(a);
    d.rooms.push_back(b);
}

} // namespace

Dungeon::Dungeon(int w, int h) : width(w), height(h) {
    tiles.resize(static_cast<size_t>(width * height));
}

bool Dungeon::isWalkable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    TileType t = at(x, y).type;
    return (t == TileType::Floor || t == TileType::StairsDown);
}

bool Dungeon::isOpaque(int x, int y) const {
    if (!inBounds(x, y)) return true;
    return at(x, y).type == TileType::Wall;
}

bool Dungeon::isStairs(int x, int y) const {
    if (!inBounds(x, y)) return false;
    return at(x, y).type == TileType::StairsDown;
}

void Dungeon::generate(RNG& rng, const DungeonGenParams& params) {
    // A default-constructed Dungeon starts at 0x0. Ensure we have a valid grid
    // allocated before generation begins.
    if (width < 8 || height < 8) {
        width = std::max(width, 8);
        height = std::max(height, 8);
    }
    const size_t expect = static_cast<size_t>(width * height);
    if (tiles.size() != expect) tiles.assign(expect, Tile{});

    constexpr int MAX_ATTEMPTS = 100;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        fillWalls(*this);
        rooms.clear();
        placeRooms(*this, rng, params);
        if (rooms.size() < 2) continue;

        placeStairs(*this);
        if (isFullyConnected()) return;
    }

    fallbackLayout(*this, rng);
    placeStairs(*this);
}

bool Dungeon::lineOfSight(int x0, int y0, int x1, int y1) const {
    // Bresenham line; stop if opaque tile blocks.
    // A diagonal step between two opaque tiles also blocks, so ranged
    // attackers cannot shoot through wall corners.
    int dx = std::abs(x1 - x0);
    int dy = std::abs(y1 - y0);
    int sx = (x0 < x1) ? 1 : -1;
    int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    int x = x0;
    int y = y0;

    while (true) {
        if (!(x == x0 && y == y0)) {
            if (isOpaque(x, y)) return false;
        }
        if (x == x1 && y == y1) break;

        const int prevX = x;
        const int prevY = y;

        int e2 = err * 2;
        if (e2 > -dy) { err -= dy; x += sx; }
        if (e2 <  dx) { err += dx; y += sy; }

        if (!inBounds(x, y)) return false;

        const int stepX = x - prevX;
        const int stepY = y - prevY;
        if (stepX != 0 && stepY != 0) {
            if (isOpaque(prevX + stepX, prevY) && isOpaque(prevX, prevY + stepY)) return false;
        }
    }

    return true;
}

bool Dungeon::hasLineOfSight(int x0, int y0, int x1, int y1) const {
    if (!inBounds(x0, y0) || !inBounds(x1, y1)) return false;
    return lineOfSight(x0, y0, x1, y1);
}

void Dungeon::computeFov(int px, int py, int radius) {
    // Reset the current view each turn; explored memory is kept.
    for (auto& t : tiles) t.visible = false;
    if (!inBounds(px, py)) return;

    auto markVis = [&](int x, int y) {
        if (!inBounds(x, y)) return;
        Tile& t = at(x, y);
        t.visible = true;
        t.explored = true;
    };

    // Always see your own tile
    markVis(px, py);
    if (radius <= 0) return;

    // Recursive shadowcasting for 8 octants.
    // Reference: RogueBasin "Recursive Shadowcasting".
    const int r2 = radius * radius;

    std::function<void(int, float, float, int, int, int, int)> castLight;
    castLight = [&](int row, float startSlope, float endSlope, int xx, int xy, int yx, int yy) {
        if (startSlope < endSlope) return;
        float newStart = startSlope;
        for (int dist = row; dist <= radius; ++dist) {
            bool blocked = false;

            for (int dx = -dist, dy = -dist; dx <= 0; ++dx) {
                const float lSlope = (dx - 0.5f) / (dy + 0.5f);
                const float rSlope = (dx + 0.5f) / (dy - 0.5f);
                if (startSlope < rSlope) continue;
                if (endSlope > lSlope) break;

                const int ax = px + dx * xx + dy * xy;
                const int ay = py + dx * yx + dy * yy;

                if (!inBounds(ax, ay)) continue;
                if (dist2({ax, ay}, {px, py}) <= r2) {
                    markVis(ax, ay);
                }

                if (blocked) {
                    if (isOpaque(ax, ay)) {
                        newStart = rSlope;
                        continue;
                    }
                    blocked = false;
                    startSlope = newStart;
                } else if (isOpaque(ax, ay) && dist < radius) {
                    blocked = true;
                    castLight(dist + 1, startSlope, lSlope, xx, xy, yx, yy);
                    newStart = rSlope;
                }
            }

            if (blocked) break;
        }
    };

    // Octant transforms
    castLight(1, 1.0f, 0.0f, 1, 0, 0, 1);
    castLight(1, 1.0f, 0.0f, 0, 1, 1, 0);
    castLight(1, 1.0f, 0.0f, 0, -1, 1, 0);
    castLight(1, 1.0f, 0.0f, -1, 0, 0, 1);
    castLight(1, 1.0f, 0.0f, -1, 0, 0, -1);
    castLight(1, 1.0f, 0.0f, 0, -1, -1, 0);
    castLight(1, 1.0f, 0.0f, 0, 1, -1, 0);
    castLight(1, 1.0f, 0.0f, 1, 0, 0, -1);
}

void Dungeon::resetVisibility() {
    for (auto& t : tiles) {
        t.visible = false;
        t.explored = false;
    }
}

int Dungeon::visibleCount() const {
    return static_cast<int>(std::count_if(tiles.begin(), tiles.end(), [](const Tile& t) { return t.visible; }));
}

int Dungeon::exploredCount() const {
    return static_cast<int>(std::count_if(tiles.begin(), tiles.end(), [](const Tile& t) { return t.explored; }));
}

std::vector<int> Dungeon::distanceMap(Vec2i from) const {
    std::vector<int> dist(static_cast<size_t>(width * height), -1);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * width + x); };

    if (!isWalkable(from.x, from.y)) return dist;
    dist[idx(from.x, from.y)] = 0;

    std::deque<Vec2i> q;
    q.push_back(from);

    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};

    while (!q.empty()) {
        Vec2i p = q.front();
        q.pop_front();
        const int cd = dist[idx(p.x, p.y)];

        for (auto& dv : dirs) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!isWalkable(nx, ny)) continue;
            const size_t ii = idx(nx, ny);
            if (dist[ii] != -1) continue;
            dist[ii] = cd + 1;
            q.push_back({nx, ny});
        }
    }

    return dist;
}

bool Dungeon::isFullyConnected() const {
    if (!isWalkable(start.x, start.y)) return false;
    const auto dist = distanceMap(start);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (isWalkable(x, y) && dist[static_cast<size_t>(y * width + x)] < 0) return false;
        }
    }
    return true;
}

Vec2i Dungeon::randomFloor(RNG& rng) const {
    for (int tries = 0; tries < 4000; ++tries) {
        int x = rng.range(1, width - 2);
        int y = rng.range(1, height - 2);
        if (at(x, y).type == TileType::Floor) return {x, y};
    }
    // Fallback: scan
    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            if (at(x, y).type == TileType::Floor) return {x, y};
        }
    }
    return start;
}
