#pragma once
#include "common.hpp"
#include "rng.hpp"
#include <cstdint>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    StairsDown,
};

struct Tile {
    TileType type = TileType::Wall;
    bool visible = false;
    bool explored = false;
};

struct Room {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return x + w / 2; }
    int cy() const { return y + h / 2; }

    // True when the rooms overlap or share an edge (no wall between them).
    bool touches(const Room& o) const {
        return x <= o.x2() && x2() >= o.x && y <= o.y2() && y2() >= o.y;
    }
};

struct DungeonGenParams {
    int maxRooms = 12;
    int roomMin = 4;
    int roomMax = 9;
};

class Dungeon {
public:
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;

    std::vector<Room> rooms;
    Vec2i start{ -1, -1 };
    Vec2i stairsDown{ -1, -1 };

    Dungeon() = default;
    Dungeon(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    Tile& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const Tile& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    bool isWalkable(int x, int y) const;
    bool isOpaque(int x, int y) const;
    bool isStairs(int x, int y) const;

    // Rooms-and-corridors layout. Deterministic for a given RNG state.
    // Always leaves a layout with at least two rooms where every walkable
    // tile is reachable from `start`.
    void generate(RNG& rng, const DungeonGenParams& params = DungeonGenParams{});

    // Recomputes `visible` for every tile and adds the visible tiles to the
    // explored set. Explored flags are never cleared here.
    void computeFov(int px, int py, int radius);

    // Clears both the current view and the fog-of-war memory.
    void resetVisibility();

    int visibleCount() const;
    int exploredCount() const;

    bool hasLineOfSight(int x0, int y0, int x1, int y1) const;

    // 4-way BFS step counts over walkable tiles; -1 for unreachable.
    std::vector<int> distanceMap(Vec2i from) const;

    // True if every walkable tile can be reached from `start`.
    bool isFullyConnected() const;

    Vec2i randomFloor(RNG& rng) const;

private:
    bool lineOfSight(int x0, int y0, int x1, int y1) const;
};
