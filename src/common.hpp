#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2i& a, const Vec2i& b) { return !(a == b); }

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

// Squared euclidean distance; compare against r*r to avoid sqrt.
inline int dist2(const Vec2i& a, const Vec2i& b) {
    const int dx = a.x - b.x;
    const int dy = a.y - b.y;
    return dx * dx + dy * dy;
}

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}
