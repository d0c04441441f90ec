#pragma once
#include "sdl.hpp"

#include "common.hpp"
#include <cstdint>
#include <string>

// Built-in 5x7 bitmap font (upper-case ASCII plus the map glyphs), so the
// window frontend needs no SDL_ttf.

struct Glyph5x7 {
    char ch;
    // 7 rows, 5 bits used (bit 4 is leftmost).
    uint8_t rows[7];
};

constexpr Glyph5x7 FONT_5X7[] = {
    {' ', {0, 0, 0, 0, 0, 0, 0}},
    {'0', {0b01110, 0b10001, 0b10011, 0b10101, 0b11001, 0b10001, 0b01110}},
    {'1', {0b00100, 0b01100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}},
    {'2', {0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0b01000, 0b11111}},
    {'3', {0b11110, 0b00001, 0b00001, 0b01110, 0b00001, 0b00001, 0b11110}},
    {'4', {0b00010, 0b00110, 0b01010, 0b10010, 0b11111, 0b00010, 0b00010}},
    {'5', {0b11111, 0b10000, 0b10000, 0b11110, 0b00001, 0b00001, 0b11110}},
    {'6', {0b00110, 0b01000, 0b10000, 0b11110, 0b10001, 0b10001, 0b01110}},
    {'7', {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b01000, 0b01000}},
    {'8', {0b01110, 0b10001, 0b10001, 0b01110, 0b10001, 0b10001, 0b01110}},
    {'9', {0b01110, 0b10001, 0b10001, 0b01111, 0b00001, 0b00010, 0b01100}},
    {'A', {0b01110, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
    {'B', {0b11110, 0b10001, 0b10001, 0b11110, 0b10001, 0b10001, 0b11110}},
    {'C', {0b01110, 0b10001, 0b10000, 0b10000, 0b10000, 0b10001, 0b01110}},
    {'D', {0b11100, 0b10010, 0b10001, 0b10001, 0b10001, 0b10010, 0b11100}},
    {'E', {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b11111}},
    {'F', {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b10000}},
    {'G', {0b01110, 0b10001, 0b10000, 0b10000, 0b10011, 0b10001, 0b01110}},
    {'H', {0b10001, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
    {'I', {0b01110, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}},
    {'J', {0b00001, 0b00001, 0b00001, 0b00001, 0b10001, 0b10001, 0b01110}},
    {'K', {0b10001, 0b10010, 0b10100, 0b11000, 0b10100, 0b10010, 0b10001}},
    {'L', {0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b11111}},
    {'M', {0b10001, 0b11011, 0b10101, 0b10101, 0b10001, 0b10001, 0b10001}},
    {'N', {0b10001, 0b10001, 0b11001, 0b10101, 0b10011, 0b10001, 0b10001}},
    {'O', {0b01110, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
    {'P', {0b11110, 0b10001, 0b10001, 0b11110, 0b10000, 0b10000, 0b10000}},
    {'Q', {0b01110, 0b10001, 0b10001, 0b10001, 0b10101, 0b10010, 0b01101}},
    {'R', {0b11110, 0b10001, 0b10001, 0b11110, 0b10100, 0b10010, 0b10001}},
    {'S', {0b01111, 0b10000, 0b10000, 0b01110, 0b00001, 0b00001, 0b11110}},
    {'T', {0b11111, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100}},
    {'U', {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
    {'V', {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01010, 0b00100}},
    {'W', {0b10001, 0b10001, 0b10001, 0b10101, 0b10101, 0b10101, 0b01010}},
    {'X', {0b10001, 0b10001, 0b01010, 0b00100, 0b01010, 0b10001, 0b10001}},
    {'Y', {0b10001, 0b10001, 0b01010, 0b00100, 0b00100, 0b00100, 0b00100}},
    {'Z', {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b11111}},
    {'.', {0, 0, 0, 0, 0, 0b01100, 0b01100}},
    {',', {0, 0, 0, 0, 0, 0b01100, 0b00100}},
    {'!', {0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0, 0b00100}},
    {'?', {0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0, 0b00100}},
    {':', {0, 0b01100, 0b01100, 0, 0b01100, 0b01100, 0}},
    {';', {0, 0b01100, 0b01100, 0, 0b01100, 0b00100, 0}},
    {'-', {0, 0, 0, 0b11111, 0, 0, 0}},
    {'_', {0, 0, 0, 0, 0, 0, 0b11111}},
    {'/', {0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0, 0}},
    {'\\', {0b10000, 0b01000, 0b00100, 0b00010, 0b00001, 0, 0}},
    {'>', {0b10000, 0b01000, 0b00100, 0b00010, 0b00100, 0b01000, 0b10000}},
    {'<', {0b00001, 0b00010, 0b00100, 0b01000, 0b00100, 0b00010, 0b00001}},
    {'|', {0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100}},
    {'+', {0, 0b00100, 0b00100, 0b11111, 0b00100, 0b00100, 0}},
    {'=', {0, 0, 0b11111, 0, 0b11111, 0, 0}},
    {'(', {0b00100, 0b01000, 0b10000, 0b10000, 0b10000, 0b01000, 0b00100}},
    {')', {0b00100, 0b00010, 0b00001, 0b00001, 0b00001, 0b00010, 0b00100}},
    {'[', {0b11100, 0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b11100}},
    {']', {0b00111, 0b00001, 0b00001, 0b00001, 0b00001, 0b00001, 0b00111}},
    {'\'', {0b00100, 0b00100, 0, 0, 0, 0, 0}},
    {'"', {0b01010, 0b01010, 0, 0, 0, 0, 0}},
    {'#', {0b01010, 0b01010, 0b11111, 0b01010, 0b11111, 0b01010, 0b01010}},
    {'*', {0, 0b10101, 0b01110, 0b11111, 0b01110, 0b10101, 0}},
    {'%', {0b11001, 0b11010, 0b00010, 0b00100, 0b01000, 0b01011, 0b10011}},
};

constexpr Glyph5x7 FONT_5X7_UNKNOWN = {'?', {0b01110, 0b10001, 0b00010, 0b00100, 0b00100, 0, 0b00100}};

inline const Glyph5x7& glyph5x7(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    for (const auto& g : FONT_5X7) {
        if (g.ch == c) return g;
    }
    return FONT_5X7_UNKNOWN;
}

// Draws one glyph with each font pixel as a `sx` x `sy` block.
inline void drawGlyph5x7(SDL_Renderer* r, int x, int y, int sx, int sy, char ch) {
    const Glyph5x7& g = glyph5x7(ch);
    for (int row = 0; row < 7; ++row) {
        const uint8_t bits = g.rows[row];
        for (int col = 0; col < 5; ++col) {
            if (bits & (1 << (4 - col))) {
                SDL_Rect px{x + col * sx, y + row * sy, sx, sy};
                SDL_RenderFillRect(r, &px);
            }
        }
    }
}

inline void drawText5x7(SDL_Renderer* r, int x, int y, int scale, Color c, const std::string& text) {
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);

    int penX = x;
    for (char ch : text) {
        drawGlyph5x7(r, penX, y, scale, scale, ch);
        // 1 column spacing
        penX += (5 + 1) * scale;
    }
}

// Centers a map glyph inside a square map cell of `cell` pixels.
inline void drawCellGlyph(SDL_Renderer* r, int x, int y, int cell, Color c, char ch) {
    const int s = (cell >= 8) ? cell / 8 : 1;
    const int ox = (cell - 5 * s) / 2;
    const int oy = (cell - 7 * s) / 2;
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
    drawGlyph5x7(r, x + ox, y + oy, s, s, ch);
}
