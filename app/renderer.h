/*---------------------------------------------------------*/
/*                                                         */
/*   renderer.h - Drawing and key polling capability       */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef RENDERER_H
#define RENDERER_H

#include "grid.h"
#include "input_resolver.h"

#include <cstdint>
#include <string>

enum class Glyph : uint8_t { Empty, Wall, Head, Body, Food, Obstacle };

// What the game loop needs from a terminal. Positions are (row, col)
// on the board; anything outside the renderer's area is clipped.
class Renderer {
public:
    virtual ~Renderer() {}

    virtual void clear() = 0;
    virtual void drawCell(const Position& pos, Glyph glyph) = 0;
    virtual void drawText(const Position& pos, const std::string& text) = 0;

    // Takes the single pending key, if any.
    virtual bool pollKey(KeyEvent& out) = 0;
};

#endif // RENDERER_H
