#pragma once
#include "vec2.h"
#include "color.h"

// Drawing capability the simulation renders through. Coordinates are
// y-down pixels with the origin at the top-left, the same space the
// pointer is reported in.
class Surface {
public:
    virtual ~Surface() = default;

    virtual void set_surface_size(int width, int height) = 0;
    virtual void clear(float x, float y, float width, float height) = 0;
    virtual void fill_disc(Vec2 center, float radius, Color color) = 0;
    // (x, y) is the top-left of the text
    virtual void draw_text(const char* text, float x, float y, float scale,
                           Color color) = 0;
    virtual float text_width(const char* text, float scale) const = 0;
};
