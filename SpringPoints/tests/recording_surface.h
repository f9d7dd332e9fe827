#pragma once
#include "surface.h"
#include <cstring>
#include <string>
#include <vector>

// Surface that remembers every call, in order, instead of drawing.
class RecordingSurface : public Surface {
public:
    enum class Op { SetSize, Clear, Disc, Text };

    struct Call {
        Op          op;
        Vec2        center{};
        float       radius = 0.0f;
        Color       color{};
        int         width  = 0;
        int         height = 0;
        std::string text;
    };

    std::vector<Call> calls;

    void set_surface_size(int width, int height) override {
        calls.push_back({Op::SetSize, {}, 0.0f, {}, width, height, {}});
    }

    void clear(float /*x*/, float /*y*/, float width, float height) override {
        calls.push_back({Op::Clear, {}, 0.0f, {},
                         static_cast<int>(width), static_cast<int>(height), {}});
    }

    void fill_disc(Vec2 center, float radius, Color color) override {
        calls.push_back({Op::Disc, center, radius, color, 0, 0, {}});
    }

    void draw_text(const char* text, float x, float y, float /*scale*/,
                   Color color) override {
        calls.push_back({Op::Text, {x, y}, 0.0f, color, 0, 0, text});
    }

    float text_width(const char* text, float scale) const override {
        return static_cast<float>(std::strlen(text)) * 6.0f * scale;
    }

    std::vector<Call> discs() const {
        std::vector<Call> out;
        for (const auto& c : calls)
            if (c.op == Op::Disc) out.push_back(c);
        return out;
    }

    std::size_t count(Op op) const {
        std::size_t n = 0;
        for (const auto& c : calls)
            if (c.op == op) ++n;
        return n;
    }
};
