#pragma once
#include "surface.h"
#include "vec2.h"
#include <glad/gl.h>
#include <cstddef>
#include <span>
#include <vector>

// OpenGL implementation of Surface. Discs and text go through one program
// and one vertex buffer, in y-down pixel coordinates.
class Renderer : public Surface {
public:
    void init();
    void cleanup();

    void set_surface_size(int width, int height) override;
    void clear(float x, float y, float width, float height) override;
    void fill_disc(Vec2 center, float radius, Color color) override;
    void draw_text(const char* text, float x, float y, float scale,
                   Color color) override;
    float text_width(const char* text, float scale) const override;

    void set_clear_color(Color color) { clear_color_ = color; }

private:
    int   win_w_ = 1;
    int   win_h_ = 1;
    Color clear_color_ = {0.0f, 0.0f, 0.0f};

    GLuint shader_  = 0;
    GLuint vao_     = 0;
    GLuint vbo_     = 0;
    GLint  u_res_   = -1;
    GLint  u_color_ = -1;

    // Enough for the reload banner with room to spare.
    static constexpr std::size_t kMaxTextQuads        = 256;
    static constexpr std::size_t kEasyFontVertexBytes = 16;   // x, y, z, rgba
    static constexpr std::size_t kMaxVerts            = kMaxTextQuads * 6;

    std::vector<char> text_quads_;   // stb_easy_font output
    std::vector<Vec2> text_tris_;

    void submit(std::span<const Vec2> verts, GLenum mode, Color color);
};
