#include "renderer.h"
#include <cmath>
#include <cstdio>
#include <cstring>

#define STB_EASY_FONT_IMPLEMENTATION
#include "stb_easy_font.h"

static constexpr float kPI             = 3.14159265f;
static constexpr int   kCircleSegments = 24;

// ---- Shaders ----------------------------------------------------------------

// Shared by discs and text. Input is y-down pixel coords, matching cursor
// positions.
static constexpr const char* kVertSrc = R"glsl(
#version 460 core
layout(location = 0) in vec2 a_pos;
uniform vec2 u_resolution;
void main() {
    vec2 ndc = vec2(
        a_pos.x / u_resolution.x * 2.0 - 1.0,
        1.0 - a_pos.y / u_resolution.y * 2.0
    );
    gl_Position = vec4(ndc, 0.0, 1.0);
}
)glsl";

static constexpr const char* kFragSrc = R"glsl(
#version 460 core
uniform vec4 u_color;
out vec4 frag_color;
void main() {
    frag_color = u_color;
}
)glsl";

// ---- Helpers ----------------------------------------------------------------

static void check_status(GLuint obj, GLenum pname, const char* what) {
    GLint ok = 0;
    char log[512];
    if (pname == GL_COMPILE_STATUS) {
        glGetShaderiv(obj, pname, &ok);
        if (!ok) glGetShaderInfoLog(obj, sizeof(log), nullptr, log);
    } else {
        glGetProgramiv(obj, pname, &ok);
        if (!ok) glGetProgramInfoLog(obj, sizeof(log), nullptr, log);
    }
    if (!ok) std::fprintf(stderr, "%s error:\n%s\n", what, log);
}

// Compiles both stages and links them; errors go to stderr and the
// (unusable) program is still returned so drawing degrades to no-ops.
static GLuint build_program(const char* vert_src, const char* frag_src) {
    GLuint stages[2] = {glCreateShader(GL_VERTEX_SHADER),
                        glCreateShader(GL_FRAGMENT_SHADER)};
    const char* sources[2] = {vert_src, frag_src};

    GLuint prog = glCreateProgram();
    for (int i = 0; i < 2; ++i) {
        glShaderSource(stages[i], 1, &sources[i], nullptr);
        glCompileShader(stages[i]);
        check_status(stages[i], GL_COMPILE_STATUS, "Shader compile");
        glAttachShader(prog, stages[i]);
    }
    glLinkProgram(prog);
    check_status(prog, GL_LINK_STATUS, "Program link");

    for (GLuint stage : stages) glDeleteShader(stage);
    return prog;
}

// ---- Renderer ---------------------------------------------------------------

void Renderer::init() {
    shader_    = build_program(kVertSrc, kFragSrc);
    u_res_     = glGetUniformLocation(shader_, "u_resolution");
    u_color_   = glGetUniformLocation(shader_, "u_color");

    glGenVertexArrays(1, &vao_);
    glGenBuffers(1, &vbo_);
    glBindVertexArray(vao_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(kMaxVerts * sizeof(Vec2)),
                 nullptr, GL_DYNAMIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(Vec2), nullptr);
    glBindVertexArray(0);

    text_quads_.resize(kMaxTextQuads * 4 * kEasyFontVertexBytes);
    text_tris_.resize(kMaxTextQuads * 6);
}

void Renderer::set_surface_size(int width, int height) {
    win_w_ = width  > 0 ? width  : 1;
    win_h_ = height > 0 ? height : 1;
}

void Renderer::clear(float x, float y, float width, float height) {
    // Scissor works in framebuffer pixels, y-up; the viewport tracks the
    // framebuffer, which may be larger than the window on HiDPI screens.
    GLint vp[4];
    glGetIntegerv(GL_VIEWPORT, vp);
    float sx = static_cast<float>(vp[2]) / win_w_;
    float sy = static_cast<float>(vp[3]) / win_h_;

    glEnable(GL_SCISSOR_TEST);
    glScissor(static_cast<GLint>(x * sx),
              static_cast<GLint>((win_h_ - y - height) * sy),
              static_cast<GLsizei>(width * sx),
              static_cast<GLsizei>(height * sy));
    glClearColor(clear_color_.r, clear_color_.g, clear_color_.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    glDisable(GL_SCISSOR_TEST);
}

void Renderer::fill_disc(Vec2 center, float radius, Color color) {
    Vec2 fan[kCircleSegments + 2];
    fan[0] = center;
    for (int i = 0; i <= kCircleSegments; ++i) {
        float angle = static_cast<float>(i) * 2.0f * kPI / kCircleSegments;
        fan[i + 1] = {center.x + radius * std::cos(angle),
                      center.y + radius * std::sin(angle)};
    }
    submit({fan, kCircleSegments + 2}, GL_TRIANGLE_FAN, color);
}

void Renderer::submit(std::span<const Vec2> verts, GLenum mode, Color color) {
    if (verts.empty() || verts.size() > kMaxVerts) return;
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferSubData(GL_ARRAY_BUFFER, 0,
                    static_cast<GLsizeiptr>(verts.size_bytes()), verts.data());
    glUseProgram(shader_);
    glUniform2f(u_res_, static_cast<float>(win_w_), static_cast<float>(win_h_));
    glUniform4f(u_color_, color.r, color.g, color.b, 1.0f);
    glBindVertexArray(vao_);
    glDrawArrays(mode, 0, static_cast<GLsizei>(verts.size()));
    glBindVertexArray(0);
}

void Renderer::draw_text(const char* text, float x, float y, float scale,
                         Color color) {
    int num_quads = stb_easy_font_print(0.0f, 0.0f, const_cast<char*>(text), nullptr,
                                        text_quads_.data(),
                                        static_cast<int>(text_quads_.size()));
    if (num_quads <= 0) return;

    // Split each quad (a, b, c, d) into triangles abc and acd, keeping only
    // x and y from stb_easy_font's vertices.
    static constexpr int kCorners[6] = {0, 1, 2, 0, 2, 3};
    std::size_t n = 0;
    for (int q = 0; q < num_quads; ++q) {
        for (int corner : kCorners) {
            const char* v = text_quads_.data() + (q * 4 + corner) * kEasyFontVertexBytes;
            float vx, vy;
            std::memcpy(&vx, v, sizeof(float));
            std::memcpy(&vy, v + sizeof(float), sizeof(float));
            text_tris_[n++] = {x + vx * scale, y + vy * scale};
        }
    }
    submit({text_tris_.data(), n}, GL_TRIANGLES, color);
}

float Renderer::text_width(const char* text, float scale) const {
    return static_cast<float>(stb_easy_font_width(const_cast<char*>(text))) * scale;
}

void Renderer::cleanup() {
    if (shader_) glDeleteProgram(shader_);
    if (vbo_)    glDeleteBuffers(1, &vbo_);
    if (vao_)    glDeleteVertexArrays(1, &vao_);
    shader_ = vbo_ = vao_ = 0;
}
