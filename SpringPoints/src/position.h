#pragma once
#include <optional>

struct Position {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr void add_x(float dx) { x += dx; }
    constexpr void add_y(float dy) { y += dy; }
    constexpr void add_z(float dz) { z += dz; }

    // x is always written; y and z only when given (an explicit 0 counts).
    constexpr void set(float nx, std::optional<float> ny = std::nullopt,
                       std::optional<float> nz = std::nullopt) {
        x = nx;
        if (ny) y = *ny;
        if (nz) z = *nz;
    }
};
