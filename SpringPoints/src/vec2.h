#pragma once

// Tightly packed pair of floats; the renderer uploads arrays of these as
// vertex data, so no other members belong here.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr bool operator==(const Vec2&) const = default;
};

static_assert(sizeof(Vec2) == 2 * sizeof(float));
