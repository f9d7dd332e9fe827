#pragma once
#include "position.h"
#include "color.h"

class Surface;

struct AnimatedPoint {
    static constexpr float kDefaultFriction       = 0.8f;
    static constexpr float kDefaultSpringStrength = 0.1f;
    static constexpr float kDepthScale            = 100.0f;  // px of displacement per unit of z
    static constexpr float kMinRadius             = 1.0f;

    Position current;
    Position target;
    Position rest;       // only re-anchored by PointField::recenter
    Position velocity;

    float spring_strength = kDefaultSpringStrength;
    float friction        = kDefaultFriction;
    float base_radius     = 0.0f;
    float radius          = 0.0f;
    Color color;

    AnimatedPoint(float x, float y, float z, float size, Color color);

    // One damped-spring step on x and y toward target, then on z toward a
    // depth derived from the planar distance to rest.
    void update();
    void draw(Surface& surface) const;
};
