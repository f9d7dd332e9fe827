#pragma once
#include "point_field.h"
#include <cstdint>
#include <span>

struct SeedPoint {
    float x, y, z;
    float size;
    std::uint32_t rgb;   // 0xRRGGBB
};

// The authored shape, in shape-local coordinates (top-left at the origin).
std::span<const SeedPoint> seed_points();

// Fresh field holding every seed point, centred on a surface of this size.
PointField make_seeded_field(float surface_width, float surface_height);
