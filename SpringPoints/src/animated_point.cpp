#include "animated_point.h"
#include "surface.h"
#include <cmath>

// Impulse first, then damping, then apply. Swapping the first two changes
// how the point settles.
static void spring_step(float target, float& pos, float& vel,
                        float strength, float friction) {
    float error = target - pos;
    vel += error * strength;
    vel *= friction;
    pos += vel;
}

AnimatedPoint::AnimatedPoint(float x, float y, float z, float size, Color c)
    : current{x, y, z},
      target{x, y, z},
      rest{x, y, z},
      velocity{},
      base_radius(size),
      radius(size),
      color(c) {}

void AnimatedPoint::update() {
    spring_step(target.x, current.x, velocity.x, spring_strength, friction);
    spring_step(target.y, current.y, velocity.y, spring_strength, friction);

    float dox = rest.x - current.x;
    float doy = rest.y - current.y;
    float d = std::sqrt(dox * dox + doy * doy);

    target.z = d / kDepthScale + 1.0f;
    spring_step(target.z, current.z, velocity.z, spring_strength, friction);

    radius = base_radius * current.z;
    if (radius < kMinRadius) radius = kMinRadius;
}

void AnimatedPoint::draw(Surface& surface) const {
    surface.fill_disc({current.x, current.y}, radius, color);
}
