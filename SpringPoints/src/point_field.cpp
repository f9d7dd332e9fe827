#include "point_field.h"
#include <cmath>

Position shape_offset(float surface_width, float surface_height) {
    return {surface_width / 2.0f - PointField::kShapeHalfWidth,
            surface_height / 2.0f - PointField::kShapeHalfHeight,
            0.0f};
}

AnimatedPoint& PointField::add_point(float x, float y, float z, float size, Color color) {
    return points_.emplace_back(x, y, z, size, color);
}

void PointField::update() {
    for (auto& p : points_) {
        float dx = pointer_.x - p.current.x;
        float dy = pointer_.y - p.current.y;
        float d = std::sqrt(dx * dx + dy * dy);

        if (d < kInteractionRadius) {
            // Mirror the pointer offset through the point. Not normalised:
            // the push is as long as the offset itself.
            p.target.x = p.current.x - dx;
            p.target.y = p.current.y - dy;
        } else {
            p.target.x = p.rest.x;
            p.target.y = p.rest.y;
        }

        p.update();
    }
}

void PointField::draw(Surface& surface) const {
    for (const auto& p : points_) {
        p.draw(surface);
    }
}

// Snaps current to the moved rest position; target and velocity are kept.
void PointField::recenter(float surface_width, float surface_height) {
    Position offset = shape_offset(surface_width, surface_height);

    // Each point keeps its placement relative to the anchor; moving the
    // anchor by a zero shift leaves rest bit-for-bit unchanged.
    float shift_x = offset.x - anchor_.x;
    float shift_y = offset.y - anchor_.y;

    for (auto& p : points_) {
        p.rest.add_x(shift_x);
        p.rest.add_y(shift_y);
        p.current.x = p.rest.x;
        p.current.y = p.rest.y;
    }
    anchor_ = offset;
}

void PointField::set_pointer(float x, float y) {
    pointer_.set(x, y, 0.0f);
}
