#pragma once
#include "animated_point.h"
#include "position.h"
#include <cstddef>
#include <span>
#include <vector>

class PointField {
public:
    static constexpr float kInteractionRadius = 150.0f;
    // Half the authored shape's bounding box; centres the shape on the surface.
    static constexpr float kShapeHalfWidth    = 180.0f;
    static constexpr float kShapeHalfHeight   = 65.0f;

    PointField() = default;
    // anchor is the shape offset the rest positions are currently laid out at
    explicit PointField(Position anchor) : anchor_(anchor) {}

    // The returned reference is invalidated by the next add_point.
    AnimatedPoint& add_point(float x, float y, float z, float size, Color color);

    void update();
    void draw(Surface& surface) const;
    void recenter(float surface_width, float surface_height);

    const Position& anchor() const { return anchor_; }

    void set_pointer(float x, float y);
    Position&       pointer()       { return pointer_; }
    const Position& pointer() const { return pointer_; }

    std::span<const AnimatedPoint> points() const { return points_; }
    std::span<AnimatedPoint>       points()       { return points_; }
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    void reserve(std::size_t n) { points_.reserve(n); }

private:
    std::vector<AnimatedPoint> points_;   // insertion order is paint order
    Position pointer_;
    Position anchor_;
};

// Top-left of the authored shape when centred on a surface of this size.
Position shape_offset(float surface_width, float surface_height);
