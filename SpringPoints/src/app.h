#pragma once
#include "point_field.h"
#include "surface.h"
#include <cstddef>
#include <vector>

struct AppEvent {
    enum class Type { PointerMoved, Resized, Reset };

    Type  type;
    float x      = 0.0f;   // PointerMoved
    float y      = 0.0f;
    int   width  = 0;      // Resized
    int   height = 0;
};

// Everything the frame loop and the window callbacks share. Callbacks only
// queue events; process_events applies them between ticks.
class App {
public:
    static constexpr float kBannerDuration = 3.0f;
    static constexpr const char* kBannerText = "Press Ctrl+R to reset points";

    App(int width, int height, float tick_period);

    void on_pointer_moved(float x, float y);
    void on_resized(int width, int height);
    void on_reset_requested();

    void process_events();

    // Renders the state left by the previous tick, then advances it.
    void tick(Surface& surface);

    void reset();

    PointField&       field()       { return field_; }
    const PointField& field() const { return field_; }

    int   width()  const { return width_; }
    int   height() const { return height_; }
    bool  banner_visible()   const { return banner_remaining_ > 0.0f; }
    std::size_t pending_events() const { return events_.size(); }

private:
    int   width_;
    int   height_;
    float tick_period_;
    float banner_remaining_ = kBannerDuration;
    bool  size_dirty_       = true;

    PointField            field_;
    std::vector<AppEvent> events_;

    void apply(const AppEvent& e);
    void resize(int width, int height);
    void draw_banner(Surface& surface) const;
};
