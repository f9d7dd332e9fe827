#include "app.h"
#include "seed.h"
#include <cstdio>

static constexpr Color kBannerColor = {0.7f, 0.7f, 0.7f};
static constexpr float kBannerScale = 2.0f;
static constexpr float kBannerTop   = 20.0f;

App::App(int width, int height, float tick_period)
    : width_(width),
      height_(height),
      tick_period_(tick_period),
      field_(make_seeded_field(static_cast<float>(width), static_cast<float>(height))) {}

void App::on_pointer_moved(float x, float y) {
    events_.push_back({AppEvent::Type::PointerMoved, x, y});
}

void App::on_resized(int width, int height) {
    events_.push_back({AppEvent::Type::Resized, 0.0f, 0.0f, width, height});
}

void App::on_reset_requested() {
    events_.push_back({AppEvent::Type::Reset});
}

void App::process_events() {
    // Swap out first so an event handler may queue more for the next drain.
    std::vector<AppEvent> pending;
    pending.swap(events_);
    for (const auto& e : pending) {
        apply(e);
    }
}

void App::apply(const AppEvent& e) {
    switch (e.type) {
    case AppEvent::Type::PointerMoved:
        field_.set_pointer(e.x, e.y);
        break;
    case AppEvent::Type::Resized:
        resize(e.width, e.height);
        break;
    case AppEvent::Type::Reset:
        reset();
        break;
    }
}

void App::resize(int width, int height) {
    // Minimised windows report 0x0; keep the last real layout.
    if (width <= 0 || height <= 0) return;
    if (width == width_ && height == height_) return;

    width_  = width;
    height_ = height;
    size_dirty_ = true;
    field_.recenter(static_cast<float>(width), static_cast<float>(height));
    std::printf("Surface resized to %dx%d\n", width, height);
}

void App::reset() {
    field_ = make_seeded_field(static_cast<float>(width_), static_cast<float>(height_));
    std::printf("Points reset!\n");
}

void App::tick(Surface& surface) {
    if (size_dirty_) {
        surface.set_surface_size(width_, height_);
        size_dirty_ = false;
    }

    surface.clear(0.0f, 0.0f, static_cast<float>(width_), static_cast<float>(height_));
    field_.draw(surface);
    if (banner_visible()) draw_banner(surface);

    field_.update();

    if (banner_remaining_ > 0.0f) {
        banner_remaining_ -= tick_period_;
        if (banner_remaining_ < 0.0f) banner_remaining_ = 0.0f;
    }
}

void App::draw_banner(Surface& surface) const {
    float tw = surface.text_width(kBannerText, kBannerScale);
    surface.draw_text(kBannerText, width_ * 0.5f - tw * 0.5f, kBannerTop,
                      kBannerScale, kBannerColor);
}
