#pragma once

// Turns variable frame times into a whole number of fixed-period ticks.
class FixedTicker {
public:
    explicit FixedTicker(float period, float max_frame_dt = 0.1f, int max_ticks = 4)
        : period_(period), max_frame_dt_(max_frame_dt), max_ticks_(max_ticks) {}

    // Adds frame_dt and returns how many ticks are due. Time beyond
    // max_ticks periods is dropped rather than carried into later frames.
    int advance(float frame_dt) {
        if (frame_dt > max_frame_dt_) frame_dt = max_frame_dt_;
        if (frame_dt < 0.0f) frame_dt = 0.0f;
        accumulator_ += frame_dt;

        int due = 0;
        while (accumulator_ >= period_ && due < max_ticks_) {
            accumulator_ -= period_;
            ++due;
        }
        if (due == max_ticks_ && accumulator_ >= period_) accumulator_ = 0.0f;
        return due;
    }

    void reset() { accumulator_ = 0.0f; }

    float accumulator() const { return accumulator_; }

private:
    float period_;
    float max_frame_dt_;
    int   max_ticks_;
    float accumulator_ = 0.0f;
};
