#pragma once

#include <cmath>
#include <cstdint>

namespace frameline::core {

// Fixed frame rate conversion between frame indices and seconds
struct FrameClock {
    double frame_rate;     // Frames per second

    // Products like 7 / 30 * 30 land a hair above the integer; this keeps
    // them from rounding up to the next frame
    static constexpr double kFrameEpsilon = 1e-6;

    explicit FrameClock(double fps = 30.0)
        : frame_rate(fps > 0.0 ? fps : 30.0)
    {}

    double frames_to_seconds(int64_t frames) const {
        return static_cast<double>(frames) / frame_rate;
    }

    // Rounds up: an event at any point inside a frame fires on the next frame
    int64_t seconds_to_frames(double seconds) const {
        return static_cast<int64_t>(std::ceil(seconds * frame_rate - kFrameEpsilon));
    }

    // Duration of a single frame in seconds
    double frame_duration() const {
        return 1.0 / frame_rate;
    }
};

} // namespace frameline::core
