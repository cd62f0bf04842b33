/// @file FrameClock.cpp
#include "arena/viewer/FrameClock.h"
#include <algorithm>

namespace arena::viewer {

namespace {
constexpr float kSmoothing = 0.1f; ///< EMA weight of the newest frame
}

FrameClock::FrameClock(float maxFrame) : maxFrame_(maxFrame) {
    reset();
}

void FrameClock::reset() {
    last_       = Clock::now();
    smoothedDt_ = 1.f / 60.f;
    frameCount_ = 0;
}

float FrameClock::tick() {
    const auto now = Clock::now();
    const float dt = std::min(std::chrono::duration<float>(now - last_).count(), maxFrame_);
    last_ = now;
    ++frameCount_;

    smoothedDt_ = kSmoothing * dt + (1.f - kSmoothing) * smoothedDt_;
    return dt;
}

float FrameClock::fps() const {
    return smoothedDt_ > 1e-6f ? 1.f / smoothedDt_ : 0.f;
}

} // namespace arena::viewer
