#pragma once
/// @file FrameClock.h
/// @brief Wall-clock frame timer feeding World::update() in the viewer.

#include <chrono>
#include <cstdint>

namespace arena::viewer {

/**
 * Measures real time between frames.
 *
 * tick() returns the seconds since the previous tick, clamped to maxFrame
 * so a stalled frame (window drag, breakpoint) does not hand the world a
 * huge backlog. fps() is an exponential moving average of the raw rate.
 */
class FrameClock {
public:
    explicit FrameClock(float maxFrame = 0.25f);

    float tick();
    void  reset();

    float    fps()        const;
    uint64_t frameCount() const { return frameCount_; }

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point last_;
    float             maxFrame_;
    float             smoothedDt_ = 1.f / 60.f;
    uint64_t          frameCount_ = 0;
};

} // namespace arena::viewer
