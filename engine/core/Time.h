// Fixed simulation step and the host-side pacing of ticks per frame.
#pragma once

#include <array>

namespace Engine {

// Simulated seconds advanced by one tick. Never scaled by speed.
constexpr double kFixedTickSeconds = 0.05;

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
};

// Turns wall-clock frame time into a number of fixed ticks for a speed
// setting of 0 (paused) to 3. Fast-forward runs more ticks, never a larger dt.
class TickPacer {
public:
    static constexpr std::array<double, 4> kTickIntervalSeconds{0.0, 0.050, 0.025, 0.016};
    static constexpr int kMaxTicksPerFrame = 8;

    // Returns how many ticks the host should run for this frame.
    int advance(const TimeStep& step, int speed) {
        if (speed <= 0 || speed >= static_cast<int>(kTickIntervalSeconds.size())) {
            accumulator_ = 0.0;
            return 0;
        }
        const double interval = kTickIntervalSeconds[static_cast<std::size_t>(speed)];
        accumulator_ += step.deltaSeconds;
        int ticks = 0;
        while (accumulator_ >= interval && ticks < kMaxTicksPerFrame) {
            accumulator_ -= interval;
            ++ticks;
        }
        // Drop backlog after a long stall instead of spiralling.
        if (ticks == kMaxTicksPerFrame) accumulator_ = 0.0;
        return ticks;
    }

    void reset() { accumulator_ = 0.0; }
    double pending() const { return accumulator_; }

private:
    double accumulator_{0.0};
};

}  // namespace Engine
