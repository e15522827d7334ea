#pragma once

namespace deckmix {

/// Monotonic millisecond clock the Engine measures playback position against.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double nowMs() const = 0;
};

/// JUCE high-resolution millisecond counter.
class SystemClock : public Clock {
public:
    double nowMs() const override;
};

} // namespace deckmix
