#pragma once

#include "core/Playback.h"

#include <memory>

namespace deckmix {

/// The long-lived handle playing the primary recording.
/// Failures of the underlying handle are logged; only playFrom() reports them.
class MainChannel {
public:
    MainChannel() = default;
    ~MainChannel();

    MainChannel(const MainChannel&) = delete;
    MainChannel& operator=(const MainChannel&) = delete;

    /// Take ownership of an opened handle and read its duration (0 if unknown).
    void attach(std::unique_ptr<PlaybackHandle> handle, float initialVolume);

    /// Stop and unload. Safe when nothing is attached.
    void close();

    bool isOpen() const { return handle_ != nullptr; }
    double getDurationMs() const { return durationMs_; }

    bool playFrom(double ms);
    void pause();
    void rewind();
    void seek(double ms);

    /// Position as reported by the handle. False if the handle cannot tell.
    bool getReportedPosition(double& ms) const;

    void setVolume(float volume);
    float getAppliedVolume() const { return appliedVolume_; }

private:
    std::unique_ptr<PlaybackHandle> handle_;
    double durationMs_ = 0.0;
    float appliedVolume_ = 0.0f;
};

} // namespace deckmix
