#pragma once

#include <memory>
#include <string>

namespace deckmix {

struct PlaybackStatus {
    bool isLoaded = false;
    bool isPlaying = false;
    double positionMs = 0.0;
    double durationMs = 0.0;
};

struct PlaybackOptions {
    bool autoplay = false;
    float initialVolume = 1.0f;
};

/// One loaded audio asset. Every operation reports failure by returning false;
/// after unload() all operations fail and getStatus().isLoaded is false.
class PlaybackHandle {
public:
    virtual ~PlaybackHandle() = default;

    virtual bool play() = 0;
    virtual bool pause() = 0;
    virtual bool stop() = 0;        // pause and rewind to 0
    virtual bool seek(double ms) = 0;
    virtual bool setVolume(float volume) = 0;
    virtual PlaybackStatus getStatus() const = 0;
    virtual void unload() = 0;
};

/// Decode/playback primitive. open() may block while the asset is read;
/// callers must not hold locks that timer callbacks need.
class PlaybackBackend {
public:
    virtual ~PlaybackBackend() = default;

    /// Returns nullptr and fills `error` if the asset cannot be opened.
    virtual std::unique_ptr<PlaybackHandle> open(const std::string& uri,
                                                 const PlaybackOptions& options,
                                                 std::string& error) = 0;
};

/// External audio stream (e.g. a live radio feed) the Engine ducks while it plays.
/// Implementations may throw; the Engine treats every call as best-effort.
class AmbientAudio {
public:
    virtual ~AmbientAudio() = default;

    virtual bool isAmbientPlaying() const = 0;
    virtual float getAmbientVolume() const = 0;
    virtual void setAmbientVolume(float volume) = 0;
};

} // namespace deckmix
