#pragma once

#include "core/Clock.h"
#include "core/DeckPool.h"
#include "core/MainChannel.h"
#include "core/MixdownPlan.h"
#include "core/Playback.h"
#include "core/TimerService.h"
#include "core/Types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace deckmix {

class Engine {
public:
    using ProgressCallback = std::function<void(double positionMs)>;
    using EndedCallback = std::function<void()>;

    /// Real-time engine: thread-backed timers and the JUCE hi-res clock.
    explicit Engine(PlaybackBackend& backend, const EngineOptions& options = {});

    /// Engine with injected timing, used by tests and headless hosts.
    /// `clock` must outlive the Engine.
    Engine(PlaybackBackend& backend, std::unique_ptr<TimerService> timers,
           const Clock& clock, const EngineOptions& options = {});

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    std::string getVersion() const;
    const EngineOptions& getOptions() const { return options_; }

    /// Stream to duck during playback. May be null; must outlive the Engine.
    void setAmbientAudio(AmbientAudio* ambient);

    // --- Session (control thread) ---
    EngineError load(const EngineConfig& config, std::string& error);
    EngineError loadFromPlan(const std::string& baseUri,
                             const std::vector<EditorSegment>& segments,
                             const TrackGains& trackGains,
                             const DuckingParams* ducking,
                             std::string& error);
    EngineError play();
    EngineError pause();
    EngineError stop();
    EngineError seek(double ms);

    /// Tear everything down. Safe to call repeatedly and from any state.
    void dispose();

    // --- Position ---
    bool isLoaded() const;
    bool isPlaying() const;
    double getPositionMs() const;
    double getDurationMs() const;

    // --- Listeners (timer thread, lock released; null clears) ---
    void onProgress(ProgressCallback callback);
    void onEnded(EndedCallback callback);

    // --- Mixer controls ---
    EngineError setTrackGain(Track track, float gain);
    EngineError setMute(Track track, bool muted);
    EngineError setSolo(Track track, bool solo);

    /// Replace the ducking settings; null installs the disabled defaults.
    EngineError setDucking(const DuckingParams* params);

    // --- Mixdown ---
    MixdownPlan buildMixdownPlan(const MixdownOptions& options) const;

    // --- Introspection ---
    std::vector<DeckKey> getActiveDeckKeys() const;
    int getActiveDeckCount() const;
    std::vector<std::string> getStartedTriggerIds() const;
    float getMainVolume() const;
    EngineConfig getConfig() const;

private:
    struct DeckLaunch {
        DeckKey key;
        std::string uri;
        float volume;
        double remainingMs;
    };

    PlaybackBackend& backend_;
    std::unique_ptr<Clock> ownedClock_;
    const Clock* clock_;
    std::unique_ptr<TimerService> timers_;
    EngineOptions options_;

    mutable std::mutex mutex_;

    // Session
    EngineConfig config_;
    MainChannel main_;
    DeckPool decks_;
    std::unordered_set<std::string> startedTriggerIds_;
    bool loaded_ = false;
    bool playing_ = false;
    double startEpochMs_ = 0.0;
    double seekOffsetMs_ = 0.0;

    // Staleness guards
    uint64_t generation_ = 0;   // bumped by load() and dispose()
    uint64_t pass_ = 0;         // bumped whenever the deck pool is cleared
    uint64_t loopToken_ = 0;    // bumped whenever the loops stop

    TimerId tickTimer_ = 0;
    TimerId progressTimer_ = 0;

    ProgressCallback progressCallback_;
    EndedCallback endedCallback_;

    // Ambient ducking (own lock; external calls never run under mutex_)
    std::mutex ambientMutex_;
    AmbientAudio* ambient_ = nullptr;
    bool ambientDucked_ = false;
    float ambientSavedVolume_ = 1.0f;

    // --- Timer callbacks (timer thread) ---
    void tick(uint64_t loopToken);
    void reportProgress(uint64_t loopToken);
    void expireDeck(const DeckKey& key, uint64_t serial, uint64_t generation);
    void launchDeck(const DeckLaunch& launch, uint64_t generation, uint64_t pass);
    void finishTrack(uint64_t generation, uint64_t pass, uint64_t loopToken);

    // --- Helpers (mutex_ held) ---
    bool isCurrentLocked(uint64_t generation, uint64_t pass, uint64_t loopToken) const;
    double positionLocked() const;
    void applyMainVolumeLocked();
    void startLoopsLocked();
    void stopLoopsLocked();
    void clearDecksLocked();
    void teardownLocked();
    bool pauseLocked();
    void seekLocked(double ms);

    // --- Ambient (mutex_ not held) ---
    void duckAmbient();
    void restoreAmbient();
};

} // namespace deckmix
