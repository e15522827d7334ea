#include "core/Engine.h"
#include "core/Logger.h"
#include "core/MixRules.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace deckmix {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

Engine::Engine(PlaybackBackend& backend, const EngineOptions& options)
    : backend_(backend),
      ownedClock_(std::make_unique<SystemClock>()),
      clock_(ownedClock_.get()),
      timers_(std::make_unique<ThreadTimerService>()),
      options_(options)
{
    DM_INFO("Engine: created tick=%.0fms progress=%.0fms",
            options_.tickIntervalMs, options_.progressIntervalMs);
}

Engine::Engine(PlaybackBackend& backend, std::unique_ptr<TimerService> timers,
               const Clock& clock, const EngineOptions& options)
    : backend_(backend),
      clock_(&clock),
      timers_(std::move(timers)),
      options_(options)
{
    DM_INFO("Engine: created with injected timers tick=%.0fms progress=%.0fms",
            options_.tickIntervalMs, options_.progressIntervalMs);
}

Engine::~Engine()
{
    dispose();
    // Joins the worker; a callback still in flight sees a stale token and returns
    timers_.reset();
    DM_INFO("Engine: destroyed");
}

std::string Engine::getVersion() const
{
    return "0.1.0";
}

void Engine::setAmbientAudio(AmbientAudio* ambient)
{
    std::lock_guard<std::mutex> lock(ambientMutex_);
    ambient_ = ambient;
    ambientDucked_ = false;
}

// ═══════════════════════════════════════════════════════════════════
// Session lifecycle
// ═══════════════════════════════════════════════════════════════════

EngineError Engine::load(const EngineConfig& config, std::string& error)
{
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownLocked();
        generation = ++generation_;
    }
    restoreAmbient();

    if (!config.validate(error))
    {
        DM_WARN("Engine::load: invalid config: %s", error.c_str());
        return EngineError::invalidConfig;
    }

    PlaybackOptions opts;
    opts.autoplay = false;
    opts.initialVolume = clampVolume(config.mainGain);

    // Opening may block on file I/O; the session lock stays free meanwhile
    auto handle = backend_.open(config.mainUri, opts, error);
    if (!handle)
    {
        DM_WARN("Engine::load: cannot open %s: %s", config.mainUri.c_str(), error.c_str());
        return EngineError::loadFailed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_)
    {
        handle->unload();
        error = "superseded by a newer load";
        DM_DEBUG("Engine::load: generation %llu superseded by %llu",
                 static_cast<unsigned long long>(generation),
                 static_cast<unsigned long long>(generation_));
        return EngineError::superseded;
    }

    config_ = config;
    main_.attach(std::move(handle), opts.initialVolume);
    loaded_ = true;
    playing_ = false;
    seekOffsetMs_ = 0.0;
    startEpochMs_ = 0.0;
    applyMainVolumeLocked();

    DM_INFO("Engine::load: main=%s duration=%.0fms triggers=%d",
            config_.mainUri.c_str(), main_.getDurationMs(),
            static_cast<int>(config_.triggers.size()));
    return EngineError::ok;
}

EngineError Engine::loadFromPlan(const std::string& baseUri,
                                 const std::vector<EditorSegment>& segments,
                                 const TrackGains& trackGains,
                                 const DuckingParams* ducking,
                                 std::string& error)
{
    return load(configFromEditor(baseUri, segments, trackGains, ducking), error);
}

EngineError Engine::play()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loaded_)
        {
            DM_DEBUG("Engine::play: not loaded");
            return EngineError::notLoaded;
        }
        if (playing_)
            return EngineError::ok;

        double duration = main_.getDurationMs();
        double from = std::max(0.0, seekOffsetMs_);
        if (duration > 0.0)
            from = std::min(from, std::max(duration - 1.0, 0.0));

        if (!main_.playFrom(from))
            return EngineError::playbackFailed;

        playing_ = true;
        startEpochMs_ = clock_->nowMs();
        applyMainVolumeLocked();
        startLoopsLocked();
        DM_INFO("Engine::play: from %.0fms", from);
    }

    duckAmbient();
    return EngineError::ok;
}

EngineError Engine::pause()
{
    bool paused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loaded_)
            return EngineError::notLoaded;
        paused = pauseLocked();
    }

    if (paused)
        restoreAmbient();
    return EngineError::ok;
}

EngineError Engine::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loaded_)
        {
            DM_DEBUG("Engine::stop: not loaded");
            return EngineError::notLoaded;
        }

        main_.rewind();
        seekOffsetMs_ = 0.0;
        playing_ = false;
        stopLoopsLocked();
        clearDecksLocked();
        startedTriggerIds_.clear();
        applyMainVolumeLocked();
        DM_INFO("Engine::stop");
    }

    restoreAmbient();
    return EngineError::ok;
}

EngineError Engine::seek(double ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
    {
        DM_DEBUG("Engine::seek: not loaded");
        return EngineError::notLoaded;
    }
    seekLocked(ms);
    return EngineError::ok;
}

void Engine::dispose()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownLocked();
        ++generation_;
        DM_DEBUG("Engine::dispose: generation=%llu", static_cast<unsigned long long>(generation_));
    }
    restoreAmbient();
}

// ═══════════════════════════════════════════════════════════════════
// Position
// ═══════════════════════════════════════════════════════════════════

bool Engine::isLoaded() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

bool Engine::isPlaying() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_;
}

double Engine::getPositionMs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return positionLocked();
}

double Engine::getDurationMs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return main_.getDurationMs();
}

void Engine::onProgress(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    progressCallback_ = std::move(callback);
}

void Engine::onEnded(EndedCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    endedCallback_ = std::move(callback);
}

// ═══════════════════════════════════════════════════════════════════
// Mixer controls
// ═══════════════════════════════════════════════════════════════════

EngineError Engine::setTrackGain(Track track, float gain)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
        return EngineError::notLoaded;

    if (isDeck(track))
    {
        int deck = deckNumber(track);
        if (!isValidDeck(deck))
            return EngineError::invalidConfig;
        config_.deckGains[deck - 1] = gain;
        decks_.applyVolume(deck, computeDeckVolume(config_, deck));
    }
    else
    {
        config_.mainGain = gain;
    }
    applyMainVolumeLocked();
    DM_DEBUG("Engine::setTrackGain: track=%d gain=%.3f", static_cast<int>(track), gain);
    return EngineError::ok;
}

EngineError Engine::setMute(Track track, bool muted)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
        return EngineError::notLoaded;

    if (isDeck(track))
    {
        int deck = deckNumber(track);
        if (!isValidDeck(deck))
            return EngineError::invalidConfig;
        config_.deckMutes[deck - 1] = muted;
        decks_.applyVolume(deck, computeDeckVolume(config_, deck));
    }
    else
    {
        config_.mainMuted = muted;
    }
    applyMainVolumeLocked();
    DM_DEBUG("Engine::setMute: track=%d muted=%d", static_cast<int>(track), muted);
    return EngineError::ok;
}

EngineError Engine::setSolo(Track track, bool solo)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
        return EngineError::notLoaded;

    if (isDeck(track))
    {
        int deck = deckNumber(track);
        if (!isValidDeck(deck))
            return EngineError::invalidConfig;
        config_.deckSolos[deck - 1] = solo;
    }
    else
    {
        config_.mainSolo = solo;
    }
    // Clips already sounding keep playing; the solo rule applies to the next trigger
    applyMainVolumeLocked();
    DM_DEBUG("Engine::setSolo: track=%d solo=%d", static_cast<int>(track), solo);
    return EngineError::ok;
}

EngineError Engine::setDucking(const DuckingParams* params)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
        return EngineError::notLoaded;

    config_.hasDucking = true;
    config_.ducking = params ? *params : DuckingParams::disabled();
    applyMainVolumeLocked();
    DM_DEBUG("Engine::setDucking: enabled=%d amount=%.1fdB",
             config_.ducking.enabled, config_.ducking.amountDb);
    return EngineError::ok;
}

// ═══════════════════════════════════════════════════════════════════
// Mixdown + introspection
// ═══════════════════════════════════════════════════════════════════

MixdownPlan Engine::buildMixdownPlan(const MixdownOptions& options) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return deckmix::buildMixdownPlan(config_, options);
}

std::vector<DeckKey> Engine::getActiveDeckKeys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return decks_.keys();
}

int Engine::getActiveDeckCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return decks_.size();
}

std::vector<std::string> Engine::getStartedTriggerIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids(startedTriggerIds_.begin(), startedTriggerIds_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

float Engine::getMainVolume() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return main_.getAppliedVolume();
}

EngineConfig Engine::getConfig() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

// ═══════════════════════════════════════════════════════════════════
// Scheduler loop (timer thread)
// ═══════════════════════════════════════════════════════════════════

void Engine::tick(uint64_t loopToken)
{
    std::vector<DeckLaunch> launches;
    uint64_t generation;
    uint64_t pass;
    bool ended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!playing_ || loopToken != loopToken_)
            return;

        double now = positionLocked();
        for (const auto& t : config_.triggers)
        {
            if (startedTriggerIds_.count(t.id))
                continue;
            if (!isTriggerDue(t, now, options_.triggerLookaheadMs))
                continue;

            // Marked before opening so a failed clip is never retried this pass
            startedTriggerIds_.insert(t.id);
            if (!isDeckAllowed(config_, t.deck))
            {
                DM_DEBUG("Engine::tick: %s blocked by mute/solo on deck %d", t.id.c_str(), t.deck);
                continue;
            }
            launches.push_back({DeckKey{t.deck, t.id}, t.uri,
                                computeDeckVolume(config_, t.deck),
                                remainingTriggerMs(t, now)});
        }

        generation = generation_;
        pass = pass_;
        double duration = main_.getDurationMs();
        ended = duration > 0.0 && now >= duration - options_.endGuardMs;
    }

    for (const auto& launch : launches)
        launchDeck(launch, generation, pass);

    if (ended)
        finishTrack(generation, pass, loopToken);
}

void Engine::launchDeck(const DeckLaunch& launch, uint64_t generation, uint64_t pass)
{
    PlaybackOptions opts;
    opts.autoplay = true;
    opts.initialVolume = launch.volume;

    std::string error;
    auto handle = backend_.open(launch.uri, opts, error);
    if (!handle)
    {
        DM_WARN("Engine: clip %s dropped, cannot open %s: %s",
                launch.key.toString().c_str(), launch.uri.c_str(), error.c_str());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || pass != pass_)
    {
        DM_DEBUG("Engine: clip %s opened after seek/load, discarding", launch.key.toString().c_str());
        if (!handle->stop())
            DM_DEBUG("Engine: stop failed for discarded clip %s", launch.key.toString().c_str());
        handle->unload();
        return;
    }

    // Gain or mute may have moved while the clip was opening
    float volume = computeDeckVolume(config_, launch.key.deck);
    if (volume != launch.volume && !handle->setVolume(volume))
        DM_DEBUG("Engine: setVolume failed for %s", launch.key.toString().c_str());

    DeckKey key = launch.key;
    uint64_t serial = decks_.add(key, std::move(handle));
    TimerId timer = timers_->scheduleOnce(launch.remainingMs, [this, key, serial, generation] {
        expireDeck(key, serial, generation);
    });
    decks_.setExpiryTimer(key, serial, timer);
    applyMainVolumeLocked();

    DM_INFO("Engine: clip %s started for %.0fms", key.toString().c_str(), launch.remainingMs);
}

void Engine::expireDeck(const DeckKey& key, uint64_t serial, uint64_t generation)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_)
        return;
    if (decks_.remove(key, serial))
    {
        applyMainVolumeLocked();
        DM_DEBUG("Engine: clip %s expired", key.toString().c_str());
    }
}

void Engine::finishTrack(uint64_t generation, uint64_t pass, uint64_t loopToken)
{
    EndedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A stop, pause or seek may have landed while clips were opening
        if (!isCurrentLocked(generation, pass, loopToken))
            return;
        callback = endedCallback_;
    }

    DM_INFO("Engine: end of main recording");
    if (callback)
        callback();

    bool paused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isCurrentLocked(generation, pass, loopToken))
            return;
        paused = pauseLocked();
        seekLocked(main_.getDurationMs());
    }
    if (paused)
        restoreAmbient();
}

void Engine::reportProgress(uint64_t loopToken)
{
    ProgressCallback callback;
    double position;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!playing_ || loopToken != loopToken_ || !progressCallback_)
            return;
        callback = progressCallback_;
        position = positionLocked();
    }
    callback(position);
}

// ═══════════════════════════════════════════════════════════════════
// Helpers (mutex_ held)
// ═══════════════════════════════════════════════════════════════════

bool Engine::isCurrentLocked(uint64_t generation, uint64_t pass, uint64_t loopToken) const
{
    return playing_ && generation == generation_ && pass == pass_ && loopToken == loopToken_;
}

double Engine::positionLocked() const
{
    if (!playing_)
        return seekOffsetMs_;
    return std::max(0.0, clock_->nowMs() - startEpochMs_ + seekOffsetMs_);
}

void Engine::applyMainVolumeLocked()
{
    if (!main_.isOpen())
        return;
    main_.setVolume(computeMainVolume(config_, decks_.size()));
}

void Engine::startLoopsLocked()
{
    stopLoopsLocked();
    uint64_t token = loopToken_;
    tickTimer_ = timers_->schedulePeriodic(options_.tickIntervalMs,
                                           [this, token] { tick(token); });
    progressTimer_ = timers_->schedulePeriodic(options_.progressIntervalMs,
                                               [this, token] { reportProgress(token); });
    if (tickTimer_ == 0 || progressTimer_ == 0)
        DM_WARN("Engine: timer service refused loop timers (tick=%u progress=%u)",
                tickTimer_, progressTimer_);
}

void Engine::stopLoopsLocked()
{
    ++loopToken_;
    timers_->cancel(tickTimer_);
    timers_->cancel(progressTimer_);
    tickTimer_ = 0;
    progressTimer_ = 0;
}

void Engine::clearDecksLocked()
{
    ++pass_;
    for (TimerId timer : decks_.clear())
        timers_->cancel(timer);
}

void Engine::teardownLocked()
{
    stopLoopsLocked();
    clearDecksLocked();
    main_.close();
    config_ = EngineConfig{};
    startedTriggerIds_.clear();
    loaded_ = false;
    playing_ = false;
    startEpochMs_ = 0.0;
    seekOffsetMs_ = 0.0;
}

bool Engine::pauseLocked()
{
    if (!playing_)
        return false;

    // Trust the channel's own position over the clock estimate to avoid drift
    double reported;
    seekOffsetMs_ = main_.getReportedPosition(reported) ? reported : positionLocked();
    main_.pause();
    playing_ = false;
    stopLoopsLocked();
    DM_INFO("Engine::pause: at %.0fms", seekOffsetMs_);
    return true;
}

void Engine::seekLocked(double ms)
{
    double duration = main_.getDurationMs();
    double clamped = std::isnan(ms) ? 0.0 : std::max(0.0, std::floor(ms));
    if (duration > 0.0)
        clamped = std::min(clamped, duration);

    main_.seek(clamped);
    seekOffsetMs_ = clamped;
    startedTriggerIds_.clear();
    clearDecksLocked();
    if (playing_)
        startEpochMs_ = clock_->nowMs();
    applyMainVolumeLocked();
    DM_DEBUG("Engine::seek: %.0fms", clamped);
}

// ═══════════════════════════════════════════════════════════════════
// Ambient ducking (best effort)
// ═══════════════════════════════════════════════════════════════════

void Engine::duckAmbient()
{
    std::lock_guard<std::mutex> lock(ambientMutex_);
    // A pause between play() and here has already run its restore
    if (!ambient_ || ambientDucked_ || !isPlaying())
        return;
    try
    {
        if (!ambient_->isAmbientPlaying())
            return;
        ambientSavedVolume_ = ambient_->getAmbientVolume();
        ambient_->setAmbientVolume(ambientSavedVolume_ * options_.ambientDuckFraction);
        ambientDucked_ = true;
        DM_DEBUG("Engine: ambient ducked from %.2f", ambientSavedVolume_);
    }
    catch (const std::exception& e)
    {
        DM_DEBUG("Engine: ambient duck ignored: %s", e.what());
    }
}

void Engine::restoreAmbient()
{
    std::lock_guard<std::mutex> lock(ambientMutex_);
    if (!ambient_ || !ambientDucked_)
        return;
    ambientDucked_ = false;
    try
    {
        ambient_->setAmbientVolume(ambientSavedVolume_);
        DM_DEBUG("Engine: ambient restored to %.2f", ambientSavedVolume_);
    }
    catch (const std::exception& e)
    {
        DM_DEBUG("Engine: ambient restore ignored: %s", e.what());
    }
}

} // namespace deckmix
