#pragma once

#include "core/Clock.h"
#include "core/Playback.h"

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace deckmix {

/// Observable state of one handle opened by TestBackend.
/// Survives the handle itself so tests can inspect unloaded clips.
struct TestHandleState {
    std::string uri;
    PlaybackOptions options;
    float volume = 1.0f;
    bool playing = false;
    bool loaded = true;
    double basePositionMs = 0.0;
    double playStartedMs = 0.0;
    double durationMs = 0.0;
    int playCalls = 0;
    int volumeCalls = 0;
};

/// In-memory playback primitive for tests. Position advances with the
/// supplied Clock while a handle is playing, capped at its duration.
class TestBackend : public PlaybackBackend {
public:
    explicit TestBackend(const Clock& clock, double defaultDurationMs = 10000.0)
        : clock_(clock), defaultDurationMs_(defaultDurationMs) {}

    std::unique_ptr<PlaybackHandle> open(const std::string& uri,
                                         const PlaybackOptions& options,
                                         std::string& error) override
    {
        if (failingUris_.count(uri))
        {
            error = "test backend: cannot open " + uri;
            return nullptr;
        }

        auto state = std::make_shared<TestHandleState>();
        state->uri = uri;
        state->options = options;
        state->volume = options.initialVolume;
        auto it = durations_.find(uri);
        state->durationMs = it != durations_.end() ? it->second : defaultDurationMs_;
        if (options.autoplay)
        {
            state->playing = true;
            state->playStartedMs = clock_.nowMs();
            ++state->playCalls;
        }
        opened_.push_back(state);
        return std::make_unique<Handle>(clock_, state);
    }

    // --- Test configuration ---
    void setDuration(const std::string& uri, double ms) { durations_[uri] = ms; }
    void failOpen(const std::string& uri) { failingUris_.insert(uri); }

    // --- Inspection ---
    const std::vector<std::shared_ptr<TestHandleState>>& opened() const { return opened_; }

    int openCount(const std::string& uri) const
    {
        return static_cast<int>(std::count_if(opened_.begin(), opened_.end(),
            [&](const std::shared_ptr<TestHandleState>& s) { return s->uri == uri; }));
    }

    int loadedCount(const std::string& uri) const
    {
        return static_cast<int>(std::count_if(opened_.begin(), opened_.end(),
            [&](const std::shared_ptr<TestHandleState>& s) { return s->uri == uri && s->loaded; }));
    }

    /// Most recent handle opened for `uri`, or nullptr.
    std::shared_ptr<TestHandleState> last(const std::string& uri) const
    {
        for (auto it = opened_.rbegin(); it != opened_.rend(); ++it)
            if ((*it)->uri == uri)
                return *it;
        return nullptr;
    }

private:
    class Handle : public PlaybackHandle {
    public:
        Handle(const Clock& clock, std::shared_ptr<TestHandleState> state)
            : clock_(clock), state_(std::move(state)) {}

        ~Handle() override { state_->loaded = false; }

        bool play() override
        {
            if (!state_->loaded) return false;
            if (!state_->playing)
            {
                state_->playing = true;
                state_->playStartedMs = clock_.nowMs();
            }
            ++state_->playCalls;
            return true;
        }

        bool pause() override
        {
            if (!state_->loaded) return false;
            state_->basePositionMs = position();
            state_->playing = false;
            return true;
        }

        bool stop() override
        {
            if (!state_->loaded) return false;
            state_->playing = false;
            state_->basePositionMs = 0.0;
            return true;
        }

        bool seek(double ms) override
        {
            if (!state_->loaded) return false;
            state_->basePositionMs = std::max(0.0, std::min(ms, state_->durationMs));
            state_->playStartedMs = clock_.nowMs();
            return true;
        }

        bool setVolume(float volume) override
        {
            if (!state_->loaded) return false;
            state_->volume = volume;
            ++state_->volumeCalls;
            return true;
        }

        PlaybackStatus getStatus() const override
        {
            PlaybackStatus st;
            st.isLoaded = state_->loaded;
            st.isPlaying = state_->loaded && state_->playing;
            st.positionMs = position();
            st.durationMs = state_->durationMs;
            return st;
        }

        void unload() override
        {
            state_->loaded = false;
            state_->playing = false;
        }

    private:
        double position() const
        {
            double pos = state_->basePositionMs;
            if (state_->playing)
                pos += clock_.nowMs() - state_->playStartedMs;
            return std::min(pos, state_->durationMs);
        }

        const Clock& clock_;
        std::shared_ptr<TestHandleState> state_;
    };

    const Clock& clock_;
    double defaultDurationMs_;
    std::map<std::string, double> durations_;
    std::set<std::string> failingUris_;
    std::vector<std::shared_ptr<TestHandleState>> opened_;
};

} // namespace deckmix
