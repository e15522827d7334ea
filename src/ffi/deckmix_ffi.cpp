#include "ffi/deckmix_ffi.h"
#include "core/Engine.h"
#include "core/JuceBackend.h"
#include "core/Logger.h"
#include "core/SessionJson.h"
#include "core/TestBackend.h"
#include "core/TestTimerService.h"

#include <juce_events/juce_events.h>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>

// --- Ambient adapter ---

class CallbackAmbient : public deckmix::AmbientAudio {
public:
    explicit CallbackAmbient(const DmAmbientCallbacks& cbs) : cbs_(cbs) {}

    bool isAmbientPlaying() const override
    {
        return cbs_.is_playing && cbs_.is_playing(cbs_.user_data);
    }

    float getAmbientVolume() const override
    {
        return cbs_.get_volume ? cbs_.get_volume(cbs_.user_data) : 1.0f;
    }

    void setAmbientVolume(float volume) override
    {
        if (cbs_.set_volume)
            cbs_.set_volume(volume, cbs_.user_data);
    }

private:
    DmAmbientCallbacks cbs_;
};

// --- EngineHandle ---

struct EngineHandle {
    // Real-time engines
    std::unique_ptr<deckmix::JuceBackend> juceBackend;
    std::mutex audioMutex;

    // Testing engines
    std::unique_ptr<deckmix::TestClock> testClock;
    std::unique_ptr<deckmix::TestBackend> testBackend;
    deckmix::TestTimerService* testTimers = nullptr; // owned by engine

    std::unique_ptr<CallbackAmbient> ambient;
    std::unique_ptr<deckmix::Engine> engine;

    ~EngineHandle()
    {
        // The engine references the backend and the ambient adapter
        engine.reset();
    }
};

static EngineHandle* cast(DmEngine e)
{
    return static_cast<EngineHandle*>(e);
}

static deckmix::Engine& eng(DmEngine e)
{
    return *cast(e)->engine;
}

static int code(deckmix::EngineError err)
{
    return static_cast<int>(err);
}

// --- JUCE initialization ---

static bool juceInitialised = false;
static juce::ScopedJuceInitialiser_GUI* juceInit = nullptr;

static void ensureJuceInit()
{
    if (!juceInitialised)
    {
        juceInit = new juce::ScopedJuceInitialiser_GUI();
        juceInitialised = true;
    }
}

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

static void clear_error(char** error)
{
    if (error) *error = nullptr;
}

// --- Result codes / Logger API ---

const char* dm_error_name(int code)
{
    if (code < 0 || code > static_cast<int>(deckmix::EngineError::superseded))
        return "unknown";
    return deckmix::engineErrorName(static_cast<deckmix::EngineError>(code));
}

void dm_set_log_level(int level)
{
    if (level < 0) level = 0;
    if (level > 4) level = 4;
    deckmix::Logger::setLevel(static_cast<deckmix::LogLevel>(level));
}

void dm_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    deckmix::Logger::setCallback(callback, user_data);
}

void dm_free_string(char* s)
{
    free(s);
}

// ═══════════════════════════════════════════════════════════════════
// Engine lifecycle
// ═══════════════════════════════════════════════════════════════════

DmEngine dm_engine_create(char** error)
{
    ensureJuceInit();
    deckmix::Logger::applyEnvironmentLevel();
    try
    {
        auto h = std::make_unique<EngineHandle>();
        h->juceBackend = std::make_unique<deckmix::JuceBackend>();
        h->engine = std::make_unique<deckmix::Engine>(*h->juceBackend);
        clear_error(error);
        return static_cast<DmEngine>(h.release());
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return nullptr;
    }
}

DmEngine dm_engine_create_for_testing(double default_duration_ms)
{
    auto* h = new (std::nothrow) EngineHandle();
    if (!h) return nullptr;

    h->testClock = std::make_unique<deckmix::TestClock>();
    h->testBackend = std::make_unique<deckmix::TestBackend>(*h->testClock, default_duration_ms);
    auto timers = std::make_unique<deckmix::TestTimerService>(*h->testClock);
    h->testTimers = timers.get();
    h->engine = std::make_unique<deckmix::Engine>(*h->testBackend, std::move(timers), *h->testClock);
    return static_cast<DmEngine>(h);
}

void dm_engine_destroy(DmEngine engine)
{
    if (!engine) return;
    delete cast(engine);
    deckmix::Logger::drain();
}

char* dm_version(DmEngine engine)
{
    return to_c_string(eng(engine).getVersion());
}

// ═══════════════════════════════════════════════════════════════════
// Audio device
// ═══════════════════════════════════════════════════════════════════

bool dm_start_audio(DmEngine engine, double sample_rate, int block_size, char** error)
{
    auto* h = cast(engine);
    if (!h->juceBackend)
    {
        set_error(error, "testing engines have no audio device");
        return false;
    }
    std::lock_guard<std::mutex> lock(h->audioMutex);
    std::string err;
    bool ok = h->juceBackend->start(sample_rate, block_size, err);
    if (!ok)
        set_error(error, err);
    else
        clear_error(error);
    return ok;
}

void dm_stop_audio(DmEngine engine)
{
    auto* h = cast(engine);
    if (!h->juceBackend) return;
    std::lock_guard<std::mutex> lock(h->audioMutex);
    h->juceBackend->stop();
}

bool dm_is_audio_running(DmEngine engine)
{
    auto* h = cast(engine);
    return h->juceBackend && h->juceBackend->isRunning();
}

// ═══════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════

int dm_load_json(DmEngine engine, const char* json, char** error)
{
    std::string err;
    deckmix::EngineConfig config;
    if (!json || !deckmix::parseEngineConfig(json, config, err))
    {
        set_error(error, json ? err : "json is NULL");
        return code(deckmix::EngineError::invalidConfig);
    }

    auto result = eng(engine).load(config, err);
    if (result != deckmix::EngineError::ok)
        set_error(error, err);
    else
        clear_error(error);
    return code(result);
}

int dm_load_plan_json(DmEngine engine, const char* json, char** error)
{
    std::string err;
    deckmix::EditorPlan plan;
    if (!json || !deckmix::parseEditorPlan(json, plan, err))
    {
        set_error(error, json ? err : "json is NULL");
        return code(deckmix::EngineError::invalidConfig);
    }

    auto result = eng(engine).loadFromPlan(plan.baseUri, plan.segments, plan.trackGains,
                                           plan.hasDucking ? &plan.ducking : nullptr, err);
    if (result != deckmix::EngineError::ok)
        set_error(error, err);
    else
        clear_error(error);
    return code(result);
}

int dm_play(DmEngine engine)
{
    return code(eng(engine).play());
}

int dm_pause(DmEngine engine)
{
    return code(eng(engine).pause());
}

int dm_stop(DmEngine engine)
{
    return code(eng(engine).stop());
}

int dm_seek(DmEngine engine, double ms)
{
    return code(eng(engine).seek(ms));
}

double dm_position_ms(DmEngine engine)
{
    return eng(engine).getPositionMs();
}

double dm_duration_ms(DmEngine engine)
{
    return eng(engine).getDurationMs();
}

bool dm_is_playing(DmEngine engine)
{
    return eng(engine).isPlaying();
}

bool dm_is_loaded(DmEngine engine)
{
    return eng(engine).isLoaded();
}

// ═══════════════════════════════════════════════════════════════════
// Mixer controls
// ═══════════════════════════════════════════════════════════════════

int dm_set_track_gain(DmEngine engine, const char* track, float gain)
{
    deckmix::Track t;
    if (!track || !deckmix::trackFromName(track, t))
        return code(deckmix::EngineError::invalidConfig);
    return code(eng(engine).setTrackGain(t, gain));
}

int dm_set_mute(DmEngine engine, const char* track, bool muted)
{
    deckmix::Track t;
    if (!track || !deckmix::trackFromName(track, t))
        return code(deckmix::EngineError::invalidConfig);
    return code(eng(engine).setMute(t, muted));
}

int dm_set_solo(DmEngine engine, const char* track, bool solo)
{
    deckmix::Track t;
    if (!track || !deckmix::trackFromName(track, t))
        return code(deckmix::EngineError::invalidConfig);
    return code(eng(engine).setSolo(t, solo));
}

int dm_set_ducking(DmEngine engine, bool enabled, float amount_db,
                   float attack_ms, float release_ms)
{
    deckmix::DuckingParams params;
    params.enabled = enabled;
    params.amountDb = amount_db;
    params.attackMs = attack_ms;
    params.releaseMs = release_ms;
    return code(eng(engine).setDucking(&params));
}

int dm_clear_ducking(DmEngine engine)
{
    return code(eng(engine).setDucking(nullptr));
}

// ═══════════════════════════════════════════════════════════════════
// Listeners
// ═══════════════════════════════════════════════════════════════════

void dm_set_progress_callback(DmEngine engine,
                              void (*callback)(double position_ms, void* user_data),
                              void* user_data)
{
    if (!callback)
    {
        eng(engine).onProgress(nullptr);
        return;
    }
    eng(engine).onProgress([callback, user_data](double ms) { callback(ms, user_data); });
}

void dm_set_ended_callback(DmEngine engine,
                           void (*callback)(void* user_data),
                           void* user_data)
{
    if (!callback)
    {
        eng(engine).onEnded(nullptr);
        return;
    }
    eng(engine).onEnded([callback, user_data] { callback(user_data); });
}

void dm_set_ambient(DmEngine engine, const DmAmbientCallbacks* callbacks)
{
    auto* h = cast(engine);
    h->engine->setAmbientAudio(nullptr);
    h->ambient.reset();
    if (!callbacks) return;
    h->ambient = std::make_unique<CallbackAmbient>(*callbacks);
    h->engine->setAmbientAudio(h->ambient.get());
}

// ═══════════════════════════════════════════════════════════════════
// Mixdown
// ═══════════════════════════════════════════════════════════════════

char* dm_mixdown_plan_json(DmEngine engine, const char* out_ext, char** error)
{
    deckmix::MixdownOptions options;
    if (out_ext)
        options.outExt = out_ext;
    if (!deckmix::isValidOutExt(options.outExt))
    {
        set_error(error, "unsupported output format: " + options.outExt);
        return nullptr;
    }
    clear_error(error);
    return to_c_string(deckmix::mixdownPlanToJson(eng(engine).buildMixdownPlan(options)));
}

// ═══════════════════════════════════════════════════════════════════
// Introspection / testing
// ═══════════════════════════════════════════════════════════════════

int dm_active_deck_count(DmEngine engine)
{
    return eng(engine).getActiveDeckCount();
}

int dm_advance_for_testing(DmEngine engine, double ms)
{
    auto* h = cast(engine);
    if (!h->testTimers) return -1;
    return h->testTimers->advance(ms);
}

void dm_test_set_duration(DmEngine engine, const char* uri, double ms)
{
    auto* h = cast(engine);
    if (!h->testBackend || !uri) return;
    h->testBackend->setDuration(uri, ms);
}
