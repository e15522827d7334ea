#ifndef DECKMIX_FFI_H
#define DECKMIX_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Opaque handle ─────────────────────────────────────────────── */

typedef void* DmEngine;

/* ── Result codes ──────────────────────────────────────────────── */

/// Returned by every control call. Mirrors deckmix::EngineError.
enum {
    DM_OK              = 0,
    DM_LOAD_FAILED     = 1,
    DM_NOT_LOADED      = 2,
    DM_INVALID_CONFIG  = 3,
    DM_PLAYBACK_FAILED = 4,
    DM_SUPERSEDED      = 5
};

/// Static name of a result code ("ok", "loadFailed", ...). Do not free.
const char* dm_error_name(int code);

/* ── String ownership ──────────────────────────────────────────── */

/// Free a string returned by any dm_* function.
/// Passing NULL is safe (no-op).
void dm_free_string(char* s);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=warn, 2=info, 3=debug, 4=trace.
/// Does not require a DmEngine handle.
void dm_set_log_level(int level);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
/// May be invoked from the host thread or the engine's timer thread.
void dm_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── Engine lifecycle ──────────────────────────────────────────── */

/// Create an engine playing through JUCE. Returns NULL on failure (sets *error).
/// The audio device is not opened until dm_start_audio().
/// Initializes JUCE MessageManager on first call (static, process-wide).
DmEngine dm_engine_create(char** error);

/// Create an engine on an in-memory playback backend and a manual clock.
/// Time only moves through dm_advance_for_testing(). Clips last
/// `default_duration_ms` unless overridden with dm_test_set_duration().
DmEngine dm_engine_create_for_testing(double default_duration_ms);

/// Destroy the engine and free all resources.
/// Passing NULL is safe (no-op).
void dm_engine_destroy(DmEngine engine);

/// Returns the engine version string. Caller must dm_free_string() the result.
char* dm_version(DmEngine engine);

/* ── Audio device ──────────────────────────────────────────────── */

/// Open the default output device. Returns false and sets *error on failure.
/// Always false for testing engines.
bool dm_start_audio(DmEngine engine, double sample_rate, int block_size, char** error);
void dm_stop_audio(DmEngine engine);
bool dm_is_audio_running(DmEngine engine);

/* ── Session ───────────────────────────────────────────────────── */

/// Load a session from EngineConfig JSON. On failure sets *error.
int dm_load_json(DmEngine engine, const char* json, char** error);

/// Load from editor segments: {"baseUri", "segments":[{id,uri,startMs,endMs,track}],
/// "trackGains":{clip,bed,sfx}, "ducking":{...}|null}.
int dm_load_plan_json(DmEngine engine, const char* json, char** error);

int dm_play(DmEngine engine);
int dm_pause(DmEngine engine);
int dm_stop(DmEngine engine);
int dm_seek(DmEngine engine, double ms);

double dm_position_ms(DmEngine engine);
double dm_duration_ms(DmEngine engine);
bool dm_is_playing(DmEngine engine);
bool dm_is_loaded(DmEngine engine);

/* ── Mixer controls ────────────────────────────────────────────── */

/// `track` is "mic" (alias "clip"), "bed" (deck 1), "sfx" (deck 2) or "deck1".."deck4".
/// Unknown names return DM_INVALID_CONFIG.
int dm_set_track_gain(DmEngine engine, const char* track, float gain);
int dm_set_mute(DmEngine engine, const char* track, bool muted);
int dm_set_solo(DmEngine engine, const char* track, bool solo);

int dm_set_ducking(DmEngine engine, bool enabled, float amount_db,
                   float attack_ms, float release_ms);

/// Reset ducking to the disabled defaults.
int dm_clear_ducking(DmEngine engine);

/* ── Listeners ─────────────────────────────────────────────────── */

/// Called roughly every 120 ms while playing. Pass NULL to clear.
/// Invoked from the timer thread (from dm_advance_for_testing() for testing engines).
void dm_set_progress_callback(DmEngine engine,
                              void (*callback)(double position_ms, void* user_data),
                              void* user_data);

/// Called once when playback reaches the end of the main recording. Pass NULL to clear.
void dm_set_ended_callback(DmEngine engine,
                           void (*callback)(void* user_data),
                           void* user_data);

/* ── Ambient ducking ───────────────────────────────────────────── */

typedef struct {
    bool  (*is_playing)(void* user_data);
    float (*get_volume)(void* user_data);
    void  (*set_volume)(float volume, void* user_data);
    void* user_data;
} DmAmbientCallbacks;

/// Stream to duck while the engine plays. The struct is copied. NULL clears.
void dm_set_ambient(DmEngine engine, const DmAmbientCallbacks* callbacks);

/* ── Mixdown ───────────────────────────────────────────────────── */

/// Render plan for the loaded session as JSON. `out_ext` is "m4a", "wav",
/// "mp3" or NULL (m4a). Returns NULL and sets *error for other formats.
/// Caller must dm_free_string() the result.
char* dm_mixdown_plan_json(DmEngine engine, const char* out_ext, char** error);

/* ── Introspection / testing ───────────────────────────────────── */

int dm_active_deck_count(DmEngine engine);

/// Advance a testing engine's clock, firing due timers on the calling thread.
/// Returns the number of timer callbacks run, or -1 for a real-time engine.
int dm_advance_for_testing(DmEngine engine, double ms);

/// Duration reported for `uri` by a testing engine's backend. No-op otherwise.
void dm_test_set_duration(DmEngine engine, const char* uri, double ms);

#ifdef __cplusplus
}
#endif

#endif /* DECKMIX_FFI_H */
