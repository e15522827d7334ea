#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ffi/deckmix_ffi.h"
#include <cstring>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

static const char* kSession = R"({
    "mainUri": "episode.wav",
    "triggers": [
        {"id": "t1", "uri": "bed.wav", "deck": 1, "atMs": 1000, "durationMs": 2000}
    ]
})";

static DmEngine loadedTestEngine()
{
    DmEngine e = dm_engine_create_for_testing(10000.0);
    REQUIRE(e != nullptr);
    REQUIRE(dm_load_json(e, kSession, nullptr) == DM_OK);
    return e;
}

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("dm_engine_create returns a handle without opening a device")
{
    char* error = nullptr;
    DmEngine engine = dm_engine_create(&error);
    REQUIRE(engine != nullptr);
    CHECK(error == nullptr);
    CHECK_FALSE(dm_is_audio_running(engine));
    CHECK_FALSE(dm_is_loaded(engine));
    CHECK(dm_advance_for_testing(engine, 100.0) == -1);
    dm_engine_destroy(engine);
}

TEST_CASE("dm_engine_destroy with NULL is a no-op")
{
    dm_engine_destroy(nullptr); // must not crash
}

TEST_CASE("dm_free_string with NULL is a no-op")
{
    dm_free_string(nullptr); // must not crash
}

TEST_CASE("dm_version returns expected version")
{
    DmEngine engine = dm_engine_create_for_testing(1000.0);
    char* version = dm_version(engine);
    REQUIRE(version != nullptr);
    REQUIRE(std::string(version) == "0.1.0");
    dm_free_string(version);
    dm_engine_destroy(engine);
}

TEST_CASE("Testing engines have no audio device")
{
    DmEngine engine = dm_engine_create_for_testing(1000.0);
    char* error = nullptr;
    CHECK_FALSE(dm_start_audio(engine, 48000.0, 512, &error));
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "testing engines have no audio device");
    dm_free_string(error);

    dm_stop_audio(engine); // no-op
    CHECK_FALSE(dm_is_audio_running(engine));
    dm_engine_destroy(engine);
}

TEST_CASE("dm_error_name")
{
    CHECK(std::string(dm_error_name(DM_OK)) == "ok");
    CHECK(std::string(dm_error_name(DM_LOAD_FAILED)) == "loadFailed");
    CHECK(std::string(dm_error_name(DM_NOT_LOADED)) == "notLoaded");
    CHECK(std::string(dm_error_name(DM_INVALID_CONFIG)) == "invalidConfig");
    CHECK(std::string(dm_error_name(DM_PLAYBACK_FAILED)) == "playbackFailed");
    CHECK(std::string(dm_error_name(DM_SUPERSEDED)) == "superseded");
    CHECK(std::string(dm_error_name(42)) == "unknown");
    CHECK(std::string(dm_error_name(-1)) == "unknown");
}

// ═══════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Control calls before dm_load_json return DM_NOT_LOADED")
{
    DmEngine e = dm_engine_create_for_testing(1000.0);
    CHECK(dm_play(e) == DM_NOT_LOADED);
    CHECK(dm_pause(e) == DM_NOT_LOADED);
    CHECK(dm_stop(e) == DM_NOT_LOADED);
    CHECK(dm_seek(e, 10.0) == DM_NOT_LOADED);
    CHECK(dm_set_track_gain(e, "mic", 0.5f) == DM_NOT_LOADED);
    CHECK(dm_clear_ducking(e) == DM_NOT_LOADED);
    CHECK(dm_position_ms(e) == 0.0);
    dm_engine_destroy(e);
}

TEST_CASE("dm_load_json rejects malformed and invalid sessions")
{
    DmEngine e = dm_engine_create_for_testing(1000.0);
    char* error = nullptr;

    SECTION("malformed JSON")
    {
        CHECK(dm_load_json(e, "{ not json", &error) == DM_INVALID_CONFIG);
        REQUIRE(error != nullptr);
        CHECK(std::strstr(error, "JSON parse error") != nullptr);
    }
    SECTION("NULL json")
    {
        CHECK(dm_load_json(e, nullptr, &error) == DM_INVALID_CONFIG);
        REQUIRE(error != nullptr);
        CHECK(std::string(error) == "json is NULL");
    }
    SECTION("trigger on a deck that does not exist")
    {
        const char* json = R"({"mainUri": "a.wav", "triggers": [
            {"id": "x", "uri": "b.wav", "deck": 5, "atMs": 0, "durationMs": 100}]})";
        CHECK(dm_load_json(e, json, &error) == DM_INVALID_CONFIG);
        REQUIRE(error != nullptr);
    }

    dm_free_string(error);
    CHECK_FALSE(dm_is_loaded(e));
    dm_engine_destroy(e);
}

TEST_CASE("dm_load_json success clears the error pointer")
{
    DmEngine e = dm_engine_create_for_testing(1000.0);
    char* error = reinterpret_cast<char*>(0x1);
    CHECK(dm_load_json(e, kSession, &error) == DM_OK);
    CHECK(error == nullptr);
    CHECK(dm_is_loaded(e));
    CHECK_FALSE(dm_is_playing(e));
    CHECK(dm_duration_ms(e) == 1000.0);
    dm_engine_destroy(e);
}

TEST_CASE("Playback through the C API follows the testing clock")
{
    DmEngine e = loadedTestEngine();

    REQUIRE(dm_play(e) == DM_OK);
    CHECK(dm_is_playing(e));
    CHECK(dm_advance_for_testing(e, 500.0) > 0);
    CHECK_THAT(dm_position_ms(e), WithinAbs(500.0, 1e-6));
    CHECK(dm_active_deck_count(e) == 0);

    dm_advance_for_testing(e, 600.0);
    CHECK(dm_active_deck_count(e) == 1);

    REQUIRE(dm_pause(e) == DM_OK);
    CHECK_FALSE(dm_is_playing(e));
    double paused = dm_position_ms(e);
    dm_advance_for_testing(e, 1000.0);
    CHECK(dm_position_ms(e) == paused);

    REQUIRE(dm_seek(e, 4000.0) == DM_OK);
    CHECK(dm_position_ms(e) == 4000.0);
    CHECK(dm_active_deck_count(e) == 0);

    REQUIRE(dm_stop(e) == DM_OK);
    CHECK(dm_position_ms(e) == 0.0);
    dm_engine_destroy(e);
}

TEST_CASE("dm_test_set_duration sets the main duration")
{
    DmEngine e = dm_engine_create_for_testing(10000.0);
    dm_test_set_duration(e, "episode.wav", 2500.0);
    dm_test_set_duration(e, nullptr, 1.0); // ignored
    REQUIRE(dm_load_json(e, kSession, nullptr) == DM_OK);
    CHECK(dm_duration_ms(e) == 2500.0);
    CHECK(dm_seek(e, 9000.0) == DM_OK);
    CHECK(dm_position_ms(e) == 2500.0);
    dm_engine_destroy(e);
}

TEST_CASE("dm_load_plan_json maps editor segments onto decks")
{
    DmEngine e = dm_engine_create_for_testing(10000.0);
    const char* plan = R"({
        "baseUri": "voice.wav",
        "segments": [
            {"id": "s1", "uri": "bed.wav", "startMs": 0, "endMs": 3000, "track": "bed"},
            {"id": "s2", "uri": "pop.wav", "startMs": 0, "endMs": 500, "track": "sfx"}
        ],
        "trackGains": {"clip": 1.0, "bed": 0.5, "sfx": 1.0}
    })";
    char* error = nullptr;
    REQUIRE(dm_load_plan_json(e, plan, &error) == DM_OK);
    CHECK(error == nullptr);

    REQUIRE(dm_play(e) == DM_OK);
    dm_advance_for_testing(e, 100.0);
    CHECK(dm_active_deck_count(e) == 2);
    dm_engine_destroy(e);
}

// ═══════════════════════════════════════════════════════════════════
// Mixer controls
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Track controls accept UI track names")
{
    DmEngine e = loadedTestEngine();
    CHECK(dm_set_track_gain(e, "mic", 0.5f) == DM_OK);
    CHECK(dm_set_track_gain(e, "clip", 0.5f) == DM_OK);
    CHECK(dm_set_track_gain(e, "bed", 0.5f) == DM_OK);
    CHECK(dm_set_mute(e, "sfx", true) == DM_OK);
    CHECK(dm_set_solo(e, "deck4", true) == DM_OK);
    CHECK(dm_set_solo(e, "deck4", false) == DM_OK);

    CHECK(dm_set_track_gain(e, "drums", 0.5f) == DM_INVALID_CONFIG);
    CHECK(dm_set_mute(e, nullptr, true) == DM_INVALID_CONFIG);
    CHECK(dm_set_solo(e, "deck5", true) == DM_INVALID_CONFIG);
    dm_engine_destroy(e);
}

TEST_CASE("Muting a deck through the C API blocks its triggers")
{
    DmEngine e = loadedTestEngine();
    REQUIRE(dm_set_mute(e, "bed", true) == DM_OK);
    REQUIRE(dm_play(e) == DM_OK);
    dm_advance_for_testing(e, 1500.0);
    CHECK(dm_active_deck_count(e) == 0);
    dm_engine_destroy(e);
}

TEST_CASE("dm_set_ducking and dm_clear_ducking")
{
    DmEngine e = loadedTestEngine();
    CHECK(dm_set_ducking(e, true, 9.0f, 20.0f, 300.0f) == DM_OK);

    char* json = dm_mixdown_plan_json(e, nullptr, nullptr);
    REQUIRE(json != nullptr);
    CHECK(std::strstr(json, "\"amountDb\": 9") != nullptr);
    dm_free_string(json);

    CHECK(dm_clear_ducking(e) == DM_OK);
    json = dm_mixdown_plan_json(e, nullptr, nullptr);
    REQUIRE(json != nullptr);
    CHECK(std::strstr(json, "\"enabled\": false") != nullptr);
    dm_free_string(json);
    dm_engine_destroy(e);
}

// ═══════════════════════════════════════════════════════════════════
// Listeners
// ═══════════════════════════════════════════════════════════════════

struct ListenerLog {
    std::vector<double> progress;
    int ended = 0;
};

static void onProgress(double positionMs, void* userData)
{
    static_cast<ListenerLog*>(userData)->progress.push_back(positionMs);
}

static void onEnded(void* userData)
{
    ++static_cast<ListenerLog*>(userData)->ended;
}

TEST_CASE("Progress and ended callbacks receive their user data")
{
    DmEngine e = dm_engine_create_for_testing(10000.0);
    dm_test_set_duration(e, "episode.wav", 1000.0);
    REQUIRE(dm_load_json(e, kSession, nullptr) == DM_OK);

    ListenerLog log;
    dm_set_progress_callback(e, onProgress, &log);
    dm_set_ended_callback(e, onEnded, &log);

    REQUIRE(dm_play(e) == DM_OK);
    dm_advance_for_testing(e, 500.0);
    REQUIRE(log.progress.size() == 4);
    CHECK_THAT(log.progress[0], WithinAbs(120.0, 1e-6));

    dm_advance_for_testing(e, 1000.0);
    CHECK(log.ended == 1);
    CHECK_FALSE(dm_is_playing(e));
    CHECK(dm_position_ms(e) == 1000.0);

    // Cleared callbacks stay quiet
    dm_set_progress_callback(e, nullptr, nullptr);
    dm_set_ended_callback(e, nullptr, nullptr);
    size_t before = log.progress.size();
    REQUIRE(dm_seek(e, 0.0) == DM_OK);
    REQUIRE(dm_play(e) == DM_OK);
    dm_advance_for_testing(e, 2000.0);
    CHECK(log.progress.size() == before);
    CHECK(log.ended == 1);
    dm_engine_destroy(e);
}

// ═══════════════════════════════════════════════════════════════════
// Ambient
// ═══════════════════════════════════════════════════════════════════

struct Radio {
    bool playing = true;
    float volume = 0.8f;
};

static bool radioPlaying(void* ud) { return static_cast<Radio*>(ud)->playing; }
static float radioVolume(void* ud) { return static_cast<Radio*>(ud)->volume; }
static void radioSetVolume(float v, void* ud) { static_cast<Radio*>(ud)->volume = v; }

TEST_CASE("dm_set_ambient ducks the ambient stream while playing")
{
    Radio radio;
    DmEngine e = loadedTestEngine();

    DmAmbientCallbacks cbs{radioPlaying, radioVolume, radioSetVolume, &radio};
    dm_set_ambient(e, &cbs);

    REQUIRE(dm_play(e) == DM_OK);
    CHECK_THAT(radio.volume, WithinAbs(0.24, 1e-6));
    REQUIRE(dm_pause(e) == DM_OK);
    CHECK_THAT(radio.volume, WithinAbs(0.8, 1e-6));

    dm_set_ambient(e, nullptr);
    REQUIRE(dm_play(e) == DM_OK);
    CHECK_THAT(radio.volume, WithinAbs(0.8, 1e-6));
    dm_engine_destroy(e);
}

// ═══════════════════════════════════════════════════════════════════
// Mixdown
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("dm_mixdown_plan_json describes the loaded session")
{
    DmEngine e = loadedTestEngine();
    REQUIRE(dm_set_track_gain(e, "bed", 0.5f) == DM_OK);

    char* error = nullptr;
    char* json = dm_mixdown_plan_json(e, "wav", &error);
    REQUIRE(json != nullptr);
    CHECK(error == nullptr);

    std::string s(json);
    CHECK(s.find("\"baseUri\": \"episode.wav\"") != std::string::npos);
    CHECK(s.find("\"trackId\": \"bed\"") != std::string::npos);
    CHECK(s.find("\"bed\": 0.5") != std::string::npos);
    CHECK(s.find("\"outExt\": \"wav\"") != std::string::npos);
    dm_free_string(json);
    dm_engine_destroy(e);
}

TEST_CASE("dm_mixdown_plan_json rejects unknown formats")
{
    DmEngine e = loadedTestEngine();
    char* error = nullptr;
    CHECK(dm_mixdown_plan_json(e, "ogg", &error) == nullptr);
    REQUIRE(error != nullptr);
    CHECK(std::string(error) == "unsupported output format: ogg");
    dm_free_string(error);
    dm_engine_destroy(e);
}
