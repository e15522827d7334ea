#include <catch2/catch_test_macros.hpp>

#include "ffi/deckmix_ffi.h"
#include "core/Logger.h"

#include <string>
#include <vector>

// --- Callback test helpers ---

struct CapturedFFILog {
    int level;
    std::string message;
};

static std::vector<CapturedFFILog> g_ffiCaptured;

static void ffiCaptureCallback(int level, const char* message, void* /*userData*/)
{
    g_ffiCaptured.push_back({level, message});
}

static void resetFFI()
{
    dm_set_log_callback(nullptr, nullptr);
    dm_set_log_level(1); // warn
    g_ffiCaptured.clear();
}

// --- Tests ---

TEST_CASE("dm_set_log_level gates messages by level")
{
    resetFFI();
    dm_set_log_level(3);
    dm_set_log_callback(ffiCaptureCallback, nullptr);

    DM_DEBUG("ffi level test");
    REQUIRE(g_ffiCaptured.size() == 1);

    g_ffiCaptured.clear();
    dm_set_log_level(1);
    DM_DEBUG("should not appear");
    REQUIRE(g_ffiCaptured.empty());

    resetFFI();
}

TEST_CASE("dm_set_log_level clamps out-of-range levels")
{
    resetFFI();
    dm_set_log_level(99);
    CHECK(deckmix::Logger::getLevel() == deckmix::LogLevel::trace);
    dm_set_log_level(-3);
    CHECK(deckmix::Logger::getLevel() == deckmix::LogLevel::off);
    resetFFI();
}

TEST_CASE("dm_set_log_callback captures messages")
{
    resetFFI();
    dm_set_log_level(3); // debug
    dm_set_log_callback(ffiCaptureCallback, nullptr);

    DM_DEBUG("ffi callback test %d", 42);
    REQUIRE(g_ffiCaptured.size() == 1);
    REQUIRE(g_ffiCaptured[0].message.find("ffi callback test 42") != std::string::npos);
    REQUIRE(g_ffiCaptured[0].level == 3); // debug

    resetFFI();
}

TEST_CASE("dm_set_log_callback receives engine logs")
{
    resetFFI();
    dm_set_log_level(2); // info
    dm_set_log_callback(ffiCaptureCallback, nullptr);

    DmEngine e = dm_engine_create_for_testing(1000.0);
    REQUIRE(dm_load_json(e, R"({"mainUri": "episode.wav"})", nullptr) == DM_OK);
    dm_engine_destroy(e);

    bool sawLoad = false;
    for (const auto& entry : g_ffiCaptured)
        if (entry.message.find("episode.wav") != std::string::npos)
            sawLoad = true;
    CHECK(sawLoad);

    resetFFI();
}

TEST_CASE("dm_set_log_callback NULL reverts to stderr")
{
    resetFFI();
    dm_set_log_level(3);

    dm_set_log_callback(ffiCaptureCallback, nullptr);
    dm_set_log_callback(nullptr, nullptr);

    // Goes to stderr, must not be captured
    DM_DEBUG("after null callback");
    REQUIRE(g_ffiCaptured.empty());

    resetFFI();
}
