#include <catch2/catch_test_macros.hpp>

#include "core/Types.h"

#include <map>

using namespace deckmix;

static Trigger makeTrigger(const std::string& id, int deck, double atMs, double durationMs)
{
    Trigger t;
    t.id = id;
    t.uri = id + ".wav";
    t.deck = deck;
    t.atMs = atMs;
    t.durationMs = durationMs;
    return t;
}

// ═══════════════════════════════════════════════════════════════════
// Track names
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("trackFromName resolves aliases")
{
    Track t;
    REQUIRE(trackFromName("mic", t));
    CHECK(t == Track::mic);
    REQUIRE(trackFromName("clip", t));
    CHECK(t == Track::mic);
    REQUIRE(trackFromName("bed", t));
    CHECK(t == Track::deck1);
    REQUIRE(trackFromName("sfx", t));
    CHECK(t == Track::deck2);
    REQUIRE(trackFromName("deck4", t));
    CHECK(t == Track::deck4);
}

TEST_CASE("trackFromName rejects unknown names")
{
    Track t = Track::deck3;
    CHECK_FALSE(trackFromName("deck0", t));
    CHECK_FALSE(trackFromName("deck5", t));
    CHECK_FALSE(trackFromName("deck", t));
    CHECK_FALSE(trackFromName("Bed", t));
    CHECK_FALSE(trackFromName("", t));
    CHECK(t == Track::deck3);
}

TEST_CASE("deck helpers agree with the Track enum")
{
    CHECK_FALSE(isDeck(Track::mic));
    CHECK(isDeck(Track::deck2));
    CHECK(deckNumber(Track::deck3) == 3);
    CHECK(deckTrack(4) == Track::deck4);
    CHECK(isValidDeck(1));
    CHECK_FALSE(isValidDeck(0));
    CHECK_FALSE(isValidDeck(kNumDecks + 1));
}

// ═══════════════════════════════════════════════════════════════════
// DeckKey
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("DeckKey distinguishes the same trigger id on different decks")
{
    DeckKey a{1, "x"};
    DeckKey b{2, "x"};
    CHECK(a != b);
    CHECK(a < b);

    std::map<DeckKey, int> m;
    m[a] = 1;
    m[b] = 2;
    CHECK(m.size() == 2);
    CHECK(a.toString() == "1:x");
}

TEST_CASE("DeckKey ids containing the separator stay distinct")
{
    // The string form "1:a:b" is ambiguous, the typed key is not
    DeckKey a{1, "a:b"};
    DeckKey b{1, "a"};
    CHECK(a != b);
}

// ═══════════════════════════════════════════════════════════════════
// Config validation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("EngineConfig defaults are unity gain, unmuted, no ducking")
{
    EngineConfig config;
    CHECK(config.mainGain == 1.0f);
    for (int deck = 1; deck <= kNumDecks; ++deck)
    {
        CHECK(config.deckGain(deck) == 1.0f);
        CHECK_FALSE(config.deckMuted(deck));
        CHECK_FALSE(config.deckSoloed(deck));
    }
    CHECK_FALSE(config.hasDucking);
    CHECK(config.deckGain(0) == 0.0f);
}

TEST_CASE("validate accepts overlapping triggers on one deck")
{
    EngineConfig config;
    config.triggers.push_back(makeTrigger("a", 1, 0, 2000));
    config.triggers.push_back(makeTrigger("b", 1, 500, 2000));
    std::string error;
    CHECK(config.validate(error));
    CHECK(error.empty());
}

TEST_CASE("validate rejects bad triggers")
{
    EngineConfig config;
    std::string error;

    SECTION("deck out of range")
    {
        config.triggers.push_back(makeTrigger("a", 5, 0, 100));
        CHECK_FALSE(config.validate(error));
        CHECK(error.find("deck 5") != std::string::npos);
    }
    SECTION("negative start")
    {
        config.triggers.push_back(makeTrigger("a", 1, -1, 100));
        CHECK_FALSE(config.validate(error));
    }
    SECTION("negative duration")
    {
        config.triggers.push_back(makeTrigger("a", 1, 0, -5));
        CHECK_FALSE(config.validate(error));
    }
    SECTION("empty id")
    {
        config.triggers.push_back(makeTrigger("", 1, 0, 100));
        CHECK_FALSE(config.validate(error));
    }
    SECTION("duplicate id")
    {
        config.triggers.push_back(makeTrigger("a", 1, 0, 100));
        config.triggers.push_back(makeTrigger("a", 2, 50, 100));
        CHECK_FALSE(config.validate(error));
        CHECK(error.find("duplicate") != std::string::npos);
    }
}

TEST_CASE("engineErrorName covers every error")
{
    CHECK(std::string(engineErrorName(EngineError::ok)) == "ok");
    CHECK(std::string(engineErrorName(EngineError::loadFailed)) == "loadFailed");
    CHECK(std::string(engineErrorName(EngineError::notLoaded)) == "notLoaded");
    CHECK(std::string(engineErrorName(EngineError::invalidConfig)) == "invalidConfig");
    CHECK(std::string(engineErrorName(EngineError::playbackFailed)) == "playbackFailed");
    CHECK(std::string(engineErrorName(EngineError::superseded)) == "superseded");
}
