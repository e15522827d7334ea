#pragma once

#include <array>
#include <string>
#include <vector>

namespace deckmix {

static constexpr int kNumDecks = 4;

enum class EngineError {
    ok,
    loadFailed,     // main asset could not be opened
    notLoaded,      // control call before a successful load()
    invalidConfig,  // config rejected by load() validation
    playbackFailed, // main channel refused to start
    superseded      // a newer load()/dispose() started while this one was in flight
};

inline const char* engineErrorName(EngineError error)
{
    switch (error) {
        case EngineError::ok:            return "ok";
        case EngineError::loadFailed:    return "loadFailed";
        case EngineError::notLoaded:     return "notLoaded";
        case EngineError::invalidConfig: return "invalidConfig";
        case EngineError::playbackFailed: return "playbackFailed";
        case EngineError::superseded:    return "superseded";
    }
    return "unknown";
}

// Main (mic) track plus the four overlay decks.
enum class Track : int { mic = 0, deck1 = 1, deck2 = 2, deck3 = 3, deck4 = 4 };

inline bool isValidDeck(int deck) { return deck >= 1 && deck <= kNumDecks; }
inline bool isDeck(Track track) { return track != Track::mic; }
inline int deckNumber(Track track) { return static_cast<int>(track); }
inline Track deckTrack(int deck) { return static_cast<Track>(deck); }

/// Resolve a UI track name: "mic"/"clip" -> mic, "bed" -> deck 1,
/// "sfx" -> deck 2, "deck1".."deck4". Returns false for unknown names.
bool trackFromName(const std::string& name, Track& out);

/// Typed key for an active overlay clip.
struct DeckKey {
    int deck = 0;
    std::string triggerId;

    bool operator==(const DeckKey& o) const { return deck == o.deck && triggerId == o.triggerId; }
    bool operator!=(const DeckKey& o) const { return !(*this == o); }
    bool operator<(const DeckKey& o) const
    {
        return deck != o.deck ? deck < o.deck : triggerId < o.triggerId;
    }

    /// "deck:triggerId", for logs only.
    std::string toString() const { return std::to_string(deck) + ":" + triggerId; }
};

struct Trigger {
    std::string id;
    std::string uri;
    int deck = 1;
    double atMs = 0.0;
    double durationMs = 0.0;
    float gain = 1.0f;
};

struct DuckingParams {
    bool enabled = false;
    float amountDb = 6.0f;
    float attackMs = 50.0f;   // stored, not applied
    float releaseMs = 200.0f; // stored, not applied

    static DuckingParams disabled() { return {}; }
};

struct EngineConfig {
    std::string mainUri;
    float mainGain = 1.0f;
    bool mainMuted = false;
    bool mainSolo = false;

    // Indexed by deck number - 1
    std::array<float, kNumDecks> deckGains{{1.0f, 1.0f, 1.0f, 1.0f}};
    std::array<bool, kNumDecks> deckMutes{};
    std::array<bool, kNumDecks> deckSolos{};

    std::vector<Trigger> triggers;

    bool hasDucking = false;
    DuckingParams ducking;

    float deckGain(int deck) const { return isValidDeck(deck) ? deckGains[deck - 1] : 0.0f; }
    bool deckMuted(int deck) const { return isValidDeck(deck) && deckMutes[deck - 1]; }
    bool deckSoloed(int deck) const { return isValidDeck(deck) && deckSolos[deck - 1]; }

    /// Checks trigger invariants. Returns false and fills `error` on the first violation.
    bool validate(std::string& error) const;
};

/// Construction-time timing constants of an Engine.
struct EngineOptions {
    double tickIntervalMs = 50.0;
    double progressIntervalMs = 120.0;
    double triggerLookaheadMs = 30.0;
    double endGuardMs = 50.0;
    float ambientDuckFraction = 0.3f;
};

} // namespace deckmix
