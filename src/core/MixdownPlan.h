#pragma once

#include "core/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace deckmix {

struct MixdownSegment {
    std::string uri;
    double startMs = 0.0;
    double endMs = 0.0;
    std::string trackId;     // "bed", "sfx", "deck3", "deck4"
    float gain = 1.0f;
    float pan = 0.0f;        // -1 left .. +1 right
    double fadeInMs = 0.0;
    double fadeOutMs = 0.0;
};

struct TrackGains {
    float clip = 1.0f;
    float bed = 1.0f;
    float sfx = 1.0f;
};

struct MixdownFx {
    std::optional<double> normalizeGainDb;
    std::optional<double> fadeInMs;
    std::optional<double> fadeOutMs;
};

/// Serializable request for the external render service.
struct MixdownPlan {
    std::string baseUri;
    std::vector<MixdownSegment> segments;
    TrackGains trackGains;
    DuckingParams ducking;
    MixdownFx fx;
    std::string outExt = "m4a";
};

struct MixdownOptions {
    MixdownFx fx;
    std::string outExt = "m4a";
    double segmentFadeInMs = 0.0;
    double segmentFadeOutMs = 0.0;
};

/// A clip placed on the editor timeline, as handed to Engine::loadFromPlan().
struct EditorSegment {
    std::string id;
    std::string uri;
    double startMs = 0.0;
    double endMs = 0.0;
    std::string track;       // "bed" lands on deck 1, anything else on deck 2
};

bool isValidOutExt(const std::string& ext);

/// Track id used in a plan for clips on `deck`.
std::string trackIdForDeck(int deck);

/// Map a live engine config to a render plan. Segments are ordered by start time.
MixdownPlan buildMixdownPlan(const EngineConfig& config, const MixdownOptions& options);

/// Build an engine config from editor segments (inverse direction of buildMixdownPlan).
/// `ducking` may be null.
EngineConfig configFromEditor(const std::string& baseUri,
                              const std::vector<EditorSegment>& segments,
                              const TrackGains& trackGains,
                              const DuckingParams* ducking);

/// Editor segments equivalent to the segments of a plan (ids "seg1", "seg2", ...).
std::vector<EditorSegment> editorSegmentsFromPlan(const MixdownPlan& plan);

} // namespace deckmix
