#pragma once

#include "core/MixdownPlan.h"
#include "core/Types.h"

#include <string>
#include <vector>

namespace deckmix {

// Session files and render requests as JSON (juce::JSON underneath).
// Parsers leave unspecified fields at their defaults and report the first
// malformed field through `error`.

bool parseEngineConfig(const std::string& json, EngineConfig& out, std::string& error);
std::string engineConfigToJson(const EngineConfig& config);

bool parseDuckingParams(const std::string& json, DuckingParams& out, std::string& error);

/// Body accepted by Engine::loadFromPlan(): {baseUri, segments, trackGains, ducking?}.
struct EditorPlan {
    std::string baseUri;
    std::vector<EditorSegment> segments;
    TrackGains trackGains;
    bool hasDucking = false;
    DuckingParams ducking;
};

bool parseEditorPlan(const std::string& json, EditorPlan& out, std::string& error);

/// Unset fx values are written as null.
std::string mixdownPlanToJson(const MixdownPlan& plan);
bool parseMixdownPlan(const std::string& json, MixdownPlan& out, std::string& error);

} // namespace deckmix
