#include "core/MixdownPlan.h"
#include "core/Logger.h"

#include <algorithm>

namespace deckmix {

bool isValidOutExt(const std::string& ext)
{
    return ext == "m4a" || ext == "wav" || ext == "mp3";
}

std::string trackIdForDeck(int deck)
{
    switch (deck)
    {
        case 1:  return "bed";
        case 2:  return "sfx";
        default: return "deck" + std::to_string(deck);
    }
}

MixdownPlan buildMixdownPlan(const EngineConfig& config, const MixdownOptions& options)
{
    MixdownPlan plan;
    plan.baseUri = config.mainUri;
    plan.trackGains = {config.mainGain, config.deckGain(1), config.deckGain(2)};
    plan.ducking = config.hasDucking ? config.ducking : DuckingParams::disabled();
    plan.fx = options.fx;
    plan.outExt = isValidOutExt(options.outExt) ? options.outExt : "m4a";

    std::vector<const Trigger*> ordered;
    ordered.reserve(config.triggers.size());
    for (const auto& t : config.triggers)
        ordered.push_back(&t);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Trigger* a, const Trigger* b) { return a->atMs < b->atMs; });

    for (const Trigger* t : ordered)
    {
        MixdownSegment seg;
        seg.uri = t->uri;
        seg.startMs = t->atMs;
        seg.endMs = t->atMs + t->durationMs;
        seg.trackId = trackIdForDeck(t->deck);
        // Decks 3 and 4 have no trackGains entry, so their gain rides on the segment
        seg.gain = t->deck > 2 ? t->gain * config.deckGain(t->deck) : t->gain;
        seg.pan = 0.0f;
        seg.fadeInMs = options.segmentFadeInMs;
        seg.fadeOutMs = options.segmentFadeOutMs;
        plan.segments.push_back(std::move(seg));
    }

    DM_DEBUG("buildMixdownPlan: base=%s segments=%d ext=%s",
             plan.baseUri.c_str(), static_cast<int>(plan.segments.size()), plan.outExt.c_str());
    return plan;
}

EngineConfig configFromEditor(const std::string& baseUri,
                              const std::vector<EditorSegment>& segments,
                              const TrackGains& trackGains,
                              const DuckingParams* ducking)
{
    EngineConfig config;
    config.mainUri = baseUri;
    config.mainGain = trackGains.clip;
    config.deckGains = {{trackGains.bed, trackGains.sfx, 1.0f, 1.0f}};

    config.triggers.reserve(segments.size());
    for (const auto& s : segments)
    {
        Trigger t;
        t.id = s.id;
        t.uri = s.uri;
        t.deck = s.track == "bed" ? 1 : 2;
        t.atMs = s.startMs;
        t.durationMs = std::max(0.0, s.endMs - s.startMs);
        t.gain = 1.0f;
        config.triggers.push_back(std::move(t));
    }

    if (ducking)
    {
        config.hasDucking = true;
        config.ducking = *ducking;
    }
    return config;
}

std::vector<EditorSegment> editorSegmentsFromPlan(const MixdownPlan& plan)
{
    std::vector<EditorSegment> segments;
    segments.reserve(plan.segments.size());
    int n = 0;
    for (const auto& s : plan.segments)
        segments.push_back({"seg" + std::to_string(++n), s.uri, s.startMs, s.endMs, s.trackId});
    return segments;
}

} // namespace deckmix
