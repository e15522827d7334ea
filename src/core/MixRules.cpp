#include "core/MixRules.h"

#include <algorithm>
#include <cmath>

namespace deckmix {

// Applied when ducking is enabled with no usable amount
static constexpr float kDefaultDuckDb = 6.0f;

float clampVolume(float value)
{
    if (std::isnan(value))
        return 0.0f;
    return std::max(0.0f, std::min(1.0f, value));
}

float dbToLinear(float db)
{
    return std::pow(10.0f, db / 20.0f);
}

bool anySoloActive(const EngineConfig& config)
{
    if (config.mainSolo)
        return true;
    return std::any_of(config.deckSolos.begin(), config.deckSolos.end(),
                       [](bool s) { return s; });
}

bool isDeckAllowed(const EngineConfig& config, int deck)
{
    if (!isValidDeck(deck))
        return false;

    if (anySoloActive(config))
    {
        if (config.mainSolo)
            return false;
        return config.deckSoloed(deck);
    }
    return !config.deckMuted(deck);
}

float computeMainVolume(const EngineConfig& config, int activeDeckCount)
{
    float base = config.mainMuted ? 0.0f : clampVolume(config.mainGain);

    if (anySoloActive(config))
        return config.mainSolo ? base : 0.0f;

    if (config.hasDucking && config.ducking.enabled && activeDeckCount > 0)
    {
        float amount = config.ducking.amountDb != 0.0f ? config.ducking.amountDb : kDefaultDuckDb;
        return clampVolume(base * dbToLinear(-amount));
    }
    return base;
}

float computeDeckVolume(const EngineConfig& config, int deck)
{
    if (config.deckMuted(deck))
        return 0.0f;
    return clampVolume(config.deckGain(deck));
}

bool isTriggerDue(const Trigger& trigger, double positionMs, double lookaheadMs)
{
    return trigger.atMs <= positionMs + lookaheadMs
        && trigger.atMs + trigger.durationMs >= positionMs;
}

double remainingTriggerMs(const Trigger& trigger, double positionMs)
{
    double elapsed = std::max(0.0, positionMs - trigger.atMs);
    return std::max(0.0, trigger.durationMs - elapsed);
}

} // namespace deckmix
