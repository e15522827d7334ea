#pragma once

#include "core/Types.h"

namespace deckmix {

// Gain staging, solo/mute resolution and trigger windows.
// Everything here is pure so the Engine and the mixdown planner agree.

/// Clamp to the playable volume range [0, 1]. Gains above unity are capped.
float clampVolume(float value);

/// 10^(db/20)
float dbToLinear(float db);

bool anySoloActive(const EngineConfig& config);

/// Mic solo blocks every deck; any other solo admits only soloed decks;
/// with no solo anywhere a deck plays unless muted.
bool isDeckAllowed(const EngineConfig& config, int deck);

/// Volume for the main channel given the number of decks currently sounding.
float computeMainVolume(const EngineConfig& config, int activeDeckCount);

/// Volume for an active clip on `deck`: 0 when muted, else the clamped deck gain.
float computeDeckVolume(const EngineConfig& config, int deck);

/// True when `positionMs` lies in [atMs - lookaheadMs, atMs + durationMs].
bool isTriggerDue(const Trigger& trigger, double positionMs, double lookaheadMs);

/// Time left in the trigger window, measured from `positionMs` (never negative,
/// never more than durationMs).
double remainingTriggerMs(const Trigger& trigger, double positionMs);

} // namespace deckmix
