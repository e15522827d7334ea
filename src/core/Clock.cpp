#include "core/Clock.h"

#include <juce_core/juce_core.h>

namespace deckmix {

double SystemClock::nowMs() const
{
    return juce::Time::getMillisecondCounterHiRes();
}

} // namespace deckmix
