#include "core/Types.h"

#include <unordered_set>

namespace deckmix {

bool trackFromName(const std::string& name, Track& out)
{
    if (name == "mic" || name == "clip") { out = Track::mic; return true; }
    if (name == "bed")   { out = Track::deck1; return true; }
    if (name == "sfx")   { out = Track::deck2; return true; }

    if (name.size() == 5 && name.compare(0, 4, "deck") == 0)
    {
        int deck = name[4] - '0';
        if (isValidDeck(deck))
        {
            out = deckTrack(deck);
            return true;
        }
    }
    return false;
}

bool EngineConfig::validate(std::string& error) const
{
    std::unordered_set<std::string> ids;
    for (const auto& t : triggers)
    {
        if (t.id.empty())
        {
            error = "trigger with empty id";
            return false;
        }
        if (!isValidDeck(t.deck))
        {
            error = "trigger " + t.id + ": deck " + std::to_string(t.deck) + " out of range 1..4";
            return false;
        }
        if (t.atMs < 0.0 || t.durationMs < 0.0)
        {
            error = "trigger " + t.id + ": atMs and durationMs must be >= 0";
            return false;
        }
        if (!ids.insert(t.id).second)
        {
            error = "duplicate trigger id " + t.id;
            return false;
        }
    }
    return true;
}

} // namespace deckmix
