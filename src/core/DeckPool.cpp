#include "core/DeckPool.h"
#include "core/Logger.h"

namespace deckmix {

DeckPool::~DeckPool()
{
    clear();
}

void DeckPool::release(const DeckKey& key, Entry& entry)
{
    if (!entry.handle)
        return;
    if (!entry.handle->stop())
        DM_DEBUG("DeckPool: stop failed for %s", key.toString().c_str());
    entry.handle->unload();
    entry.handle.reset();
}

uint64_t DeckPool::add(const DeckKey& key, std::unique_ptr<PlaybackHandle> handle)
{
    auto it = entries_.find(key);
    if (it != entries_.end())
    {
        DM_DEBUG("DeckPool::add: replacing %s", key.toString().c_str());
        release(key, it->second);
        entries_.erase(it);
    }

    uint64_t serial = nextSerial_++;
    entries_[key] = Entry{std::move(handle), serial, 0};
    DM_DEBUG("DeckPool::add: %s serial=%llu active=%d",
             key.toString().c_str(), static_cast<unsigned long long>(serial), size());
    return serial;
}

void DeckPool::setExpiryTimer(const DeckKey& key, uint64_t serial, TimerId timer)
{
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.serial == serial)
        it->second.expiryTimer = timer;
}

bool DeckPool::remove(const DeckKey& key, uint64_t serial)
{
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.serial != serial)
    {
        DM_TRACE("DeckPool::remove: %s serial=%llu already gone",
                 key.toString().c_str(), static_cast<unsigned long long>(serial));
        return false;
    }

    release(key, it->second);
    entries_.erase(it);
    DM_DEBUG("DeckPool::remove: %s active=%d", key.toString().c_str(), size());
    return true;
}

std::vector<TimerId> DeckPool::clear()
{
    std::vector<TimerId> timers;
    timers.reserve(entries_.size());
    for (auto& [key, entry] : entries_)
    {
        if (entry.expiryTimer != 0)
            timers.push_back(entry.expiryTimer);
        release(key, entry);
    }
    if (!entries_.empty())
        DM_DEBUG("DeckPool::clear: released %d clips", size());
    entries_.clear();
    return timers;
}

int DeckPool::applyVolume(int deck, float volume)
{
    int count = 0;
    for (auto& [key, entry] : entries_)
    {
        if (key.deck != deck || !entry.handle)
            continue;
        if (!entry.handle->setVolume(volume))
            DM_DEBUG("DeckPool::applyVolume: setVolume failed for %s", key.toString().c_str());
        ++count;
    }
    return count;
}

bool DeckPool::contains(const DeckKey& key) const
{
    return entries_.count(key) != 0;
}

int DeckPool::size() const
{
    return static_cast<int>(entries_.size());
}

bool DeckPool::empty() const
{
    return entries_.empty();
}

std::vector<DeckKey> DeckPool::keys() const
{
    std::vector<DeckKey> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_)
        result.push_back(entry.first);
    return result;
}

} // namespace deckmix
