#pragma once

#include "core/Playback.h"
#include "core/TimerService.h"
#include "core/Types.h"

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace deckmix {

/// Active overlay clips keyed by (deck, triggerId).
/// Each entry carries a serial so a late expiry for a clip that was
/// cleared and re-fired under the same key cannot remove its successor.
/// Not synchronized: the owning Engine serializes access.
class DeckPool {
public:
    DeckPool() = default;
    ~DeckPool();

    DeckPool(const DeckPool&) = delete;
    DeckPool& operator=(const DeckPool&) = delete;

    /// Register a playing clip. An existing entry under the same key is
    /// stopped and unloaded first. Returns the new entry's serial.
    uint64_t add(const DeckKey& key, std::unique_ptr<PlaybackHandle> handle);

    /// Remember the one-shot timer that will expire `key`.
    void setExpiryTimer(const DeckKey& key, uint64_t serial, TimerId timer);

    /// Stop, unload and forget `key` if its serial still matches.
    bool remove(const DeckKey& key, uint64_t serial);

    /// Stop and unload every clip. Returns the pending expiry timers so the
    /// caller can cancel them.
    std::vector<TimerId> clear();

    /// Apply `volume` to every active clip on `deck`. Returns how many were touched.
    int applyVolume(int deck, float volume);

    bool contains(const DeckKey& key) const;
    int size() const;
    bool empty() const;
    std::vector<DeckKey> keys() const;

private:
    struct Entry {
        std::unique_ptr<PlaybackHandle> handle;
        uint64_t serial = 0;
        TimerId expiryTimer = 0;
    };

    std::map<DeckKey, Entry> entries_;
    uint64_t nextSerial_ = 1;

    static void release(const DeckKey& key, Entry& entry);
};

} // namespace deckmix
