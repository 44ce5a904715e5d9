#pragma once

#include "modules/event_management/observation.hpp"
#include "modules/event_management/source_identity.hpp"
#include <queue>
#include <vector>
#include <mutex>
#include <cstdint>
#include <optional>

namespace sovereign_defense {
namespace decision {

/**
 * @brief Min-heap of pending block expiries
 *
 * Entries are never removed early. Each carries the generation of the
 * block it was scheduled for, and the consumer discards entries whose
 * generation no longer matches the source's state.
 */
class ExpirySchedule {
public:
    struct Entry {
        event_management::TimePoint expires_at;
        event_management::SourceIdentity source;
        uint64_t generation;
    };

    void schedule(const event_management::SourceIdentity& source,
                  event_management::TimePoint expires_at,
                  uint64_t generation);

    /**
     * @brief Removes and returns every entry due at or before now
     */
    std::vector<Entry> popDue(event_management::TimePoint now);

    std::optional<event_management::TimePoint> nextDue() const;
    size_t size() const;

private:
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const { return a.expires_at > b.expires_at; }
    };

    mutable std::mutex mutex_;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
};

} // namespace decision
} // namespace sovereign_defense
