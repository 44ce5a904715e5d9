#include "modules/decision/expiry_schedule.hpp"

namespace sovereign_defense {
namespace decision {

void ExpirySchedule::schedule(const event_management::SourceIdentity& source,
                              event_management::TimePoint expires_at,
                              uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    heap_.push(Entry{expires_at, source, generation});
}

std::vector<ExpirySchedule::Entry> ExpirySchedule::popDue(event_management::TimePoint now) {
    std::vector<Entry> due;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!heap_.empty() && heap_.top().expires_at <= now) {
        due.push_back(heap_.top());
        heap_.pop();
    }
    return due;
}

std::optional<event_management::TimePoint> ExpirySchedule::nextDue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.top().expires_at;
}

size_t ExpirySchedule::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

} // namespace decision
} // namespace sovereign_defense
