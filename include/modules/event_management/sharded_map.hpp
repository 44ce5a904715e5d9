#pragma once

#include "modules/event_management/source_identity.hpp"
#include <vector>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <utility>
#include <cstddef>

namespace sovereign_defense {
namespace event_management {

/**
 * @brief Per-source state map split into independently locked shards
 *
 * All access to one SourceIdentity goes through the lock of its shard, so
 * mutations for a single source are serialized while unrelated sources in
 * other shards proceed in parallel.
 */
template <typename Value>
class ShardedMap {
public:
    explicit ShardedMap(size_t shard_count = 16) {
        if (shard_count == 0) {
            shard_count = 1;
        }
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    /**
     * @brief Runs fn on the entry for key, creating it when absent
     *
     * The shard lock is held for the duration of fn.
     */
    template <typename Fn>
    auto withEntry(const SourceIdentity& key, Fn&& fn) -> decltype(fn(std::declval<Value&>())) {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return fn(shard.entries[key]);
    }

    /**
     * @brief Runs fn on the entry for key only when it exists
     *
     * @return false if there is no entry for key
     */
    template <typename Fn>
    bool withExisting(const SourceIdentity& key, Fn&& fn) {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    /**
     * @brief Visits every entry, one shard at a time
     */
    template <typename Fn>
    void forEach(Fn&& fn) {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (auto& entry : shard->entries) {
                fn(entry.first, entry.second);
            }
        }
    }

    /**
     * @brief Removes every entry for which pred(key, value) is true
     *
     * @return Number of removed entries
     */
    template <typename Pred>
    size_t eraseIf(Pred&& pred) {
        size_t removed = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (auto it = shard->entries.begin(); it != shard->entries.end();) {
                if (pred(it->first, it->second)) {
                    it = shard->entries.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    bool contains(const SourceIdentity& key) const {
        const Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.entries.find(key) != shard.entries.end();
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            total += shard->entries.size();
        }
        return total;
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<SourceIdentity, Value> entries;
    };

    Shard& shardFor(const SourceIdentity& key) {
        return *shards_[std::hash<SourceIdentity>()(key) % shards_.size()];
    }

    const Shard& shardFor(const SourceIdentity& key) const {
        return *shards_[std::hash<SourceIdentity>()(key) % shards_.size()];
    }

    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace event_management
} // namespace sovereign_defense
