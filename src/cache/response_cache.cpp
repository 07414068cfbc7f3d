/**
 * ODDSGATE - Caching Odds API Gateway
 * Response Cache Implementation
 */

#include "cache/response_cache.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace oddsgate::cache {

ResponseCache::ResponseCache(const ResponseCacheConfig& config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
{
    if (config_.max_entries == 0) {
        spdlog::debug("Response cache initialized: unbounded");
    } else {
        spdlog::debug("Response cache initialized: max_entries={}", config_.max_entries);
    }
}

std::optional<CacheEntry> ResponseCache::get(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second->entry;
}

void ResponseCache::put(const CacheKey& key, CacheEntry entry) {
    std::size_t entry_size = entry.body.size();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        std::size_t old_size = it->second->entry.body.size();
        it->second->entry = std::move(entry);
        size_bytes_ = size_bytes_ - old_size + entry_size;

        // Most recently written goes to the front
        if (it->second != entries_.begin()) {
            entries_.splice(entries_.begin(), entries_, it->second);
        }

        spdlog::debug("Cache entry replaced: key={}, status={}, size={}",
                      key.to_string(), it->second->entry.status_code, entry_size);
    } else {
        entries_.push_front(Node{key, std::move(entry)});
        index_[key] = entries_.begin();
        size_bytes_ += entry_size;

        spdlog::debug("Cache entry added: key={}, status={}, size={}, entries={}",
                      key.to_string(), entries_.front().entry.status_code,
                      entry_size, index_.size());
    }

    ++writes_;
    evict_if_needed();
}

bool ResponseCache::is_fresh(const CacheEntry& entry, std::chrono::seconds ttl) const {
    return (now() - entry.timestamp) < ttl;
}

std::optional<CacheEntry> ResponseCache::lookup(const CacheKey& key, std::chrono::seconds ttl) {
    auto entry = get(key);
    if (!entry) {
        ++misses_;
        return std::nullopt;
    }
    if (!is_fresh(*entry, ttl)) {
        ++stale_;
        return std::nullopt;
    }
    ++hits_;
    return entry;
}

CacheEntry ResponseCache::make_entry(int status_code, std::string body) const {
    return CacheEntry{now(), status_code, std::move(body)};
}

std::chrono::steady_clock::time_point ResponseCache::now() const {
    return clock_();
}

void ResponseCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = index_.size();
    index_.clear();
    entries_.clear();
    size_bytes_ = 0;

    spdlog::info("Cache cleared: {} entries removed", count);
}

CacheStats ResponseCache::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.stale = stale_.load();
    stats.writes = writes_.load();
    stats.evictions = evictions_.load();
    stats.entries = index_.size();
    stats.size_bytes = size_bytes_.load();
    stats.max_entries = config_.max_entries;

    return stats;
}

void ResponseCache::evict_if_needed() {
    if (config_.max_entries == 0) {
        return;
    }

    while (index_.size() > config_.max_entries && !entries_.empty()) {
        auto& oldest = entries_.back();

        spdlog::debug("Evicting cache entry: key={}, size={}",
                      oldest.key.to_string(), oldest.entry.body.size());

        size_bytes_ -= oldest.entry.body.size();
        index_.erase(oldest.key);
        entries_.pop_back();

        ++evictions_;
    }
}

} // namespace oddsgate::cache
