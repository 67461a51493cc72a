/// @file src/cache/metrics_cache.cpp
/// @brief Sharded TTL cache for ManifoldMetrics.

#include "chit/metrics_cache.hpp"

#include <mutex>
#include <utility>

namespace chit::cache {

// ─── CacheKeyHash ─────────────────────────────────────────────────────────────

std::size_t CacheKeyHash::operator()(const CacheKey& k) const noexcept {
    const std::size_t h = std::hash<std::string>{}(k.document_id);
    return h ^ (static_cast<std::size_t>(k.mode) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

// ─── MetricsCache ─────────────────────────────────────────────────────────────

MetricsCache::MetricsCache(ClockFunc clock)
    : clock_(std::move(clock)) {}

MetricsCache::Clock::time_point MetricsCache::now() const {
    return clock_ ? clock_() : Clock::now();
}

bool MetricsCache::expired(const Entry& e, Clock::time_point now) noexcept {
    return now - e.inserted_at >= e.ttl;
}

MetricsCache::Shard& MetricsCache::shard_for(const CacheKey& key) {
    // Shard on the document id only so invalidate() touches one shard.
    return shards_[std::hash<std::string>{}(key.document_id) % SHARD_COUNT];
}

std::optional<ManifoldMetrics> MetricsCache::get(const CacheKey& key) {
    Shard& shard = shard_for(key);
    const auto t = now();
    {
        std::shared_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            return std::nullopt;
        }
        if (!expired(it->second, t)) {
            return it->second.value;
        }
    }

    // Expired: upgrade and erase unless a writer refreshed it meanwhile.
    std::unique_lock lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it != shard.entries.end() && expired(it->second, t)) {
        shard.entries.erase(it);
    }
    return std::nullopt;
}

void MetricsCache::put(const CacheKey& key, ManifoldMetrics value,
                       std::chrono::milliseconds ttl) {
    Shard& shard = shard_for(key);
    const auto t = now();
    std::unique_lock lock(shard.mutex);
    shard.entries.insert_or_assign(key, Entry{std::move(value), t, ttl});
}

void MetricsCache::invalidate(const std::string& document_id) {
    Shard& shard = shard_for(CacheKey{document_id, AnalysisMode::Heuristic});
    std::unique_lock lock(shard.mutex);
    shard.entries.erase(CacheKey{document_id, AnalysisMode::Heuristic});
    shard.entries.erase(CacheKey{document_id, AnalysisMode::Exact});
}

std::size_t MetricsCache::sweep() {
    const auto t = now();
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        removed += std::erase_if(shard.entries,
                                 [t](const auto& kv) { return expired(kv.second, t); });
    }
    return removed;
}

std::size_t MetricsCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

void MetricsCache::clear() {
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        shard.entries.clear();
    }
}

} // namespace chit::cache
