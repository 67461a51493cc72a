#pragma once

/// @file include/chit/metrics_cache.hpp
/// @brief Metrics Cache: TTL cache of ManifoldMetrics keyed by document + mode.
///
/// # Module: Metrics Cache
///
/// ## Responsibility
/// Avoid recomputing metrics for documents requested repeatedly within a
/// short window. The cache is the only shared mutable state in the engine;
/// one instance is constructed per process and handed to the query API.
///
/// ## Concurrency
/// Keys are spread over a fixed number of shards, each guarded by a
/// `std::shared_mutex`: lookups take a shared lock, writes an exclusive one.
///
/// ## Expiry
/// Lazy: an entry older than its TTL is treated as absent and erased by the
/// lookup that finds it. `sweep()` purges all expired entries at once.
/// `invalidate()` drops both modes of a document immediately, so the next
/// lookup after the ingestion pipeline's change signal misses.

#include "chit/types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace chit::cache {

// ─── CacheKey ─────────────────────────────────────────────────────────────────

struct CacheKey {
    std::string  document_id;
    AnalysisMode mode = AnalysisMode::Heuristic;

    bool operator==(const CacheKey&) const = default;
};

struct CacheKeyHash {
    [[nodiscard]] std::size_t operator()(const CacheKey& k) const noexcept;
};

// ─── MetricsStore ─────────────────────────────────────────────────────────────

/// Cache interface consumed by the query API.
class MetricsStore {
public:
    virtual ~MetricsStore() = default;

    [[nodiscard]] virtual std::optional<ManifoldMetrics> get(const CacheKey& key) = 0;
    virtual void put(const CacheKey& key, ManifoldMetrics value,
                     std::chrono::milliseconds ttl) = 0;

    /// Drop every mode cached for `document_id`.
    virtual void invalidate(const std::string& document_id) = 0;
};

// ─── MetricsCache ─────────────────────────────────────────────────────────────

class MetricsCache final : public MetricsStore {
public:
    using Clock     = std::chrono::steady_clock;
    using ClockFunc = std::function<Clock::time_point()>;

    static constexpr std::size_t SHARD_COUNT = 16;

    /// # Arguments
    /// * `clock` - time source; defaults to steady_clock::now (tests inject)
    explicit MetricsCache(ClockFunc clock = {});

    [[nodiscard]] std::optional<ManifoldMetrics> get(const CacheKey& key) override;
    void put(const CacheKey& key, ManifoldMetrics value,
             std::chrono::milliseconds ttl) override;
    void invalidate(const std::string& document_id) override;

    /// Erase all expired entries. Returns the number removed.
    std::size_t sweep();

    /// Live and not-yet-swept entries.
    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    struct Entry {
        ManifoldMetrics   value;
        Clock::time_point inserted_at;
        std::chrono::milliseconds ttl;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<CacheKey, Entry, CacheKeyHash> entries;
    };

    [[nodiscard]] Shard& shard_for(const CacheKey& key);
    [[nodiscard]] Clock::time_point now() const;
    [[nodiscard]] static bool expired(const Entry& e, Clock::time_point now) noexcept;

    ClockFunc clock_;
    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace chit::cache
