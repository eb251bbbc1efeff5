#pragma once

#include "core/cache/cache_backend.h"
#include "core/shared/clock.h"

#include <QString>

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rw {

struct ResultCacheConfig {
    int maxEntries = 1000;
    int ttlSeconds = 3600;
};

// Copy of a cache entry handed to callers; the cache keeps the original.
struct CacheEntry {
    QString key;
    QString queryNormalized;
    QString toolName;
    QString value;
    qint64 createdAtMs = 0;
    int ttlSeconds = 0;
    int hitCount = 0;
    qint64 lastAccessedMs = 0;

    qint64 expiresAtMs() const { return createdAtMs + static_cast<qint64>(ttlSeconds) * 1000; }
    bool isExpiredAt(qint64 nowMs) const { return nowMs >= expiresAtMs(); }
};

// ResultCache -- LRU + TTL cache of tool results keyed by
// (normalized query, tool name).
//
// An entry is live while now < created_at + ttl. Expired entries are
// dropped lazily on get() or in bulk by invalidateExpired(). When a new key
// would exceed maxEntries the least recently read entry is evicted.
// set() on an existing key is a write, not a read: it refreshes value,
// ttl and created_at but leaves the recency position alone.
//
// With a backend the cache is write-through and warms itself from the
// backend at construction. Backend failures are logged and otherwise
// ignored; memory stays authoritative.
//
// Thread safety: every public method takes the single internal mutex.
class ResultCache {
public:
    explicit ResultCache(ResultCacheConfig config = {},
                         std::shared_ptr<const Clock> clock = nullptr,
                         std::unique_ptr<CacheBackend> backend = nullptr);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Stable across restarts; the separator never survives query normalization.
    static QString makeKey(const QString& queryNormalized, const QString& toolName);

    // Returns a copy of the live entry and counts a hit, or nullopt and
    // counts a miss. Expired entries are removed.
    std::optional<CacheEntry> get(const QString& queryNormalized, const QString& toolName);

    void set(const QString& queryNormalized, const QString& toolName,
             const QString& value, int ttlSeconds);
    void set(const QString& queryNormalized, const QString& toolName, const QString& value);

    // Snapshot without touching hit counts, recency or statistics.
    std::optional<CacheEntry> peek(const QString& queryNormalized,
                                   const QString& toolName) const;

    bool invalidate(const QString& queryNormalized, const QString& toolName);
    int invalidateExpired();
    int clearAll();

    struct PopularEntry {
        QString queryNormalized;
        QString toolName;
        int hitCount = 0;
    };

    struct Stats {
        int totalEntries = 0;
        int liveEntries = 0;
        double averageHitCount = 0.0;
        double hitRate = 0.0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        std::vector<PopularEntry> popular;   // top 5 by hit count
    };
    Stats statistics() const;

    // Reset the hit/miss/eviction counters behind hitRate.
    void resetStatistics();

    int size() const;
    bool isPersistent() const { return m_backend != nullptr; }
    const ResultCacheConfig& config() const { return m_config; }

private:
    using EntryList = std::list<CacheEntry>;

    ResultCacheConfig m_config;
    std::shared_ptr<const Clock> m_clock;
    std::unique_ptr<CacheBackend> m_backend;

    mutable std::mutex m_mutex;
    EntryList m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, EntryList::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
    uint64_t m_expirations = 0;

    // Callers hold m_mutex.
    void eraseLocked(EntryList::iterator it);
    void evictLeastRecentLocked();
    void persistLocked(const CacheEntry& entry);
    void warmFromBackend();
};

} // namespace rw
