#include "core/cache/result_cache.h"
#include "core/shared/logging.h"

#include <QChar>

#include <algorithm>
#include <iterator>
#include <utility>

namespace rw {

namespace {

constexpr int kPopularEntryCount = 5;

// Unit separator: normalized queries only contain letters, digits and spaces.
constexpr char16_t kKeySeparator = 0x1F;

CacheRow toRow(const CacheEntry& entry)
{
    CacheRow row;
    row.key = entry.key;
    row.queryNormalized = entry.queryNormalized;
    row.toolName = entry.toolName;
    row.value = entry.value;
    row.createdAtMs = entry.createdAtMs;
    row.ttlSeconds = entry.ttlSeconds;
    row.hitCount = entry.hitCount;
    row.lastAccessedMs = entry.lastAccessedMs;
    return row;
}

CacheEntry fromRow(const CacheRow& row)
{
    CacheEntry entry;
    entry.key = row.key;
    entry.queryNormalized = row.queryNormalized;
    entry.toolName = row.toolName;
    entry.value = row.value;
    entry.createdAtMs = row.createdAtMs;
    entry.ttlSeconds = row.ttlSeconds;
    entry.hitCount = row.hitCount;
    entry.lastAccessedMs = row.lastAccessedMs;
    return entry;
}

} // namespace

ResultCache::ResultCache(ResultCacheConfig config,
                         std::shared_ptr<const Clock> clock,
                         std::unique_ptr<CacheBackend> backend)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : SystemClock::instance())
    , m_backend(std::move(backend))
{
    if (m_backend) {
        warmFromBackend();
    }
}

QString ResultCache::makeKey(const QString& queryNormalized, const QString& toolName)
{
    return queryNormalized + QChar(kKeySeparator) + toolName;
}

std::optional<CacheEntry> ResultCache::get(const QString& queryNormalized,
                                           const QString& toolName)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(makeKey(queryNormalized, toolName));
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    const qint64 now = m_clock->nowMs();
    if (it->second->isExpiredAt(now)) {
        // Expired -- remove lazily
        eraseLocked(it->second);
        ++m_expirations;
        ++m_misses;
        return std::nullopt;
    }

    CacheEntry& entry = *it->second;
    ++entry.hitCount;
    entry.lastAccessedMs = now;

    // Move to front (most recently used)
    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    persistLocked(entry);
    return entry;
}

void ResultCache::set(const QString& queryNormalized, const QString& toolName,
                      const QString& value, int ttlSeconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_config.maxEntries <= 0) {
        return;
    }

    const QString key = makeKey(queryNormalized, toolName);
    const qint64 now = m_clock->nowMs();

    // Existing key: rewrite in place, recency untouched
    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        CacheEntry& entry = *existing->second;
        entry.value = value;
        entry.ttlSeconds = ttlSeconds;
        entry.createdAtMs = now;
        persistLocked(entry);
        return;
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        evictLeastRecentLocked();
    }

    CacheEntry entry;
    entry.key = key;
    entry.queryNormalized = queryNormalized;
    entry.toolName = toolName;
    entry.value = value;
    entry.createdAtMs = now;
    entry.ttlSeconds = ttlSeconds;
    entry.lastAccessedMs = now;

    m_list.push_front(std::move(entry));
    m_index[key] = m_list.begin();
    persistLocked(m_list.front());
}

void ResultCache::set(const QString& queryNormalized, const QString& toolName,
                      const QString& value)
{
    set(queryNormalized, toolName, value, m_config.ttlSeconds);
}

std::optional<CacheEntry> ResultCache::peek(const QString& queryNormalized,
                                            const QString& toolName) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(makeKey(queryNormalized, toolName));
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return *it->second;
}

bool ResultCache::invalidate(const QString& queryNormalized, const QString& toolName)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(makeKey(queryNormalized, toolName));
    if (it == m_index.end()) {
        return false;
    }
    eraseLocked(it->second);
    return true;
}

int ResultCache::invalidateExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const qint64 now = m_clock->nowMs();
    int removed = 0;
    for (auto it = m_list.begin(); it != m_list.end();) {
        auto current = it++;
        if (current->isExpiredAt(now)) {
            eraseLocked(current);
            ++removed;
        }
    }

    m_expirations += static_cast<uint64_t>(removed);
    if (removed > 0) {
        LOG_DEBUG(rwCache, "invalidateExpired: removed %d entries", removed);
    }
    return removed;
}

int ResultCache::clearAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const int removed = static_cast<int>(m_list.size());
    m_list.clear();
    m_index.clear();

    if (m_backend && !m_backend->clear()) {
        LOG_WARN(rwCache, "Failed to clear persistent cache backend");
    }
    return removed;
}

ResultCache::Stats ResultCache::statistics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    Stats stats;
    stats.totalEntries = static_cast<int>(m_list.size());
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.evictions = m_evictions;
    stats.expirations = m_expirations;

    const qint64 now = m_clock->nowMs();
    long long totalHitCount = 0;
    for (const CacheEntry& entry : m_list) {
        totalHitCount += entry.hitCount;
        if (!entry.isExpiredAt(now)) {
            ++stats.liveEntries;
        }
    }

    if (stats.totalEntries > 0) {
        stats.averageHitCount = static_cast<double>(totalHitCount) / stats.totalEntries;
    }

    const uint64_t lookups = m_hits + m_misses;
    if (lookups > 0) {
        stats.hitRate = static_cast<double>(m_hits) / static_cast<double>(lookups);
    }

    // List order is recency order, so equal hit counts favour recent entries.
    std::vector<const CacheEntry*> ranked;
    ranked.reserve(m_list.size());
    for (const CacheEntry& entry : m_list) {
        ranked.push_back(&entry);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const CacheEntry* a, const CacheEntry* b) {
                         return a->hitCount > b->hitCount;
                     });
    const size_t popularCount = std::min(ranked.size(), static_cast<size_t>(kPopularEntryCount));
    for (size_t i = 0; i < popularCount; ++i) {
        stats.popular.push_back({ranked[i]->queryNormalized, ranked[i]->toolName,
                                 ranked[i]->hitCount});
    }

    return stats;
}

void ResultCache::resetStatistics()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hits = 0;
    m_misses = 0;
    m_evictions = 0;
    m_expirations = 0;
}

int ResultCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_list.size());
}

void ResultCache::eraseLocked(EntryList::iterator it)
{
    const QString key = it->key;
    m_index.erase(key);
    m_list.erase(it);

    if (m_backend && !m_backend->remove(key)) {
        LOG_WARN(rwCache, "Failed to remove cache row from backend");
    }
}

void ResultCache::evictLeastRecentLocked()
{
    if (m_list.empty()) {
        return;
    }
    LOG_DEBUG(rwCache, "Evicting least recently used entry: tool=%s query='%s'",
              qUtf8Printable(m_list.back().toolName),
              qUtf8Printable(m_list.back().queryNormalized));
    eraseLocked(std::prev(m_list.end()));
    ++m_evictions;
}

void ResultCache::persistLocked(const CacheEntry& entry)
{
    if (m_backend && !m_backend->put(toRow(entry))) {
        LOG_WARN(rwCache, "Failed to persist cache row; entry is kept in memory only");
    }
}

void ResultCache::warmFromBackend()
{
    auto rows = m_backend->loadAll();
    if (!rows) {
        LOG_WARN(rwCache, "Failed to load persisted cache rows; starting empty");
        return;
    }

    const qint64 now = m_clock->nowMs();
    std::vector<CacheEntry> live;
    live.reserve(rows->size());
    for (const CacheRow& row : *rows) {
        CacheEntry entry = fromRow(row);
        if (entry.isExpiredAt(now)) {
            if (!m_backend->remove(entry.key)) {
                LOG_WARN(rwCache, "Failed to drop expired cache row from backend");
            }
            continue;
        }
        live.push_back(std::move(entry));
    }

    // Most recently accessed first; equal access times put the older
    // entry closer to eviction.
    std::sort(live.begin(), live.end(), [](const CacheEntry& a, const CacheEntry& b) {
        if (a.lastAccessedMs != b.lastAccessedMs) {
            return a.lastAccessedMs > b.lastAccessedMs;
        }
        if (a.createdAtMs != b.createdAtMs) {
            return a.createdAtMs > b.createdAtMs;
        }
        return a.key < b.key;
    });

    const size_t capacity = static_cast<size_t>(std::max(0, m_config.maxEntries));
    for (size_t i = 0; i < live.size(); ++i) {
        if (i >= capacity) {
            if (!m_backend->remove(live[i].key)) {
                LOG_WARN(rwCache, "Failed to drop over-capacity cache row from backend");
            }
            continue;
        }
        m_list.push_back(std::move(live[i]));
        m_index[m_list.back().key] = std::prev(m_list.end());
    }

    LOG_INFO(rwCache, "Warmed result cache with %d persisted entries",
             static_cast<int>(m_list.size()));
}

} // namespace rw
