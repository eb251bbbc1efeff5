#pragma once

#include <QString>
#include <QtGlobal>

#include <optional>
#include <vector>

namespace rw {

// One persisted cache entry. Timestamps are milliseconds since the epoch.
struct CacheRow {
    QString key;
    QString queryNormalized;
    QString toolName;
    QString value;
    qint64 createdAtMs = 0;
    int ttlSeconds = 0;
    int hitCount = 0;
    qint64 lastAccessedMs = 0;
};

// CacheBackend -- durable key/value store behind the result cache.
//
// Same contract as an in-memory map. Implementations report failures
// through their return values and never throw; the cache treats every
// failure as "no entry" and keeps serving from memory.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual std::optional<CacheRow> get(const QString& key) = 0;

    // Insert or replace the row with the same key.
    virtual bool put(const CacheRow& row) = 0;

    virtual bool remove(const QString& key) = 0;
    virtual bool clear() = 0;

    // Every stored row, in no particular order. nullopt on read failure.
    virtual std::optional<std::vector<CacheRow>> loadAll() = 0;
};

} // namespace rw
