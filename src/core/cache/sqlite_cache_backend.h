#pragma once

#include "core/cache/cache_backend.h"

#include <QString>

#include <optional>
#include <vector>

#include <sqlite3.h>

namespace rw {

// SQLiteCacheBackend -- durable result-cache rows in a single SQLite table.
//
// Not internally synchronized: ResultCache calls it under its own mutex.
class SQLiteCacheBackend : public CacheBackend {
public:
    ~SQLiteCacheBackend() override;

    // Move-only (owns sqlite3* handle)
    SQLiteCacheBackend(SQLiteCacheBackend&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteCacheBackend& operator=(SQLiteCacheBackend&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteCacheBackend(const SQLiteCacheBackend&) = delete;
    SQLiteCacheBackend& operator=(const SQLiteCacheBackend&) = delete;

    // Open or create the cache database at the given path.
    // Creates the schema on first open.
    static std::optional<SQLiteCacheBackend> open(const QString& dbPath);

    std::optional<CacheRow> get(const QString& key) override;
    bool put(const CacheRow& row) override;
    bool remove(const QString& key) override;
    bool clear() override;
    std::optional<std::vector<CacheRow>> loadAll() override;

    // Access raw handle (for testing)
    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteCacheBackend() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace rw
