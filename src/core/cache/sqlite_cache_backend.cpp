#include "core/cache/sqlite_cache_backend.h"
#include "core/cache/cache_schema.h"
#include "core/shared/logging.h"

#include <QFile>

namespace rw {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

CacheRow readRow(sqlite3_stmt* stmt)
{
    CacheRow row;
    row.key = columnText(stmt, 0);
    row.queryNormalized = columnText(stmt, 1);
    row.toolName = columnText(stmt, 2);
    row.value = columnText(stmt, 3);
    row.createdAtMs = sqlite3_column_int64(stmt, 4);
    row.ttlSeconds = sqlite3_column_int(stmt, 5);
    row.hitCount = sqlite3_column_int(stmt, 6);
    row.lastAccessedMs = sqlite3_column_int64(stmt, 7);
    return row;
}

} // namespace

SQLiteCacheBackend::~SQLiteCacheBackend()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteCacheBackend> SQLiteCacheBackend::open(const QString& dbPath)
{
    SQLiteCacheBackend backend;
    if (!backend.init(dbPath)) {
        return std::nullopt;
    }
    return backend;
}

bool SQLiteCacheBackend::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rwCache, "Failed to open cache database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kCacheConnectionPragmas)) {
        LOG_ERROR(rwCache, "Failed to set cache connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='result_cache'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kCacheDatabasePragmas)) {
            LOG_ERROR(rwCache, "Failed to set cache database pragmas");
            return false;
        }
        if (!execSql(kCacheSchemaV1)) {
            LOG_ERROR(rwCache, "Failed to create cache schema");
            return false;
        }
    }

    // Cached answers may quote user queries: owner-only access.
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(rwCache, "Cache database opened: %s", dbPath.toUtf8().constData());
    return true;
}

bool SQLiteCacheBackend::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rwCache, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::optional<CacheRow> SQLiteCacheBackend::get(const QString& key)
{
    const char* sql = R"(
        SELECT cache_key, query_text, tool_used, value, created_at,
               ttl_seconds, hit_count, last_accessed
        FROM result_cache WHERE cache_key = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rwCache, "Failed to prepare cache lookup: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<CacheRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteCacheBackend::put(const CacheRow& row)
{
    const char* sql = R"(
        INSERT OR REPLACE INTO result_cache
            (cache_key, query_text, tool_used, value, created_at,
             ttl_seconds, hit_count, last_accessed)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rwCache, "Failed to prepare cache write: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray keyUtf8 = row.key.toUtf8();
    const QByteArray queryUtf8 = row.queryNormalized.toUtf8();
    const QByteArray toolUtf8 = row.toolName.toUtf8();
    const QByteArray valueUtf8 = row.value.toUtf8();

    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, queryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, toolUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, valueUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, row.createdAtMs);
    sqlite3_bind_int(stmt, 6, row.ttlSeconds);
    sqlite3_bind_int(stmt, 7, row.hitCount);
    sqlite3_bind_int64(stmt, 8, row.lastAccessedMs);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rwCache, "Failed to write cache row: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SQLiteCacheBackend::remove(const QString& key)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM result_cache WHERE cache_key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rwCache, "Failed to prepare cache delete: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool SQLiteCacheBackend::clear()
{
    return execSql("DELETE FROM result_cache");
}

std::optional<std::vector<CacheRow>> SQLiteCacheBackend::loadAll()
{
    const char* sql = R"(
        SELECT cache_key, query_text, tool_used, value, created_at,
               ttl_seconds, hit_count, last_accessed
        FROM result_cache
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rwCache, "Failed to prepare cache scan: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<CacheRow> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readRow(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(rwCache, "Cache scan aborted: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return rows;
}

} // namespace rw
