#pragma once

namespace rw {

// Per-connection pragmas, safe on every open.
constexpr const char* kCacheConnectionPragmas = R"(
PRAGMA temp_store = MEMORY;
PRAGMA synchronous = NORMAL;
)";

// Database-level pragmas, run once when the file is created.
constexpr const char* kCacheDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

constexpr int kCacheSchemaVersion = 1;

constexpr const char* kCacheSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS result_cache (
    cache_key TEXT PRIMARY KEY,
    query_text TEXT NOT NULL,
    tool_used TEXT NOT NULL,
    value TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    ttl_seconds INTEGER NOT NULL,
    hit_count INTEGER NOT NULL DEFAULT 0,
    last_accessed INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_result_cache_tool ON result_cache(tool_used);
CREATE INDEX IF NOT EXISTS idx_result_cache_last_accessed ON result_cache(last_accessed DESC);
)";

} // namespace rw
