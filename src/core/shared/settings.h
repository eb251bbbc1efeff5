#pragma once

#include <QString>

namespace rw {

struct RouterSettings {
    // Result cache
    bool cacheEnabled = true;
    int cacheTtlSeconds = 3600;              // 1 hour
    int cacheMaxEntries = 1000;
    QString cacheDbPath;                     // empty = memory only

    // Tool invocation
    int toolTimeoutMs = 30000;               // 0 = wait indefinitely
    bool webSearchFallback = true;
};

} // namespace rw
