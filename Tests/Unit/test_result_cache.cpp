#include <QtTest/QtTest>
#include "core/cache/result_cache.h"
#include "Support/manual_clock.h"

#include <map>
#include <memory>
#include <thread>
#include <vector>

namespace {

using RowMap = std::map<QString, rw::CacheRow>;

// Backend over a map the test keeps a handle to.
class MapBackend : public rw::CacheBackend {
public:
    explicit MapBackend(std::shared_ptr<RowMap> rows) : m_rows(std::move(rows)) {}

    std::optional<rw::CacheRow> get(const QString& key) override
    {
        auto it = m_rows->find(key);
        if (it == m_rows->end()) {
            return std::nullopt;
        }
        return it->second;
    }
    bool put(const rw::CacheRow& row) override
    {
        (*m_rows)[row.key] = row;
        return true;
    }
    bool remove(const QString& key) override
    {
        m_rows->erase(key);
        return true;
    }
    bool clear() override
    {
        m_rows->clear();
        return true;
    }
    std::optional<std::vector<rw::CacheRow>> loadAll() override
    {
        std::vector<rw::CacheRow> rows;
        for (const auto& [key, row] : *m_rows) {
            rows.push_back(row);
        }
        return rows;
    }

private:
    std::shared_ptr<RowMap> m_rows;
};

// Every operation fails.
class BrokenBackend : public rw::CacheBackend {
public:
    std::optional<rw::CacheRow> get(const QString&) override { return std::nullopt; }
    bool put(const rw::CacheRow&) override { return false; }
    bool remove(const QString&) override { return false; }
    bool clear() override { return false; }
    std::optional<std::vector<rw::CacheRow>> loadAll() override { return std::nullopt; }
};

rw::CacheRow makeRow(const QString& query, const QString& tool, qint64 createdAtMs,
                     int ttlSeconds, qint64 lastAccessedMs)
{
    rw::CacheRow row;
    row.key = rw::ResultCache::makeKey(query, tool);
    row.queryNormalized = query;
    row.toolName = tool;
    row.value = QStringLiteral("value of ") + query;
    row.createdAtMs = createdAtMs;
    row.ttlSeconds = ttlSeconds;
    row.lastAccessedMs = lastAccessedMs;
    return row;
}

const QString kTool = QStringLiteral("hospitals");

} // namespace

class TestResultCache : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<rw::test::ManualClock> m_clock;

private slots:
    void init()
    {
        m_clock = std::make_shared<rw::test::ManualClock>();
    }

    void testCacheHitReturnsSameValue()
    {
        rw::ResultCacheConfig config;
        rw::ResultCache cache(config, m_clock);
        cache.set(QStringLiteral("hospitals in dhaka"), kTool, QStringLiteral("12 hospitals"), 60);

        auto entry = cache.get(QStringLiteral("hospitals in dhaka"), kTool);
        QVERIFY(entry.has_value());
        QCOMPARE(entry->value, QStringLiteral("12 hospitals"));
        QCOMPARE(entry->ttlSeconds, 60);
        QCOMPARE(entry->hitCount, 1);
        QCOMPARE(entry->createdAtMs, m_clock->nowMs());
    }

    void testCacheMissReturnsNullopt()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        QVERIFY(!cache.get(QStringLiteral("nothing here"), kTool).has_value());
        QCOMPARE(cache.statistics().misses, uint64_t(1));
    }

    void testCacheTTLExpiration()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"), 10);

        m_clock->advanceMs(9999);
        QVERIFY(cache.get(QStringLiteral("q"), kTool).has_value());

        // Expiry is inclusive: now == created_at + ttl is a miss
        m_clock->advanceMs(1);
        QVERIFY(!cache.get(QStringLiteral("q"), kTool).has_value());
        QCOMPARE(cache.size(), 0);
        QVERIFY(!cache.peek(QStringLiteral("q"), kTool).has_value());
        QCOMPARE(cache.statistics().expirations, uint64_t(1));
    }

    void testDefaultTtlFromConfig()
    {
        rw::ResultCacheConfig config;
        config.ttlSeconds = 5;
        rw::ResultCache cache(config, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        QCOMPARE(cache.peek(QStringLiteral("q"), kTool)->ttlSeconds, 5);

        m_clock->advanceSeconds(5);
        QVERIFY(!cache.get(QStringLiteral("q"), kTool).has_value());
    }

    void testCacheLRUEviction()
    {
        rw::ResultCacheConfig config;
        config.maxEntries = 3;
        rw::ResultCache cache(config, m_clock);

        cache.set(QStringLiteral("a"), kTool, QStringLiteral("1"));
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));
        cache.set(QStringLiteral("c"), kTool, QStringLiteral("3"));
        QCOMPARE(cache.size(), 3);

        cache.set(QStringLiteral("d"), kTool, QStringLiteral("4"));
        QCOMPARE(cache.size(), 3);
        QVERIFY(!cache.peek(QStringLiteral("a"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("b"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("c"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("d"), kTool).has_value());
        QCOMPARE(cache.statistics().evictions, uint64_t(1));
    }

    void testGetProtectsFromEviction()
    {
        rw::ResultCacheConfig config;
        config.maxEntries = 3;
        rw::ResultCache cache(config, m_clock);

        cache.set(QStringLiteral("a"), kTool, QStringLiteral("1"));
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));
        cache.set(QStringLiteral("c"), kTool, QStringLiteral("3"));

        QVERIFY(cache.get(QStringLiteral("a"), kTool).has_value());
        cache.set(QStringLiteral("d"), kTool, QStringLiteral("4"));

        QVERIFY(cache.peek(QStringLiteral("a"), kTool).has_value());
        QVERIFY(!cache.peek(QStringLiteral("b"), kTool).has_value());
    }

    void testSetExistingKeyIsNotAnAccess()
    {
        rw::ResultCacheConfig config;
        config.maxEntries = 3;
        rw::ResultCache cache(config, m_clock);

        cache.set(QStringLiteral("a"), kTool, QStringLiteral("old"), 10);
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));
        cache.set(QStringLiteral("c"), kTool, QStringLiteral("3"));

        m_clock->advanceSeconds(8);
        cache.set(QStringLiteral("a"), kTool, QStringLiteral("new"), 20);
        QCOMPARE(cache.size(), 3);

        auto rewritten = cache.peek(QStringLiteral("a"), kTool);
        QVERIFY(rewritten.has_value());
        QCOMPARE(rewritten->value, QStringLiteral("new"));
        QCOMPARE(rewritten->ttlSeconds, 20);
        QCOMPARE(rewritten->createdAtMs, m_clock->nowMs());
        QCOMPARE(rewritten->hitCount, 0);

        // Still the least recently used entry
        cache.set(QStringLiteral("d"), kTool, QStringLiteral("4"));
        QVERIFY(!cache.peek(QStringLiteral("a"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("b"), kTool).has_value());
    }

    void testRepeatedHitsOnlyTouchCounters()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        const qint64 createdAt = m_clock->nowMs();

        for (int i = 1; i <= 3; ++i) {
            m_clock->advanceMs(100);
            auto entry = cache.get(QStringLiteral("q"), kTool);
            QVERIFY(entry.has_value());
            QCOMPARE(entry->hitCount, i);
            QCOMPARE(entry->value, QStringLiteral("v"));
            QCOMPARE(entry->createdAtMs, createdAt);
            QCOMPARE(entry->lastAccessedMs, m_clock->nowMs());
        }
    }

    void testKeysDistinguishQueryAndTool()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("food in sylhet"), QStringLiteral("restaurants"),
                  QStringLiteral("from restaurants"));
        cache.set(QStringLiteral("food in sylhet"), QStringLiteral("web_search"),
                  QStringLiteral("from web"));
        QCOMPARE(cache.size(), 2);
        QCOMPARE(cache.get(QStringLiteral("food in sylhet"), QStringLiteral("web_search"))->value,
                 QStringLiteral("from web"));

        QVERIFY(rw::ResultCache::makeKey(QStringLiteral("a b"), QStringLiteral("c"))
                != rw::ResultCache::makeKey(QStringLiteral("a"), QStringLiteral("b c")));
        QCOMPARE(rw::ResultCache::makeKey(QStringLiteral("a"), QStringLiteral("b")),
                 rw::ResultCache::makeKey(QStringLiteral("a"), QStringLiteral("b")));
    }

    void testInvalidate()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        QVERIFY(cache.invalidate(QStringLiteral("q"), kTool));
        QVERIFY(!cache.invalidate(QStringLiteral("q"), kTool));
        QCOMPARE(cache.size(), 0);
    }

    void testInvalidateExpired()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("short"), kTool, QStringLiteral("v"), 1);
        cache.set(QStringLiteral("shorter"), kTool, QStringLiteral("v"), 2);
        cache.set(QStringLiteral("long"), kTool, QStringLiteral("v"), 100);

        QCOMPARE(cache.invalidateExpired(), 0);
        m_clock->advanceSeconds(2);
        QCOMPARE(cache.invalidateExpired(), 2);
        QCOMPARE(cache.size(), 1);
        QVERIFY(cache.peek(QStringLiteral("long"), kTool).has_value());
    }

    void testCacheClearRemovesAll()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("a"), kTool, QStringLiteral("1"));
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));

        QCOMPARE(cache.clearAll(), 2);
        QCOMPARE(cache.size(), 0);
        QVERIFY(!cache.get(QStringLiteral("a"), kTool).has_value());
    }

    void testCacheStats()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("a"), kTool, QStringLiteral("1"));
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));
        cache.set(QStringLiteral("c"), kTool, QStringLiteral("3"), 1);

        QVERIFY(cache.get(QStringLiteral("a"), kTool).has_value());
        QVERIFY(cache.get(QStringLiteral("a"), kTool).has_value());
        QVERIFY(cache.get(QStringLiteral("b"), kTool).has_value());
        QVERIFY(!cache.get(QStringLiteral("zzz"), kTool).has_value());

        m_clock->advanceSeconds(1);
        rw::ResultCache::Stats stats = cache.statistics();
        QCOMPARE(stats.totalEntries, 3);
        QCOMPARE(stats.liveEntries, 2);
        QCOMPARE(stats.hits, uint64_t(3));
        QCOMPARE(stats.misses, uint64_t(1));
        QCOMPARE(stats.hitRate, 0.75);
        QCOMPARE(stats.averageHitCount, 1.0);
        QVERIFY(!stats.popular.empty());
        QCOMPARE(stats.popular.front().queryNormalized, QStringLiteral("a"));
        QCOMPARE(stats.popular.front().hitCount, 2);

        cache.resetStatistics();
        stats = cache.statistics();
        QCOMPARE(stats.hits, uint64_t(0));
        QCOMPARE(stats.hitRate, 0.0);
        QCOMPARE(stats.totalEntries, 3);
    }

    void testPeekDoesNotCount()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        QVERIFY(cache.peek(QStringLiteral("q"), kTool).has_value());
        QVERIFY(!cache.peek(QStringLiteral("other"), kTool).has_value());

        const auto stats = cache.statistics();
        QCOMPARE(stats.hits, uint64_t(0));
        QCOMPARE(stats.misses, uint64_t(0));
        QCOMPARE(cache.peek(QStringLiteral("q"), kTool)->hitCount, 0);
    }

    void testZeroCapacityStoresNothing()
    {
        rw::ResultCacheConfig config;
        config.maxEntries = 0;
        rw::ResultCache cache(config, m_clock);
        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        QCOMPARE(cache.size(), 0);
    }

    void testWriteThroughToBackend()
    {
        auto rows = std::make_shared<RowMap>();
        rw::ResultCacheConfig config;
        config.maxEntries = 2;
        rw::ResultCache cache(config, m_clock, std::make_unique<MapBackend>(rows));
        QVERIFY(cache.isPersistent());

        cache.set(QStringLiteral("a"), kTool, QStringLiteral("1"));
        cache.set(QStringLiteral("b"), kTool, QStringLiteral("2"));
        QCOMPARE(rows->size(), size_t(2));

        m_clock->advanceMs(50);
        QVERIFY(cache.get(QStringLiteral("a"), kTool).has_value());
        const QString keyA = rw::ResultCache::makeKey(QStringLiteral("a"), kTool);
        QCOMPARE(rows->at(keyA).hitCount, 1);
        QCOMPARE(rows->at(keyA).lastAccessedMs, m_clock->nowMs());

        // Eviction of "b" is mirrored
        cache.set(QStringLiteral("c"), kTool, QStringLiteral("3"));
        QCOMPARE(rows->size(), size_t(2));
        QVERIFY(rows->count(rw::ResultCache::makeKey(QStringLiteral("b"), kTool)) == 0);

        QVERIFY(cache.invalidate(QStringLiteral("c"), kTool));
        QCOMPARE(rows->size(), size_t(1));

        cache.clearAll();
        QVERIFY(rows->empty());
    }

    void testWarmsFromBackend()
    {
        const qint64 now = m_clock->nowMs();
        auto rows = std::make_shared<RowMap>();
        for (const rw::CacheRow& row : {
                 makeRow(QStringLiteral("expired"), kTool, now - 20000, 10, now - 1000),
                 makeRow(QStringLiteral("recent"), kTool, now - 5000, 3600, now - 100),
                 makeRow(QStringLiteral("older"), kTool, now - 5000, 3600, now - 2000),
                 makeRow(QStringLiteral("oldest"), kTool, now - 5000, 3600, now - 3000)}) {
            (*rows)[row.key] = row;
        }

        rw::ResultCacheConfig config;
        config.maxEntries = 2;
        rw::ResultCache cache(config, m_clock, std::make_unique<MapBackend>(rows));

        QCOMPARE(cache.size(), 2);
        QVERIFY(cache.peek(QStringLiteral("recent"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("older"), kTool).has_value());
        QVERIFY(!cache.peek(QStringLiteral("oldest"), kTool).has_value());
        QVERIFY(!cache.peek(QStringLiteral("expired"), kTool).has_value());
        // Dropped rows are removed from the backend too
        QCOMPARE(rows->size(), size_t(2));

        // Recency survives the reload: "older" is evicted first
        cache.set(QStringLiteral("fresh"), kTool, QStringLiteral("v"));
        QVERIFY(!cache.peek(QStringLiteral("older"), kTool).has_value());
        QVERIFY(cache.peek(QStringLiteral("recent"), kTool).has_value());
    }

    void testBackendFailuresDegradeToMemory()
    {
        rw::ResultCache cache(rw::ResultCacheConfig{}, m_clock, std::make_unique<BrokenBackend>());
        QCOMPARE(cache.size(), 0);

        cache.set(QStringLiteral("q"), kTool, QStringLiteral("v"));
        auto entry = cache.get(QStringLiteral("q"), kTool);
        QVERIFY(entry.has_value());
        QCOMPARE(entry->value, QStringLiteral("v"));
        QVERIFY(cache.invalidate(QStringLiteral("q"), kTool));
        QCOMPARE(cache.clearAll(), 0);
    }

    void testConcurrentAccessRespectsCapacity()
    {
        rw::ResultCacheConfig config;
        config.maxEntries = 50;
        rw::ResultCache cache(config, m_clock);

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, t]() {
                for (int i = 0; i < 200; ++i) {
                    const QString query = QStringLiteral("q%1").arg((t * 37 + i) % 120);
                    cache.set(query, kTool, QString::number(i));
                    cache.get(query, kTool);
                }
            });
        }
        for (std::thread& thread : threads) {
            thread.join();
        }

        QVERIFY(cache.size() <= 50);
        const auto stats = cache.statistics();
        QCOMPARE(stats.hits + stats.misses, uint64_t(800));
    }
};

QTEST_MAIN(TestResultCache)
#include "test_result_cache.moc"
