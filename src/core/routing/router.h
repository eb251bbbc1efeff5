#pragma once

#include "core/cache/cache_backend.h"
#include "core/cache/result_cache.h"
#include "core/query/lexicon.h"
#include "core/query/query_classifier.h"
#include "core/query/query_normalizer.h"
#include "core/ranking/confidence_scorer.h"
#include "core/shared/clock.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/tools/tool_executor.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace rw {

using ToolRegistry = std::map<QString, std::shared_ptr<ToolExecutor>>;

struct AnswerOptions {
    // Overrides RouterSettings::toolTimeoutMs when set; 0 disables the timeout.
    std::optional<int> timeoutMs;
    CancelToken cancelToken;
};

// Envelope returned by Router::answer().
struct AnswerResult {
    QString response;
    QString toolUsed;
    double routingConfidence = 0.0;
    double resultConfidence = 0.0;
    bool cached = false;
    int cacheHits = 0;
    bool fallbackUsed = false;
    bool timedOut = false;
    QuestionType questionType = QuestionType::General;
    std::optional<QString> location;
    std::optional<QString> sqlText;
    qint64 elapsedMs = 0;

    QJsonObject toJson() const;
};

struct ToolRecommendation {
    QString tool;
    double score = 0.0;
    double share = 0.0;   // score / total score
};

// Router -- classify, look up the cache, run the tool, score, fill the cache.
//
// The lexicon is borrowed and must outlive the router. Tool executors are
// resolved by name once at construction. When RouterSettings::cacheDbPath
// is set and no backend is passed in, the cache is backed by a
// SQLiteCacheBackend at that path; an unusable path degrades to a
// memory-only cache.
//
// answer() may be called from several threads at once: the classifier and
// scorer are stateless and the cache serializes itself.
class Router {
public:
    Router(const Lexicon& lexicon,
           RouterSettings settings,
           ToolRegistry tools,
           std::shared_ptr<const Clock> clock = nullptr,
           std::unique_ptr<CacheBackend> backend = nullptr);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    RoutingDecision route(const QString& query) const;

    AnswerResult answer(const QString& query, const AnswerOptions& options = {});

    // Answers each '?'-separated question of the input in order.
    std::vector<AnswerResult> answerAll(const QString& text, const AnswerOptions& options = {});
    std::vector<AnswerResult> answerBatch(const QStringList& queries,
                                          const AnswerOptions& options = {});

    QString explainRouting(const QString& query) const;

    // Tools with a non-zero score, best first.
    std::vector<ToolRecommendation> recommendTools(const QString& query) const;

    ResultCache::Stats cacheStats() const;
    int cacheClearAll();
    int cacheClearExpired();
    bool cacheInvalidate(const QString& query);

    bool cacheEnabled() const { return m_cache != nullptr; }
    const RouterSettings& settings() const { return m_settings; }

private:
    struct ToolRun {
        ExecutionOutcome outcome;
        QString toolUsed;
        bool timedOut = false;
        bool cancelled = false;
    };

    ToolRun runTool(const QString& tool, const NormalizedQuery& query,
                    const AnswerOptions& options) const;
    ToolRun runWithFallback(const QString& tool, const NormalizedQuery& query,
                            const AnswerOptions& options) const;
    std::optional<AnswerResult> lookupCache(const NormalizedQuery& query,
                                            const RoutingDecision& decision);
    void storeInCache(const NormalizedQuery& query, const RoutingDecision& decision,
                      const AnswerResult& result);

    const Lexicon& m_lexicon;
    RouterSettings m_settings;
    ToolRegistry m_tools;
    QueryClassifier m_classifier;
    ConfidenceScorer m_scorer;
    std::unique_ptr<ResultCache> m_cache;
};

} // namespace rw
