#include "core/routing/router.h"
#include "core/cache/sqlite_cache_backend.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>

#include <algorithm>
#include <chrono>
#include <climits>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

namespace rw {

namespace {

// Granularity at which a running tool call notices caller cancellation.
constexpr int kCancelPollMs = 20;

QString webSearchTool()
{
    return QString::fromLatin1(kWebSearchTool);
}

QString formatScore(double value)
{
    return QString::number(value, 'f', 2);
}

} // namespace

QJsonObject AnswerResult::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("response")] = response;
    json[QStringLiteral("toolUsed")] = toolUsed;
    json[QStringLiteral("routingConfidence")] = routingConfidence;
    json[QStringLiteral("resultConfidence")] = resultConfidence;
    json[QStringLiteral("cached")] = cached;
    json[QStringLiteral("cacheHits")] = cacheHits;
    json[QStringLiteral("fallbackUsed")] = fallbackUsed;
    json[QStringLiteral("timedOut")] = timedOut;
    json[QStringLiteral("questionType")] = questionTypeToString(questionType);
    json[QStringLiteral("location")] = location ? QJsonValue(*location) : QJsonValue();
    if (sqlText) {
        json[QStringLiteral("sqlText")] = *sqlText;
    }
    json[QStringLiteral("elapsedMs")] = elapsedMs;
    return json;
}

Router::Router(const Lexicon& lexicon,
               RouterSettings settings,
               ToolRegistry tools,
               std::shared_ptr<const Clock> clock,
               std::unique_ptr<CacheBackend> backend)
    : m_lexicon(lexicon)
    , m_settings(std::move(settings))
    , m_tools(std::move(tools))
    , m_classifier(lexicon)
{
    for (auto it = m_tools.begin(); it != m_tools.end();) {
        if (!it->second) {
            LOG_WARN(rwRouting, "Ignoring null executor registered for tool %s",
                     qUtf8Printable(it->first));
            it = m_tools.erase(it);
        } else {
            ++it;
        }
    }

    for (const Lexicon::ToolEntry& entry : m_lexicon.tools()) {
        if (m_tools.find(entry.tool) == m_tools.end()) {
            LOG_WARN(rwRouting, "No executor registered for tool %s",
                     qUtf8Printable(entry.tool));
        }
    }

    if (!m_settings.cacheEnabled) {
        LOG_INFO(rwRouting, "Result cache disabled");
        return;
    }

    if (!backend && !m_settings.cacheDbPath.isEmpty()) {
        QDir().mkpath(QFileInfo(m_settings.cacheDbPath).absolutePath());
        auto opened = SQLiteCacheBackend::open(m_settings.cacheDbPath);
        if (opened) {
            backend = std::make_unique<SQLiteCacheBackend>(std::move(*opened));
        } else {
            LOG_WARN(rwCache, "Cache database unavailable at %s; using memory-only cache",
                     qUtf8Printable(m_settings.cacheDbPath));
        }
    }

    ResultCacheConfig config;
    config.maxEntries = m_settings.cacheMaxEntries;
    config.ttlSeconds = m_settings.cacheTtlSeconds;
    m_cache = std::make_unique<ResultCache>(config, std::move(clock), std::move(backend));
}

RoutingDecision Router::route(const QString& query) const
{
    return m_classifier.classify(query);
}

AnswerResult Router::answer(const QString& query, const AnswerOptions& options)
{
    QElapsedTimer timer;
    timer.start();

    const NormalizedQuery normalized = QueryNormalizer::normalize(query);
    const RoutingDecision decision = m_classifier.classify(normalized);

    AnswerResult result;
    result.toolUsed = decision.primaryTool;
    result.routingConfidence = decision.confidence;
    result.questionType = decision.questionType;
    result.location = decision.location;

    if (normalized.isEmpty()) {
        result.response = QStringLiteral("Please enter a question.");
        result.elapsedMs = timer.elapsed();
        return result;
    }

    LOG_DEBUG(rwRouting, "route: '%s' -> %s (confidence=%.2f, type=%s)",
              qUtf8Printable(normalized.normalized),
              qUtf8Printable(decision.primaryTool),
              decision.confidence,
              qUtf8Printable(questionTypeToString(decision.questionType)));

    if (auto hit = lookupCache(normalized, decision)) {
        hit->elapsedMs = timer.elapsed();
        return *hit;
    }

    const ToolRun run = runWithFallback(decision.primaryTool, normalized, options);
    const ExecutionOutcome& outcome = run.outcome;

    result.toolUsed = run.toolUsed;
    result.fallbackUsed = outcome.usedFallback;
    result.timedOut = run.timedOut;
    result.sqlText = outcome.sqlText;
    result.resultConfidence = m_scorer.score(decision, outcome);

    if (run.timedOut) {
        result.response = QStringLiteral("The %1 tool did not respond in time.").arg(run.toolUsed);
    } else if (run.cancelled) {
        result.response = QStringLiteral("The request was cancelled before the %1 tool finished.")
                              .arg(run.toolUsed);
    } else if (!outcome.success) {
        result.response = outcome.rawResult.isEmpty()
            ? QStringLiteral("The %1 tool could not answer this question.").arg(run.toolUsed)
            : QStringLiteral("The %1 tool could not answer this question: %2")
                  .arg(run.toolUsed, outcome.rawResult);
    } else if (outcome.resultEmpty && outcome.rawResult.isEmpty()) {
        result.response = QStringLiteral("No matching results were found.");
    } else {
        result.response = outcome.rawResult;
    }

    if (outcome.success && !outcome.resultEmpty && !run.timedOut && !run.cancelled) {
        storeInCache(normalized, decision, result);
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

std::vector<AnswerResult> Router::answerAll(const QString& text, const AnswerOptions& options)
{
    const QStringList questions = QueryNormalizer::splitQuestions(text);
    if (questions.isEmpty()) {
        return {answer(text, options)};
    }

    std::vector<AnswerResult> results;
    results.reserve(static_cast<size_t>(questions.size()));
    for (const QString& question : questions) {
        results.push_back(answer(question, options));
    }
    return results;
}

std::vector<AnswerResult> Router::answerBatch(const QStringList& queries,
                                              const AnswerOptions& options)
{
    std::vector<AnswerResult> results;
    results.reserve(static_cast<size_t>(queries.size()));
    for (const QString& query : queries) {
        results.push_back(answer(query, options));
    }
    return results;
}

QString Router::explainRouting(const QString& query) const
{
    const NormalizedQuery normalized = QueryNormalizer::normalize(query);
    const RoutingDecision decision = m_classifier.classify(normalized);

    QStringList lines;
    lines << QStringLiteral("Query: %1").arg(normalized.original.trimmed());
    lines << QStringLiteral("Normalized: %1").arg(normalized.normalized);
    lines << QStringLiteral("Primary tool: %1 (confidence %2)")
                 .arg(decision.primaryTool, formatScore(decision.confidence));
    lines << QStringLiteral("Question type: %1").arg(questionTypeToString(decision.questionType));
    lines << QStringLiteral("Location: %1")
                 .arg(decision.location.value_or(QStringLiteral("none")));
    lines << QStringLiteral("Scores:");
    for (const ToolScore& score : decision.toolScores) {
        lines << QStringLiteral("  %1: %2").arg(score.tool, formatScore(score.score));
    }
    return lines.join(QLatin1Char('\n'));
}

std::vector<ToolRecommendation> Router::recommendTools(const QString& query) const
{
    const RoutingDecision decision = m_classifier.classify(query);
    const double total = decision.totalScore();

    std::vector<ToolRecommendation> recommendations;
    for (const ToolScore& score : decision.toolScores) {
        if (score.score <= 0.0) {
            continue;
        }
        recommendations.push_back({score.tool, score.score, total > 0.0 ? score.score / total : 0.0});
    }

    const QStringList& priority = m_lexicon.toolPriority();
    auto rankOf = [&priority](const QString& tool) {
        const int index = static_cast<int>(priority.indexOf(tool));
        return index < 0 ? INT_MAX : index;
    };
    std::stable_sort(recommendations.begin(), recommendations.end(),
                     [&rankOf](const ToolRecommendation& a, const ToolRecommendation& b) {
                         if (a.share != b.share) {
                             return a.share > b.share;
                         }
                         return rankOf(a.tool) < rankOf(b.tool);
                     });
    return recommendations;
}

ResultCache::Stats Router::cacheStats() const
{
    return m_cache ? m_cache->statistics() : ResultCache::Stats{};
}

int Router::cacheClearAll()
{
    if (!m_cache) {
        return 0;
    }
    const int removed = m_cache->clearAll();
    LOG_INFO(rwCache, "Cleared %d cached results", removed);
    return removed;
}

int Router::cacheClearExpired()
{
    return m_cache ? m_cache->invalidateExpired() : 0;
}

bool Router::cacheInvalidate(const QString& query)
{
    const NormalizedQuery normalized = QueryNormalizer::normalize(query);
    if (!m_cache || normalized.isEmpty()) {
        return false;
    }
    const RoutingDecision decision = m_classifier.classify(normalized);
    return m_cache->invalidate(normalized.normalized, decision.primaryTool);
}

Router::ToolRun Router::runTool(const QString& tool, const NormalizedQuery& query,
                                const AnswerOptions& options) const
{
    auto it = m_tools.find(tool);
    if (it == m_tools.end()) {
        throw std::runtime_error("no executor registered for tool " + tool.toStdString());
    }
    std::shared_ptr<ToolExecutor> executor = it->second;

    ToolRun run;
    run.toolUsed = tool;
    run.outcome.resultEmpty = true;

    if (options.cancelToken.isCancelled()) {
        run.cancelled = true;
        return run;
    }

    const int timeoutMs = options.timeoutMs.value_or(m_settings.toolTimeoutMs);
    if (timeoutMs <= 0) {
        run.outcome = executor->run(query, options.cancelToken);
        return run;
    }

    // The worker owns everything it touches, so an abandoned call may
    // finish after this router is gone.
    CancelToken workerToken;
    auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
    std::future<ExecutionOutcome> future = promise->get_future();
    std::thread worker([executor, query, workerToken, promise]() {
        try {
            promise->set_value(executor->run(query, workerToken));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    QElapsedTimer timer;
    timer.start();
    while (true) {
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            run.timedOut = true;
            break;
        }
        const qint64 slice = std::min<qint64>(remaining, kCancelPollMs);
        if (future.wait_for(std::chrono::milliseconds(slice)) == std::future_status::ready) {
            worker.join();
            run.outcome = future.get();
            return run;
        }
        if (options.cancelToken.isCancelled()) {
            run.cancelled = true;
            break;
        }
    }

    workerToken.cancel();
    worker.detach();

    if (run.timedOut) {
        LOG_WARN(rwTools, "Tool %s timed out after %d ms", qUtf8Printable(tool), timeoutMs);
    } else {
        LOG_INFO(rwTools, "Tool %s cancelled by caller", qUtf8Printable(tool));
    }
    return run;
}

Router::ToolRun Router::runWithFallback(const QString& tool, const NormalizedQuery& query,
                                        const AnswerOptions& options) const
{
    try {
        return runTool(tool, query, options);
    } catch (const std::exception& e) {
        LOG_WARN(rwTools, "Tool %s failed: %s", qUtf8Printable(tool), e.what());
        if (!m_settings.webSearchFallback || tool == webSearchTool()) {
            ToolRun failed;
            failed.toolUsed = tool;
            failed.outcome.resultEmpty = true;
            failed.outcome.rawResult = QString::fromUtf8(e.what());
            return failed;
        }
    }

    LOG_INFO(rwTools, "Falling back to %s for tool %s", kWebSearchTool, qUtf8Printable(tool));
    try {
        ToolRun run = runTool(webSearchTool(), query, options);
        run.outcome.usedFallback = true;
        return run;
    } catch (const std::exception& e) {
        LOG_WARN(rwTools, "Fallback tool %s failed: %s", kWebSearchTool, e.what());
        ToolRun failed;
        failed.toolUsed = webSearchTool();
        failed.outcome.usedFallback = true;
        failed.outcome.resultEmpty = true;
        failed.outcome.rawResult = QString::fromUtf8(e.what());
        return failed;
    }
}

std::optional<AnswerResult> Router::lookupCache(const NormalizedQuery& query,
                                                const RoutingDecision& decision)
{
    if (!m_cache) {
        return std::nullopt;
    }

    const auto entry = m_cache->get(query.normalized, decision.primaryTool);
    if (!entry) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(entry->value.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rwCache, "Discarding unreadable cache entry for '%s': %s",
                 qUtf8Printable(query.normalized), qUtf8Printable(parseError.errorString()));
        m_cache->invalidate(query.normalized, decision.primaryTool);
        return std::nullopt;
    }

    const QJsonObject json = doc.object();
    AnswerResult result;
    result.response = json.value(QStringLiteral("response")).toString();
    result.toolUsed = json.value(QStringLiteral("toolUsed")).toString(decision.primaryTool);
    result.resultConfidence = json.value(QStringLiteral("resultConfidence")).toDouble();
    result.fallbackUsed = json.value(QStringLiteral("fallbackUsed")).toBool();
    if (json.contains(QStringLiteral("sqlText"))) {
        result.sqlText = json.value(QStringLiteral("sqlText")).toString();
    }
    result.routingConfidence = decision.confidence;
    result.questionType = decision.questionType;
    result.location = decision.location;
    result.cached = true;
    result.cacheHits = entry->hitCount;

    LOG_DEBUG(rwCache, "cache hit: '%s' tool=%s hits=%d",
              qUtf8Printable(query.normalized), qUtf8Printable(decision.primaryTool),
              entry->hitCount);
    return result;
}

void Router::storeInCache(const NormalizedQuery& query, const RoutingDecision& decision,
                          const AnswerResult& result)
{
    if (!m_cache) {
        return;
    }

    QJsonObject json;
    json[QStringLiteral("response")] = result.response;
    json[QStringLiteral("toolUsed")] = result.toolUsed;
    json[QStringLiteral("resultConfidence")] = result.resultConfidence;
    json[QStringLiteral("fallbackUsed")] = result.fallbackUsed;
    if (result.sqlText) {
        json[QStringLiteral("sqlText")] = *result.sqlText;
    }

    m_cache->set(query.normalized, decision.primaryTool,
                 QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact)),
                 m_settings.cacheTtlSeconds);
}

} // namespace rw
