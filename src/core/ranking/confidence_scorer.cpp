#include "core/ranking/confidence_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace rw {

namespace {

double roundToCents(double value)
{
    return std::round(value * 100.0) / 100.0;
}

} // namespace

QString outcomeBandToString(OutcomeBand band)
{
    switch (band) {
    case OutcomeBand::Clean:    return QStringLiteral("clean");
    case OutcomeBand::Complex:  return QStringLiteral("complex");
    case OutcomeBand::Fallback: return QStringLiteral("fallback");
    case OutcomeBand::Failed:   return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

ConfidenceScorer::ConfidenceScorer(const ScoringBands& bands)
    : m_bands(bands)
{
}

OutcomeBand ConfidenceScorer::classifyOutcome(const RoutingDecision& decision,
                                              const ExecutionOutcome& outcome)
{
    if (!outcome.success || outcome.resultEmpty) {
        return OutcomeBand::Failed;
    }
    if (outcome.usedFallback) {
        return OutcomeBand::Fallback;
    }
    if (decision.questionType == QuestionType::Filter
        || decision.questionType == QuestionType::Comparison) {
        return OutcomeBand::Complex;
    }
    return OutcomeBand::Clean;
}

const ConfidenceBand& ConfidenceScorer::bandFor(OutcomeBand band) const
{
    switch (band) {
    case OutcomeBand::Clean:    return m_bands.clean;
    case OutcomeBand::Complex:  return m_bands.complex;
    case OutcomeBand::Fallback: return m_bands.fallback;
    case OutcomeBand::Failed:   return m_bands.failed;
    }
    return m_bands.failed;
}

ConfidenceBreakdown ConfidenceScorer::explain(const RoutingDecision& decision,
                                              const ExecutionOutcome& outcome) const
{
    ConfidenceBreakdown breakdown;
    breakdown.band = classifyOutcome(decision, outcome);
    breakdown.bounds = bandFor(breakdown.band);
    breakdown.routingConfidence = std::clamp(decision.confidence, 0.0, 1.0);

    const ConfidenceBand& band = breakdown.bounds;
    breakdown.interpolated = band.floor
        + (band.ceiling - band.floor) * breakdown.routingConfidence;

    double value = breakdown.interpolated;
    if (decision.primaryTool == QLatin1String(kWebSearchTool)
        && value > m_bands.webSearchCeiling) {
        value = m_bands.webSearchCeiling;
        breakdown.webSearchCapped = true;
    }

    // The only place a confidence leaves the scorer: never 1.00.
    breakdown.finalScore = std::clamp(roundToCents(value), kMinConfidence, kMaxConfidence);
    return breakdown;
}

double ConfidenceScorer::score(const RoutingDecision& decision,
                               const ExecutionOutcome& outcome) const
{
    const ConfidenceBreakdown breakdown = explain(decision, outcome);
    LOG_DEBUG(rwScoring, "confidence: tool=%s band=%s routing=%.2f final=%.2f",
              qUtf8Printable(decision.primaryTool),
              qUtf8Printable(outcomeBandToString(breakdown.band)),
              breakdown.routingConfidence,
              breakdown.finalScore);
    return breakdown.finalScore;
}

QString ConfidenceScorer::category(double score)
{
    if (score >= 0.90) {
        return QStringLiteral("High confidence");
    }
    if (score >= 0.80) {
        return QStringLiteral("Good confidence");
    }
    if (score >= 0.70) {
        return QStringLiteral("Medium confidence");
    }
    if (score >= 0.50) {
        return QStringLiteral("Low confidence");
    }
    return QStringLiteral("Very low confidence");
}

} // namespace rw
