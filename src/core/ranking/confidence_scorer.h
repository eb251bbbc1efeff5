#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>

namespace rw {

enum class OutcomeBand {
    Clean,
    Complex,
    Fallback,
    Failed,
};

QString outcomeBandToString(OutcomeBand band);

struct ConfidenceBreakdown {
    OutcomeBand band = OutcomeBand::Failed;
    ConfidenceBand bounds;
    double routingConfidence = 0.0;
    double interpolated = 0.0;      // before the web-search cap and rounding
    bool webSearchCapped = false;
    double finalScore = 0.0;
};

// ConfidenceScorer -- fuses routing confidence with the execution outcome.
//
// The result is always in [0.00, 0.95], rounded to two decimals. Pure and
// stateless after construction; safe to share across threads.
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const ScoringBands& bands = {});

    double score(const RoutingDecision& decision, const ExecutionOutcome& outcome) const;
    ConfidenceBreakdown explain(const RoutingDecision& decision,
                                const ExecutionOutcome& outcome) const;

    static OutcomeBand classifyOutcome(const RoutingDecision& decision,
                                       const ExecutionOutcome& outcome);

    // Human-readable label for a final score.
    static QString category(double score);

    const ScoringBands& bands() const { return m_bands; }

    static constexpr double kMinConfidence = 0.0;
    static constexpr double kMaxConfidence = 0.95;

private:
    ScoringBands m_bands;

    const ConfidenceBand& bandFor(OutcomeBand band) const;
};

} // namespace rw
