#pragma once

#include "core/query/lexicon.h"
#include "core/query/query_normalizer.h"
#include "core/shared/types.h"

#include <QString>

namespace rw {

// QueryClassifier -- deterministic keyword router.
//
// Scores every lexicon tool against the query, detects the question type
// and the most specific gazetteer location, and resolves ties by
//   1. tools with a keyword directly qualifying the detected location
//      ("hospitals in Dhaka"),
//   2. the lexicon's tool priority order,
//   3. tool declaration order.
// A query that matches nothing routes to web_search with confidence 0.
//
// classify() is const and touches no shared mutable state, so one
// instance may serve any number of threads. The lexicon must outlive it.
class QueryClassifier {
public:
    explicit QueryClassifier(const Lexicon& lexicon);

    RoutingDecision classify(const NormalizedQuery& query) const;
    RoutingDecision classify(const QString& rawQuery) const;

    const Lexicon& lexicon() const { return m_lexicon; }

    static constexpr double kMinConfidence = 0.05;
    static constexpr double kMaxConfidence = 0.95;

private:
    const Lexicon& m_lexicon;

    QString breakTie(const std::vector<QString>& tied,
                     const QStringList& tokens,
                     int locationPosition) const;
};

} // namespace rw
