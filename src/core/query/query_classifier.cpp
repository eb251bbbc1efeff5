#include "core/query/query_classifier.h"

#include <algorithm>
#include <cmath>

namespace rw {

namespace {

constexpr double kScoreEpsilon = 1e-9;

bool matchesAt(const QStringList& tokens, const QStringList& phrase, int position)
{
    if (position < 0 || position + phrase.size() > tokens.size()) {
        return false;
    }
    for (int i = 0; i < phrase.size(); ++i) {
        if (tokens.at(position + i) != phrase.at(i)) {
            return false;
        }
    }
    return true;
}

// Index of the first whole-token occurrence of phrase, or -1.
int findPhrase(const QStringList& tokens, const QStringList& phrase)
{
    if (phrase.isEmpty()) {
        return -1;
    }
    const int last = static_cast<int>(tokens.size() - phrase.size());
    for (int position = 0; position <= last; ++position) {
        if (matchesAt(tokens, phrase, position)) {
            return position;
        }
    }
    return -1;
}

bool inFirstThird(int position, int tokenCount)
{
    return position * 3 < tokenCount;
}

double scoreTool(const Lexicon::ToolEntry& entry, const QStringList& tokens, double bonus)
{
    const int tokenCount = static_cast<int>(tokens.size());
    double score = 0.0;
    for (const Lexicon::Term& term : entry.terms) {
        const int position = findPhrase(tokens, term.tokens);
        if (position < 0) {
            continue;
        }
        score += term.weight;
        if (inFirstThird(position, tokenCount)) {
            score += term.weight * bonus;
        }
    }
    return score;
}

QuestionType detectQuestionType(const Lexicon& lexicon, const QStringList& tokens)
{
    for (const Lexicon::QuestionRule& rule : lexicon.questionRules()) {
        for (const Lexicon::Term& phrase : rule.phrases) {
            if (findPhrase(tokens, phrase.tokens) >= 0) {
                return rule.type;
            }
        }
    }
    return QuestionType::General;
}

struct LocationMatch {
    const Lexicon::Place* place = nullptr;
    int position = -1;
};

// Longest span wins; equal spans go to the earliest occurrence, then to
// gazetteer order.
LocationMatch detectLocation(const Lexicon& lexicon, const QStringList& tokens)
{
    LocationMatch best;
    for (const Lexicon::Place& place : lexicon.gazetteer()) {
        const int position = findPhrase(tokens, place.tokens);
        if (position < 0) {
            continue;
        }
        if (!best.place
            || place.tokens.size() > best.place->tokens.size()
            || (place.tokens.size() == best.place->tokens.size() && position < best.position)) {
            best.place = &place;
            best.position = position;
        }
    }
    return best;
}

// True when the term ends right before the location, directly or through
// "in" ("hospital dhaka", "hospital in dhaka").
bool qualifiesLocation(const Lexicon::Term& term, const QStringList& tokens, int locationPosition)
{
    const int span = static_cast<int>(term.tokens.size());
    if (matchesAt(tokens, term.tokens, locationPosition - span)) {
        return true;
    }
    return locationPosition >= 1
        && tokens.at(locationPosition - 1) == QLatin1String("in")
        && matchesAt(tokens, term.tokens, locationPosition - 1 - span);
}

} // namespace

QueryClassifier::QueryClassifier(const Lexicon& lexicon)
    : m_lexicon(lexicon)
{
}

RoutingDecision QueryClassifier::classify(const QString& rawQuery) const
{
    return classify(QueryNormalizer::normalize(rawQuery));
}

RoutingDecision QueryClassifier::classify(const NormalizedQuery& query) const
{
    RoutingDecision decision;
    decision.primaryTool = QString::fromLatin1(kWebSearchTool);

    const QStringList& tokens = query.tokens;
    const double bonus = m_lexicon.positionalBonus();

    decision.toolScores.reserve(m_lexicon.tools().size());
    double maxScore = 0.0;
    for (const Lexicon::ToolEntry& entry : m_lexicon.tools()) {
        const double score = tokens.isEmpty() ? 0.0 : scoreTool(entry, tokens, bonus);
        decision.toolScores.push_back({entry.tool, score});
        maxScore = std::max(maxScore, score);
    }

    if (tokens.isEmpty()) {
        return decision;
    }

    decision.questionType = detectQuestionType(m_lexicon, tokens);

    const LocationMatch location = detectLocation(m_lexicon, tokens);
    if (location.place) {
        decision.hasLocation = true;
        decision.location = location.place->displayName;
    }

    if (maxScore <= 0.0) {
        return decision;
    }

    std::vector<QString> tied;
    for (const ToolScore& entry : decision.toolScores) {
        if (std::fabs(entry.score - maxScore) <= kScoreEpsilon) {
            tied.push_back(entry.tool);
        }
    }

    decision.primaryTool = tied.size() == 1
        ? tied.front()
        : breakTie(tied, tokens, location.place ? location.position : -1);

    const double total = decision.totalScore();
    const double share = total > 0.0 ? maxScore / total : 0.0;
    decision.confidence = std::clamp(share, kMinConfidence, kMaxConfidence);
    return decision;
}

QString QueryClassifier::breakTie(const std::vector<QString>& tied,
                                  const QStringList& tokens,
                                  int locationPosition) const
{
    std::vector<QString> candidates = tied;

    if (locationPosition >= 0) {
        std::vector<QString> qualified;
        for (const QString& tool : tied) {
            const Lexicon::ToolEntry* entry = m_lexicon.findTool(tool);
            if (!entry) {
                continue;
            }
            const bool anyQualifies = std::any_of(
                entry->terms.begin(), entry->terms.end(),
                [&](const Lexicon::Term& term) {
                    return qualifiesLocation(term, tokens, locationPosition);
                });
            if (anyQualifies) {
                qualified.push_back(tool);
            }
        }
        if (!qualified.empty()) {
            candidates = std::move(qualified);
        }
    }

    if (candidates.size() == 1) {
        return candidates.front();
    }

    for (const QString& preferred : m_lexicon.toolPriority()) {
        if (std::find(candidates.begin(), candidates.end(), preferred) != candidates.end()) {
            return preferred;
        }
    }

    // Candidates are collected in declaration order.
    return candidates.front();
}

} // namespace rw
