#include "core/shared/types.h"

namespace rw {

QString questionTypeToString(QuestionType type)
{
    switch (type) {
    case QuestionType::Count:      return QStringLiteral("count");
    case QuestionType::List:       return QStringLiteral("list");
    case QuestionType::Filter:     return QStringLiteral("filter");
    case QuestionType::Comparison: return QStringLiteral("comparison");
    case QuestionType::General:    return QStringLiteral("general");
    }
    return QStringLiteral("general");
}

QuestionType questionTypeFromString(const QString& str)
{
    if (str == QLatin1String("count"))      return QuestionType::Count;
    if (str == QLatin1String("list"))       return QuestionType::List;
    if (str == QLatin1String("filter"))     return QuestionType::Filter;
    if (str == QLatin1String("comparison")) return QuestionType::Comparison;
    return QuestionType::General;
}

bool operator==(const ToolScore& lhs, const ToolScore& rhs)
{
    return lhs.tool == rhs.tool && lhs.score == rhs.score;
}

double RoutingDecision::scoreFor(const QString& tool) const
{
    for (const ToolScore& entry : toolScores) {
        if (entry.tool == tool) {
            return entry.score;
        }
    }
    return 0.0;
}

double RoutingDecision::totalScore() const
{
    double total = 0.0;
    for (const ToolScore& entry : toolScores) {
        total += entry.score;
    }
    return total;
}

bool operator==(const RoutingDecision& lhs, const RoutingDecision& rhs)
{
    return lhs.primaryTool == rhs.primaryTool
        && lhs.confidence == rhs.confidence
        && lhs.questionType == rhs.questionType
        && lhs.hasLocation == rhs.hasLocation
        && lhs.location == rhs.location
        && lhs.toolScores == rhs.toolScores;
}

bool operator!=(const RoutingDecision& lhs, const RoutingDecision& rhs)
{
    return !(lhs == rhs);
}

} // namespace rw
