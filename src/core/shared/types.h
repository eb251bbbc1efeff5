#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace rw {

// Tool identifiers known to the default lexicon. A custom lexicon may
// declare additional tools; web_search is always the universal fallback.
constexpr const char* kInstitutionsTool = "institutions";
constexpr const char* kHospitalsTool = "hospitals";
constexpr const char* kRestaurantsTool = "restaurants";
constexpr const char* kWebSearchTool = "web_search";

enum class QuestionType {
    Count,
    List,
    Filter,
    Comparison,
    General,
};

QString questionTypeToString(QuestionType type);
QuestionType questionTypeFromString(const QString& str);

struct ToolScore {
    QString tool;
    double score = 0.0;
};

bool operator==(const ToolScore& lhs, const ToolScore& rhs);

// Output of the classifier. toolScores holds every lexicon tool in
// declaration order, including tools that scored zero.
struct RoutingDecision {
    QString primaryTool = QString::fromLatin1(kWebSearchTool);
    double confidence = 0.0;
    QuestionType questionType = QuestionType::General;
    bool hasLocation = false;
    std::optional<QString> location;
    std::vector<ToolScore> toolScores;

    double scoreFor(const QString& tool) const;
    double totalScore() const;
};

bool operator==(const RoutingDecision& lhs, const RoutingDecision& rhs);
bool operator!=(const RoutingDecision& lhs, const RoutingDecision& rhs);

// Reported by a tool executor after running a query.
struct ExecutionOutcome {
    bool success = false;
    bool usedFallback = false;
    bool resultEmpty = false;
    QString rawResult;
    std::optional<QString> sqlText;
};

} // namespace rw
