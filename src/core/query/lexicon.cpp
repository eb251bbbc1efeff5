#include "core/query/lexicon.h"
#include "core/query/query_normalizer.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace rw {

namespace {

constexpr double kKeywordWeight = 1.0;
constexpr double kPhraseWeight = 1.5;
constexpr double kAnalysisWeight = 3.0;

void appendTerms(std::vector<Lexicon::Term>& terms,
                 std::initializer_list<const char*> phrases,
                 double weight)
{
    for (const char* phrase : phrases) {
        terms.push_back(Lexicon::makeTerm(QString::fromLatin1(phrase), weight));
    }
}

Lexicon::ToolEntry institutionsEntry()
{
    Lexicon::ToolEntry entry;
    entry.tool = QString::fromLatin1(kInstitutionsTool);
    appendTerms(entry.terms,
                {"university", "universities", "college", "colleges", "institution",
                 "institutions", "institute", "institutes", "education", "educational",
                 "school", "schools", "academic", "student", "students", "faculty",
                 "degree", "degrees", "campus", "enrollment"},
                kKeywordWeight);
    appendTerms(entry.terms,
                {"university of", "college of", "institute of", "university in",
                 "universities in", "college in", "colleges in"},
                kPhraseWeight);
    return entry;
}

Lexicon::ToolEntry hospitalsEntry()
{
    Lexicon::ToolEntry entry;
    entry.tool = QString::fromLatin1(kHospitalsTool);
    appendTerms(entry.terms,
                {"hospital", "hospitals", "medical", "healthcare", "clinic", "clinics",
                 "doctor", "doctors", "nurse", "nurses", "patient", "patients", "bed",
                 "beds", "emergency", "surgery", "icu"},
                kKeywordWeight);
    appendTerms(entry.terms,
                {"medical college", "health center", "hospital in", "hospitals in",
                 "medical facility", "clinic in", "clinics in"},
                kPhraseWeight);
    return entry;
}

Lexicon::ToolEntry restaurantsEntry()
{
    Lexicon::ToolEntry entry;
    entry.tool = QString::fromLatin1(kRestaurantsTool);
    appendTerms(entry.terms,
                {"restaurant", "restaurants", "food", "dining", "dine", "eat", "eating",
                 "meal", "meals", "cuisine", "menu", "dish", "dishes", "cooking", "chef",
                 "cafe", "cafes"},
                kKeywordWeight);
    appendTerms(entry.terms,
                {"restaurant in", "restaurants in", "food in", "eat in", "dining in",
                 "cuisine in", "places to eat"},
                kPhraseWeight);
    return entry;
}

Lexicon::ToolEntry webSearchEntry()
{
    Lexicon::ToolEntry entry;
    entry.tool = QString::fromLatin1(kWebSearchTool);
    appendTerms(entry.terms,
                {"policy", "policies", "government", "history", "cultural", "culture",
                 "festival", "festivals", "economy", "economic", "development",
                 "statistics", "population", "weather", "news", "current", "definition",
                 "overview", "background"},
                kKeywordWeight);
    appendTerms(entry.terms,
                {"what is", "who is", "when was", "how to"},
                kPhraseWeight);
    // Economic and analytical questions are not answerable from the
    // domain tables.
    appendTerms(entry.terms,
                {"inflation", "impact", "compare", "analysis", "trend", "trends", "growth",
                 "market", "finance", "investment", "cost", "price", "prices", "budget"},
                kAnalysisWeight);
    return entry;
}

Lexicon::QuestionRule makeRule(QuestionType type, std::initializer_list<const char*> phrases)
{
    Lexicon::QuestionRule rule;
    rule.type = type;
    appendTerms(rule.phrases, phrases, kKeywordWeight);
    return rule;
}

std::optional<std::vector<Lexicon::Term>> termsFromJson(const QJsonArray& array)
{
    std::vector<Lexicon::Term> terms;
    terms.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (value.isString()) {
            terms.push_back(Lexicon::makeTerm(value.toString()));
            continue;
        }
        if (!value.isObject()) {
            return std::nullopt;
        }
        const QJsonObject obj = value.toObject();
        const QString phrase = obj.value(QStringLiteral("phrase")).toString();
        const double weight = obj.value(QStringLiteral("weight")).toDouble(kKeywordWeight);
        if (phrase.trimmed().isEmpty() || weight < 0.0) {
            return std::nullopt;
        }
        terms.push_back(Lexicon::makeTerm(phrase, weight));
    }
    return terms;
}

QJsonArray termsToJson(const std::vector<Lexicon::Term>& terms)
{
    QJsonArray array;
    for (const Lexicon::Term& term : terms) {
        QJsonObject obj;
        obj.insert(QStringLiteral("phrase"), term.phrase);
        obj.insert(QStringLiteral("weight"), term.weight);
        array.append(obj);
    }
    return array;
}

} // namespace

Lexicon::Lexicon(std::vector<ToolEntry> tools,
                 std::vector<QuestionRule> questionRules,
                 std::vector<Place> gazetteer,
                 QStringList toolPriority,
                 double positionalBonus)
    : m_tools(std::move(tools))
    , m_questionRules(std::move(questionRules))
    , m_gazetteer(std::move(gazetteer))
    , m_toolPriority(std::move(toolPriority))
    , m_positionalBonus(std::max(0.0, positionalBonus))
{
    for (ToolEntry& entry : m_tools) {
        entry.terms.erase(std::remove_if(entry.terms.begin(), entry.terms.end(),
                                         [](const Term& term) { return term.tokens.isEmpty(); }),
                          entry.terms.end());
    }
    m_gazetteer.erase(std::remove_if(m_gazetteer.begin(), m_gazetteer.end(),
                                     [](const Place& place) { return place.tokens.isEmpty(); }),
                      m_gazetteer.end());

    if (!findTool(QString::fromLatin1(kWebSearchTool))) {
        ToolEntry fallback;
        fallback.tool = QString::fromLatin1(kWebSearchTool);
        m_tools.push_back(std::move(fallback));
    }
}

Lexicon::Term Lexicon::makeTerm(const QString& phrase, double weight)
{
    const NormalizedQuery normalized = QueryNormalizer::normalize(phrase);
    Term term;
    term.phrase = normalized.normalized;
    term.tokens = normalized.tokens;
    term.weight = weight;
    return term;
}

Lexicon::Place Lexicon::makePlace(const QString& displayName)
{
    Place place;
    place.displayName = displayName.trimmed();
    place.tokens = QueryNormalizer::normalize(displayName).tokens;
    return place;
}

const Lexicon::ToolEntry* Lexicon::findTool(const QString& tool) const
{
    for (const ToolEntry& entry : m_tools) {
        if (entry.tool == tool) {
            return &entry;
        }
    }
    return nullptr;
}

Lexicon Lexicon::defaults()
{
    std::vector<ToolEntry> tools;
    tools.push_back(institutionsEntry());
    tools.push_back(hospitalsEntry());
    tools.push_back(restaurantsEntry());
    tools.push_back(webSearchEntry());

    std::vector<QuestionRule> rules;
    rules.push_back(makeRule(QuestionType::Count,
                             {"how many", "number of", "count of", "total number",
                              "how much", "quantity of"}));
    rules.push_back(makeRule(QuestionType::List,
                             {"list", "list all", "show all", "show me all", "find all",
                              "get all", "display all", "enumerate"}));
    rules.push_back(makeRule(QuestionType::Comparison,
                             {"compare", "compared", "comparison", "versus", "vs",
                              "difference between", "better than", "worse than", "best",
                              "top", "highest", "lowest", "ranking"}));
    rules.push_back(makeRule(QuestionType::Filter,
                             {"with", "without", "established after", "established before",
                              "founded after", "founded before", "more than", "less than",
                              "fewer than", "greater than", "at least", "at most", "after",
                              "before", "above", "below", "over", "under", "having"}));

    std::vector<Place> gazetteer;
    for (const char* name : {"Dhaka", "Old Dhaka", "Dhaka Cantonment", "Chattogram",
                             "Chittagong", "Rajshahi", "Khulna", "Sylhet", "Barisal",
                             "Barishal", "Rangpur", "Mymensingh", "Comilla", "Cumilla",
                             "Gazipur", "Narayanganj", "Bogura", "Jashore", "Cox's Bazar",
                             "Bangladesh"}) {
        gazetteer.push_back(makePlace(QString::fromLatin1(name)));
    }

    const QStringList priority = {
        QString::fromLatin1(kInstitutionsTool),
        QString::fromLatin1(kHospitalsTool),
        QString::fromLatin1(kRestaurantsTool),
        QString::fromLatin1(kWebSearchTool),
    };

    return Lexicon(std::move(tools), std::move(rules), std::move(gazetteer), priority);
}

std::optional<Lexicon> Lexicon::fromJson(const QJsonObject& json)
{
    const QJsonArray toolsArray = json.value(QStringLiteral("tools")).toArray();
    if (toolsArray.isEmpty()) {
        LOG_WARN(rwCore, "Lexicon JSON declares no tools");
        return std::nullopt;
    }

    std::vector<ToolEntry> tools;
    for (const QJsonValue& value : toolsArray) {
        const QJsonObject obj = value.toObject();
        ToolEntry entry;
        entry.tool = obj.value(QStringLiteral("name")).toString().trimmed();
        if (entry.tool.isEmpty()) {
            LOG_WARN(rwCore, "Lexicon JSON has a tool without a name");
            return std::nullopt;
        }
        auto terms = termsFromJson(obj.value(QStringLiteral("terms")).toArray());
        if (!terms) {
            LOG_WARN(rwCore, "Lexicon JSON has malformed terms for tool %s",
                     qUtf8Printable(entry.tool));
            return std::nullopt;
        }
        entry.terms = std::move(*terms);
        tools.push_back(std::move(entry));
    }

    std::vector<QuestionRule> rules;
    for (const QJsonValue& value : json.value(QStringLiteral("questionTypes")).toArray()) {
        const QJsonObject obj = value.toObject();
        QuestionRule rule;
        rule.type = questionTypeFromString(obj.value(QStringLiteral("type")).toString());
        auto phrases = termsFromJson(obj.value(QStringLiteral("phrases")).toArray());
        if (!phrases) {
            LOG_WARN(rwCore, "Lexicon JSON has malformed question phrases");
            return std::nullopt;
        }
        rule.phrases = std::move(*phrases);
        rules.push_back(std::move(rule));
    }

    std::vector<Place> gazetteer;
    for (const QJsonValue& value : json.value(QStringLiteral("gazetteer")).toArray()) {
        gazetteer.push_back(makePlace(value.toString()));
    }

    QStringList priority;
    for (const QJsonValue& value : json.value(QStringLiteral("toolPriority")).toArray()) {
        priority.append(value.toString().trimmed());
    }

    const double bonus = json.value(QStringLiteral("positionalBonus")).toDouble(0.25);

    return Lexicon(std::move(tools), std::move(rules), std::move(gazetteer), priority, bonus);
}

QJsonObject Lexicon::toJson() const
{
    QJsonArray toolsArray;
    for (const ToolEntry& entry : m_tools) {
        QJsonObject obj;
        obj.insert(QStringLiteral("name"), entry.tool);
        obj.insert(QStringLiteral("terms"), termsToJson(entry.terms));
        toolsArray.append(obj);
    }

    QJsonArray rulesArray;
    for (const QuestionRule& rule : m_questionRules) {
        QJsonObject obj;
        obj.insert(QStringLiteral("type"), questionTypeToString(rule.type));
        obj.insert(QStringLiteral("phrases"), termsToJson(rule.phrases));
        rulesArray.append(obj);
    }

    QJsonArray gazetteerArray;
    for (const Place& place : m_gazetteer) {
        gazetteerArray.append(place.displayName);
    }

    QJsonObject json;
    json.insert(QStringLiteral("tools"), toolsArray);
    json.insert(QStringLiteral("questionTypes"), rulesArray);
    json.insert(QStringLiteral("gazetteer"), gazetteerArray);
    json.insert(QStringLiteral("toolPriority"), QJsonArray::fromStringList(m_toolPriority));
    json.insert(QStringLiteral("positionalBonus"), m_positionalBonus);
    return json;
}

} // namespace rw
