#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace rw {

// Lexicon -- immutable keyword tables used by the classifier.
//
// Holds the weighted keyword/phrase table of every tool, the
// priority-ordered question-type phrases, and the location gazetteer.
// Every phrase is normalized and tokenized once at construction so that
// matching works on whole tokens only ("rated" never matches "rate").
//
// A Lexicon is built once at startup and shared by const reference;
// it has no mutable state and is safe to read from any thread.
class Lexicon {
public:
    struct Term {
        QString phrase;
        QStringList tokens;
        double weight = 1.0;
    };

    struct ToolEntry {
        QString tool;
        std::vector<Term> terms;
    };

    // Rules are evaluated in order; the first rule with a matching
    // phrase decides the question type.
    struct QuestionRule {
        QuestionType type = QuestionType::General;
        std::vector<Term> phrases;
    };

    struct Place {
        QString displayName;
        QStringList tokens;
    };

    // Tools keep their declaration order. A web_search entry is appended
    // when the table does not declare one, so the universal fallback is
    // always a candidate.
    Lexicon(std::vector<ToolEntry> tools,
            std::vector<QuestionRule> questionRules,
            std::vector<Place> gazetteer,
            QStringList toolPriority,
            double positionalBonus = 0.25);

    // Built-in tables for the institutions / hospitals / restaurants
    // domains plus general web search.
    static Lexicon defaults();

    // Parse a lexicon from JSON. Returns nullopt when the document has no
    // tools or a malformed section.
    static std::optional<Lexicon> fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    static Term makeTerm(const QString& phrase, double weight = 1.0);
    static Place makePlace(const QString& displayName);

    const std::vector<ToolEntry>& tools() const { return m_tools; }
    const ToolEntry* findTool(const QString& tool) const;
    const std::vector<QuestionRule>& questionRules() const { return m_questionRules; }
    const std::vector<Place>& gazetteer() const { return m_gazetteer; }
    const QStringList& toolPriority() const { return m_toolPriority; }

    // Fraction of a term's weight added when the match starts in the
    // first third of the query.
    double positionalBonus() const { return m_positionalBonus; }

private:
    std::vector<ToolEntry> m_tools;
    std::vector<QuestionRule> m_questionRules;
    std::vector<Place> m_gazetteer;
    QStringList m_toolPriority;
    double m_positionalBonus = 0.25;
};

} // namespace rw
