#include <QtTest/QtTest>

#include "core/query/lexicon.h"

#include <QJsonArray>

class TestLexicon : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsDeclareToolsInPriorityOrder()
    {
        const rw::Lexicon lexicon = rw::Lexicon::defaults();
        QCOMPARE(lexicon.tools().size(), size_t(4));
        QCOMPARE(lexicon.tools().at(0).tool, QStringLiteral("institutions"));
        QCOMPARE(lexicon.tools().at(1).tool, QStringLiteral("hospitals"));
        QCOMPARE(lexicon.tools().at(2).tool, QStringLiteral("restaurants"));
        QCOMPARE(lexicon.tools().at(3).tool, QStringLiteral("web_search"));
        QCOMPARE(lexicon.toolPriority(),
                 QStringList({QStringLiteral("institutions"), QStringLiteral("hospitals"),
                              QStringLiteral("restaurants"), QStringLiteral("web_search")}));
    }

    void testQuestionRulesInPriorityOrder()
    {
        const rw::Lexicon lexicon = rw::Lexicon::defaults();
        const auto& rules = lexicon.questionRules();
        QCOMPARE(rules.size(), size_t(4));
        QCOMPARE(rules.at(0).type, rw::QuestionType::Count);
        QCOMPARE(rules.at(1).type, rw::QuestionType::List);
        QCOMPARE(rules.at(2).type, rw::QuestionType::Comparison);
        QCOMPARE(rules.at(3).type, rw::QuestionType::Filter);
    }

    void testTermsAreTokenized()
    {
        const rw::Lexicon::Term term =
            rw::Lexicon::makeTerm(QStringLiteral("  Established   AFTER "), 1.5);
        QCOMPARE(term.phrase, QStringLiteral("established after"));
        QCOMPARE(term.tokens.size(), 2);
        QCOMPARE(term.weight, 1.5);

        const rw::Lexicon::Place place = rw::Lexicon::makePlace(QStringLiteral("Cox's Bazar"));
        QCOMPARE(place.displayName, QStringLiteral("Cox's Bazar"));
        QCOMPARE(place.tokens, QStringList({QStringLiteral("coxs"), QStringLiteral("bazar")}));
    }

    void testWebSearchAppendedWhenMissing()
    {
        rw::Lexicon::ToolEntry clinics;
        clinics.tool = QStringLiteral("clinics");
        clinics.terms.push_back(rw::Lexicon::makeTerm(QStringLiteral("clinic")));
        clinics.terms.push_back(rw::Lexicon::makeTerm(QStringLiteral(" ?! ")));

        const rw::Lexicon lexicon({clinics}, {}, {}, {});
        QCOMPARE(lexicon.tools().size(), size_t(2));
        QCOMPARE(lexicon.tools().back().tool, QStringLiteral("web_search"));
        QVERIFY(lexicon.tools().back().terms.empty());

        // Terms that normalize to nothing are dropped
        QCOMPARE(lexicon.findTool(QStringLiteral("clinics"))->terms.size(), size_t(1));
        QVERIFY(lexicon.findTool(QStringLiteral("museums")) == nullptr);
    }

    void testJsonRoundTripKeepsTables()
    {
        const rw::Lexicon original = rw::Lexicon::defaults();
        const auto restored = rw::Lexicon::fromJson(original.toJson());
        QVERIFY(restored.has_value());
        QCOMPARE(restored->tools().size(), original.tools().size());
        QCOMPARE(restored->gazetteer().size(), original.gazetteer().size());
        QCOMPARE(restored->toolPriority(), original.toolPriority());
        QCOMPARE(restored->positionalBonus(), original.positionalBonus());
        QCOMPARE(restored->findTool(QStringLiteral("hospitals"))->terms.size(),
                 original.findTool(QStringLiteral("hospitals"))->terms.size());
    }

    void testFromJsonAcceptsPlainStrings()
    {
        const QJsonObject json{
            {QStringLiteral("tools"), QJsonArray{QJsonObject{
                {QStringLiteral("name"), QStringLiteral("parks")},
                {QStringLiteral("terms"), QJsonArray{QStringLiteral("park"),
                    QJsonObject{{QStringLiteral("phrase"), QStringLiteral("national park")},
                                {QStringLiteral("weight"), 2.0}}}}}}},
            {QStringLiteral("gazetteer"), QJsonArray{QStringLiteral("Sylhet")}},
        };

        const auto lexicon = rw::Lexicon::fromJson(json);
        QVERIFY(lexicon.has_value());
        const rw::Lexicon::ToolEntry* parks = lexicon->findTool(QStringLiteral("parks"));
        QVERIFY(parks != nullptr);
        QCOMPARE(parks->terms.size(), size_t(2));
        QCOMPARE(parks->terms.at(1).weight, 2.0);
        QVERIFY(lexicon->findTool(QStringLiteral("web_search")) != nullptr);
        QCOMPARE(lexicon->gazetteer().size(), size_t(1));
    }

    void testFromJsonRejectsMalformedInput()
    {
        QVERIFY(!rw::Lexicon::fromJson(QJsonObject()).has_value());

        const QJsonObject unnamed{
            {QStringLiteral("tools"), QJsonArray{QJsonObject{
                {QStringLiteral("terms"), QJsonArray{QStringLiteral("park")}}}}}};
        QVERIFY(!rw::Lexicon::fromJson(unnamed).has_value());

        const QJsonObject badTerm{
            {QStringLiteral("tools"), QJsonArray{QJsonObject{
                {QStringLiteral("name"), QStringLiteral("parks")},
                {QStringLiteral("terms"), QJsonArray{42}}}}}};
        QVERIFY(!rw::Lexicon::fromJson(badTerm).has_value());

        const QJsonObject negativeWeight{
            {QStringLiteral("tools"), QJsonArray{QJsonObject{
                {QStringLiteral("name"), QStringLiteral("parks")},
                {QStringLiteral("terms"), QJsonArray{QJsonObject{
                    {QStringLiteral("phrase"), QStringLiteral("park")},
                    {QStringLiteral("weight"), -1.0}}}}}}}};
        QVERIFY(!rw::Lexicon::fromJson(negativeWeight).has_value());
    }
};

QTEST_MAIN(TestLexicon)
#include "test_lexicon.moc"
