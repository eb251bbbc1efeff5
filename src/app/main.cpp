#include "core/query/lexicon.h"
#include "core/routing/router.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>

#include <optional>

namespace {

std::optional<rw::Lexicon> loadLexicon(const QString& path)
{
    if (path.isEmpty()) {
        return rw::Lexicon::defaults();
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return rw::Lexicon::fromJson(doc.object());
}

QJsonObject explainAsJson(const rw::Router& router, const QString& query)
{
    const rw::RoutingDecision decision = router.route(query);

    QJsonObject scores;
    for (const rw::ToolScore& score : decision.toolScores) {
        scores[score.tool] = score.score;
    }

    QJsonArray recommendations;
    for (const rw::ToolRecommendation& rec : router.recommendTools(query)) {
        QJsonObject item;
        item[QStringLiteral("tool")] = rec.tool;
        item[QStringLiteral("score")] = rec.score;
        item[QStringLiteral("share")] = rec.share;
        recommendations.append(item);
    }

    QJsonObject json;
    json[QStringLiteral("query")] = query;
    json[QStringLiteral("primaryTool")] = decision.primaryTool;
    json[QStringLiteral("confidence")] = decision.confidence;
    json[QStringLiteral("questionType")] = rw::questionTypeToString(decision.questionType);
    json[QStringLiteral("hasLocation")] = decision.hasLocation;
    json[QStringLiteral("location")] = decision.location ? QJsonValue(*decision.location)
                                                         : QJsonValue();
    json[QStringLiteral("toolScores")] = scores;
    json[QStringLiteral("recommendations")] = recommendations;
    return json;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("routewise-explain"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Show how questions would be routed to the answering tools."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption jsonOption(QStringLiteral("json"),
                                        QStringLiteral("Print one JSON object per question."));
    const QCommandLineOption lexiconOption(QStringLiteral("lexicon"),
                                           QStringLiteral("Load keyword tables from <file>."),
                                           QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
                                           QStringLiteral("Enable routewise debug logging."));
    parser.addOption(jsonOption);
    parser.addOption(lexiconOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("question"),
                                 QStringLiteral("Question(s) to explain."),
                                 QStringLiteral("question..."));
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption)
                                         ? QStringLiteral("routewise.*.debug=true")
                                         : QStringLiteral("routewise.*.info=false\n"
                                                          "routewise.*.warning=false"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList questions = parser.positionalArguments();
    if (questions.isEmpty()) {
        parser.showHelp(1);
    }

    const std::optional<rw::Lexicon> lexicon = loadLexicon(parser.value(lexiconOption));
    if (!lexicon) {
        err << "Could not load lexicon from " << parser.value(lexiconOption) << Qt::endl;
        return 1;
    }

    rw::RouterSettings settings = rw::SettingsManager::load().value_or(rw::RouterSettings{});
    rw::SettingsManager::applyEnvironment(settings);
    // Routing only: no tool runs, so there is nothing to cache.
    settings.cacheEnabled = false;

    rw::Router router(*lexicon, settings, rw::ToolRegistry{});

    for (const QString& question : questions) {
        if (parser.isSet(jsonOption)) {
            out << QJsonDocument(explainAsJson(router, question)).toJson(QJsonDocument::Compact)
                << Qt::endl;
            continue;
        }

        out << router.explainRouting(question) << Qt::endl;
        const auto recommendations = router.recommendTools(question);
        if (!recommendations.empty()) {
            out << "Recommended:" << Qt::endl;
            for (const rw::ToolRecommendation& rec : recommendations) {
                out << "  " << rec.tool << " ("
                    << QString::number(rec.share * 100.0, 'f', 0) << "%)" << Qt::endl;
            }
        }
        out << Qt::endl;
    }

    return 0;
}
