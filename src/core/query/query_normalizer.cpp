#include "core/query/query_normalizer.h"

namespace rw {

namespace {

bool isApostrophe(QChar ch)
{
    switch (ch.unicode()) {
    case '\'':
    case '`':
    case 0x2018:
    case 0x2019:
        return true;
    default:
        return false;
    }
}

} // namespace

NormalizedQuery QueryNormalizer::normalize(const QString& raw)
{
    NormalizedQuery result;
    result.original = raw;

    const QString working = raw.trimmed();

    QString normalized;
    normalized.reserve(working.size());

    for (QChar ch : working) {
        // "Cox's" and "Coxs" must normalize to the same token.
        if (isApostrophe(ch)) {
            continue;
        }

        if (!ch.isLetterOrNumber()) {
            ch = QLatin1Char(' ');
        }

        if (ch.isSpace()) {
            if (normalized.isEmpty() || normalized.back() == QLatin1Char(' ')) {
                continue;
            }
            normalized.append(QLatin1Char(' '));
            continue;
        }

        normalized.append(ch.toLower());
    }

    result.normalized = normalized.trimmed();
    if (!result.normalized.isEmpty()) {
        result.tokens = result.normalized.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    }
    return result;
}

QStringList QueryNormalizer::splitQuestions(const QString& raw)
{
    QStringList parts;
    const QStringList pieces = raw.split(QLatin1Char('?'), Qt::SkipEmptyParts);
    for (const QString& piece : pieces) {
        const QString trimmed = piece.trimmed();
        if (!trimmed.isEmpty()) {
            parts.append(trimmed);
        }
    }
    return parts;
}

} // namespace rw
