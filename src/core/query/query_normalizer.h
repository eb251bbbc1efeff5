#pragma once

#include <QString>
#include <QStringList>

namespace rw {

// Immutable per-request query. `original` is kept for display,
// `normalized` and `tokens` are what the classifier and cache see.
struct NormalizedQuery {
    QString original;
    QString normalized;
    QStringList tokens;

    bool isEmpty() const { return normalized.isEmpty(); }
};

class QueryNormalizer {
public:
    // Lowercase, drop punctuation (letters and digits survive),
    // collapse whitespace.
    static NormalizedQuery normalize(const QString& raw);

    // Split multi-question input on '?'. Empty parts are dropped and each
    // returned part is trimmed; input without '?' yields one part.
    static QStringList splitQuestions(const QString& raw);
};

} // namespace rw
