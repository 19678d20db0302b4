#pragma once

#include <QString>

namespace fr {

// A single knowledge fact. An empty id means the statement has no stable
// identity and is keyed by its text instead.
struct Statement {
    QString id;
    QString text;
    double weight = 1.0;

    bool hasId() const { return !id.trimmed().isEmpty(); }
    bool isBlank() const { return text.trimmed().isEmpty(); }

    // Relevance multiplier as seen by scorers: non-finite -> 1.0, negative -> 0.0.
    double effectiveWeight() const;

    // "id:<id>" when the id is present, "tx:<trimmed text>" otherwise.
    // Empty when neither is usable.
    QString dedupKey() const;
};

bool operator==(const Statement& lhs, const Statement& rhs);
bool operator!=(const Statement& lhs, const Statement& rhs);

// Ordering used for every score tie-break: ascending trimmed id, so a blank id
// sorts first.
bool idLess(const Statement& lhs, const Statement& rhs);

} // namespace fr
