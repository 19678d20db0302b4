#pragma once

#include "core/shared/statement.h"

#include <QString>

#include <optional>
#include <vector>

namespace fr {

// Scorer -- relevance model for (query, statement) pairs.
//
// Implementations must be safe to call concurrently once constructed and
// must never throw from score(). prepare() may be called more than once;
// only the first call is allowed to have an effect.
class Scorer {
public:
    virtual ~Scorer() = default;

    // Finite, non-negative relevance of statement for query.
    virtual double score(const QString& query, const Statement& statement) const = 0;

    // Optional warmup over the corpus (document statistics, token caches).
    virtual void prepare(const std::vector<Statement>& corpus) { (void)corpus; }

    // Optional fast access to the tokens the scorer sees for statement.
    // nullopt means "not supported"; callers fall back to their own matching.
    virtual std::optional<std::vector<QString>> tokens(const Statement& statement) const
    {
        (void)statement;
        return std::nullopt;
    }
};

} // namespace fr
