#pragma once

#include "core/shared/statement.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace fr {

template <typename T>
struct Scored {
    T item;
    double score = 0.0;

    Scored() = default;
    Scored(T value, double s)
        : item(std::move(value))
        , score(s)
    {
    }
};

using ScoredStatement = Scored<Statement>;

// Sort by (score DESC, id ASC). Callers must filter non-finite scores first.
inline void rankScored(std::vector<ScoredStatement>& scored)
{
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredStatement& a, const ScoredStatement& b) {
                         if (a.score != b.score) {
                             return a.score > b.score; // Descending
                         }
                         return idLess(a.item, b.item); // Ascending (tie-break)
                     });
}

} // namespace fr
