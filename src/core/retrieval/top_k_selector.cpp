#include "core/retrieval/top_k_selector.h"

#include <algorithm>

namespace fr {

std::vector<Statement> TopKSelector::select(const std::vector<ScoredStatement>& ranked,
                                            int k,
                                            const ExplorationConfig& config,
                                            uint64_t seed) const
{
    Q_UNUSED(config);
    Q_UNUSED(seed);

    std::vector<Statement> out;
    if (k <= 0 || ranked.empty()) {
        return out;
    }

    const size_t limit = std::min(ranked.size(), static_cast<size_t>(k));
    out.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        out.push_back(ranked[i].item);
    }
    return out;
}

} // namespace fr
