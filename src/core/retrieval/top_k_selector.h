#pragma once

#include "core/retrieval/exploration_strategy.h"

namespace fr {

// Pure exploitation: the first k ranked candidates, in rank order.
class TopKSelector : public ExplorationStrategy {
public:
    std::vector<Statement> select(const std::vector<ScoredStatement>& ranked,
                                  int k,
                                  const ExplorationConfig& config,
                                  uint64_t seed) const override;
};

} // namespace fr
