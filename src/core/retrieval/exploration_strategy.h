#pragma once

#include "core/shared/exploration_config.h"
#include "core/shared/scored.h"

#include <cstdint>
#include <vector>

namespace fr {

// Turns a fully ranked candidate list into the final result list. Owns every
// explore/exploit decision; the retriever treats it as a deterministic
// function of its arguments.
class ExplorationStrategy {
public:
    virtual ~ExplorationStrategy() = default;

    // ranked is sorted by (score DESC, id ASC) and holds only finite scores.
    virtual std::vector<Statement> select(const std::vector<ScoredStatement>& ranked,
                                          int k,
                                          const ExplorationConfig& config,
                                          uint64_t seed) const = 0;
};

} // namespace fr
