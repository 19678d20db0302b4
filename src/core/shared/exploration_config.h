#pragma once

namespace fr {

// Knobs of the multi-iteration retrieval loop. Read-only for the retriever and
// forwarded untouched to the exploration strategy.
struct ExplorationConfig {
    int iterations = 3;
    int candidateGateMinTokenLen = 3;
    int maxCandidatesPerIter = 120000;
    double minScore = 1e-9;
    int refineTerms = 14;
    double iterationDecay = 0.72;   // (0, 1]
    double qualityFloor = 0.0;      // 0 disables adaptive precision

    bool isValid() const;

    // Copy with every out-of-range field replaced by its default.
    ExplorationConfig sanitized() const;
};

} // namespace fr
