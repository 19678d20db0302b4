#pragma once

#include "core/shared/statement.h"

#include <vector>

namespace fr {

// Source of statements for retrieval. The retriever only ever reads
// snapshots; ownership and persistence stay with the implementation.
class KnowledgeBase {
public:
    virtual ~KnowledgeBase() = default;

    // Must return the same order for the same underlying state. The order
    // decides tie-breaks and which statements fall under the per-iteration
    // candidate cap.
    virtual std::vector<Statement> snapshotSorted() const = 0;
};

} // namespace fr
