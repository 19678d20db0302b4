#pragma once

#include "core/retrieval/knowledge_base.h"

#include <QString>

#include <map>
#include <optional>
#include <shared_mutex>

namespace fr {

// Id-keyed statement store. Snapshots are ordered by ascending id.
class InMemoryKnowledgeBase : public KnowledgeBase {
public:
    InMemoryKnowledgeBase() = default;

    InMemoryKnowledgeBase(const InMemoryKnowledgeBase&) = delete;
    InMemoryKnowledgeBase& operator=(const InMemoryKnowledgeBase&) = delete;

    // Inserts or replaces by id. Statements with a blank id or blank text are
    // rejected; non-finite or negative weights are stored as 1.0.
    // Returns true if the stored state changed.
    bool upsert(Statement statement);

    std::optional<Statement> get(const QString& id) const;
    bool remove(const QString& id);
    int size() const;

    std::vector<Statement> snapshotSorted() const override;

private:
    mutable std::shared_mutex m_mutex;
    std::map<QString, Statement> m_byId;
};

} // namespace fr
