#include "core/retrieval/in_memory_knowledge_base.h"
#include "core/shared/logging.h"

#include <cmath>
#include <mutex>
#include <utility>

namespace fr {

bool InMemoryKnowledgeBase::upsert(Statement statement)
{
    statement.id = statement.id.trimmed();
    if (statement.id.isEmpty() || statement.isBlank()) {
        LOG_WARN(frCore, "upsert: rejected statement without id or text");
        return false;
    }
    if (!std::isfinite(statement.weight) || statement.weight < 0.0) {
        statement.weight = 1.0;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_byId.find(statement.id);
    if (it == m_byId.end()) {
        const QString id = statement.id;
        m_byId.emplace(id, std::move(statement));
        return true;
    }
    if (it->second == statement) {
        return false;
    }
    it->second = std::move(statement);
    return true;
}

std::optional<Statement> InMemoryKnowledgeBase::get(const QString& id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_byId.find(id.trimmed());
    if (it == m_byId.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryKnowledgeBase::remove(const QString& id)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_byId.erase(id.trimmed()) > 0;
}

int InMemoryKnowledgeBase::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_byId.size());
}

std::vector<Statement> InMemoryKnowledgeBase::snapshotSorted() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<Statement> out;
    out.reserve(m_byId.size());
    for (const auto& [id, statement] : m_byId) {
        out.push_back(statement);
    }
    return out;
}

} // namespace fr
