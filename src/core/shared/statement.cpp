#include "core/shared/statement.h"

#include <cmath>

namespace fr {

double Statement::effectiveWeight() const
{
    if (!std::isfinite(weight)) {
        return 1.0;
    }
    return weight < 0.0 ? 0.0 : weight;
}

QString Statement::dedupKey() const
{
    if (hasId()) {
        return QStringLiteral("id:") + id;
    }
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    return QStringLiteral("tx:") + trimmed;
}

bool operator==(const Statement& lhs, const Statement& rhs)
{
    return lhs.id == rhs.id && lhs.text == rhs.text
           && (lhs.weight == rhs.weight
               || (std::isnan(lhs.weight) && std::isnan(rhs.weight)));
}

bool operator!=(const Statement& lhs, const Statement& rhs)
{
    return !(lhs == rhs);
}

bool idLess(const Statement& lhs, const Statement& rhs)
{
    return lhs.id.trimmed() < rhs.id.trimmed();
}

} // namespace fr
