#include "core/retrieval/fingerprint.h"

#include <QByteArray>
#include <QCryptographicHash>
#include <QtEndian>

namespace fr {

uint64_t mixSeed(uint64_t a, uint64_t b)
{
    uint64_t x = a ^ b;
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}

uint64_t stableHash(const QString& text)
{
    const QByteArray digest = QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Sha256);
    return qFromBigEndian<quint64>(digest.constData());
}

uint64_t queryFingerprint(uint64_t seed, const QString& query)
{
    return mixSeed(seed, stableHash(query));
}

} // namespace fr
