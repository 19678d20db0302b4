#pragma once

#include <QString>

#include <cstdint>

namespace fr {

// Deterministic 64-bit mixing used for cache keys and derived seeds.
// Stable across processes and platforms (no per-process hash seed).
uint64_t mixSeed(uint64_t a, uint64_t b);

// First 8 bytes (big-endian) of the SHA-256 of the UTF-8 text.
uint64_t stableHash(const QString& text);

// Cache key of a (seed, query) pair.
uint64_t queryFingerprint(uint64_t seed, const QString& query);

} // namespace fr
