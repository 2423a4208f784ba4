// ZEUS - Proof-of-Work Primitives
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Challenge payloads are 76-byte block header templates. A candidate nonce is
// appended little-endian to form the 80-byte header that Zeus scrypt ASICs
// hash. The 32-bit difficulty target bounds the most significant word of
// the resulting 256-bit hash.

#ifndef ZEUS_PROTOCOL_POW_H
#define ZEUS_PROTOCOL_POW_H

#include "zeus/core/random.h"
#include "zeus/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace zeus {
namespace protocol {

// ============================================================================
// Constants
// ============================================================================

/// version(4) + prev(32) + merkle(32) + time(4) + bits(4)
constexpr size_t HEADER_TEMPLATE_SIZE = 76;

/// Template plus the 4-byte nonce
constexpr size_t HEADER_SIZE = 80;

constexpr uint32_t HEADER_VERSION = 1;

/// Size of the full nonce space
constexpr uint64_t NONCE_SPACE = 0x100000000ULL;

// ============================================================================
// Algorithm Selection
// ============================================================================

enum class PowAlgorithm {
    Scrypt,     // scrypt(N=1024, r=1, p=1), the Zeus ASIC algorithm
    Sha256d     // double SHA-256
};

const char* PowAlgorithmToString(PowAlgorithm algo);
std::optional<PowAlgorithm> PowAlgorithmFromString(const std::string& str);

// ============================================================================
// Header Construction
// ============================================================================

/**
 * Build a fresh header template.
 * 
 * @param target Difficulty target stored in the bits field
 * @param timestamp Seconds since epoch stored in the time field
 * @param rng Source for the previous-hash and merkle seed bytes
 */
Bytes BuildHeaderTemplate(uint32_t target, int64_t timestamp, RandomSource& rng);

/// payload || LE32(nonce)
Bytes BuildHeader(const Bytes& payload, uint32_t nonce);

// ============================================================================
// Hashing
// ============================================================================

/// Hash a complete header with the selected algorithm
Hash256 HashHeader(const Byte* header, size_t len, PowAlgorithm algo);

/// hash(payload, nonce)
Hash256 ComputePowHash(const Bytes& payload, uint32_t nonce, PowAlgorithm algo);

/// Most significant 32 bits of a little-endian 256-bit hash
inline uint32_t HashHighWord(const Hash256& hash) {
    return ReadLE32(hash.data() + 28);
}

/// True iff hash <= (target << 224 | 2^224 - 1)
inline bool MeetsTarget(const Hash256& hash, uint32_t target) {
    return HashHighWord(hash) <= target;
}

/// Recompute and compare in one step
bool CheckProofOfWork(const Bytes& payload, uint32_t nonce, uint32_t target,
                      PowAlgorithm algo);

/// Mean number of hashes needed to find a nonce meeting target
double ExpectedHashes(uint32_t target);

// ============================================================================
// Challenge Identity
// ============================================================================

/// hex(SHA256(payload || LE32(target) || LE64(issuedAtMs)))
std::string ComputeChallengeId(const Bytes& payload, uint32_t target,
                               TimestampMs issuedAtMs);

} // namespace protocol
} // namespace zeus

#endif // ZEUS_PROTOCOL_POW_H
