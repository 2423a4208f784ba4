// ZEUS - Proof-of-Work Primitives Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/protocol/pow.h"
#include "zeus/core/hex.h"
#include "zeus/crypto/scrypt.h"
#include "zeus/crypto/sha256.h"

#include <algorithm>
#include <cctype>

namespace zeus {
namespace protocol {

const char* PowAlgorithmToString(PowAlgorithm algo) {
    switch (algo) {
        case PowAlgorithm::Scrypt:  return "scrypt";
        case PowAlgorithm::Sha256d: return "sha256d";
    }
    return "unknown";
}

std::optional<PowAlgorithm> PowAlgorithmFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "scrypt") return PowAlgorithm::Scrypt;
    if (lower == "sha256d") return PowAlgorithm::Sha256d;
    return std::nullopt;
}

Bytes BuildHeaderTemplate(uint32_t target, int64_t timestamp, RandomSource& rng) {
    Bytes header(HEADER_TEMPLATE_SIZE, 0);
    Byte* p = header.data();
    
    WriteLE32(p, HEADER_VERSION);
    p += 4;
    
    rng.Fill(p, 32);
    p += 32;
    
    // Merkle root commits to a fresh 64-byte seed
    Bytes seed = rng.NextBytes(64);
    Hash256 merkle = SHA256Hash(seed);
    std::copy(merkle.begin(), merkle.end(), p);
    p += 32;
    
    WriteLE32(p, static_cast<uint32_t>(timestamp));
    p += 4;
    WriteLE32(p, target);
    
    return header;
}

Bytes BuildHeader(const Bytes& payload, uint32_t nonce) {
    Bytes header(payload.size() + 4);
    std::copy(payload.begin(), payload.end(), header.begin());
    WriteLE32(header.data() + payload.size(), nonce);
    return header;
}

Hash256 HashHeader(const Byte* header, size_t len, PowAlgorithm algo) {
    switch (algo) {
        case PowAlgorithm::Scrypt:
            return ScryptHash(header, len);
        case PowAlgorithm::Sha256d:
            return DoubleSHA256(header, len);
    }
    throw std::invalid_argument("unknown PoW algorithm");
}

Hash256 ComputePowHash(const Bytes& payload, uint32_t nonce, PowAlgorithm algo) {
    Bytes header = BuildHeader(payload, nonce);
    return HashHeader(header.data(), header.size(), algo);
}

bool CheckProofOfWork(const Bytes& payload, uint32_t nonce, uint32_t target,
                      PowAlgorithm algo) {
    return MeetsTarget(ComputePowHash(payload, nonce, algo), target);
}

double ExpectedHashes(uint32_t target) {
    return static_cast<double>(NONCE_SPACE) / (static_cast<double>(target) + 1.0);
}

std::string ComputeChallengeId(const Bytes& payload, uint32_t target,
                               TimestampMs issuedAtMs) {
    Byte suffix[12];
    WriteLE32(suffix, target);
    WriteLE64(suffix + 4, static_cast<uint64_t>(issuedAtMs));
    
    SHA256 hasher;
    hasher.Write(payload.data(), payload.size()).Write(suffix, sizeof(suffix));
    Byte digest[SHA256::OUTPUT_SIZE];
    hasher.Finalize(digest);
    return BytesToHex(digest, sizeof(digest));
}

} // namespace protocol
} // namespace zeus
