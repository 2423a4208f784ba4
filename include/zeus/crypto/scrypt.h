// ZEUS - Scrypt Proof-of-Work Hash
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Litecoin-style scrypt(N=1024, r=1, p=1) as computed by Zeus scrypt ASICs.
// The 80-byte header is both password and salt.

#ifndef ZEUS_CRYPTO_SCRYPT_H
#define ZEUS_CRYPTO_SCRYPT_H

#include "zeus/core/types.h"

#include <cstddef>
#include <cstdint>

namespace zeus {

/// Scrypt parameters used by the network
struct ScryptParams {
    uint64_t N{1024};
    uint64_t r{1};
    uint64_t p{1};
    /// Memory ceiling passed to the KDF (0 = OpenSSL default)
    uint64_t maxMem{0};
};

/// Compute scrypt over data with data as salt, producing 32 bytes
Hash256 ScryptHash(const Byte* data, size_t len,
                   const ScryptParams& params = ScryptParams());

/// Compute scrypt with an explicit salt
Hash256 ScryptHash(const Byte* data, size_t len,
                   const Byte* salt, size_t saltLen,
                   const ScryptParams& params = ScryptParams());

} // namespace zeus

#endif // ZEUS_CRYPTO_SCRYPT_H
