// ZEUS - Scrypt Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/crypto/scrypt.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace zeus {

Hash256 ScryptHash(const Byte* data, size_t len, const ScryptParams& params) {
    return ScryptHash(data, len, data, len, params);
}

Hash256 ScryptHash(const Byte* data, size_t len,
                   const Byte* salt, size_t saltLen,
                   const ScryptParams& params) {
    Byte out[32];
    int ok = EVP_PBE_scrypt(reinterpret_cast<const char*>(data), len,
                            salt, saltLen,
                            params.N, params.r, params.p, params.maxMem,
                            out, sizeof(out));
    if (ok != 1) {
        throw std::runtime_error("EVP_PBE_scrypt failed");
    }
    return Hash256(out, sizeof(out));
}

} // namespace zeus
