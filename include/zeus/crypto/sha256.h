// ZEUS - SHA256 Hash Function
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Incremental SHA-256 on top of OpenSSL's EVP digest interface.

#ifndef ZEUS_CRYPTO_SHA256_H
#define ZEUS_CRYPTO_SHA256_H

#include "zeus/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

// Forward declaration keeps OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace zeus {

/// SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize and write OUTPUT_SIZE bytes. The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// SHA256 of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA256(SHA256(data))
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace zeus

#endif // ZEUS_CRYPTO_SHA256_H
