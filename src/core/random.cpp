// ZEUS - Random Number Generation Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/core/random.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>
#else
    #include <fstream>
#endif

namespace zeus {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret <= 0) return false;
        filled += static_cast<size_t>(ret);
    }
    return true;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;
#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

// ============================================================================
// Core Random Functions
// ============================================================================

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

uint64_t GetRandInt(uint64_t max) {
    return GetOsRandom().NextInt(max);
}

// ============================================================================
// RandomSource
// ============================================================================

uint64_t RandomSource::NextUint64() {
    uint64_t result;
    Fill(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

uint64_t RandomSource::NextInt(uint64_t max) {
    if (max <= 1) return 0;
    
    // Largest multiple of max that fits in 64 bits
    uint64_t threshold = (static_cast<uint64_t>(-1) / max) * max;
    uint64_t result;
    do {
        result = NextUint64();
    } while (result >= threshold);
    
    return result % max;
}

double RandomSource::NextDouble() {
    // 53 random mantissa bits
    return static_cast<double>(NextUint64() >> 11) * (1.0 / 9007199254740992.0);
}

Bytes RandomSource::NextBytes(size_t len) {
    Bytes out(len);
    Fill(out.data(), out.size());
    return out;
}

void SeededRandom::Fill(uint8_t* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t i = 0;
    while (i < len) {
        uint64_t word = engine_();
        size_t n = std::min(len - i, sizeof(word));
        std::memcpy(buf + i, &word, n);
        i += n;
    }
}

RandomSource& GetOsRandom() {
    static OsRandom instance;
    return instance;
}

} // namespace zeus
