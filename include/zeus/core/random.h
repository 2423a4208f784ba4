// ZEUS - Random Number Generation Header
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// OS-entropy backed random bytes plus an injectable RandomSource so that
// challenge payloads and weighted draws never depend on ambient global state.

#ifndef ZEUS_CORE_RANDOM_H
#define ZEUS_CORE_RANDOM_H

#include "zeus/core/types.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace zeus {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes (throws on failure)
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max) without modulo bias
uint64_t GetRandInt(uint64_t max);

// ============================================================================
// Random Sources
// ============================================================================

/**
 * Abstract source of randomness.
 *
 * Components that need randomness take a RandomSource& so tests can swap
 * in a seeded generator and replay a run exactly.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    
    /// Fill a buffer with random bytes
    virtual void Fill(uint8_t* buf, size_t len) = 0;
    
    /// Uniform 64-bit value
    uint64_t NextUint64();
    
    /// Uniform value in [0, max) (rejection sampling)
    uint64_t NextInt(uint64_t max);
    
    /// Uniform double in [0, 1)
    double NextDouble();
    
    /// Fresh random byte vector
    Bytes NextBytes(size_t len);
};

/// RandomSource backed by the operating system CSPRNG
class OsRandom : public RandomSource {
public:
    void Fill(uint8_t* buf, size_t len) override { GetRandBytes(buf, len); }
};

/// Deterministic RandomSource for tests and replay
class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(uint64_t seed) : engine_(seed) {}
    
    void Fill(uint8_t* buf, size_t len) override;

private:
    std::mt19937_64 engine_;
    std::mutex mutex_;
};

/// Process-wide OS random source
RandomSource& GetOsRandom();

namespace detail {

/// Get entropy from OS. Returns false on failure.
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace zeus

#endif // ZEUS_CORE_RANDOM_H
