// ZEUS - Core Types Header
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Fundamental types shared by the validator and miner sides.

#ifndef ZEUS_CORE_TYPES_H
#define ZEUS_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace zeus {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Byte buffer
using Bytes = std::vector<Byte>;

/// Wall-clock timestamp in milliseconds since the Unix epoch
using TimestampMs = int64_t;

/// Miner identifier (hotkey, uid or operator-chosen name)
using MinerId = std::string;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp (seconds)
inline int64_t GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline TimestampMs GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Little-endian helpers
// ============================================================================

inline uint32_t ReadLE32(const Byte* ptr) {
    return static_cast<uint32_t>(ptr[0]) |
           (static_cast<uint32_t>(ptr[1]) << 8) |
           (static_cast<uint32_t>(ptr[2]) << 16) |
           (static_cast<uint32_t>(ptr[3]) << 24);
}

inline void WriteLE32(Byte* ptr, uint32_t val) {
    ptr[0] = static_cast<Byte>(val);
    ptr[1] = static_cast<Byte>(val >> 8);
    ptr[2] = static_cast<Byte>(val >> 16);
    ptr[3] = static_cast<Byte>(val >> 24);
}

inline void WriteLE64(Byte* ptr, uint64_t val) {
    WriteLE32(ptr, static_cast<uint32_t>(val));
    WriteLE32(ptr + 4, static_cast<uint32_t>(val >> 32));
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size hash stored little-endian (byte 0 is least significant)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }
    
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    void SetNull() noexcept { data_.fill(0); }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    /// Numeric comparison (most significant byte is stored last)
    bool operator<(const BaseHash& other) const noexcept {
        for (size_t i = SIZE; i-- > 0;) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }
    
    /// Hex of the raw byte order (byte 0 first)
    std::string ToHex() const;
    
    /// Parse hex produced by ToHex()
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace zeus

#endif // ZEUS_CORE_TYPES_H
