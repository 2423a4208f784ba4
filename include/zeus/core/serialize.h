// ZEUS - Serialization Header
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Little-endian binary serialization used for checkpoints.

#ifndef ZEUS_CORE_SERIALIZE_H
#define ZEUS_CORE_SERIALIZE_H

#include "zeus/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace zeus {

/// Maximum size for serialized strings/vectors
static constexpr uint64_t MAX_SERIALIZE_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}
    
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    
    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    
    bool empty() const noexcept { return size() == 0; }
    
    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }
    
    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }
    
    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    /// Copy of the unread bytes as a std::string
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Integers (little-endian)
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    Byte buf[4];
    WriteLE32(buf, obj);
    s.Write(buf, 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    Byte buf[8];
    WriteLE64(buf, obj);
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    Byte buf[4];
    s.Read(buf, 4);
    return ReadLE32(buf);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    Byte buf[8];
    s.Read(buf, 8);
    return static_cast<uint64_t>(ReadLE32(buf)) |
           (static_cast<uint64_t>(ReadLE32(buf + 4)) << 32);
}

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// IEEE-754 bit pattern
template<typename Stream>
inline void Serialize(Stream& s, double a) {
    uint64_t bits;
    std::memcpy(&bits, &a, sizeof(bits));
    ser_writedata64(s, bits);
}

template<typename Stream>
inline void Unserialize(Stream& s, double& a) {
    uint64_t bits = ser_readdata64(s);
    std::memcpy(&a, &bits, sizeof(a));
}

// ============================================================================
// Strings (u32 length prefix)
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    ser_writedata32(s, static_cast<uint32_t>(str.size()));
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint32_t size = ser_readdata32(s);
    if (size > MAX_SERIALIZE_SIZE) {
        throw std::ios_base::failure("Unserialize(): string too large");
    }
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace zeus

#endif // ZEUS_CORE_SERIALIZE_H
