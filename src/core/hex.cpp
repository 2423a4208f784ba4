// ZEUS - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/core/hex.h"

#include <stdexcept>

namespace zeus {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";
    
    int Nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }
    
    std::vector<uint8_t> out;
    out.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = Nibble(hex[i]);
        int low = Nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (Nibble(c) < 0) return false;
    }
    return true;
}

} // namespace zeus
