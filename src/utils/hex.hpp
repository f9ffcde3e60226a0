//===----------------------------------------------------------------------===//
//                         GateWire
//
// utils/hex.hpp
//
// Hex helpers for blobs and the codec tool
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gatewire {

inline std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += DIGITS[data[i] >> 4];
        out += DIGITS[data[i] & 0x0F];
    }
    return out;
}

inline std::string BytesToHex(const std::vector<uint8_t>& bytes) {
    return BytesToHex(bytes.data(), bytes.size());
}

inline int HexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Accepts an optional "0x" prefix
inline bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        return false;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = HexDigitValue(hex[i]);
        int lo = HexDigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

} // namespace gatewire
