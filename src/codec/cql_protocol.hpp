//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/cql_protocol.hpp
//
// CQL native protocol v4 constants and byte order utilities
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace gatewire {
namespace cql {

//===----------------------------------------------------------------------===//
// Value Length Markers
//===----------------------------------------------------------------------===//
constexpr int32_t NULL_LENGTH = -1;
constexpr int32_t UNSET_LENGTH = -2;

//===----------------------------------------------------------------------===//
// Temporal Constants
//===----------------------------------------------------------------------===//

// Day number of 1970-01-01 in the unsigned date encoding
constexpr uint32_t EPOCH_DAY = 1U << 31;
constexpr int64_t NANOS_PER_DAY = 86400LL * 1000 * 1000 * 1000;

//===----------------------------------------------------------------------===//
// Byte Order Utilities
//===----------------------------------------------------------------------===//
inline uint16_t LoadBigEndian16(const uint8_t* p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

inline uint32_t LoadBigEndian32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint64_t LoadBigEndian64(const uint8_t* p) {
    return (uint64_t(LoadBigEndian32(p)) << 32) | uint64_t(LoadBigEndian32(p + 4));
}

inline void StoreBigEndian16(uint16_t value, uint8_t* p) {
    p[0] = static_cast<uint8_t>(value >> 8);
    p[1] = static_cast<uint8_t>(value);
}

inline void StoreBigEndian32(uint32_t value, uint8_t* p) {
    p[0] = static_cast<uint8_t>(value >> 24);
    p[1] = static_cast<uint8_t>(value >> 16);
    p[2] = static_cast<uint8_t>(value >> 8);
    p[3] = static_cast<uint8_t>(value);
}

inline void StoreBigEndian64(uint64_t value, uint8_t* p) {
    StoreBigEndian32(static_cast<uint32_t>(value >> 32), p);
    StoreBigEndian32(static_cast<uint32_t>(value), p + 4);
}

//===----------------------------------------------------------------------===//
// Zig-zag
//===----------------------------------------------------------------------===//
inline uint64_t ZigZagEncode(int64_t n) {
    return (static_cast<uint64_t>(n) << 1) ^ static_cast<uint64_t>(n >> 63);
}

inline int64_t ZigZagDecode(uint64_t n) {
    return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
}

} // namespace cql
} // namespace gatewire
