//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/raw_type.hpp
//
// Storage engine raw type kinds and their stable ids
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace gatewire {

//===----------------------------------------------------------------------===//
// Raw Types (CQL native protocol v4 option ids)
//===----------------------------------------------------------------------===//
enum class RawType : int32_t {
    CUSTOM = 0x0000,
    ASCII = 0x0001,
    BIGINT = 0x0002,
    BLOB = 0x0003,
    BOOLEAN = 0x0004,
    COUNTER = 0x0005,
    DECIMAL = 0x0006,
    DOUBLE = 0x0007,
    FLOAT = 0x0008,
    INT = 0x0009,
    TIMESTAMP = 0x000B,
    UUID = 0x000C,
    TEXT = 0x000D,          // VARCHAR is the same type
    VARINT = 0x000E,
    TIMEUUID = 0x000F,
    INET = 0x0010,
    DATE = 0x0011,
    TIME = 0x0012,
    SMALLINT = 0x0013,
    TINYINT = 0x0014,
    DURATION = 0x0015,
    LIST = 0x0020,
    MAP = 0x0021,
    SET = 0x0022,
    UDT = 0x0030,
    TUPLE = 0x0031,
};

inline int32_t RawTypeId(RawType raw) {
    return static_cast<int32_t>(raw);
}

// Lower-case CQL name, e.g. "bigint", "list"
const char* RawTypeName(RawType raw);

// Case-insensitive lookup by CQL name; "varchar" resolves to TEXT.
bool RawTypeFromName(const std::string& name, RawType& out);

// Lookup by stable id
bool RawTypeFromId(int32_t id, RawType& out);

// True for list, set, map, tuple and udt
inline bool IsComposite(RawType raw) {
    switch (raw) {
        case RawType::LIST:
        case RawType::SET:
        case RawType::MAP:
        case RawType::TUPLE:
        case RawType::UDT:
            return true;
        default:
            return false;
    }
}

inline bool IsCollection(RawType raw) {
    return raw == RawType::LIST || raw == RawType::SET || raw == RawType::MAP;
}

//===----------------------------------------------------------------------===//
// Fixed encoded length (-1 for variable length)
//===----------------------------------------------------------------------===//
inline int32_t GetFixedLength(RawType raw) {
    switch (raw) {
        case RawType::BOOLEAN:
        case RawType::TINYINT:
            return 1;
        case RawType::SMALLINT:
            return 2;
        case RawType::INT:
        case RawType::FLOAT:
        case RawType::DATE:
            return 4;
        case RawType::BIGINT:
        case RawType::COUNTER:
        case RawType::DOUBLE:
        case RawType::TIMESTAMP:
        case RawType::TIME:
            return 8;
        case RawType::UUID:
        case RawType::TIMEUUID:
            return 16;
        default:
            return -1;
    }
}

} // namespace gatewire
