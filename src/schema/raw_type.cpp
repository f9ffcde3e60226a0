//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/raw_type.cpp
//
// Raw type name and id tables
//===----------------------------------------------------------------------===//

#include "schema/raw_type.hpp"
#include <parallel_hashmap/phmap.h>
#include <algorithm>
#include <cctype>

namespace gatewire {

const char* RawTypeName(RawType raw) {
    switch (raw) {
        case RawType::CUSTOM:    return "custom";
        case RawType::ASCII:     return "ascii";
        case RawType::BIGINT:    return "bigint";
        case RawType::BLOB:      return "blob";
        case RawType::BOOLEAN:   return "boolean";
        case RawType::COUNTER:   return "counter";
        case RawType::DECIMAL:   return "decimal";
        case RawType::DOUBLE:    return "double";
        case RawType::FLOAT:     return "float";
        case RawType::INT:       return "int";
        case RawType::TIMESTAMP: return "timestamp";
        case RawType::UUID:      return "uuid";
        case RawType::TEXT:      return "text";
        case RawType::VARINT:    return "varint";
        case RawType::TIMEUUID:  return "timeuuid";
        case RawType::INET:      return "inet";
        case RawType::DATE:      return "date";
        case RawType::TIME:      return "time";
        case RawType::SMALLINT:  return "smallint";
        case RawType::TINYINT:   return "tinyint";
        case RawType::DURATION:  return "duration";
        case RawType::LIST:      return "list";
        case RawType::MAP:       return "map";
        case RawType::SET:       return "set";
        case RawType::UDT:       return "udt";
        case RawType::TUPLE:     return "tuple";
    }
    return "unknown";
}

namespace {

const phmap::flat_hash_map<std::string, RawType>& NameTable() {
    static const phmap::flat_hash_map<std::string, RawType> table = {
        {"custom", RawType::CUSTOM},
        {"ascii", RawType::ASCII},
        {"bigint", RawType::BIGINT},
        {"blob", RawType::BLOB},
        {"boolean", RawType::BOOLEAN},
        {"counter", RawType::COUNTER},
        {"decimal", RawType::DECIMAL},
        {"double", RawType::DOUBLE},
        {"float", RawType::FLOAT},
        {"int", RawType::INT},
        {"timestamp", RawType::TIMESTAMP},
        {"uuid", RawType::UUID},
        {"text", RawType::TEXT},
        {"varchar", RawType::TEXT},
        {"varint", RawType::VARINT},
        {"timeuuid", RawType::TIMEUUID},
        {"inet", RawType::INET},
        {"date", RawType::DATE},
        {"time", RawType::TIME},
        {"smallint", RawType::SMALLINT},
        {"tinyint", RawType::TINYINT},
        {"duration", RawType::DURATION},
        {"list", RawType::LIST},
        {"map", RawType::MAP},
        {"set", RawType::SET},
        {"udt", RawType::UDT},
        {"tuple", RawType::TUPLE},
    };
    return table;
}

const phmap::flat_hash_map<int32_t, RawType>& IdTable() {
    static const phmap::flat_hash_map<int32_t, RawType> table = [] {
        phmap::flat_hash_map<int32_t, RawType> ids;
        for (const auto& entry : NameTable()) {
            ids.emplace(RawTypeId(entry.second), entry.second);
        }
        return ids;
    }();
    return table;
}

} // namespace

bool RawTypeFromName(const std::string& name, RawType& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = NameTable();
    auto it = table.find(lower);
    if (it == table.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool RawTypeFromId(int32_t id, RawType& out) {
    const auto& table = IdTable();
    auto it = table.find(id);
    if (it == table.end()) {
        return false;
    }
    out = it->second;
    return true;
}

} // namespace gatewire
