//===----------------------------------------------------------------------===//
//                         GateWire
//
// common.hpp
//
// Common definitions shared by the marshalling layer
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace gatewire {

// Raw byte sequence
using Bytes = std::vector<uint8_t>;

// Immutable shared buffer handed between the binder, the execution
// collaborator and the projector. A null pointer stands for a null value.
using BufferPtr = std::shared_ptr<const Bytes>;

inline BufferPtr MakeBuffer(Bytes bytes) {
    return std::make_shared<const Bytes>(std::move(bytes));
}

inline BufferPtr MakeBuffer(std::initializer_list<uint8_t> bytes) {
    return std::make_shared<const Bytes>(bytes);
}

// Forward declarations
class Value;
class ColumnType;
class TypeSpec;
class ValueCodec;
struct Column;
struct MarshalError;
struct MarshalConfig;

// Constants
constexpr uint32_t DEFAULT_MAX_NESTING_DEPTH = 32;
constexpr uint32_t DEFAULT_MAX_COLLECTION_ELEMENTS = 1024 * 1024;
constexpr uint64_t DEFAULT_MAX_VALUE_BYTES = 256ULL * 1024 * 1024;  // 256MB

} // namespace gatewire
