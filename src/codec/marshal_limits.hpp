//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/marshal_limits.hpp
//
// Safety limits applied while parsing types and decoding values
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace gatewire {

struct MarshalLimits {
    // Deepest type nesting accepted by the type parser
    uint32_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
    // Largest element/entry count of a list, set or map
    uint32_t max_collection_elements = DEFAULT_MAX_COLLECTION_ELEMENTS;
    // Largest single encoded value
    uint64_t max_value_bytes = DEFAULT_MAX_VALUE_BYTES;
};

// Active limits. Installed once at startup, before any request is served;
// read-only afterwards.
const MarshalLimits& GetMarshalLimits();
void SetMarshalLimits(const MarshalLimits& limits);

} // namespace gatewire
