//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/result_set.hpp
//
// Request and response payloads of the wire API
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "wire/type_spec.hpp"
#include "wire/value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gatewire {

//===----------------------------------------------------------------------===//
// Bind Values
//===----------------------------------------------------------------------===//
struct Values {
    std::vector<Value> values;
    // Empty for positional binding
    std::vector<std::string> value_names;
};

//===----------------------------------------------------------------------===//
// Query Parameters
//===----------------------------------------------------------------------===//
struct QueryParameters {
    bool skip_metadata = false;
    std::optional<int32_t> page_size;
    std::optional<Bytes> paging_state;
};

//===----------------------------------------------------------------------===//
// Result Set
//===----------------------------------------------------------------------===//
struct ColumnSpec {
    std::string name;
    TypeSpec type;

    bool operator==(const ColumnSpec& other) const {
        return name == other.name && type == other.type;
    }
};

struct Row {
    std::vector<Value> values;
};

struct ResultSet {
    // Absent when the client asked to skip metadata
    std::optional<std::vector<ColumnSpec>> columns;
    std::vector<Row> rows;
    std::optional<Bytes> paging_state;
    // Rows in this page, set together with paging_state
    std::optional<int32_t> page_size;
};

} // namespace gatewire
