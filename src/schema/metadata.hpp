//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/metadata.hpp
//
// Statement and result metadata handed over by the execution engine
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "schema/column_type.hpp"
#include <optional>
#include <vector>

namespace gatewire {

// Bind markers of a prepared statement, in marker order
struct PreparedMetadata {
    std::vector<Column> columns;
};

struct Prepared {
    Bytes statement_id;
    PreparedMetadata metadata;
};

struct ResultMetadata {
    std::vector<Column> columns;
    // Set when more pages are available
    std::optional<Bytes> paging_state;
};

// A page of stored rows, one buffer per column (null for a null cell)
struct Rows {
    std::vector<std::vector<BufferPtr>> rows;
    ResultMetadata result_metadata;
};

} // namespace gatewire
