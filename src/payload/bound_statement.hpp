//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/bound_statement.hpp
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gatewire {

// Result of binding client values against a prepared statement
struct BoundStatement {
    Bytes statement_id;
    // One slot per bind marker: encoded bytes, null, or the caller's unset
    // sentinel (same pointer)
    std::vector<BufferPtr> values;
    // Names in the order the client supplied them; absent for positional binds
    std::optional<std::vector<std::string>> bound_names;
};

} // namespace gatewire
