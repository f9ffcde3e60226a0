//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/type_parser.hpp
//
// CQL type string parser
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/column_type.hpp"
#include "error/marshal_error.hpp"
#include <string>

namespace gatewire {

// Parses a CQL type such as "map<text, frozen<list<int>>>" or
// "tuple<int, text>". Names are case-insensitive and whitespace is ignored.
// User-defined types cannot be named here since resolving them needs the
// schema catalog. Failures are INVALID_ARGUMENT.
bool ParseColumnType(const std::string& text, ColumnType& out, MarshalError& error);

} // namespace gatewire
