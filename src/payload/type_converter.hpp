//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/type_converter.hpp
//
// Conversion between catalog column types and wire type descriptors
//===----------------------------------------------------------------------===//

#pragma once

#include "error/marshal_error.hpp"
#include "schema/column_type.hpp"
#include "wire/type_spec.hpp"

namespace gatewire {

// Recursively converts a column type. Composites with the wrong number of
// parameters fail with FAILED_PRECONDITION. UDT fields are converted from
// their raw kind only, so every field becomes a basic descriptor
// (a list<int> field is reported as basic(32)).
bool ConvertType(const ColumnType& type, TypeSpec& out, MarshalError& error);

// Inverse of ConvertType for descriptors without UDT flattening. UDT
// fields come back as primitive or bare raw kinds.
bool ToColumnType(const TypeSpec& spec, ColumnType& out, MarshalError& error);

} // namespace gatewire
