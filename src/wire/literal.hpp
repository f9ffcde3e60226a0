//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/literal.hpp
//
// Parsing of scalar literals into wire values
//===----------------------------------------------------------------------===//

#pragma once

#include "error/marshal_error.hpp"
#include "schema/column_type.hpp"
#include "wire/value.hpp"
#include <string>

namespace gatewire {

// Parses a literal of a primitive type into the wire value the codecs
// expect:
//   integers, timestamp    decimal digits with optional sign
//   float, double          anything strtod accepts
//   boolean                true / false
//   blob                   hex, optional 0x prefix
//   uuid, timeuuid         8-4-4-4-12 hex
//   inet                   dotted IPv4 or IPv6
//   date                   YYYY-MM-DD
//   time                   HH:MM:SS[.fraction]
//   decimal                [-]digits[.digits]
//   varint                 [-]digits
//   duration               e.g. 1y2mo3w4d5h6m7s8ms9us10ns, optional leading -
// Composite types are rejected with INVALID_ARGUMENT.
bool ParseLiteral(const std::string& text, const ColumnType& type, Value& out,
                  MarshalError& error);

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day);

} // namespace gatewire
