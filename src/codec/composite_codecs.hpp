//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/composite_codecs.hpp
//
// Codecs for list, set, map, tuple and user-defined types. Each delegates
// its elements to the codec registered for the element's raw type.
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/value_codec.hpp"

namespace gatewire {

// list and set: [int32 n] then n x [int32 length][bytes]
class CollectionCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

// map: [int32 n] then n x (key, value). On the wire a map is a flattened
// collection [k1, v1, k2, v2, ...].
class MapCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

// tuple: positional fields, null written as length -1. Missing trailing
// fields are not written.
class TupleCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

// udt: fields in declared order; absent fields are written as null
class UdtCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

} // namespace gatewire
