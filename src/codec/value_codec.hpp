//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/value_codec.hpp
//
// Encoding of wire values into storage engine bytes and back
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "error/marshal_error.hpp"
#include "schema/column_type.hpp"
#include "wire/value.hpp"

namespace gatewire {

class ByteWriter;

//===----------------------------------------------------------------------===//
// Value Codec
//===----------------------------------------------------------------------===//

// Codec for one raw type. Implementations are stateless and shared by all
// threads. Encode and Decode never see the null or unset variants; those are
// handled by EncodeValue / DecodeValue and by the composite codecs.
class ValueCodec {
public:
    virtual ~ValueCodec() = default;

    // Appends the encoding of value to out. Fails with INVALID_VALUE when the
    // value does not match the shape of type.
    virtual bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                        MarshalError& error) const = 0;

    // Decodes exactly len bytes. Fails with INVALID_VALUE on truncated input,
    // trailing bytes or inconsistent counts.
    virtual bool Decode(const uint8_t* data, size_t len, const ColumnType& type,
                        Value& out, MarshalError& error) const = 0;
};

//===----------------------------------------------------------------------===//
// Null-aware entry points
//===----------------------------------------------------------------------===//

// Null encodes to a null buffer without consulting the codec. Unset is
// rejected; callers substitute their own sentinel before reaching here.
bool EncodeValue(const ValueCodec& codec, const Value& value, const ColumnType& type,
                 BufferPtr& out, MarshalError& error);

// A null buffer decodes to Value::Null()
bool DecodeValue(const ValueCodec& codec, const BufferPtr& buffer, const ColumnType& type,
                 Value& out, MarshalError& error);

//===----------------------------------------------------------------------===//
// Element helpers used by the composite codecs
//===----------------------------------------------------------------------===//

// Writes [int32 length][bytes] for value, looking up the codec of type.
// Null is written as length -1 when allow_null is set.
bool EncodeElement(const Value& value, const ColumnType& type, bool allow_null,
                   ByteWriter& writer, MarshalError& error);

// Decodes one element; a null data pointer yields Value::Null()
bool DecodeElement(const uint8_t* data, int32_t length, const ColumnType& type,
                   Value& out, MarshalError& error);

} // namespace gatewire
