//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/value_codec.cpp
//===----------------------------------------------------------------------===//

#include "codec/value_codec.hpp"
#include "codec/byte_writer.hpp"
#include "codec/marshal_limits.hpp"
#include "codec/value_codecs.hpp"

namespace gatewire {

bool EncodeValue(const ValueCodec& codec, const Value& value, const ColumnType& type,
                 BufferPtr& out, MarshalError& error) {
    if (value.IsNull()) {
        out = nullptr;
        return true;
    }
    if (value.IsUnset()) {
        error = MarshalError::InvalidValue("unset is not a valid value here");
        return false;
    }

    Bytes bytes;
    if (!codec.Encode(value, type, bytes, error)) {
        return false;
    }

    uint64_t max_bytes = GetMarshalLimits().max_value_bytes;
    if (bytes.size() > max_bytes) {
        error = MarshalError::InvalidValue("Encoded value of " + std::to_string(bytes.size()) +
                                           " bytes exceeds the maximum of " +
                                           std::to_string(max_bytes) + " bytes");
        return false;
    }

    out = MakeBuffer(std::move(bytes));
    return true;
}

bool DecodeValue(const ValueCodec& codec, const BufferPtr& buffer, const ColumnType& type,
                 Value& out, MarshalError& error) {
    if (!buffer) {
        out = Value::Null();
        return true;
    }
    return codec.Decode(buffer->data(), buffer->size(), type, out, error);
}

bool EncodeElement(const Value& value, const ColumnType& type, bool allow_null,
                   ByteWriter& writer, MarshalError& error) {
    if (value.IsUnset()) {
        error = MarshalError::InvalidValue("unset is not supported inside composite values");
        return false;
    }
    if (value.IsNull()) {
        if (!allow_null) {
            error = MarshalError::InvalidValue("null is not supported inside collections");
            return false;
        }
        writer.WriteNull();
        return true;
    }

    Bytes bytes;
    if (!ValueCodecs::Get(type.GetRawType()).Encode(value, type, bytes, error)) {
        return false;
    }
    if (bytes.size() > static_cast<size_t>(INT32_MAX)) {
        error = MarshalError::InvalidValue("Element of " + std::to_string(bytes.size()) +
                                           " bytes is too large");
        return false;
    }
    writer.WriteValue(bytes);
    return true;
}

bool DecodeElement(const uint8_t* data, int32_t length, const ColumnType& type,
                   Value& out, MarshalError& error) {
    if (data == nullptr) {
        out = Value::Null();
        return true;
    }
    return ValueCodecs::Get(type.GetRawType())
        .Decode(data, static_cast<size_t>(length), type, out, error);
}

} // namespace gatewire
