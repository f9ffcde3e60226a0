//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/scalar_codecs.hpp
//
// Codecs for the primitive raw types
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/value_codec.hpp"

namespace gatewire {

// tinyint, smallint, int, bigint, counter and timestamp. The 64-bit wire
// integer is range-checked against the width of the raw type.
class IntegerCodec : public ValueCodec {
public:
    explicit IntegerCodec(RawType raw);

    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;

private:
    RawType raw_;
    int width_;
    int64_t min_;
    int64_t max_;
};

class FloatCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class DoubleCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class BooleanCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

// ascii (7-bit only) and text/varchar (UTF-8)
class StringCodec : public ValueCodec {
public:
    explicit StringCodec(bool ascii_only) : ascii_only_(ascii_only) {}

    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;

private:
    bool Validate(const uint8_t* data, size_t len, MarshalError& error) const;

    bool ascii_only_;
};

class BlobCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

// uuid, and timeuuid which only accepts version 1
class UuidCodec : public ValueCodec {
public:
    explicit UuidCodec(bool time_based) : time_based_(time_based) {}

    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;

private:
    bool time_based_;
};

class InetCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class DateCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class TimeCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class DecimalCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class VarintCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

class DurationCodec : public ValueCodec {
public:
    bool Encode(const Value& value, const ColumnType& type, Bytes& out,
                MarshalError& error) const override;
    bool Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                MarshalError& error) const override;
};

} // namespace gatewire
