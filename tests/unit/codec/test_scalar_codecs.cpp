//===----------------------------------------------------------------------===//
//                         GateWire - Unit Tests
//
// tests/unit/codec/test_scalar_codecs.cpp
//
// Unit tests for primitive value codecs
//===----------------------------------------------------------------------===//

#include "codec/scalar_codecs.hpp"
#include "codec/cql_protocol.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace gatewire;

static Bytes MustEncode(const ValueCodec& codec, const Value& value, RawType raw) {
    Bytes out;
    MarshalError error;
    bool ok = codec.Encode(value, ColumnType(raw), out, error);
    if (!ok) {
        std::cerr << "    unexpected failure: " << error.ToString() << std::endl;
    }
    assert(ok);
    return out;
}

static std::string EncodeError(const ValueCodec& codec, const Value& value, RawType raw) {
    Bytes out;
    MarshalError error;
    assert(!codec.Encode(value, ColumnType(raw), out, error));
    assert(error.code == ErrorCode::INVALID_VALUE);
    return error.message;
}

static Value MustDecode(const ValueCodec& codec, const Bytes& bytes, RawType raw) {
    Value out;
    MarshalError error;
    bool ok = codec.Decode(bytes.data(), bytes.size(), ColumnType(raw), out, error);
    if (!ok) {
        std::cerr << "    unexpected failure: " << error.ToString() << std::endl;
    }
    assert(ok);
    return out;
}

static std::string DecodeError(const ValueCodec& codec, const Bytes& bytes, RawType raw) {
    Value out;
    MarshalError error;
    assert(!codec.Decode(bytes.data(), bytes.size(), ColumnType(raw), out, error));
    assert(error.code == ErrorCode::INVALID_VALUE);
    return error.message;
}

//===----------------------------------------------------------------------===//
// Numeric Tests
//===----------------------------------------------------------------------===//

void TestIntegers() {
    std::cout << "  Testing integer widths..." << std::endl;

    IntegerCodec tinyint(RawType::TINYINT);
    IntegerCodec smallint(RawType::SMALLINT);
    IntegerCodec int32(RawType::INT);
    IntegerCodec bigint(RawType::BIGINT);

    assert(MustEncode(tinyint, Value::Int(-1), RawType::TINYINT) == Bytes({0xFF}));
    assert(MustEncode(smallint, Value::Int(258), RawType::SMALLINT) == Bytes({0x01, 0x02}));
    assert(MustEncode(int32, Value::Int(1), RawType::INT) == Bytes({0x00, 0x00, 0x00, 0x01}));
    assert(MustEncode(bigint, Value::Int(INT64_MIN), RawType::BIGINT) ==
           Bytes({0x80, 0, 0, 0, 0, 0, 0, 0}));

    // Sign extension on decode
    assert(MustDecode(tinyint, Bytes({0x80}), RawType::TINYINT) == Value::Int(-128));
    assert(MustDecode(smallint, Bytes({0xFF, 0xFE}), RawType::SMALLINT) == Value::Int(-2));
    assert(MustDecode(int32, Bytes({0x7F, 0xFF, 0xFF, 0xFF}), RawType::INT) == Value::Int(INT32_MAX));
    assert(MustDecode(bigint, Bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}), RawType::BIGINT) ==
           Value::Int(-1));

    std::cout << "    PASSED" << std::endl;
}

void TestIntegerErrors() {
    std::cout << "  Testing integer range and length errors..." << std::endl;

    IntegerCodec tinyint(RawType::TINYINT);
    IntegerCodec int32(RawType::INT);

    assert(EncodeError(tinyint, Value::Int(128), RawType::TINYINT) ==
           "Valid range for tinyint is -128 to 127");
    assert(EncodeError(int32, Value::Int(int64_t(INT32_MAX) + 1), RawType::INT) ==
           "Valid range for int is -2147483648 to 2147483647");
    assert(EncodeError(int32, Value::String("1"), RawType::INT) == "Expected integer type");

    assert(DecodeError(int32, Bytes({0x00, 0x01}), RawType::INT) ==
           "Expected 4 bytes for a int value, but received 2");

    IntegerCodec timestamp(RawType::TIMESTAMP);
    assert(DecodeError(timestamp, Bytes(), RawType::TIMESTAMP) ==
           "Expected 8 bytes for a timestamp value, but received 0");

    std::cout << "    PASSED" << std::endl;
}

void TestFloatingPoint() {
    std::cout << "  Testing float and double..." << std::endl;

    FloatCodec float_codec;
    DoubleCodec double_codec;

    assert(MustEncode(float_codec, Value::Float(1.0f), RawType::FLOAT) ==
           Bytes({0x3F, 0x80, 0x00, 0x00}));
    assert(MustEncode(double_codec, Value::Double(-2.0), RawType::DOUBLE) ==
           Bytes({0xC0, 0x00, 0, 0, 0, 0, 0, 0}));

    Value nan = MustDecode(float_codec, Bytes({0x7F, 0xC0, 0x00, 0x00}), RawType::FLOAT);
    assert(std::isnan(nan.GetFloat()));
    assert(MustDecode(double_codec, Bytes({0x3F, 0xF8, 0, 0, 0, 0, 0, 0}), RawType::DOUBLE) ==
           Value::Double(1.5));

    assert(EncodeError(float_codec, Value::Double(1.0), RawType::FLOAT) == "Expected float type");
    assert(EncodeError(double_codec, Value::Float(1.0f), RawType::DOUBLE) == "Expected double type");
    assert(DecodeError(double_codec, Bytes({0x00}), RawType::DOUBLE) ==
           "Expected 8 bytes for a double value, but received 1");

    std::cout << "    PASSED" << std::endl;
}

void TestBoolean() {
    std::cout << "  Testing boolean..." << std::endl;

    BooleanCodec codec;
    assert(MustEncode(codec, Value::Boolean(true), RawType::BOOLEAN) == Bytes({0x01}));
    assert(MustEncode(codec, Value::Boolean(false), RawType::BOOLEAN) == Bytes({0x00}));
    // Any non-zero byte is true
    assert(MustDecode(codec, Bytes({0x02}), RawType::BOOLEAN) == Value::Boolean(true));
    assert(DecodeError(codec, Bytes({0x00, 0x01}), RawType::BOOLEAN) ==
           "Expected 1 bytes for a boolean value, but received 2");
    assert(EncodeError(codec, Value::Int(1), RawType::BOOLEAN) == "Expected boolean type");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Text and Binary Tests
//===----------------------------------------------------------------------===//

void TestStrings() {
    std::cout << "  Testing ascii and text..." << std::endl;

    StringCodec ascii(true);
    StringCodec text(false);

    assert(MustEncode(text, Value::String("h\xC3\xA9"), RawType::TEXT) == Bytes({'h', 0xC3, 0xA9}));
    assert(MustEncode(ascii, Value::String(""), RawType::ASCII).empty());

    assert(EncodeError(ascii, Value::String("h\xC3\xA9"), RawType::ASCII) ==
           "Invalid ASCII character in string");
    assert(DecodeError(text, Bytes({0xC3}), RawType::TEXT) == "Invalid UTF-8 in string");
    assert(EncodeError(text, Value::Blob(Bytes({0x01})), RawType::TEXT) == "Expected string type");

    assert(MustDecode(ascii, Bytes({'o', 'k'}), RawType::ASCII) == Value::String("ok"));

    std::cout << "    PASSED" << std::endl;
}

void TestBlob() {
    std::cout << "  Testing blob..." << std::endl;

    BlobCodec codec;
    assert(MustEncode(codec, Value::Blob(Bytes({0xDE, 0xAD})), RawType::BLOB) == Bytes({0xDE, 0xAD}));
    assert(MustDecode(codec, Bytes(), RawType::BLOB) == Value::Blob(Bytes()));
    assert(EncodeError(codec, Value::String("x"), RawType::BLOB) == "Expected bytes type");

    std::cout << "    PASSED" << std::endl;
}

void TestUuids() {
    std::cout << "  Testing uuid and timeuuid..." << std::endl;

    UuidCodec uuid_codec(false);
    UuidCodec timeuuid_codec(true);

    UuidValue v4;
    assert(ParseUuid("123e4567-e89b-42d3-a456-426614174000", v4));
    UuidValue v1;
    assert(ParseUuid("c9e1c6a0-6f4e-11ee-b962-0242ac120002", v1));
    assert(v4.Version() == 4);
    assert(v1.Version() == 1);

    Bytes encoded = MustEncode(uuid_codec, Value::Uuid(v4), RawType::UUID);
    assert(encoded.size() == 16);
    assert(encoded[0] == 0x12 && encoded[15] == 0x00);
    assert(MustDecode(uuid_codec, encoded, RawType::UUID) == Value::Uuid(v4));

    assert(EncodeError(timeuuid_codec, Value::Uuid(v4), RawType::TIMEUUID) ==
           "Expected a time-based (version 1) UUID, but received version 4");
    assert(DecodeError(timeuuid_codec, encoded, RawType::TIMEUUID) ==
           "Expected a time-based (version 1) UUID, but received version 4");
    Bytes time_based = MustEncode(timeuuid_codec, Value::Uuid(v1), RawType::TIMEUUID);
    assert(MustDecode(timeuuid_codec, time_based, RawType::TIMEUUID) == Value::Uuid(v1));

    assert(DecodeError(uuid_codec, Bytes(15), RawType::UUID) ==
           "Expected 16 bytes for a uuid value, but received 15");
    assert(EncodeError(uuid_codec, Value::String("x"), RawType::UUID) == "Expected UUID type");

    std::cout << "    PASSED" << std::endl;
}

void TestInet() {
    std::cout << "  Testing inet..." << std::endl;

    InetCodec codec;
    assert(MustEncode(codec, Value::Inet(Bytes({127, 0, 0, 1})), RawType::INET) ==
           Bytes({127, 0, 0, 1}));
    assert(MustDecode(codec, Bytes(16), RawType::INET) == Value::Inet(Bytes(16)));
    assert(EncodeError(codec, Value::Inet(Bytes(5)), RawType::INET) ==
           "Expected 4 or 16 bytes for an inet address, but received 5");
    assert(DecodeError(codec, Bytes(3), RawType::INET) ==
           "Expected 4 or 16 bytes for an inet address, but received 3");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Temporal Tests
//===----------------------------------------------------------------------===//

void TestDateAndTime() {
    std::cout << "  Testing date and time..." << std::endl;

    DateCodec date;
    TimeCodec time;

    assert(MustEncode(date, Value::Date(cql::EPOCH_DAY), RawType::DATE) ==
           Bytes({0x80, 0x00, 0x00, 0x00}));
    assert(MustDecode(date, Bytes({0x80, 0x00, 0x00, 0x01}), RawType::DATE) ==
           Value::Date(cql::EPOCH_DAY + 1));

    assert(MustEncode(time, Value::Time(1), RawType::TIME) == Bytes({0, 0, 0, 0, 0, 0, 0, 1}));
    assert(EncodeError(time, Value::Time(cql::NANOS_PER_DAY), RawType::TIME) ==
           "Valid range for time is 0 to 86399999999999 nanoseconds");
    assert(EncodeError(time, Value::Time(-1), RawType::TIME) ==
           "Valid range for time is 0 to 86399999999999 nanoseconds");
    assert(DecodeError(time, Bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}), RawType::TIME) ==
           "Valid range for time is 0 to 86399999999999 nanoseconds");
    assert(EncodeError(date, Value::Time(0), RawType::DATE) == "Expected date type");

    std::cout << "    PASSED" << std::endl;
}

void TestDuration() {
    std::cout << "  Testing duration..." << std::endl;

    DurationCodec codec;

    // months=1, days=2, nanos=3 as zig-zag vints
    Bytes encoded = MustEncode(codec, Value::Duration(1, 2, 3), RawType::DURATION);
    assert(encoded == Bytes({0x02, 0x04, 0x06}));
    assert(MustDecode(codec, encoded, RawType::DURATION) == Value::Duration(1, 2, 3));

    Bytes negative = MustEncode(codec, Value::Duration(-1, 0, -1000), RawType::DURATION);
    assert(MustDecode(codec, negative, RawType::DURATION) == Value::Duration(-1, 0, -1000));

    assert(EncodeError(codec, Value::Duration(1, -1, 0), RawType::DURATION) ==
           "The duration months, days and nanoseconds must be all of the same sign");
    assert(DecodeError(codec, Bytes({0x02, 0x01, 0x00}), RawType::DURATION) ==
           "The duration months, days and nanoseconds must be all of the same sign");
    assert(DecodeError(codec, Bytes({0x02, 0x04}), RawType::DURATION) ==
           "Not enough bytes to read a duration value");
    assert(DecodeError(codec, Bytes({0x02, 0x04, 0x06, 0x00}), RawType::DURATION) ==
           "Unexpected 1 trailing bytes after a duration value");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Arbitrary Precision Tests
//===----------------------------------------------------------------------===//

void TestDecimalAndVarint() {
    std::cout << "  Testing decimal and varint..." << std::endl;

    DecimalCodec decimal;
    VarintCodec varint;

    // 12.34 = 1234 x 10^-2
    Bytes encoded = MustEncode(decimal, Value::Decimal(2, Bytes({0x04, 0xD2})), RawType::DECIMAL);
    assert(encoded == Bytes({0x00, 0x00, 0x00, 0x02, 0x04, 0xD2}));
    assert(MustDecode(decimal, encoded, RawType::DECIMAL) == Value::Decimal(2, Bytes({0x04, 0xD2})));

    assert(EncodeError(decimal, Value::Decimal(0, Bytes()), RawType::DECIMAL) ==
           "Expected at least one byte for the unscaled value of a decimal");
    assert(DecodeError(decimal, Bytes({0x00, 0x00, 0x00, 0x02}), RawType::DECIMAL) ==
           "Expected at least 5 bytes for a decimal value, but received 4");

    assert(MustEncode(varint, Value::Varint(Bytes({0xFF})), RawType::VARINT) == Bytes({0xFF}));
    assert(MustDecode(varint, Bytes({0x00, 0x80}), RawType::VARINT) == Value::Varint(Bytes({0x00, 0x80})));
    assert(DecodeError(varint, Bytes(), RawType::VARINT) == "Expected at least one byte for a varint value");
    assert(EncodeError(varint, Value::Int(1), RawType::VARINT) == "Expected varint type");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Scalar Codec Unit Tests ===" << std::endl;

    std::cout << "\n1. Numeric:" << std::endl;
    TestIntegers();
    TestIntegerErrors();
    TestFloatingPoint();
    TestBoolean();

    std::cout << "\n2. Text and Binary:" << std::endl;
    TestStrings();
    TestBlob();
    TestUuids();
    TestInet();

    std::cout << "\n3. Temporal:" << std::endl;
    TestDateAndTime();
    TestDuration();

    std::cout << "\n4. Arbitrary Precision:" << std::endl;
    TestDecimalAndVarint();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
