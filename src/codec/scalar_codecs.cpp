//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/scalar_codecs.cpp
//
// Fixed and variable length primitive encodings (CQL native protocol v4)
//===----------------------------------------------------------------------===//

#include "codec/scalar_codecs.hpp"
#include "codec/byte_reader.hpp"
#include "codec/byte_writer.hpp"
#include "codec/cql_protocol.hpp"
#include "utils/utf8.hpp"
#include <cstring>

namespace gatewire {

namespace {

bool ExpectKind(const Value& value, ValueKind kind, const char* expected, MarshalError& error) {
    if (value.Kind() != kind) {
        error = MarshalError::InvalidValue(std::string("Expected ") + expected + " type");
        return false;
    }
    return true;
}

bool ExpectLength(size_t len, size_t expected, RawType raw, MarshalError& error) {
    if (len != expected) {
        error = MarshalError::InvalidValue("Expected " + std::to_string(expected) +
                                           " bytes for a " + RawTypeName(raw) +
                                           " value, but received " + std::to_string(len));
        return false;
    }
    return true;
}

void AppendBigEndian(uint64_t value, int width, Bytes& out) {
    for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Integers
//===----------------------------------------------------------------------===//
IntegerCodec::IntegerCodec(RawType raw)
    : raw_(raw), width_(GetFixedLength(raw)) {
    if (width_ >= 8) {
        min_ = INT64_MIN;
        max_ = INT64_MAX;
    } else {
        max_ = (int64_t(1) << (width_ * 8 - 1)) - 1;
        min_ = -max_ - 1;
    }
}

bool IntegerCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                          MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::INT, "integer", error)) {
        return false;
    }
    int64_t v = value.GetInt();
    if (v < min_ || v > max_) {
        error = MarshalError::InvalidValue(std::string("Valid range for ") + RawTypeName(raw_) +
                                           " is " + std::to_string(min_) + " to " +
                                           std::to_string(max_));
        return false;
    }
    AppendBigEndian(static_cast<uint64_t>(v), width_, out);
    return true;
}

bool IntegerCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                          MarshalError& error) const {
    if (!ExpectLength(len, static_cast<size_t>(width_), raw_, error)) {
        return false;
    }
    uint64_t raw = 0;
    for (int i = 0; i < width_; i++) {
        raw = (raw << 8) | data[i];
    }
    // Sign extend
    int unused = 64 - width_ * 8;
    int64_t v = unused == 0 ? static_cast<int64_t>(raw)
                            : static_cast<int64_t>(raw << unused) >> unused;
    out = Value::Int(v);
    return true;
}

//===----------------------------------------------------------------------===//
// Floating point
//===----------------------------------------------------------------------===//
bool FloatCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                        MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::FLOAT, "float", error)) {
        return false;
    }
    float f = value.GetFloat();
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    AppendBigEndian(bits, 4, out);
    return true;
}

bool FloatCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                        MarshalError& error) const {
    if (!ExpectLength(len, 4, RawType::FLOAT, error)) {
        return false;
    }
    uint32_t bits = cql::LoadBigEndian32(data);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    out = Value::Float(f);
    return true;
}

bool DoubleCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                         MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::DOUBLE, "double", error)) {
        return false;
    }
    double d = value.GetDouble();
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    AppendBigEndian(bits, 8, out);
    return true;
}

bool DoubleCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                         MarshalError& error) const {
    if (!ExpectLength(len, 8, RawType::DOUBLE, error)) {
        return false;
    }
    uint64_t bits = cql::LoadBigEndian64(data);
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    out = Value::Double(d);
    return true;
}

//===----------------------------------------------------------------------===//
// Boolean
//===----------------------------------------------------------------------===//
bool BooleanCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                          MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::BOOLEAN, "boolean", error)) {
        return false;
    }
    out.push_back(value.GetBoolean() ? 1 : 0);
    return true;
}

bool BooleanCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                          MarshalError& error) const {
    if (!ExpectLength(len, 1, RawType::BOOLEAN, error)) {
        return false;
    }
    out = Value::Boolean(data[0] != 0);
    return true;
}

//===----------------------------------------------------------------------===//
// Strings
//===----------------------------------------------------------------------===//
bool StringCodec::Validate(const uint8_t* data, size_t len, MarshalError& error) const {
    if (ascii_only_) {
        if (!IsAscii(data, len)) {
            error = MarshalError::InvalidValue("Invalid ASCII character in string");
            return false;
        }
    } else if (!IsValidUtf8(data, len)) {
        error = MarshalError::InvalidValue("Invalid UTF-8 in string");
        return false;
    }
    return true;
}

bool StringCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                         MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::STRING, "string", error)) {
        return false;
    }
    const std::string& s = value.GetString();
    const uint8_t* data = reinterpret_cast<const uint8_t*>(s.data());
    if (!Validate(data, s.size(), error)) {
        return false;
    }
    out.insert(out.end(), data, data + s.size());
    return true;
}

bool StringCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                         MarshalError& error) const {
    if (!Validate(data, len, error)) {
        return false;
    }
    out = Value::String(std::string(reinterpret_cast<const char*>(data), len));
    return true;
}

//===----------------------------------------------------------------------===//
// Blob
//===----------------------------------------------------------------------===//
bool BlobCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                       MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::BYTES, "bytes", error)) {
        return false;
    }
    const Bytes& blob = value.GetBlob();
    out.insert(out.end(), blob.begin(), blob.end());
    return true;
}

bool BlobCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                       MarshalError&) const {
    out = Value::Blob(Bytes(data, data + len));
    return true;
}

//===----------------------------------------------------------------------===//
// UUID
//===----------------------------------------------------------------------===//
bool UuidCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                       MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::UUID, "UUID", error)) {
        return false;
    }
    const UuidValue& uuid = value.GetUuid();
    if (time_based_ && uuid.Version() != 1) {
        error = MarshalError::InvalidValue("Expected a time-based (version 1) UUID, but received version " +
                                           std::to_string(uuid.Version()));
        return false;
    }
    out.insert(out.end(), uuid.bytes.begin(), uuid.bytes.end());
    return true;
}

bool UuidCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                       MarshalError& error) const {
    if (!ExpectLength(len, 16, time_based_ ? RawType::TIMEUUID : RawType::UUID, error)) {
        return false;
    }
    UuidValue uuid;
    std::memcpy(uuid.bytes.data(), data, 16);
    if (time_based_ && uuid.Version() != 1) {
        error = MarshalError::InvalidValue("Expected a time-based (version 1) UUID, but received version " +
                                           std::to_string(uuid.Version()));
        return false;
    }
    out = Value::Uuid(uuid);
    return true;
}

//===----------------------------------------------------------------------===//
// Inet
//===----------------------------------------------------------------------===//
bool InetCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                       MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::INET, "inet", error)) {
        return false;
    }
    const Bytes& address = value.GetInet().address;
    if (address.size() != 4 && address.size() != 16) {
        error = MarshalError::InvalidValue("Expected 4 or 16 bytes for an inet address, but received " +
                                           std::to_string(address.size()));
        return false;
    }
    out.insert(out.end(), address.begin(), address.end());
    return true;
}

bool InetCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                       MarshalError& error) const {
    if (len != 4 && len != 16) {
        error = MarshalError::InvalidValue("Expected 4 or 16 bytes for an inet address, but received " +
                                           std::to_string(len));
        return false;
    }
    out = Value::Inet(Bytes(data, data + len));
    return true;
}

//===----------------------------------------------------------------------===//
// Date / Time
//===----------------------------------------------------------------------===//
bool DateCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                       MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::DATE, "date", error)) {
        return false;
    }
    AppendBigEndian(value.GetDate().days, 4, out);
    return true;
}

bool DateCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                       MarshalError& error) const {
    if (!ExpectLength(len, 4, RawType::DATE, error)) {
        return false;
    }
    out = Value::Date(cql::LoadBigEndian32(data));
    return true;
}

namespace {

bool CheckTimeRange(int64_t nanos, MarshalError& error) {
    if (nanos < 0 || nanos >= cql::NANOS_PER_DAY) {
        error = MarshalError::InvalidValue("Valid range for time is 0 to " +
                                           std::to_string(cql::NANOS_PER_DAY - 1) +
                                           " nanoseconds");
        return false;
    }
    return true;
}

} // namespace

bool TimeCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                       MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::TIME, "time", error)) {
        return false;
    }
    int64_t nanos = value.GetTime().nanos;
    if (!CheckTimeRange(nanos, error)) {
        return false;
    }
    AppendBigEndian(static_cast<uint64_t>(nanos), 8, out);
    return true;
}

bool TimeCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                       MarshalError& error) const {
    if (!ExpectLength(len, 8, RawType::TIME, error)) {
        return false;
    }
    int64_t nanos = static_cast<int64_t>(cql::LoadBigEndian64(data));
    if (!CheckTimeRange(nanos, error)) {
        return false;
    }
    out = Value::Time(nanos);
    return true;
}

//===----------------------------------------------------------------------===//
// Decimal / Varint
//===----------------------------------------------------------------------===//
bool DecimalCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                          MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::DECIMAL, "decimal", error)) {
        return false;
    }
    const DecimalValue& decimal = value.GetDecimal();
    if (decimal.unscaled.bytes.empty()) {
        error = MarshalError::InvalidValue("Expected at least one byte for the unscaled value of a decimal");
        return false;
    }
    AppendBigEndian(static_cast<uint32_t>(decimal.scale), 4, out);
    out.insert(out.end(), decimal.unscaled.bytes.begin(), decimal.unscaled.bytes.end());
    return true;
}

bool DecimalCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                          MarshalError& error) const {
    if (len < 5) {
        error = MarshalError::InvalidValue("Expected at least 5 bytes for a decimal value, but received " +
                                           std::to_string(len));
        return false;
    }
    int32_t scale = static_cast<int32_t>(cql::LoadBigEndian32(data));
    out = Value::Decimal(scale, Bytes(data + 4, data + len));
    return true;
}

bool VarintCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                         MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::VARINT, "varint", error)) {
        return false;
    }
    const Bytes& bytes = value.GetVarint().bytes;
    if (bytes.empty()) {
        error = MarshalError::InvalidValue("Expected at least one byte for a varint value");
        return false;
    }
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool VarintCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                         MarshalError& error) const {
    if (len == 0) {
        error = MarshalError::InvalidValue("Expected at least one byte for a varint value");
        return false;
    }
    out = Value::Varint(Bytes(data, data + len));
    return true;
}

//===----------------------------------------------------------------------===//
// Duration
//===----------------------------------------------------------------------===//
namespace {

bool CheckDurationSigns(int64_t months, int64_t days, int64_t nanos, MarshalError& error) {
    bool any_negative = months < 0 || days < 0 || nanos < 0;
    bool any_positive = months > 0 || days > 0 || nanos > 0;
    if (any_negative && any_positive) {
        error = MarshalError::InvalidValue(
            "The duration months, days and nanoseconds must be all of the same sign");
        return false;
    }
    return true;
}

} // namespace

bool DurationCodec::Encode(const Value& value, const ColumnType&, Bytes& out,
                           MarshalError& error) const {
    if (!ExpectKind(value, ValueKind::DURATION, "duration", error)) {
        return false;
    }
    const DurationValue& d = value.GetDuration();
    if (!CheckDurationSigns(d.months, d.days, d.nanos, error)) {
        return false;
    }
    ByteWriter writer;
    writer.WriteSignedVInt(d.months);
    writer.WriteSignedVInt(d.days);
    writer.WriteSignedVInt(d.nanos);
    const Bytes& bytes = writer.GetBuffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool DurationCodec::Decode(const uint8_t* data, size_t len, const ColumnType&, Value& out,
                           MarshalError& error) const {
    ByteReader reader(data, len);
    int64_t months, days, nanos;
    if (!reader.ReadSignedVInt(months) || !reader.ReadSignedVInt(days) ||
        !reader.ReadSignedVInt(nanos)) {
        error = MarshalError::InvalidValue("Not enough bytes to read a duration value");
        return false;
    }
    if (reader.HasRemaining()) {
        error = MarshalError::InvalidValue("Unexpected " + std::to_string(reader.Remaining()) +
                                           " trailing bytes after a duration value");
        return false;
    }
    if (months < INT32_MIN || months > INT32_MAX || days < INT32_MIN || days > INT32_MAX) {
        error = MarshalError::InvalidValue("Duration months and days must fit in 32 bits");
        return false;
    }
    if (!CheckDurationSigns(months, days, nanos, error)) {
        return false;
    }
    out = Value::Duration(static_cast<int32_t>(months), static_cast<int32_t>(days), nanos);
    return true;
}

} // namespace gatewire
