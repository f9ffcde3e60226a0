//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/value.hpp
//
// Typed wire values exchanged with gateway clients
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <array>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gatewire {

class Value;

//===----------------------------------------------------------------------===//
// Value Kinds (same order as the variant alternatives)
//===----------------------------------------------------------------------===//
enum class ValueKind : uint8_t {
    UNSET = 0,
    NULL_VALUE,
    INT,
    FLOAT,
    DOUBLE,
    BOOLEAN,
    BYTES,
    STRING,
    UUID,
    INET,
    DATE,
    TIME,
    DECIMAL,
    VARINT,
    DURATION,
    COLLECTION,
    UDT,
};

const char* ValueKindToString(ValueKind kind);

//===----------------------------------------------------------------------===//
// Payloads
//===----------------------------------------------------------------------===//
struct UnsetValue {
    bool operator==(const UnsetValue&) const { return true; }
};

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

struct UuidValue {
    std::array<uint8_t, 16> bytes{};

    // Version nibble of byte 6
    int Version() const { return bytes[6] >> 4; }

    bool operator==(const UuidValue& other) const { return bytes == other.bytes; }
};

struct InetValue {
    // 4 bytes for IPv4, 16 for IPv6
    Bytes address;

    bool operator==(const InetValue& other) const { return address == other.address; }
};

struct DateValue {
    // Days with 1970-01-01 at 2^31
    uint32_t days = 0;

    bool operator==(const DateValue& other) const { return days == other.days; }
};

struct TimeValue {
    // Nanoseconds since midnight
    int64_t nanos = 0;

    bool operator==(const TimeValue& other) const { return nanos == other.nanos; }
};

struct VarintValue {
    // Two's-complement, big-endian, minimal
    Bytes bytes;

    bool operator==(const VarintValue& other) const { return bytes == other.bytes; }
};

struct DecimalValue {
    int32_t scale = 0;
    VarintValue unscaled;

    bool operator==(const DecimalValue& other) const {
        return scale == other.scale && unscaled == other.unscaled;
    }
};

struct DurationValue {
    int32_t months = 0;
    int32_t days = 0;
    int64_t nanos = 0;

    bool operator==(const DurationValue& other) const {
        return months == other.months && days == other.days && nanos == other.nanos;
    }
};

// list, set and tuple elements; maps as flattened [k1, v1, k2, v2, ...]
struct CollectionValue {
    std::vector<Value> elements;

    bool operator==(const CollectionValue& other) const;
};

struct UdtValue {
    std::map<std::string, Value> fields;

    bool operator==(const UdtValue& other) const;
};

//===----------------------------------------------------------------------===//
// Value
//===----------------------------------------------------------------------===//
class Value {
public:
    using Storage = std::variant<UnsetValue, NullValue, int64_t, float, double, bool, Bytes,
                                 std::string, UuidValue, InetValue, DateValue, TimeValue,
                                 DecimalValue, VarintValue, DurationValue, CollectionValue,
                                 UdtValue>;

    Value() : storage_(NullValue{}) {}

    static Value Unset() { return Value(Storage(UnsetValue{})); }
    static Value Null() { return Value(Storage(NullValue{})); }
    static Value Int(int64_t v) { return Value(Storage(v)); }
    static Value Float(float v) { return Value(Storage(v)); }
    static Value Double(double v) { return Value(Storage(v)); }
    static Value Boolean(bool v) { return Value(Storage(v)); }
    static Value Blob(Bytes v) { return Value(Storage(std::move(v))); }
    static Value String(std::string v) { return Value(Storage(std::move(v))); }
    static Value Uuid(const UuidValue& v) { return Value(Storage(v)); }
    static Value Inet(Bytes address) { return Value(Storage(InetValue{std::move(address)})); }
    static Value Date(uint32_t days) { return Value(Storage(DateValue{days})); }
    static Value Time(int64_t nanos) { return Value(Storage(TimeValue{nanos})); }
    static Value Decimal(int32_t scale, Bytes unscaled) {
        return Value(Storage(DecimalValue{scale, VarintValue{std::move(unscaled)}}));
    }
    static Value Varint(Bytes bytes) { return Value(Storage(VarintValue{std::move(bytes)})); }
    static Value Duration(int32_t months, int32_t days, int64_t nanos) {
        return Value(Storage(DurationValue{months, days, nanos}));
    }
    static Value Collection(std::vector<Value> elements);
    static Value Udt(std::map<std::string, Value> fields);

    ValueKind Kind() const { return static_cast<ValueKind>(storage_.index()); }
    bool IsUnset() const { return Kind() == ValueKind::UNSET; }
    bool IsNull() const { return Kind() == ValueKind::NULL_VALUE; }

    int64_t GetInt() const { return std::get<int64_t>(storage_); }
    float GetFloat() const { return std::get<float>(storage_); }
    double GetDouble() const { return std::get<double>(storage_); }
    bool GetBoolean() const { return std::get<bool>(storage_); }
    const Bytes& GetBlob() const { return std::get<Bytes>(storage_); }
    const std::string& GetString() const { return std::get<std::string>(storage_); }
    const UuidValue& GetUuid() const { return std::get<UuidValue>(storage_); }
    const InetValue& GetInet() const { return std::get<InetValue>(storage_); }
    const DateValue& GetDate() const { return std::get<DateValue>(storage_); }
    const TimeValue& GetTime() const { return std::get<TimeValue>(storage_); }
    const DecimalValue& GetDecimal() const { return std::get<DecimalValue>(storage_); }
    const VarintValue& GetVarint() const { return std::get<VarintValue>(storage_); }
    const DurationValue& GetDuration() const { return std::get<DurationValue>(storage_); }
    const std::vector<Value>& GetElements() const {
        return std::get<CollectionValue>(storage_).elements;
    }
    const std::map<std::string, Value>& GetFields() const {
        return std::get<UdtValue>(storage_).fields;
    }

    // Human readable form, close to CQL literal syntax
    std::string ToString() const;

    bool operator==(const Value& other) const { return storage_ == other.storage_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    explicit Value(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

inline bool CollectionValue::operator==(const CollectionValue& other) const {
    return elements == other.elements;
}

inline bool UdtValue::operator==(const UdtValue& other) const {
    return fields == other.fields;
}

//===----------------------------------------------------------------------===//
// Formatting helpers
//===----------------------------------------------------------------------===//

// "123e4567-e89b-12d3-a456-426614174000"
std::string FormatUuid(const UuidValue& uuid);
bool ParseUuid(const std::string& text, UuidValue& out);

// Dotted IPv4 or RFC 5952 IPv6
std::string FormatInet(const InetValue& inet);

// Signed decimal digits of a two's-complement big-endian integer
std::string FormatVarint(const Bytes& bytes);
bool ParseVarint(const std::string& text, Bytes& out);

// "YYYY-MM-DD"
std::string FormatDate(uint32_t days);
// "HH:MM:SS.nnnnnnnnn"
std::string FormatTime(int64_t nanos);

} // namespace gatewire
