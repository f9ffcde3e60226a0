//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/composite_codecs.cpp
//===----------------------------------------------------------------------===//

#include "codec/composite_codecs.hpp"
#include "codec/byte_reader.hpp"
#include "codec/byte_writer.hpp"
#include "codec/marshal_limits.hpp"
#include "logging/logger.hpp"
#include <parallel_hashmap/phmap.h>

namespace gatewire {

namespace {

// The catalog never hands out composites with the wrong number of
// parameters; seeing one here is a defect.
void ExpectArity(const ColumnType& type, size_t min_count, size_t max_count) {
    size_t count = type.Parameters().size();
    if (count < min_count || count > max_count) {
        GW_LOG_ERROR("codec", "Malformed composite type {} with {} parameters",
                     type.ToString(), count);
        throw InternalError(std::string("Malformed ") + RawTypeName(type.GetRawType()) +
                            " type with " + std::to_string(count) + " parameters");
    }
}

bool ExpectCollection(const Value& value, MarshalError& error) {
    if (value.Kind() != ValueKind::COLLECTION) {
        error = MarshalError::InvalidValue("Expected collection type");
        return false;
    }
    return true;
}

bool ReadCount(ByteReader& reader, const char* what, int32_t& count, MarshalError& error) {
    if (!reader.ReadInt32(count)) {
        error = MarshalError::InvalidValue(std::string("Not enough bytes to read the ") + what +
                                           " size");
        return false;
    }
    if (count < 0) {
        error = MarshalError::InvalidValue(std::string("Negative ") + what + " size " +
                                           std::to_string(count));
        return false;
    }
    uint32_t max_elements = GetMarshalLimits().max_collection_elements;
    if (static_cast<uint32_t>(count) > max_elements) {
        error = MarshalError::InvalidValue(std::string("The ") + what + " size " +
                                           std::to_string(count) + " exceeds the maximum of " +
                                           std::to_string(max_elements) + " elements");
        return false;
    }
    // Every element carries at least its 4 byte length
    if (static_cast<size_t>(count) > reader.Remaining() / 4) {
        error = MarshalError::InvalidValue(std::string("The ") + what + " size " +
                                           std::to_string(count) +
                                           " is inconsistent with its encoded length");
        return false;
    }
    return true;
}

// Reads and decodes one [int32 length][bytes] element
bool ReadElement(ByteReader& reader, const ColumnType& type, bool allow_null,
                 const char* what, Value& out, MarshalError& error) {
    const uint8_t* data;
    int32_t length;
    if (!reader.ReadValue(data, length)) {
        error = MarshalError::InvalidValue(std::string("Not enough bytes to read a ") + what);
        return false;
    }
    if (data == nullptr && !allow_null) {
        error = MarshalError::InvalidValue("null is not supported inside collections");
        return false;
    }
    return DecodeElement(data, length, type, out, error);
}

bool ExpectEnd(const ByteReader& reader, const char* what, MarshalError& error) {
    if (reader.HasRemaining()) {
        error = MarshalError::InvalidValue("Unexpected " + std::to_string(reader.Remaining()) +
                                           " trailing bytes after " + what);
        return false;
    }
    return true;
}

} // namespace

//===----------------------------------------------------------------------===//
// List / Set
//===----------------------------------------------------------------------===//
bool CollectionCodec::Encode(const Value& value, const ColumnType& type, Bytes& out,
                             MarshalError& error) const {
    ExpectArity(type, 1, 1);
    if (!ExpectCollection(value, error)) {
        return false;
    }

    const auto& elements = value.GetElements();
    const ColumnType& element_type = type.Parameters()[0];

    ByteWriter writer;
    writer.WriteInt32(static_cast<int32_t>(elements.size()));
    for (const auto& element : elements) {
        if (!EncodeElement(element, element_type, false, writer, error)) {
            return false;
        }
    }
    const Bytes& bytes = writer.GetBuffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool CollectionCodec::Decode(const uint8_t* data, size_t len, const ColumnType& type,
                             Value& out, MarshalError& error) const {
    ExpectArity(type, 1, 1);
    const char* what = type.GetRawType() == RawType::SET ? "set" : "list";
    const ColumnType& element_type = type.Parameters()[0];

    ByteReader reader(data, len);
    int32_t count;
    if (!ReadCount(reader, what, count, error)) {
        return false;
    }

    std::vector<Value> elements;
    elements.reserve(static_cast<size_t>(count));
    for (int32_t i = 0; i < count; i++) {
        Value element;
        if (!ReadElement(reader, element_type, false, "collection element", element, error)) {
            return false;
        }
        elements.push_back(std::move(element));
    }
    if (!ExpectEnd(reader, what, error)) {
        return false;
    }
    out = Value::Collection(std::move(elements));
    return true;
}

//===----------------------------------------------------------------------===//
// Map
//===----------------------------------------------------------------------===//
bool MapCodec::Encode(const Value& value, const ColumnType& type, Bytes& out,
                      MarshalError& error) const {
    ExpectArity(type, 2, 2);
    if (!ExpectCollection(value, error)) {
        return false;
    }

    const auto& elements = value.GetElements();
    if (elements.size() % 2 != 0) {
        error = MarshalError::InvalidValue("Expected an even number of elements for a map, but received " +
                                           std::to_string(elements.size()));
        return false;
    }

    const ColumnType& key_type = type.Parameters()[0];
    const ColumnType& value_type = type.Parameters()[1];

    ByteWriter writer;
    writer.WriteInt32(static_cast<int32_t>(elements.size() / 2));
    for (size_t i = 0; i < elements.size(); i += 2) {
        if (!EncodeElement(elements[i], key_type, false, writer, error) ||
            !EncodeElement(elements[i + 1], value_type, false, writer, error)) {
            return false;
        }
    }
    const Bytes& bytes = writer.GetBuffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool MapCodec::Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                      MarshalError& error) const {
    ExpectArity(type, 2, 2);
    const ColumnType& key_type = type.Parameters()[0];
    const ColumnType& value_type = type.Parameters()[1];

    ByteReader reader(data, len);
    int32_t count;
    if (!ReadCount(reader, "map", count, error)) {
        return false;
    }

    std::vector<Value> elements;
    elements.reserve(static_cast<size_t>(count) * 2);
    for (int32_t i = 0; i < count; i++) {
        Value key;
        Value val;
        if (!ReadElement(reader, key_type, false, "map key", key, error) ||
            !ReadElement(reader, value_type, false, "map value", val, error)) {
            return false;
        }
        elements.push_back(std::move(key));
        elements.push_back(std::move(val));
    }
    if (!ExpectEnd(reader, "map", error)) {
        return false;
    }
    out = Value::Collection(std::move(elements));
    return true;
}

//===----------------------------------------------------------------------===//
// Tuple
//===----------------------------------------------------------------------===//
bool TupleCodec::Encode(const Value& value, const ColumnType& type, Bytes& out,
                        MarshalError& error) const {
    ExpectArity(type, 1, SIZE_MAX);
    if (!ExpectCollection(value, error)) {
        return false;
    }

    const auto& elements = value.GetElements();
    const auto& element_types = type.Parameters();
    if (elements.size() > element_types.size()) {
        error = MarshalError::InvalidValue("Too many elements for " + type.ToString() +
                                           ": expected at most " +
                                           std::to_string(element_types.size()) +
                                           ", but received " + std::to_string(elements.size()));
        return false;
    }

    ByteWriter writer;
    for (size_t i = 0; i < elements.size(); i++) {
        if (!EncodeElement(elements[i], element_types[i], true, writer, error)) {
            return false;
        }
    }
    const Bytes& bytes = writer.GetBuffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool TupleCodec::Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                        MarshalError& error) const {
    ExpectArity(type, 1, SIZE_MAX);
    const auto& element_types = type.Parameters();

    ByteReader reader(data, len);
    std::vector<Value> elements;
    for (size_t i = 0; i < element_types.size() && reader.HasRemaining(); i++) {
        Value element;
        if (!ReadElement(reader, element_types[i], true, "tuple element", element, error)) {
            return false;
        }
        elements.push_back(std::move(element));
    }
    if (!ExpectEnd(reader, "tuple", error)) {
        return false;
    }
    out = Value::Collection(std::move(elements));
    return true;
}

//===----------------------------------------------------------------------===//
// User-defined type
//===----------------------------------------------------------------------===//
namespace {

void ExpectFields(const ColumnType& type) {
    if (type.Fields().empty()) {
        GW_LOG_ERROR("codec", "User defined type {} has no fields", type.ToString());
        throw InternalError("Malformed user defined type " + type.ToString() + " without fields");
    }
}

} // namespace

bool UdtCodec::Encode(const Value& value, const ColumnType& type, Bytes& out,
                      MarshalError& error) const {
    ExpectFields(type);
    if (value.Kind() != ValueKind::UDT) {
        error = MarshalError::InvalidValue("Expected user-defined type");
        return false;
    }

    const auto& values = value.GetFields();
    phmap::flat_hash_set<std::string> declared;
    for (const auto& field : type.Fields()) {
        declared.insert(field.name);
    }
    for (const auto& entry : values) {
        if (declared.find(entry.first) == declared.end()) {
            error = MarshalError::InvalidValue("Field '" + entry.first +
                                               "' is not defined in user-defined type " +
                                               type.ToString());
            return false;
        }
    }

    // Trailing absent fields are omitted; an absent field before a present
    // one has to be written as null to keep the positions.
    const auto& fields = type.Fields();
    size_t present = 0;
    for (size_t i = 0; i < fields.size(); i++) {
        if (values.count(fields[i].name) > 0) {
            present = i + 1;
        }
    }

    ByteWriter writer;
    for (size_t i = 0; i < present; i++) {
        const auto& field = fields[i];
        const ColumnType& field_type = ColumnTypeNotNull(field);
        auto it = values.find(field.name);
        if (it == values.end()) {
            writer.WriteNull();
            continue;
        }
        if (!EncodeElement(it->second, field_type, true, writer, error)) {
            return false;
        }
    }
    const Bytes& bytes = writer.GetBuffer();
    out.insert(out.end(), bytes.begin(), bytes.end());
    return true;
}

bool UdtCodec::Decode(const uint8_t* data, size_t len, const ColumnType& type, Value& out,
                      MarshalError& error) const {
    ExpectFields(type);

    ByteReader reader(data, len);
    std::map<std::string, Value> fields;
    for (const auto& field : type.Fields()) {
        if (!reader.HasRemaining()) {
            break;
        }
        Value field_value;
        if (!ReadElement(reader, ColumnTypeNotNull(field), true, "user-defined type field",
                         field_value, error)) {
            return false;
        }
        fields.emplace(field.name, std::move(field_value));
    }
    if (!ExpectEnd(reader, "user-defined type", error)) {
        return false;
    }
    out = Value::Udt(std::move(fields));
    return true;
}

} // namespace gatewire
