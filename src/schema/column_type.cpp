//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/column_type.cpp
//
// Column type implementation
//===----------------------------------------------------------------------===//

#include "schema/column_type.hpp"
#include "error/marshal_error.hpp"
#include "logging/logger.hpp"

namespace gatewire {

ColumnType ColumnType::List(ColumnType element, bool frozen) {
    std::vector<ColumnType> parameters;
    parameters.push_back(std::move(element));
    return Parameterized(RawType::LIST, std::move(parameters), frozen);
}

ColumnType ColumnType::Set(ColumnType element, bool frozen) {
    std::vector<ColumnType> parameters;
    parameters.push_back(std::move(element));
    return Parameterized(RawType::SET, std::move(parameters), frozen);
}

ColumnType ColumnType::Map(ColumnType key, ColumnType value, bool frozen) {
    std::vector<ColumnType> parameters;
    parameters.push_back(std::move(key));
    parameters.push_back(std::move(value));
    return Parameterized(RawType::MAP, std::move(parameters), frozen);
}

ColumnType ColumnType::Tuple(std::vector<ColumnType> elements) {
    // Tuples are always frozen
    return Parameterized(RawType::TUPLE, std::move(elements), true);
}

ColumnType ColumnType::Udt(std::string keyspace, std::string name,
                           std::vector<Column> fields, bool frozen) {
    ColumnType type(RawType::UDT);
    type.parameterized_ = true;
    type.frozen_ = frozen;
    type.keyspace_ = std::move(keyspace);
    type.name_ = std::move(name);
    type.fields_ = std::move(fields);
    return type;
}

ColumnType ColumnType::Parameterized(RawType raw, std::vector<ColumnType> parameters,
                                     bool frozen) {
    ColumnType type(raw);
    type.parameterized_ = true;
    type.frozen_ = frozen;
    type.parameters_ = std::move(parameters);
    return type;
}

std::string ColumnType::ToString() const {
    if (!parameterized_) {
        return RawTypeName(raw_);
    }

    std::string out;
    if (raw_ == RawType::UDT) {
        out = keyspace_.empty() ? name_ : keyspace_ + "." + name_;
    } else {
        out = RawTypeName(raw_);
        out += '<';
        for (size_t i = 0; i < parameters_.size(); i++) {
            if (i > 0) out += ", ";
            out += parameters_[i].ToString();
        }
        out += '>';
    }

    // Tuples are implicitly frozen
    if (frozen_ && raw_ != RawType::TUPLE) {
        out = "frozen<" + out + ">";
    }
    return out;
}

bool ColumnType::operator==(const ColumnType& other) const {
    if (raw_ != other.raw_ || parameterized_ != other.parameterized_ ||
        frozen_ != other.frozen_ || parameters_ != other.parameters_ ||
        keyspace_ != other.keyspace_ || name_ != other.name_ ||
        fields_.size() != other.fields_.size()) {
        return false;
    }
    for (size_t i = 0; i < fields_.size(); i++) {
        const auto& a = fields_[i];
        const auto& b = other.fields_[i];
        if (a.name != b.name) return false;
        if (!a.type || !b.type) {
            if (a.type != b.type) return false;
        } else if (*a.type != *b.type) {
            return false;
        }
    }
    return true;
}

const ColumnType& ColumnTypeNotNull(const Column& column) {
    if (!column.type) {
        GW_LOG_ERROR("types", "Column '{}' has no type in the supplied metadata", column.name);
        throw InternalError("Column '" + column.name + "' doesn't have a valid type");
    }
    return *column.type;
}

} // namespace gatewire
