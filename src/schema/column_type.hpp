//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/column_type.hpp
//
// Recursive column type descriptors supplied by the schema catalog
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "schema/raw_type.hpp"
#include <string>
#include <vector>

namespace gatewire {

class ColumnType;

//===----------------------------------------------------------------------===//
// Column
//===----------------------------------------------------------------------===//
struct Column {
    std::string name;
    // Always set by a healthy catalog; null is an internal error
    std::shared_ptr<const ColumnType> type;

    Column() = default;
    Column(std::string name_p, std::shared_ptr<const ColumnType> type_p)
        : name(std::move(name_p))
        , type(std::move(type_p)) {}
    Column(std::string name_p, ColumnType type_p);
};

//===----------------------------------------------------------------------===//
// Column Type
//===----------------------------------------------------------------------===//

// A primitive leaf, or a parameterized composite owning its children.
// UDTs carry their fields as named columns instead of parameters.
class ColumnType {
public:
    // Primitive leaf; also used for the bare raw kind of a composite
    explicit ColumnType(RawType raw = RawType::CUSTOM)
        : raw_(raw) {}

    static ColumnType Primitive(RawType raw) { return ColumnType(raw); }

    static ColumnType List(ColumnType element, bool frozen = false);
    static ColumnType Set(ColumnType element, bool frozen = false);
    static ColumnType Map(ColumnType key, ColumnType value, bool frozen = false);
    static ColumnType Tuple(std::vector<ColumnType> elements);
    static ColumnType Udt(std::string keyspace, std::string name,
                          std::vector<Column> fields, bool frozen = false);

    // Composite with arbitrary parameters, arity is not checked. Catalog
    // adapters use it; malformed arity is rejected by the converter and codecs.
    static ColumnType Parameterized(RawType raw, std::vector<ColumnType> parameters,
                                    bool frozen = false);

    RawType GetRawType() const { return raw_; }
    int32_t Id() const { return RawTypeId(raw_); }

    // The raw kind alone, without parameters or fields
    ColumnType RawKind() const { return ColumnType(raw_); }

    bool IsParameterized() const { return parameterized_; }
    bool IsFrozen() const { return frozen_; }

    const std::vector<ColumnType>& Parameters() const { return parameters_; }

    // UDT only
    const std::vector<Column>& Fields() const { return fields_; }
    const std::string& Keyspace() const { return keyspace_; }
    const std::string& Name() const { return name_; }

    // CQL form, e.g. "map<text, frozen<list<int>>>"
    std::string ToString() const;

    bool operator==(const ColumnType& other) const;
    bool operator!=(const ColumnType& other) const { return !(*this == other); }

private:
    RawType raw_;
    bool parameterized_ = false;
    bool frozen_ = false;
    std::vector<ColumnType> parameters_;
    std::vector<Column> fields_;
    std::string keyspace_;
    std::string name_;
};

inline Column::Column(std::string name_p, ColumnType type_p)
    : name(std::move(name_p))
    , type(std::make_shared<const ColumnType>(std::move(type_p))) {}

// Type of a column, throwing InternalError when the catalog left it unset
const ColumnType& ColumnTypeNotNull(const Column& column);

} // namespace gatewire
