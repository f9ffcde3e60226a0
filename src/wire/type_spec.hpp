//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/type_spec.hpp
//
// Wire form of a column type, sent to clients as result metadata
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gatewire {

enum class TypeSpecKind : uint8_t {
    BASIC = 0,
    LIST,
    MAP,
    SET,
    TUPLE,
    UDT,
};

class TypeSpec {
public:
    TypeSpec() = default;

    // Leaf carrying a raw type id
    static TypeSpec Basic(int32_t id);
    static TypeSpec List(TypeSpec element);
    static TypeSpec Set(TypeSpec element);
    static TypeSpec Map(TypeSpec key, TypeSpec value);
    static TypeSpec Tuple(std::vector<TypeSpec> elements);
    static TypeSpec Udt(std::map<std::string, TypeSpec> fields);

    TypeSpecKind Kind() const { return kind_; }
    int32_t BasicId() const { return basic_; }

    // list/set element; map key and value
    const TypeSpec& Element() const { return children_[0]; }
    const TypeSpec& Key() const { return children_[0]; }
    const TypeSpec& ValueType() const { return children_[1]; }

    // tuple elements (also list/set/map children)
    const std::vector<TypeSpec>& Children() const { return children_; }

    const std::map<std::string, TypeSpec>& Fields() const { return fields_; }

    // e.g. "map<text, list<int>>", "udt<a: int, b: list>"
    std::string ToString() const;

    bool operator==(const TypeSpec& other) const {
        return kind_ == other.kind_ && basic_ == other.basic_ &&
               children_ == other.children_ && fields_ == other.fields_;
    }
    bool operator!=(const TypeSpec& other) const { return !(*this == other); }

private:
    TypeSpecKind kind_ = TypeSpecKind::BASIC;
    int32_t basic_ = 0;
    std::vector<TypeSpec> children_;
    std::map<std::string, TypeSpec> fields_;
};

} // namespace gatewire
