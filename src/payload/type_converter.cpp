//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/type_converter.cpp
//===----------------------------------------------------------------------===//

#include "payload/type_converter.hpp"
#include "logging/logger.hpp"

namespace gatewire {

bool ConvertType(const ColumnType& type, TypeSpec& out, MarshalError& error) {
    if (!type.IsParameterized()) {
        out = TypeSpec::Basic(type.Id());
        return true;
    }

    const auto& parameters = type.Parameters();
    switch (type.GetRawType()) {
        case RawType::LIST: {
            if (parameters.size() != 1) {
                error = MarshalError::FailedPrecondition(
                    "Expected list type to have a parameterized type");
                return false;
            }
            TypeSpec element;
            if (!ConvertType(parameters[0], element, error)) {
                return false;
            }
            out = TypeSpec::List(std::move(element));
            return true;
        }
        case RawType::MAP: {
            if (parameters.size() != 2) {
                error = MarshalError::FailedPrecondition(
                    "Expected map type to have key/value parameterized types");
                return false;
            }
            TypeSpec key;
            TypeSpec value;
            if (!ConvertType(parameters[0], key, error) ||
                !ConvertType(parameters[1], value, error)) {
                return false;
            }
            out = TypeSpec::Map(std::move(key), std::move(value));
            return true;
        }
        case RawType::SET: {
            if (parameters.size() != 1) {
                error = MarshalError::FailedPrecondition(
                    "Expected set type to have a parameterized type");
                return false;
            }
            TypeSpec element;
            if (!ConvertType(parameters[0], element, error)) {
                return false;
            }
            out = TypeSpec::Set(std::move(element));
            return true;
        }
        case RawType::TUPLE: {
            if (parameters.empty()) {
                error = MarshalError::FailedPrecondition(
                    "Expected tuple type to have at least one parameterized type");
                return false;
            }
            std::vector<TypeSpec> elements;
            elements.reserve(parameters.size());
            for (const auto& parameter : parameters) {
                TypeSpec element;
                if (!ConvertType(parameter, element, error)) {
                    return false;
                }
                elements.push_back(std::move(element));
            }
            out = TypeSpec::Tuple(std::move(elements));
            return true;
        }
        case RawType::UDT: {
            if (type.Fields().empty()) {
                error = MarshalError::FailedPrecondition(
                    "Expected user defined type to have at least one field");
                return false;
            }
            std::map<std::string, TypeSpec> fields;
            for (const auto& field : type.Fields()) {
                // Only the raw kind of the field is reported
                TypeSpec field_spec;
                if (!ConvertType(ColumnTypeNotNull(field).RawKind(), field_spec, error)) {
                    return false;
                }
                fields[field.name] = std::move(field_spec);
            }
            out = TypeSpec::Udt(std::move(fields));
            return true;
        }
        default:
            GW_LOG_ERROR("types", "Unhandled parameterized type {}", type.ToString());
            throw InternalError("Unhandled parameterized type");
    }
}

bool ToColumnType(const TypeSpec& spec, ColumnType& out, MarshalError& error) {
    switch (spec.Kind()) {
        case TypeSpecKind::BASIC: {
            RawType raw;
            if (!RawTypeFromId(spec.BasicId(), raw)) {
                error = MarshalError::InvalidArgument("Unknown basic type id " +
                                                      std::to_string(spec.BasicId()));
                return false;
            }
            out = ColumnType::Primitive(raw);
            return true;
        }
        case TypeSpecKind::LIST:
        case TypeSpecKind::SET:
        case TypeSpecKind::MAP:
        case TypeSpecKind::TUPLE: {
            std::vector<ColumnType> parameters;
            for (const auto& child : spec.Children()) {
                ColumnType parameter;
                if (!ToColumnType(child, parameter, error)) {
                    return false;
                }
                parameters.push_back(std::move(parameter));
            }
            RawType raw = spec.Kind() == TypeSpecKind::LIST  ? RawType::LIST
                        : spec.Kind() == TypeSpecKind::SET   ? RawType::SET
                        : spec.Kind() == TypeSpecKind::MAP   ? RawType::MAP
                                                             : RawType::TUPLE;
            out = raw == RawType::TUPLE ? ColumnType::Tuple(std::move(parameters))
                                        : ColumnType::Parameterized(raw, std::move(parameters));
            return true;
        }
        case TypeSpecKind::UDT: {
            std::vector<Column> fields;
            for (const auto& [name, field_spec] : spec.Fields()) {
                ColumnType field_type;
                if (!ToColumnType(field_spec, field_type, error)) {
                    return false;
                }
                fields.emplace_back(name, std::move(field_type));
            }
            out = ColumnType::Udt("", "", std::move(fields));
            return true;
        }
    }
    throw InternalError("Unhandled type descriptor kind");
}

} // namespace gatewire
