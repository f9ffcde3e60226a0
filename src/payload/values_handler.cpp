//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/values_handler.cpp
//
// Binding of client values and projection of stored rows
//===----------------------------------------------------------------------===//

#include "payload/values_handler.hpp"
#include "codec/value_codecs.hpp"
#include "logging/logger.hpp"
#include "payload/type_converter.hpp"
#include <algorithm>

namespace gatewire {

bool ValuesHandler::EncodeBindValue(const Value& value, const ColumnType& type,
                                    const BufferPtr& unset_value, BufferPtr& out,
                                    MarshalError& error) {
    if (value.IsUnset()) {
        out = unset_value;
        return true;
    }
    return EncodeValue(ValueCodecs::Get(type.GetRawType()), value, type, out, error);
}

//===----------------------------------------------------------------------===//
// Bind
//===----------------------------------------------------------------------===//
bool ValuesHandler::BindValues(const Prepared& prepared, const Values& values,
                               const BufferPtr& unset_value, BoundStatement& out,
                               MarshalError& error) const {
    const auto& columns = prepared.metadata.columns;
    const size_t column_count = columns.size();
    const size_t values_count = values.values.size();

    if (values_count != column_count) {
        error = MarshalError::FailedPrecondition(
            "Invalid number of bind values. Expected " + std::to_string(column_count) +
            ", but received " + std::to_string(values_count));
        GW_LOG_DEBUG("bind", "{}", error.message);
        return false;
    }

    BoundStatement bound;
    bound.statement_id = prepared.statement_id;
    bound.values.reserve(column_count);

    if (!values.value_names.empty()) {
        const size_t names_count = values.value_names.size();
        if (names_count != column_count) {
            error = MarshalError::FailedPrecondition(
                "Invalid number of bind names. Expected " + std::to_string(column_count) +
                ", but received " + std::to_string(names_count));
            GW_LOG_DEBUG("bind", "{}", error.message);
            return false;
        }

        std::vector<std::string> names;
        names.reserve(names_count);
        for (size_t i = 0; i < names_count; i++) {
            const std::string& name = values.value_names[i];
            auto column = std::find_if(columns.begin(), columns.end(),
                                       [&name](const Column& c) { return c.name == name; });
            if (column == columns.end()) {
                error = MarshalError::InvalidArgument(
                    "Unable to find bind marker with name '" + name + "'");
                GW_LOG_DEBUG("bind", "{}", error.message);
                return false;
            }

            const ColumnType& type = ColumnTypeNotNull(*column);
            BufferPtr encoded;
            MarshalError inner;
            if (!EncodeBindValue(values.values[i], type, unset_value, encoded, inner)) {
                std::string message = "Invalid argument for name '" + name + "': " + inner.message;
                error = MarshalError(ErrorCode::INVALID_ARGUMENT, std::move(message), std::move(inner));
                GW_LOG_DEBUG("bind", "{}", error.message);
                return false;
            }
            bound.values.push_back(std::move(encoded));
            names.push_back(name);
        }
        bound.bound_names = std::move(names);
    } else {
        for (size_t i = 0; i < column_count; i++) {
            const ColumnType& type = ColumnTypeNotNull(columns[i]);
            BufferPtr encoded;
            MarshalError inner;
            if (!EncodeBindValue(values.values[i], type, unset_value, encoded, inner)) {
                std::string message = "Invalid argument at position " + std::to_string(i + 1) +
                                      ": " + inner.message;
                error = MarshalError(ErrorCode::INVALID_ARGUMENT, std::move(message), std::move(inner));
                GW_LOG_DEBUG("bind", "{}", error.message);
                return false;
            }
            bound.values.push_back(std::move(encoded));
        }
    }

    GW_LOG_TRACE("bind", "Bound {} values", bound.values.size());
    out = std::move(bound);
    return true;
}

//===----------------------------------------------------------------------===//
// Result
//===----------------------------------------------------------------------===//
bool ValuesHandler::ProcessResult(const Rows& rows, const QueryParameters& parameters,
                                  ResultSet& out, MarshalError& error) const {
    const auto& columns = rows.result_metadata.columns;
    const size_t column_count = columns.size();

    ResultSet result;

    if (!parameters.skip_metadata) {
        std::vector<ColumnSpec> specs;
        specs.reserve(column_count);
        for (const auto& column : columns) {
            ColumnSpec spec;
            spec.name = column.name;
            if (!ConvertType(ColumnTypeNotNull(column), spec.type, error)) {
                GW_LOG_DEBUG("result", "Column '{}': {}", column.name, error.message);
                return false;
            }
            specs.push_back(std::move(spec));
        }
        result.columns = std::move(specs);
    }

    result.rows.reserve(rows.rows.size());
    for (size_t r = 0; r < rows.rows.size(); r++) {
        const auto& row = rows.rows[r];
        if (row.size() != column_count) {
            GW_LOG_ERROR("result", "Row {} has {} values for {} columns", r, row.size(),
                         column_count);
            throw InternalError("Row " + std::to_string(r) + " has " +
                                std::to_string(row.size()) + " values, but the result has " +
                                std::to_string(column_count) + " columns");
        }

        Row wire_row;
        wire_row.values.reserve(column_count);
        for (size_t i = 0; i < column_count; i++) {
            const ColumnType& type = ColumnTypeNotNull(columns[i]);
            Value value;
            MarshalError inner;
            if (!DecodeValue(ValueCodecs::Get(type.GetRawType()), row[i], type, value, inner)) {
                GW_LOG_ERROR("result", "Unable to decode column '{}' of type {}: {}",
                             columns[i].name, type.ToString(), inner.message);
                std::string message = "Unable to decode column '" + columns[i].name + "': " +
                                      inner.message;
                throw InternalError(
                    MarshalError(ErrorCode::INTERNAL_ERROR, std::move(message), std::move(inner)));
            }
            wire_row.values.push_back(std::move(value));
        }
        result.rows.push_back(std::move(wire_row));
    }

    if (rows.result_metadata.paging_state) {
        result.paging_state = *rows.result_metadata.paging_state;
        result.page_size = static_cast<int32_t>(rows.rows.size());
    }

    out = std::move(result);
    return true;
}

} // namespace gatewire
