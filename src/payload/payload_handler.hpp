//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/payload_handler.hpp
//
// Interface between a wire payload format and the execution engine
//===----------------------------------------------------------------------===//

#pragma once

#include "error/marshal_error.hpp"
#include "payload/bound_statement.hpp"
#include "schema/metadata.hpp"
#include "wire/result_set.hpp"

namespace gatewire {

class PayloadHandler {
public:
    virtual ~PayloadHandler() = default;

    // Encodes client values for the bind markers of prepared. Unset values
    // become unset_value in the output. Recoverable failures are
    // FAILED_PRECONDITION or INVALID_ARGUMENT; InternalError is thrown for
    // catalog defects.
    virtual bool BindValues(const Prepared& prepared, const Values& values,
                            const BufferPtr& unset_value, BoundStatement& out,
                            MarshalError& error) const = 0;

    // Decodes a page of stored rows into a wire result set. Stored bytes
    // that do not decode are an InternalError.
    virtual bool ProcessResult(const Rows& rows, const QueryParameters& parameters,
                               ResultSet& out, MarshalError& error) const = 0;
};

} // namespace gatewire
