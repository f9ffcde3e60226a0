//===----------------------------------------------------------------------===//
//                         GateWire
//
// error/marshal_error.cpp
//
// Structured error implementation
//===----------------------------------------------------------------------===//

#include "error/marshal_error.hpp"

namespace gatewire {

std::string MarshalError::ToString() const {
    std::string out = ErrorCodeToString(code);
    out += ": ";
    out += message;

    const MarshalError* inner = cause.get();
    while (inner) {
        out += " (caused by ";
        out += ErrorCodeToString(inner->code);
        out += ": ";
        out += inner->message;
        out += ")";
        inner = inner->cause.get();
    }
    return out;
}

InternalError::InternalError(MarshalError error)
    : std::runtime_error(error.message)
    , error_(std::move(error)) {
    error_.code = ErrorCode::INTERNAL_ERROR;
}

InternalError::InternalError(const std::string& message)
    : std::runtime_error(message)
    , error_(ErrorCode::INTERNAL_ERROR, message) {
}

} // namespace gatewire
