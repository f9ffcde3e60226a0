//===----------------------------------------------------------------------===//
//                         GateWire
//
// error/marshal_error.hpp
//
// Error codes and structured errors for the marshalling layer
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace gatewire {

//===----------------------------------------------------------------------===//
// Error Codes
//===----------------------------------------------------------------------===//
enum class ErrorCode : uint32_t {
    // ===== 0x0000xxxx: Success =====
    OK                      = 0x00000000,

    // ===== 0x0001xxxx: Client Errors =====
    INVALID_VALUE           = 0x00010001,  // Value does not match its declared type
    INVALID_ARGUMENT        = 0x00010002,  // Bind value or marker rejected
    FAILED_PRECONDITION     = 0x00010003,  // Request shape mismatch

    // ===== 0x0002xxxx: Server Errors =====
    INTERNAL_ERROR          = 0x00020001,  // Broken invariant
};

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::INVALID_VALUE:          return "INVALID_VALUE";
        case ErrorCode::INVALID_ARGUMENT:       return "INVALID_ARGUMENT";
        case ErrorCode::FAILED_PRECONDITION:    return "FAILED_PRECONDITION";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
        default:                                return "UNKNOWN_ERROR";
    }
}

//===----------------------------------------------------------------------===//
// Marshal Error
//===----------------------------------------------------------------------===//
struct MarshalError {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    // Underlying failure this error wraps, if any
    std::shared_ptr<const MarshalError> cause;

    MarshalError() = default;

    MarshalError(ErrorCode code_p, std::string message_p)
        : code(code_p)
        , message(std::move(message_p)) {}

    MarshalError(ErrorCode code_p, std::string message_p, MarshalError cause_p)
        : code(code_p)
        , message(std::move(message_p))
        , cause(std::make_shared<const MarshalError>(std::move(cause_p))) {}

    bool IsOk() const { return code == ErrorCode::OK; }

    // "CODE: message", followed by "(caused by ...)" for each wrapped cause
    std::string ToString() const;

    static MarshalError InvalidValue(std::string message_p) {
        return MarshalError(ErrorCode::INVALID_VALUE, std::move(message_p));
    }

    static MarshalError InvalidArgument(std::string message_p) {
        return MarshalError(ErrorCode::INVALID_ARGUMENT, std::move(message_p));
    }

    static MarshalError FailedPrecondition(std::string message_p) {
        return MarshalError(ErrorCode::FAILED_PRECONDITION, std::move(message_p));
    }

    static MarshalError Internal(std::string message_p) {
        return MarshalError(ErrorCode::INTERNAL_ERROR, std::move(message_p));
    }
};

//===----------------------------------------------------------------------===//
// Internal Error
//===----------------------------------------------------------------------===//

// Thrown for invariants that never break on a healthy system: a column
// without a type, stored bytes that do not match their declared type, an
// unknown composite kind.
class InternalError : public std::runtime_error {
public:
    explicit InternalError(MarshalError error);
    explicit InternalError(const std::string& message);

    const MarshalError& GetError() const { return error_; }

private:
    MarshalError error_;
};

} // namespace gatewire
