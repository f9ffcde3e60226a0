//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/marshal_limits.cpp
//===----------------------------------------------------------------------===//

#include "codec/marshal_limits.hpp"

namespace gatewire {

namespace {
MarshalLimits g_limits;
} // namespace

const MarshalLimits& GetMarshalLimits() {
    return g_limits;
}

void SetMarshalLimits(const MarshalLimits& limits) {
    g_limits = limits;
}

} // namespace gatewire
