//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/value_codecs.hpp
//
// Registry of the codec for each raw type
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/value_codec.hpp"
#include "schema/raw_type.hpp"

namespace gatewire {

class ValueCodecs {
public:
    // Codec for raw. Codecs are process-wide, immutable, and safe to share
    // across threads. Throws InternalError for custom types.
    static const ValueCodec& Get(RawType raw);
};

} // namespace gatewire
