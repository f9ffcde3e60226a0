//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/value_codecs.cpp
//===----------------------------------------------------------------------===//

#include "codec/value_codecs.hpp"
#include "codec/composite_codecs.hpp"
#include "codec/scalar_codecs.hpp"
#include "logging/logger.hpp"

namespace gatewire {

const ValueCodec& ValueCodecs::Get(RawType raw) {
    switch (raw) {
        case RawType::ASCII: {
            static const StringCodec codec(true);
            return codec;
        }
        case RawType::TEXT: {
            static const StringCodec codec(false);
            return codec;
        }
        case RawType::TINYINT: {
            static const IntegerCodec codec(RawType::TINYINT);
            return codec;
        }
        case RawType::SMALLINT: {
            static const IntegerCodec codec(RawType::SMALLINT);
            return codec;
        }
        case RawType::INT: {
            static const IntegerCodec codec(RawType::INT);
            return codec;
        }
        case RawType::BIGINT: {
            static const IntegerCodec codec(RawType::BIGINT);
            return codec;
        }
        case RawType::COUNTER: {
            static const IntegerCodec codec(RawType::COUNTER);
            return codec;
        }
        case RawType::TIMESTAMP: {
            static const IntegerCodec codec(RawType::TIMESTAMP);
            return codec;
        }
        case RawType::FLOAT: {
            static const FloatCodec codec;
            return codec;
        }
        case RawType::DOUBLE: {
            static const DoubleCodec codec;
            return codec;
        }
        case RawType::BOOLEAN: {
            static const BooleanCodec codec;
            return codec;
        }
        case RawType::BLOB: {
            static const BlobCodec codec;
            return codec;
        }
        case RawType::UUID: {
            static const UuidCodec codec(false);
            return codec;
        }
        case RawType::TIMEUUID: {
            static const UuidCodec codec(true);
            return codec;
        }
        case RawType::INET: {
            static const InetCodec codec;
            return codec;
        }
        case RawType::DATE: {
            static const DateCodec codec;
            return codec;
        }
        case RawType::TIME: {
            static const TimeCodec codec;
            return codec;
        }
        case RawType::DECIMAL: {
            static const DecimalCodec codec;
            return codec;
        }
        case RawType::VARINT: {
            static const VarintCodec codec;
            return codec;
        }
        case RawType::DURATION: {
            static const DurationCodec codec;
            return codec;
        }
        case RawType::LIST:
        case RawType::SET: {
            static const CollectionCodec codec;
            return codec;
        }
        case RawType::MAP: {
            static const MapCodec codec;
            return codec;
        }
        case RawType::TUPLE: {
            static const TupleCodec codec;
            return codec;
        }
        case RawType::UDT: {
            static const UdtCodec codec;
            return codec;
        }
        case RawType::CUSTOM:
            break;
    }

    GW_LOG_ERROR("codec", "No codec registered for raw type {}", RawTypeId(raw));
    throw InternalError("Unsupported type " + std::to_string(RawTypeId(raw)));
}

} // namespace gatewire
