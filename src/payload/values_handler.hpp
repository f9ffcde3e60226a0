//===----------------------------------------------------------------------===//
//                         GateWire
//
// payload/values_handler.hpp
//
// Payload handler for typed wire values
//===----------------------------------------------------------------------===//

#pragma once

#include "payload/payload_handler.hpp"

namespace gatewire {

class ValuesHandler : public PayloadHandler {
public:
    bool BindValues(const Prepared& prepared, const Values& values,
                    const BufferPtr& unset_value, BoundStatement& out,
                    MarshalError& error) const override;

    bool ProcessResult(const Rows& rows, const QueryParameters& parameters,
                       ResultSet& out, MarshalError& error) const override;

private:
    // Unset passes unset_value through untouched; everything else goes
    // through the codec of the column's raw type
    static bool EncodeBindValue(const Value& value, const ColumnType& type,
                                const BufferPtr& unset_value, BufferPtr& out,
                                MarshalError& error);
};

} // namespace gatewire
