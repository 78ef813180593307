// src/transport/proto_codec.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "hub_rules.pb.h"

namespace transport
{

    namespace pb = hubrules::v1;

    hub_rules::Value from_proto(const pb::Value &v);
    void to_proto(const hub_rules::Value &v, pb::Value *out);

    // Epoch milliseconds <-> TimePoint
    int64_t to_epoch_ms(hub_rules::TimePoint t);
    hub_rules::TimePoint from_epoch_ms(int64_t ms);

    // Throws std::invalid_argument if device_id or attribute is empty.
    // A zero timestamp is replaced by `arrival`.
    hub_rules::DeviceEvent decode_event(const pb::DeviceEvent &event, hub_rules::TimePoint arrival);

    // Returns false if the payload is not a HubFrame
    bool parse_hub_frame(const std::vector<uint8_t> &payload, pb::HubFrame &frame);

    // Serialized CommandIssued for one command sent on behalf of ctx
    std::string encode_command(const hub_rules::ExecutionContext &ctx, const hub_rules::DeviceId &device_id,
                               const std::string &command, const hub_rules::ValueList &args,
                               hub_rules::TimePoint when);

} // namespace transport
