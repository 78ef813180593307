// src/transport/proto_codec.cpp
#include "proto_codec.hpp"

#include <chrono>
#include <stdexcept>

namespace transport
{

    hub_rules::Value from_proto(const pb::Value &v)
    {
        switch (v.kind_case())
        {
        case pb::Value::kBoolValue:
            return v.bool_value();
        case pb::Value::kIntValue:
            return static_cast<int64_t>(v.int_value());
        case pb::Value::kDoubleValue:
            return v.double_value();
        case pb::Value::kStringValue:
            return v.string_value();
        case pb::Value::KIND_NOT_SET:
            break;
        }
        return hub_rules::Value{};
    }

    namespace
    {
        struct ToProto
        {
            pb::Value *out;

            void operator()(std::monostate) const { out->Clear(); }
            void operator()(bool b) const { out->set_bool_value(b); }
            void operator()(int64_t i) const { out->set_int_value(i); }
            void operator()(double d) const { out->set_double_value(d); }
            void operator()(const std::string &s) const { out->set_string_value(s); }
        };
    } // namespace

    void to_proto(const hub_rules::Value &v, pb::Value *out)
    {
        std::visit(ToProto{out}, v);
    }

    int64_t to_epoch_ms(hub_rules::TimePoint t)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    hub_rules::TimePoint from_epoch_ms(int64_t ms)
    {
        return hub_rules::TimePoint(std::chrono::duration_cast<hub_rules::TimePoint::duration>(
            std::chrono::milliseconds(ms)));
    }

    hub_rules::DeviceEvent decode_event(const pb::DeviceEvent &event, hub_rules::TimePoint arrival)
    {
        if (event.device_id().empty())
        {
            throw std::invalid_argument("device event without device_id");
        }
        if (event.attribute().empty())
        {
            throw std::invalid_argument("device event for '" + event.device_id() + "' without attribute");
        }

        hub_rules::DeviceEvent out;
        out.device_id = event.device_id();
        out.attribute = event.attribute();
        out.value = from_proto(event.value());
        out.timestamp = event.timestamp_ms() != 0 ? from_epoch_ms(event.timestamp_ms()) : arrival;
        return out;
    }

    bool parse_hub_frame(const std::vector<uint8_t> &payload, pb::HubFrame &frame)
    {
        return frame.ParseFromArray(payload.data(), static_cast<int>(payload.size()));
    }

    std::string encode_command(const hub_rules::ExecutionContext &ctx, const hub_rules::DeviceId &device_id,
                               const std::string &command, const hub_rules::ValueList &args,
                               hub_rules::TimePoint when)
    {
        pb::CommandIssued msg;
        msg.set_device_id(device_id);
        msg.set_command(command);
        for (const auto &arg : args)
        {
            to_proto(arg, msg.add_arguments());
        }
        msg.set_rule_name(ctx.rule_name);
        msg.set_scene_name(ctx.scene_name);
        msg.set_timestamp_ms(to_epoch_ms(when));

        std::string bytes;
        if (!msg.SerializeToString(&bytes))
        {
            throw std::runtime_error("failed to serialize CommandIssued for '" + device_id + "'");
        }
        return bytes;
    }

} // namespace transport
