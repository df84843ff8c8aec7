// SPDX-License-Identifier: Apache-2.0
#include "VadEvent.hpp"

#include <core/JsonUtils.hpp>

namespace vadkit
{

auto toJson(const VadEvent& event) -> nlohmann::json
{
    return nlohmann::json {
        { "type", VadEventType },
        { "speaking", event.speaking },
        { "rms", event.rms },
    };
}

auto toJson(const PositionedVadEvent& event) -> nlohmann::json
{
    auto record = toJson(event.event);
    record["block"] = event.blockIndex;
    record["timeMs"] = event.timeMs;
    return record;
}

auto vadEventFromJson(const nlohmann::json& record) -> Result<VadEvent>
{
    if (!record.is_object())
        return makeError(ErrorCode::ProtocolError, "VAD event record must be a JSON object");

    auto type = json::getString(record, "type");
    if (!type)
        return std::unexpected(type.error());
    if (*type != VadEventType)
        return makeError(ErrorCode::ProtocolError, std::format("Unexpected event type: {}", *type));

    auto speaking = json::getBool(record, "speaking");
    if (!speaking)
        return std::unexpected(speaking.error());

    auto rms = json::getDouble(record, "rms");
    if (!rms)
        return std::unexpected(rms.error());

    return VadEvent { .speaking = *speaking, .rms = static_cast<float>(*rms) };
}

} // namespace vadkit
