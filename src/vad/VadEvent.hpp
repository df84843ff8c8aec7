// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace vadkit
{

/// @brief Value of the "type" discriminant in the event wire record.
constexpr auto VadEventType = std::string_view { "vad" };

/// @brief A speaking-state transition. Only emitted on edges, never per block.
struct VadEvent
{
    bool speaking = false;

    /// @brief RMS of the block that completed the transition.
    float rms = 0.0f;

    auto operator==(const VadEvent&) const -> bool = default;
};

/// @brief A VadEvent tagged with its position in the stream.
struct PositionedVadEvent
{
    VadEvent event;

    /// @brief 0-based index of the block that triggered the transition.
    std::uint64_t blockIndex = 0;

    /// @brief Stream time at the end of that block, in milliseconds.
    double timeMs = 0.0;
};

/// @brief Encodes an event as {"type": "vad", "speaking": bool, "rms": number}.
[[nodiscard]] auto toJson(const VadEvent& event) -> nlohmann::json;

/// @brief Encodes the wire record plus "block" and "timeMs" fields.
[[nodiscard]] auto toJson(const PositionedVadEvent& event) -> nlohmann::json;

/// @brief Decodes a wire record.
/// @return The event, or ErrorCode::ProtocolError if the discriminant or a field is wrong.
[[nodiscard]] auto vadEventFromJson(const nlohmann::json& record) -> Result<VadEvent>;

} // namespace vadkit

template <>
struct std::formatter<vadkit::VadEvent>: std::formatter<std::string>
{
    auto format(const vadkit::VadEvent& event, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("{} (rms {:.4f})", event.speaking ? "speech" : "silence", event.rms), ctx);
    }
};
