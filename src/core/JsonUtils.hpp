// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace vadkit::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts a required boolean field from a JSON object.
[[nodiscard]] inline auto getBool(const nlohmann::json& obj, std::string_view key) -> Result<bool>
{
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_boolean())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid boolean field: {}", key));
    return obj[keyStr].get<bool>();
}

/// @brief Extracts a required numeric field from a JSON object.
[[nodiscard]] inline auto getDouble(const nlohmann::json& obj, std::string_view key) -> Result<double>
{
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_number())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid number field: {}", key));
    return obj[keyStr].get<double>();
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, std::int64_t defaultValue)
    -> std::int64_t
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<std::int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional float field from a JSON object.
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<float>();
    return defaultValue;
}

/// @brief Extracts a numeric field that may be absent or null.
/// @return The value, or std::nullopt if missing, null or not a number.
[[nodiscard]] inline auto getOptionalDouble(const nlohmann::json& obj, std::string_view key)
    -> std::optional<double>
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return std::nullopt;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

} // namespace vadkit::json
