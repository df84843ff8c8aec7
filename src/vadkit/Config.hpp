// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/DetectorConfig.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vadkit
{

/// @brief Detector section of the config file.
struct DetectorSection
{
    DetectorConfig detector;

    /// @brief Onset as a duration. Overrides detector.onsetFrames when set.
    std::optional<double> onsetMs;

    /// @brief Offset as a duration. Overrides detector.offsetFrames when set.
    std::optional<double> offsetMs;
};

/// @brief Output section of the config file.
struct OutputConfig
{
    /// @brief Adds "block" and "timeMs" to every printed event.
    bool positions = false;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    DetectorSection detector;
    StreamFormat stream;
    OutputConfig output;
};

/// @brief Resolves the effective detector configuration, converting durations to block counts.
/// @return The configuration, or ErrorCode::ConfigError.
[[nodiscard]] auto resolveDetectorConfig(const AppConfig& config) -> Result<DetectorConfig>;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; defaults are returned.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses the application configuration from a JSON document.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace vadkit
