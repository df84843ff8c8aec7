// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace vadkit
{

namespace
{

    // Frame counts and stream sizes are unsigned; reject what does not fit instead of wrapping.
    auto getUint32Or(const nlohmann::json& obj,
                     std::string_view section,
                     std::string_view key,
                     std::uint32_t defaultValue) -> Result<std::uint32_t>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr))
            return defaultValue;

        auto const& value = obj[keyStr];
        if (!value.is_number_integer())
            return makeError(ErrorCode::ConfigError, std::format("{}.{} must be an integer", section, key));

        auto const raw = json::getIntOr(obj, key, 0);
        if (raw < 0 || raw > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
            return makeError(ErrorCode::ConfigError, std::format("{}.{} out of range: {}", section, key, raw));
        return static_cast<std::uint32_t>(raw);
    }

    auto getFloatStrict(const nlohmann::json& obj, std::string_view section, std::string_view key, float defaultValue)
        -> Result<float>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr))
            return defaultValue;
        if (!obj[keyStr].is_number())
            return makeError(ErrorCode::ConfigError, std::format("{}.{} must be a number", section, key));
        return json::getFloatOr(obj, key, defaultValue);
    }

    // Absent and null both mean "not set".
    auto getOptionalDurationMs(const nlohmann::json& obj, std::string_view section, std::string_view key)
        -> Result<std::optional<double>>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr) || obj[keyStr].is_null())
            return std::nullopt;
        if (!obj[keyStr].is_number())
            return makeError(ErrorCode::ConfigError, std::format("{}.{} must be a number or null", section, key));
        return json::getOptionalDouble(obj, key);
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\vadkit";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/vadkit";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/vadkit";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/vadkit";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto resolveDetectorConfig(const AppConfig& config) -> Result<DetectorConfig>
{
    auto const& section = config.detector;
    auto resolved = detectorConfigFromDurations(section.detector, section.onsetMs, section.offsetMs, config.stream);
    if (!resolved)
        return std::unexpected(resolved.error());

    if (section.onsetMs || section.offsetMs)
        log::debug("Detector timing: block {:.3f} ms, onset {} blocks, offset {} blocks",
                   blockDurationMs(config.stream.blockSize, config.stream.sampleRate),
                   resolved->onsetFrames,
                   resolved->offsetFrames);
    return resolved;
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Detector section
    if (root.contains("detector"))
    {
        auto const& detector = root["detector"];
        if (!detector.is_object())
            return makeError(ErrorCode::ConfigError, "detector must be a JSON object");

        auto threshold =
            getFloatStrict(detector, "detector", "speechThreshold", config.detector.detector.speechThreshold);
        if (!threshold)
            return std::unexpected(threshold.error());
        config.detector.detector.speechThreshold = *threshold;

        auto onset = getUint32Or(detector, "detector", "onsetFrames", config.detector.detector.onsetFrames);
        if (!onset)
            return std::unexpected(onset.error());
        config.detector.detector.onsetFrames = *onset;

        auto offset = getUint32Or(detector, "detector", "offsetFrames", config.detector.detector.offsetFrames);
        if (!offset)
            return std::unexpected(offset.error());
        config.detector.detector.offsetFrames = *offset;

        auto onsetMs = getOptionalDurationMs(detector, "detector", "onsetMs");
        if (!onsetMs)
            return std::unexpected(onsetMs.error());
        config.detector.onsetMs = *onsetMs;

        auto offsetMs = getOptionalDurationMs(detector, "detector", "offsetMs");
        if (!offsetMs)
            return std::unexpected(offsetMs.error());
        config.detector.offsetMs = *offsetMs;
    }

    // Stream section
    if (root.contains("stream"))
    {
        auto const& stream = root["stream"];
        if (!stream.is_object())
            return makeError(ErrorCode::ConfigError, "stream must be a JSON object");

        auto sampleRate = getUint32Or(stream, "stream", "sampleRate", config.stream.sampleRate);
        if (!sampleRate)
            return std::unexpected(sampleRate.error());
        config.stream.sampleRate = *sampleRate;

        auto blockSize = getUint32Or(stream, "stream", "blockSize", config.stream.blockSize);
        if (!blockSize)
            return std::unexpected(blockSize.error());
        config.stream.blockSize = *blockSize;
    }

    // Output section
    if (root.contains("output"))
    {
        auto const& output = root["output"];
        if (!output.is_object())
            return makeError(ErrorCode::ConfigError, "output must be a JSON object");
        if (output.contains("positions") && !output["positions"].is_boolean())
            return makeError(ErrorCode::ConfigError, "output.positions must be a boolean");
        config.output.positions = json::getBoolOr(output, "positions", false);
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto result = parseConfig(ss.str());
    if (!result)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, result.error().message));

    log::debug("Loaded config from {}", path);
    return result;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Detector section
    auto detector = nlohmann::json::object();
    detector["speechThreshold"] = config.detector.detector.speechThreshold;
    detector["onsetFrames"] = config.detector.detector.onsetFrames;
    detector["offsetFrames"] = config.detector.detector.offsetFrames;
    if (config.detector.onsetMs)
        detector["onsetMs"] = *config.detector.onsetMs;
    if (config.detector.offsetMs)
        detector["offsetMs"] = *config.detector.offsetMs;
    root["detector"] = std::move(detector);

    // Stream section
    auto stream = nlohmann::json::object();
    stream["sampleRate"] = config.stream.sampleRate;
    stream["blockSize"] = config.stream.blockSize;
    root["stream"] = std::move(stream);

    // Output section
    auto output = nlohmann::json::object();
    output["positions"] = config.output.positions;
    root["output"] = std::move(output);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace vadkit
