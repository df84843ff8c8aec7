// SPDX-License-Identifier: Apache-2.0
#include "DetectorConfig.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace vadkit
{

auto validate(const DetectorConfig& config) -> VoidResult
{
    // Written so that NaN fails the check.
    if (!(config.speechThreshold > 0.0f && config.speechThreshold < 1.0f))
        return makeError(ErrorCode::ConfigError,
                         std::format("speechThreshold must be in (0, 1), got {}", config.speechThreshold));

    if (config.onsetFrames < 1)
        return makeError(ErrorCode::ConfigError,
                         std::format("onsetFrames must be >= 1, got {}", config.onsetFrames));

    if (config.offsetFrames < 1)
        return makeError(ErrorCode::ConfigError,
                         std::format("offsetFrames must be >= 1, got {}", config.offsetFrames));

    return {};
}

auto validate(const StreamFormat& format) -> VoidResult
{
    if (format.sampleRate == 0)
        return makeError(ErrorCode::ConfigError, "sampleRate must be > 0");
    if (format.blockSize == 0)
        return makeError(ErrorCode::ConfigError, "blockSize must be > 0");
    return {};
}

auto blockDurationMs(std::uint32_t blockSize, std::uint32_t sampleRate) -> double
{
    if (sampleRate == 0)
        return 0.0;
    return 1000.0 * static_cast<double>(blockSize) / static_cast<double>(sampleRate);
}

auto framesForDuration(double durationMs, double blockMs) -> std::uint32_t
{
    if (!(blockMs > 0.0) || !(durationMs > 0.0))
        return 1;

    auto const frames = std::ceil(durationMs / blockMs);
    if (frames >= static_cast<double>(std::numeric_limits<std::uint32_t>::max()))
        return std::numeric_limits<std::uint32_t>::max();
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(frames));
}

auto detectorConfigFromDurations(const DetectorConfig& base,
                                 std::optional<double> onsetMs,
                                 std::optional<double> offsetMs,
                                 const StreamFormat& format) -> Result<DetectorConfig>
{
    auto config = base;

    if (onsetMs || offsetMs)
    {
        if (auto formatResult = validate(format); !formatResult)
            return std::unexpected(formatResult.error());

        auto const blockMs = blockDurationMs(format.blockSize, format.sampleRate);

        if (onsetMs)
        {
            if (!(*onsetMs >= 0.0))
                return makeError(ErrorCode::ConfigError, std::format("onsetMs must be >= 0, got {}", *onsetMs));
            config.onsetFrames = framesForDuration(*onsetMs, blockMs);
        }

        if (offsetMs)
        {
            if (!(*offsetMs >= 0.0))
                return makeError(ErrorCode::ConfigError, std::format("offsetMs must be >= 0, got {}", *offsetMs));
            config.offsetFrames = framesForDuration(*offsetMs, blockMs);
        }
    }

    if (auto result = validate(config); !result)
        return std::unexpected(result.error());
    return config;
}

} // namespace vadkit
