// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>

namespace vadkit
{

/// @brief Tuning of the energy detector.
///
/// Onset and offset are counted in blocks, so their wall-clock meaning depends on
/// the block size and sample rate of the stream (see StreamFormat).
struct DetectorConfig
{
    /// @brief RMS amplitude a block must strictly exceed to count as speech. Range (0, 1).
    float speechThreshold = 0.015f;

    /// @brief Consecutive above-threshold blocks required to enter speech.
    std::uint32_t onsetFrames = 3;

    /// @brief Consecutive below-threshold blocks required to leave speech (hangover).
    std::uint32_t offsetFrames = 8;
};

/// @brief Shape of the block stream fed into a detector.
struct StreamFormat
{
    std::uint32_t sampleRate = 48000;

    /// @brief Samples per block. 128 matches the Web Audio render quantum.
    std::uint32_t blockSize = 128;
};

/// @brief Checks the DetectorConfig invariants.
/// @return Success, or ErrorCode::ConfigError naming the offending field.
[[nodiscard]] auto validate(const DetectorConfig& config) -> VoidResult;

/// @brief Checks that a StreamFormat has a non-zero sample rate and block size.
[[nodiscard]] auto validate(const StreamFormat& format) -> VoidResult;

/// @brief Duration of one block in milliseconds.
[[nodiscard]] auto blockDurationMs(std::uint32_t blockSize, std::uint32_t sampleRate) -> double;

/// @brief Converts a duration into a block count, ceil(durationMs / blockMs), never less than 1.
[[nodiscard]] auto framesForDuration(double durationMs, double blockMs) -> std::uint32_t;

/// @brief Applies onset/offset durations in milliseconds on top of a base configuration.
///
/// A duration that is not set keeps the base frame count. The stream format is only
/// consulted (and validated) when at least one duration is set.
/// @return The validated configuration, or ErrorCode::ConfigError for a bad format,
///         a negative duration or an invalid result.
[[nodiscard]] auto detectorConfigFromDurations(const DetectorConfig& base,
                                               std::optional<double> onsetMs,
                                               std::optional<double> offsetMs,
                                               const StreamFormat& format) -> Result<DetectorConfig>;

} // namespace vadkit
