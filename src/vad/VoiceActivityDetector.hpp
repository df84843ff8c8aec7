// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/DetectorConfig.hpp>
#include <vad/VadEvent.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace vadkit
{

/// @brief Debounce counters and speaking flag of a detector.
struct DetectorState
{
    std::uint32_t aboveCount = 0;
    std::uint32_t belowCount = 0;
    bool speaking = false;

    auto operator==(const DetectorState&) const -> bool = default;
};

/// @brief Root-mean-square amplitude of a block.
///
/// Returns 0 for an empty block and for blocks whose energy is not finite.
[[nodiscard]] auto computeRms(std::span<const float> samples) -> float;

/// @brief Energy based voice activity detector with onset/offset hysteresis.
///
/// Each block's RMS is compared against the speech threshold. The detector enters
/// speech after onsetFrames consecutive loud blocks and leaves it after offsetFrames
/// consecutive quiet blocks. Events are only produced on these two edges.
///
/// process() neither allocates, locks nor logs, so it may run inside a real-time
/// audio callback. An instance belongs to one stream and one thread.
class VoiceActivityDetector
{
  public:
    /// @brief Creates a detector in the silence state.
    /// @param config Detector tuning.
    /// @return The detector, or ErrorCode::ConfigError if config is out of range.
    [[nodiscard]] static auto create(const DetectorConfig& config) -> Result<VoiceActivityDetector>;

    /// @brief Feeds one block of mono samples.
    /// @param block Samples in [-1, 1]. Not retained past this call. Empty blocks are ignored.
    /// @return The transition caused by this block, if any.
    [[nodiscard]] auto process(std::span<const float> block) -> std::optional<VadEvent>;

    /// @brief Returns the detector to its initial silence state.
    void reset();

    [[nodiscard]] auto state() const -> DetectorState { return _state; }
    [[nodiscard]] auto speaking() const -> bool { return _state.speaking; }

    /// @brief RMS of the most recent non-empty block.
    [[nodiscard]] auto lastRms() const -> float { return _lastRms; }

    [[nodiscard]] auto config() const -> const DetectorConfig& { return _config; }

  private:
    explicit VoiceActivityDetector(const DetectorConfig& config);

    DetectorConfig _config;
    DetectorState _state;
    float _lastRms = 0.0f;
};

} // namespace vadkit
