// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <cmath>
#include <limits>

namespace vadkit
{

namespace
{

    void saturatingIncrement(std::uint32_t& counter)
    {
        if (counter < std::numeric_limits<std::uint32_t>::max())
            ++counter;
    }

} // namespace

auto computeRms(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto sum = 0.0;
    for (auto const sample: samples)
        sum += static_cast<double>(sample) * static_cast<double>(sample);

    auto const rms = std::sqrt(sum / static_cast<double>(samples.size()));
    if (!std::isfinite(rms))
        return 0.0f;
    return static_cast<float>(rms);
}

VoiceActivityDetector::VoiceActivityDetector(const DetectorConfig& config): _config(config)
{
}

auto VoiceActivityDetector::create(const DetectorConfig& config) -> Result<VoiceActivityDetector>
{
    if (auto result = validate(config); !result)
        return std::unexpected(result.error());

    return VoiceActivityDetector(config);
}

auto VoiceActivityDetector::process(std::span<const float> block) -> std::optional<VadEvent>
{
    if (block.empty())
        return std::nullopt;

    auto const rms = computeRms(block);
    _lastRms = rms;

    if (rms > _config.speechThreshold)
    {
        saturatingIncrement(_state.aboveCount);
        _state.belowCount = 0;
    }
    else
    {
        saturatingIncrement(_state.belowCount);
        _state.aboveCount = 0;
    }

    if (!_state.speaking && _state.aboveCount >= _config.onsetFrames)
    {
        _state.speaking = true;
        return VadEvent { .speaking = true, .rms = rms };
    }

    if (_state.speaking && _state.belowCount >= _config.offsetFrames)
    {
        _state.speaking = false;
        return VadEvent { .speaking = false, .rms = rms };
    }

    return std::nullopt;
}

void VoiceActivityDetector::reset()
{
    _state = DetectorState {};
    _lastRms = 0.0f;
}

} // namespace vadkit
