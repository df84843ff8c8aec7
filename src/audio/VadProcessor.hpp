// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/DetectorConfig.hpp>
#include <vad/EventQueue.hpp>
#include <vad/VadEvent.hpp>
#include <vad/VoiceActivityDetector.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <utility>
#include <vector>

namespace vadkit
{

/// @brief Channel from the audio thread to the controller thread.
using VadEventQueue = EventQueue<PositionedVadEvent, 256>;

/// @brief What the processor does when the event queue is full.
enum class QueueFullPolicy : std::uint8_t
{
    /// @brief Drop the event and count it. Required inside a real-time audio callback.
    Drop,

    /// @brief Yield until the consumer frees a slot. For producers without a deadline.
    Wait,
};

/// @brief Drives a detector from an audio stream delivered in arbitrary chunk sizes.
///
/// Incoming samples are cut into fixed blocks of StreamFormat::blockSize. Every
/// completed block goes through the detector in stream order and each transition is
/// posted to the event queue together with its position. The block buffer is sized
/// at construction, so process() is safe to call from an audio callback.
class VadProcessor
{
  public:
    /// @brief Creates a processor.
    /// @param detector The detector to drive. Its current state is kept.
    /// @param format Block size and sample rate of the stream.
    /// @param events Queue receiving the transitions. Must outlive the processor.
    /// @param policy Behaviour on a full queue.
    /// @return The processor, or ErrorCode::ConfigError for an invalid format.
    [[nodiscard]] static auto create(VoiceActivityDetector detector,
                                     const StreamFormat& format,
                                     VadEventQueue& events,
                                     QueueFullPolicy policy = QueueFullPolicy::Drop) -> Result<VadProcessor>;

    /// @brief Token that ends a QueueFullPolicy::Wait wait. The pending event is then dropped.
    void setStopToken(std::stop_token stopToken) { _stopToken = std::move(stopToken); }

    /// @brief Feeds the next chunk of mono samples. Partial blocks carry over.
    void process(std::span<const float> chunk);

    /// @brief Runs the detector on a trailing partial block, if any.
    void flush();

    [[nodiscard]] auto blocksProcessed() const -> std::uint64_t { return _blocksProcessed; }
    [[nodiscard]] auto eventsPosted() const -> std::uint64_t { return _eventsPosted; }

    /// @brief Samples waiting for their block to fill up.
    [[nodiscard]] auto pendingSamples() const -> std::size_t { return _pendingCount; }

    [[nodiscard]] auto detector() const -> const VoiceActivityDetector& { return _detector; }
    [[nodiscard]] auto format() const -> const StreamFormat& { return _format; }

  private:
    VadProcessor(VoiceActivityDetector detector,
                 const StreamFormat& format,
                 VadEventQueue& events,
                 QueueFullPolicy policy);

    void processBlock(std::span<const float> block);

    VoiceActivityDetector _detector;
    StreamFormat _format;
    VadEventQueue* _events;
    QueueFullPolicy _policy;
    std::stop_token _stopToken;

    std::vector<float> _pending;
    std::size_t _pendingCount = 0;

    std::uint64_t _samplesProcessed = 0;
    std::uint64_t _blocksProcessed = 0;
    std::uint64_t _eventsPosted = 0;
};

} // namespace vadkit
