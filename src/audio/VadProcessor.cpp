// SPDX-License-Identifier: Apache-2.0
#include "VadProcessor.hpp"

#include <algorithm>

namespace vadkit
{

VadProcessor::VadProcessor(VoiceActivityDetector detector,
                           const StreamFormat& format,
                           VadEventQueue& events,
                           QueueFullPolicy policy):
    _detector(std::move(detector)),
    _format(format),
    _events(&events),
    _policy(policy),
    _pending(format.blockSize, 0.0f)
{
}

auto VadProcessor::create(VoiceActivityDetector detector,
                          const StreamFormat& format,
                          VadEventQueue& events,
                          QueueFullPolicy policy) -> Result<VadProcessor>
{
    if (auto result = validate(format); !result)
        return std::unexpected(result.error());

    return VadProcessor(std::move(detector), format, events, policy);
}

void VadProcessor::process(std::span<const float> chunk)
{
    auto const blockSize = static_cast<std::size_t>(_format.blockSize);

    while (!chunk.empty())
    {
        // Whole blocks straight from the caller's buffer when nothing is pending.
        if (_pendingCount == 0 && chunk.size() >= blockSize)
        {
            processBlock(chunk.first(blockSize));
            chunk = chunk.subspan(blockSize);
            continue;
        }

        auto const count = std::min(blockSize - _pendingCount, chunk.size());
        std::ranges::copy(chunk.first(count), _pending.begin() + static_cast<std::ptrdiff_t>(_pendingCount));
        _pendingCount += count;
        chunk = chunk.subspan(count);

        if (_pendingCount == blockSize)
        {
            processBlock(_pending);
            _pendingCount = 0;
        }
    }
}

void VadProcessor::flush()
{
    if (_pendingCount == 0)
        return;

    processBlock(std::span<const float>(_pending).first(_pendingCount));
    _pendingCount = 0;
}

void VadProcessor::processBlock(std::span<const float> block)
{
    auto const blockIndex = _blocksProcessed;
    _samplesProcessed += block.size();
    ++_blocksProcessed;

    auto event = _detector.process(block);
    if (!event)
        return;

    auto const timeMs = 1000.0 * static_cast<double>(_samplesProcessed) / static_cast<double>(_format.sampleRate);
    auto const positioned = PositionedVadEvent { .event = *event, .blockIndex = blockIndex, .timeMs = timeMs };

    // Dropped events are counted by the queue for the consumer to report.
    auto const posted = _policy == QueueFullPolicy::Wait ? _events->pushWait(positioned, _stopToken)
                                                         : _events->tryPush(positioned);
    if (posted)
        ++_eventsPosted;
}

} // namespace vadkit
