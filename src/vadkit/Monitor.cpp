// SPDX-License-Identifier: Apache-2.0
#include "Monitor.hpp"

#include <audio/AudioFileReader.hpp>
#include <audio/VadProcessor.hpp>
#include <core/Log.hpp>
#include <vad/VoiceActivityDetector.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>

namespace vadkit
{

Monitor::Monitor(AppConfig config): _config(std::move(config))
{
}

auto Monitor::run(std::string_view audioPath, const EventSink& sink) -> Result<MonitorSummary>
{
    auto detectorConfig = resolveDetectorConfig(_config);
    if (!detectorConfig)
        return std::unexpected(detectorConfig.error());

    auto detector = VoiceActivityDetector::create(*detectorConfig);
    if (!detector)
        return std::unexpected(detector.error());

    log::info("Detector: threshold {}, onset {} blocks, offset {} blocks, block {} samples @ {} Hz",
              detectorConfig->speechThreshold,
              detectorConfig->onsetFrames,
              detectorConfig->offsetFrames,
              _config.stream.blockSize,
              _config.stream.sampleRate);

    // The file decoder has no real-time deadline, so the producer waits for queue
    // space instead of dropping transitions.
    auto events = std::make_unique<VadEventQueue>();
    auto processor = VadProcessor::create(std::move(*detector), _config.stream, *events, QueueFullPolicy::Wait);
    if (!processor)
        return std::unexpected(processor.error());

    auto reader = AudioFileReader {};
    if (auto openResult = reader.open(audioPath, _config.stream); !openResult)
        return std::unexpected(openResult.error());

    auto producerDone = std::atomic<bool> { false };
    auto readResult = std::optional<Result<std::uint64_t>> {};

    // Declared after everything it touches: on any early exit (a throwing sink) the
    // jthread destructor requests stop and joins before those are destroyed.
    auto producer = std::jthread([&](const std::stop_token& stopToken) {
        processor->setStopToken(stopToken);
        readResult = reader.read([&](std::span<const float> chunk) {
            if (!stopToken.stop_requested())
                processor->process(chunk);
        });
        if (!stopToken.stop_requested())
            processor->flush();
        producerDone.store(true, std::memory_order_release);
    });

    auto summary = MonitorSummary {};
    auto const deliver = [&](const PositionedVadEvent& event) {
        log::debug("Block {}: {}", event.blockIndex, event.event);
        sink(event);
        ++summary.eventsDelivered;
    };

    while (!producerDone.load(std::memory_order_acquire))
    {
        if (auto event = events->tryPop())
            deliver(*event);
        else
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    producer.join();

    while (auto event = events->tryPop())
        deliver(*event);

    if (!*readResult)
        return std::unexpected(readResult->error());

    summary.framesRead = **readResult;
    summary.blocksProcessed = processor->blocksProcessed();
    summary.eventsDropped = events->droppedCount();
    summary.speakingAtEnd = processor->detector().speaking();

    if (summary.eventsDropped > 0)
        log::warning("{} events dropped, event queue full", summary.eventsDropped);

    log::info("Processed {} frames in {} blocks, {} transitions",
              summary.framesRead,
              summary.blocksProcessed,
              summary.eventsDelivered);
    return summary;
}

} // namespace vadkit
