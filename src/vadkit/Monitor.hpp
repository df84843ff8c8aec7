// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vad/VadEvent.hpp>
#include <vadkit/Config.hpp>

#include <cstdint>
#include <functional>
#include <string_view>

namespace vadkit
{

/// @brief Receives each transition on the controller thread.
using EventSink = std::function<void(const PositionedVadEvent& event)>;

/// @brief Counters reported after a monitor run.
struct MonitorSummary
{
    std::uint64_t framesRead = 0;
    std::uint64_t blocksProcessed = 0;
    std::uint64_t eventsDelivered = 0;
    std::uint64_t eventsDropped = 0;
    bool speakingAtEnd = false;
};

/// @brief Runs the detector over an audio file.
///
/// Decoding and detection run on a producer thread, standing in for the audio thread.
/// Transitions travel through a VadEventQueue and are handed to the sink on the
/// calling thread. The producer waits for queue space, so no transition is dropped.
class Monitor
{
  public:
    explicit Monitor(AppConfig config);

    /// @brief Processes a whole file.
    /// @param audioPath File to decode.
    /// @param sink Called for every transition, in stream order.
    /// @return Run counters, or the first configuration or I/O error.
    /// An exception thrown by the sink propagates after the producer has been stopped and joined.
    [[nodiscard]] auto run(std::string_view audioPath, const EventSink& sink) -> Result<MonitorSummary>;

  private:
    AppConfig _config;
};

} // namespace vadkit
