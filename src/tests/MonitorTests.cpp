// SPDX-License-Identifier: Apache-2.0
#include <vadkit/Monitor.hpp>

#include "TestAudio.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vadkit;
using Catch::Approx;

namespace
{

auto testConfig() -> AppConfig
{
    auto config = AppConfig {};
    config.stream = { .sampleRate = 16000, .blockSize = 160 };
    return config;
}

} // namespace

TEST_CASE("Monitor reports speech start and end from a file", "[monitor]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vadkit_test_monitor.wav";
    REQUIRE(test::writeWav(tempPath, test::burst(160, 10, 20, 15, 0.1f), 16000));

    auto events = std::vector<PositionedVadEvent> {};
    auto monitor = Monitor(testConfig());
    auto result = monitor.run(tempPath.string(), [&](const PositionedVadEvent& e) { events.push_back(e); });

    REQUIRE(result.has_value());
    CHECK(result->framesRead == 45 * 160);
    CHECK(result->blocksProcessed == 45);
    CHECK(result->eventsDelivered == 2);
    CHECK(result->eventsDropped == 0);
    CHECK(!result->speakingAtEnd);

    REQUIRE(events.size() == 2);
    CHECK(events[0].event.speaking);
    CHECK(events[0].blockIndex == 12);
    CHECK(events[0].event.rms == Approx(0.1f));
    CHECK(!events[1].event.speaking);
    CHECK(events[1].blockIndex == 37);
    CHECK(events[1].timeMs == Approx(380.0));

    std::filesystem::remove(tempPath);
}

TEST_CASE("Monitor reports speech still active at end of file", "[monitor]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vadkit_test_monitor_open.wav";
    REQUIRE(test::writeWav(tempPath, test::burst(160, 2, 10, 3, 0.1f), 16000));

    auto count = 0;
    auto monitor = Monitor(testConfig());
    auto result = monitor.run(tempPath.string(), [&](const PositionedVadEvent&) { ++count; });

    REQUIRE(result.has_value());
    CHECK(count == 1);
    CHECK(result->speakingAtEnd);

    std::filesystem::remove(tempPath);
}

TEST_CASE("Monitor surfaces configuration errors before opening the file", "[monitor]")
{
    auto config = testConfig();
    config.detector.detector.speechThreshold = 0.0f;

    auto called = false;
    auto monitor = Monitor(config);
    auto result = monitor.run("/nonexistent/file.wav", [&](const PositionedVadEvent&) { called = true; });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(!called);
}

TEST_CASE("Monitor surfaces I/O errors", "[monitor]")
{
    auto monitor = Monitor(testConfig());
    auto result = monitor.run("/nonexistent/file.wav", [](const PositionedVadEvent&) {});

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}

TEST_CASE("Monitor delivers every transition when the consumer falls behind", "[monitor]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vadkit_test_monitor_busy.wav";
    constexpr auto Blocks = 1000;
    REQUIRE(test::writeWav(tempPath, test::alternating(160, Blocks, 0.1f), 16000));

    auto config = testConfig();
    config.detector.detector.onsetFrames = 1;
    config.detector.detector.offsetFrames = 1;

    // Stalling on the first event lets the decoder run far ahead of the queue capacity.
    auto events = std::vector<PositionedVadEvent> {};
    auto monitor = Monitor(config);
    auto result = monitor.run(tempPath.string(), [&](const PositionedVadEvent& e) {
        if (events.empty())
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        events.push_back(e);
    });

    REQUIRE(result.has_value());
    CHECK(result->blocksProcessed == Blocks);
    CHECK(result->eventsDelivered == Blocks);
    CHECK(result->eventsDropped == 0);

    REQUIRE(events.size() == static_cast<std::size_t>(Blocks));
    auto alternates = true;
    for (auto i = std::size_t { 0 }; i < events.size(); ++i)
        alternates = alternates && events[i].blockIndex == i && events[i].event.speaking == (i % 2 == 0);
    CHECK(alternates);

    std::filesystem::remove(tempPath);
}

TEST_CASE("Monitor stops its producer when the sink throws", "[monitor]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vadkit_test_monitor_throw.wav";
    REQUIRE(test::writeWav(tempPath, test::alternating(160, 1000, 0.1f), 16000));

    auto config = testConfig();
    config.detector.detector.onsetFrames = 1;
    config.detector.detector.offsetFrames = 1;

    auto monitor = Monitor(config);
    REQUIRE_THROWS_AS(
        (void) monitor.run(tempPath.string(),
                           [](const PositionedVadEvent&) { throw std::runtime_error("sink failed"); }),
        std::runtime_error);

    std::filesystem::remove(tempPath);
}
