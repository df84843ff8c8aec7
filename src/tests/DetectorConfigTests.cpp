// SPDX-License-Identifier: Apache-2.0
#include <vad/DetectorConfig.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optional>

using namespace vadkit;
using Catch::Approx;

TEST_CASE("validate accepts the default configuration", "[detector-config]")
{
    CHECK(validate(DetectorConfig {}).has_value());
    CHECK(validate(StreamFormat {}).has_value());
}

TEST_CASE("validate accepts thresholds just inside the open interval", "[detector-config]")
{
    CHECK(validate(DetectorConfig { .speechThreshold = 0.0001f }).has_value());
    CHECK(validate(DetectorConfig { .speechThreshold = 0.9999f }).has_value());
}

TEST_CASE("validate rejects an empty stream format", "[detector-config]")
{
    auto result = validate(StreamFormat { .sampleRate = 0, .blockSize = 128 });
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ConfigError);

    result = validate(StreamFormat { .sampleRate = 48000, .blockSize = 0 });
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("blockDurationMs", "[detector-config]")
{
    CHECK(blockDurationMs(128, 48000) == Approx(2.6666667));
    CHECK(blockDurationMs(160, 16000) == Approx(10.0));
    CHECK(blockDurationMs(128, 0) == 0.0);
}

TEST_CASE("framesForDuration rounds up", "[detector-config]")
{
    CHECK(framesForDuration(30.0, 10.0) == 3);
    CHECK(framesForDuration(31.0, 10.0) == 4);
    CHECK(framesForDuration(1.0, 10.0) == 1);
    CHECK(framesForDuration(200.0, 2.5) == 80);
}

TEST_CASE("framesForDuration never returns zero", "[detector-config]")
{
    CHECK(framesForDuration(0.0, 10.0) == 1);
    CHECK(framesForDuration(-5.0, 10.0) == 1);
    CHECK(framesForDuration(30.0, 0.0) == 1);
}

TEST_CASE("detectorConfigFromDurations converts milliseconds to blocks", "[detector-config]")
{
    auto const format = StreamFormat { .sampleRate = 16000, .blockSize = 160 };
    auto const base = DetectorConfig { .speechThreshold = 0.02f, .onsetFrames = 5, .offsetFrames = 7 };

    SECTION("both durations")
    {
        auto result = detectorConfigFromDurations(base, 30.0, 200.0, format);
        REQUIRE(result.has_value());
        CHECK(result->speechThreshold == 0.02f);
        CHECK(result->onsetFrames == 3);
        CHECK(result->offsetFrames == 20);
    }

    SECTION("unset duration keeps the base frame count")
    {
        auto result = detectorConfigFromDurations(base, std::nullopt, 200.0, format);
        REQUIRE(result.has_value());
        CHECK(result->onsetFrames == 5);
        CHECK(result->offsetFrames == 20);
    }

    SECTION("no durations ignores the format")
    {
        auto result = detectorConfigFromDurations(base, std::nullopt, std::nullopt, StreamFormat { .sampleRate = 0 });
        REQUIRE(result.has_value());
        CHECK(result->onsetFrames == 5);
        CHECK(result->offsetFrames == 7);
    }
}

TEST_CASE("detectorConfigFromDurations validates its inputs", "[detector-config]")
{
    auto const format = StreamFormat { .sampleRate = 16000, .blockSize = 160 };

    SECTION("bad threshold")
    {
        auto result = detectorConfigFromDurations({ .speechThreshold = 1.5f }, 30.0, 200.0, format);
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("bad threshold without durations")
    {
        auto result = detectorConfigFromDurations({ .speechThreshold = 1.5f }, std::nullopt, std::nullopt, format);
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("negative duration")
    {
        auto result = detectorConfigFromDurations({}, -1.0, 200.0, format);
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("bad format")
    {
        auto result = detectorConfigFromDurations({}, 30.0, 200.0, StreamFormat { .sampleRate = 0 });
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}
