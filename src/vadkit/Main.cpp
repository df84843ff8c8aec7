// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <vad/VadEvent.hpp>
#include <vadkit/Config.hpp>
#include <vadkit/Monitor.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "vadkit: energy based voice activity detection" };

    auto audioPath = std::string {};
    auto configPath = std::string {};
    auto writeConfigPath = std::string {};
    auto threshold = std::optional<float> {};
    auto onsetFrames = std::optional<std::uint32_t> {};
    auto offsetFrames = std::optional<std::uint32_t> {};
    auto onsetMs = std::optional<double> {};
    auto offsetMs = std::optional<double> {};
    auto sampleRate = std::optional<std::uint32_t> {};
    auto blockSize = std::optional<std::uint32_t> {};
    auto positions = false;
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("input", audioPath, "Audio file to analyse (WAV, FLAC, MP3)");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--threshold", threshold, "Speech threshold as RMS amplitude, in (0, 1)");
    app.add_option("--onset-frames", onsetFrames, "Loud blocks required to enter speech");
    app.add_option("--offset-frames", offsetFrames, "Quiet blocks required to leave speech");
    app.add_option("--onset-ms", onsetMs, "Onset as a duration (overrides --onset-frames)");
    app.add_option("--offset-ms", offsetMs, "Offset as a duration (overrides --offset-frames)");
    app.add_option("--sample-rate", sampleRate, "Analysis sample rate in Hz");
    app.add_option("--block-size", blockSize, "Samples per detector block");
    app.add_option("--write-config", writeConfigPath, "Write the effective config to this path");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("--positions", positions, "Include block index and time in printed events");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        vadkit::log::setLevel(vadkit::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = vadkit::log::parseLevel(logLevel);
        if (!level)
        {
            vadkit::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        vadkit::log::setLevel(*level);
    }

    // Load config
    auto configResult =
        configPath.empty() ? vadkit::loadConfig() : vadkit::loadConfigFromFile(configPath);

    if (!configResult)
    {
        vadkit::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (threshold)
        config.detector.detector.speechThreshold = *threshold;
    if (onsetFrames)
        config.detector.detector.onsetFrames = *onsetFrames;
    if (offsetFrames)
        config.detector.detector.offsetFrames = *offsetFrames;
    if (onsetMs)
        config.detector.onsetMs = *onsetMs;
    if (offsetMs)
        config.detector.offsetMs = *offsetMs;
    if (sampleRate)
        config.stream.sampleRate = *sampleRate;
    if (blockSize)
        config.stream.blockSize = *blockSize;
    if (positions)
        config.output.positions = true;

    if (!writeConfigPath.empty())
    {
        if (auto saveResult = vadkit::saveConfigToFile(writeConfigPath, config); !saveResult)
        {
            vadkit::log::error("Failed to write config: {}", saveResult.error().message);
            return 1;
        }
        vadkit::log::info("Config written to {}", writeConfigPath);
        if (audioPath.empty())
            return 0;
    }

    if (audioPath.empty())
    {
        vadkit::log::error("No input file given");
        std::cerr << app.help();
        return 1;
    }

    auto const withPositions = config.output.positions;
    auto monitor = vadkit::Monitor(std::move(config));
    auto result = monitor.run(audioPath, [withPositions](const vadkit::PositionedVadEvent& event) {
        auto const record = withPositions ? vadkit::toJson(event) : vadkit::toJson(event.event);
        std::cout << record.dump() << std::endl;
    });

    if (!result)
    {
        vadkit::log::error("{}", result.error());
        return 1;
    }

    return 0;
}
