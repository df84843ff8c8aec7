// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace vadkit::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};

    // The monitor logs from both the producer and the controller thread.
    auto writeMutex = std::mutex {};

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(writeMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error")
        return Level::Error;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto lock = std::lock_guard(writeMutex);
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace vadkit::log
