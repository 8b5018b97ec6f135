// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <cstdio>
#include <format>
#include <print>
#include <utility>

namespace asciiart::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};

    constexpr auto LevelNames = std::array<std::pair<Level, std::string_view>, 5> { {
        { Level::Error, "error" },
        { Level::Warning, "warning" },
        { Level::Info, "info" },
        { Level::Debug, "debug" },
        { Level::Trace, "trace" },
    } };
} // namespace

auto levelName(Level level) -> std::string_view
{
    for (auto const& [candidate, name]: LevelNames)
        if (candidate == level)
            return name;
    return "unknown";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const& [level, candidate]: LevelNames)
        if (candidate == name)
            return level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

void setCallback(LogCallback callback)
{
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

auto formatLine(Level level, std::string_view message) -> std::string
{
    switch (level)
    {
        case Level::Error: break;
        case Level::Warning: return std::format("Warning: {}", message);
        case Level::Info: break;
        case Level::Debug:
        case Level::Trace: return std::format("[{}] {}", levelName(level), message);
    }
    return std::string(message);
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "{}", formatLine(level, message));
}

} // namespace asciiart::log
