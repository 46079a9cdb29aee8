// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace scribe::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto writeMutex = std::mutex {};

    auto levelPrefix(Level level) -> std::string_view
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
    auto lowered = std::string {};
    for (auto const ch: name)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (lowered == "error")
        return Level::Error;
    if (lowered == "warning" || lowered == "warn")
        return Level::Warning;
    if (lowered == "info")
        return Level::Info;
    if (lowered == "debug")
        return Level::Debug;
    if (lowered == "trace")
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

    auto const threadTag = std::hash<std::thread::id> {}(std::this_thread::get_id()) % 10000;
    auto const line = std::format("[{}] [{:04}] {}\n", levelPrefix(level), threadTag, message);
    std::fputs(line.c_str(), stderr);
}

} // namespace scribe::log
