// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace scribe::log
{

/// @brief Severity of a log line, ordered from most to least severe.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every log line that passes the level filter, without level prefix.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes log lines to @p callback instead of stderr. An empty callback restores stderr.
void setCallback(LogCallback callback);

/// @brief Sets the most verbose level that is still written.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
/// @return The level, or std::nullopt if the name is not recognized.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Returns true if lines of @p level pass the current filter.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Writes one log line.
///
/// Lines go to the installed callback, or to stderr prefixed with the level and a short
/// tag of the calling thread. Pipeline workers log concurrently; lines never interleave.
void write(Level level, std::string_view message);

/// @brief Formats and writes a line, skipping the formatting when @p level is filtered out.
template <typename... Args>
void print(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace scribe::log
