// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace toolbridge::log
{

/// @brief Verbosity level for log messages, ordered from most to least severe.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to a callback instead of stderr. An empty callback restores stderr.
///
/// The callback is invoked under the logger's lock and must not log itself.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if a message of the given level would be written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
/// @return The level, or std::nullopt if the name is not recognized.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Returns the lowercase name of a level.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Writes an already formatted message.
///
/// Without a callback the message goes to stderr as "HH:MM:SS.mmm LEVEL message".
void write(Level level, std::string_view message);

/// @brief Formats and writes a message if its level is enabled.
template <typename... Args>
void logAt(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    logAt(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    logAt(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    logAt(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    logAt(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    logAt(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace toolbridge::log
