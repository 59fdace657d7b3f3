/**
 * @file log.hpp
 * @brief Channel-tagged logging
 *
 * Output format:
 *   [channel] message                 (debug, info -> stdout)
 *   [channel] WARNING: message        (stderr)
 *   [channel] ERROR: message          (stderr)
 *
 * A sink can be installed to capture messages (tests, tools). The level
 * filter applies before the sink is called.
 */

#pragma once

#include <functional>
#include <optional>
#include <string_view>

namespace terratile {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

/// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

[[nodiscard]] std::string_view logLevelName(LogLevel level);

class Log {
public:
    using Sink = std::function<void(LogLevel, std::string_view channel, std::string_view message)>;

    static void setLevel(LogLevel level);
    [[nodiscard]] static LogLevel level();
    [[nodiscard]] static bool enabled(LogLevel level);

    /// Replace the output sink. An empty function restores console output.
    static void setSink(Sink sink);

    static void debug(std::string_view channel, std::string_view message);
    static void info(std::string_view channel, std::string_view message);
    static void warn(std::string_view channel, std::string_view message);
    static void error(std::string_view channel, std::string_view message);

    static void write(LogLevel level, std::string_view channel, std::string_view message);
};

}  // namespace terratile
