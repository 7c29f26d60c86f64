/**
 * @file log_types.hpp
 * @brief Core type definitions, palette and constants for the devlog library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <optional>
#include <algorithm>
#include <chrono>
#include <concepts>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace devlog
{

// Buffer pool constants
inline constexpr size_t BUFFER_POOL_SIZE    = 256;       // Buffers kept around for reuse
inline constexpr size_t MAX_POOLED_CAPACITY = 16 * 1024; // Larger buffers are freed instead of pooled

// Rendering defaults
inline constexpr auto DEFAULT_SLOW_THRESHOLD = std::chrono::seconds(1);
inline constexpr const char *DEFAULT_TIME_FORMAT = "%H:%M:%S"; // time-only layout

// Caller resolution
inline constexpr int MAX_CALLER_DEPTH   = 13; // Frames inspected by the multi-frame walk
inline constexpr int TRACE_CALLER_SKIP  = 2;  // resolve_caller() + sql_tracer::trace()

// Reserved context keys
inline constexpr const char *SOURCE_KEY   = "source";
inline constexpr const char *DURATION_KEY = "duration";
inline constexpr const char *ROWS_KEY     = "rows";
inline constexpr const char *SQL_KEY      = "sql";

// Metrics collection configuration
// Define before including log.hpp to enable buffer pool statistics:
// #define DEVLOG_COLLECT_BUFFER_POOL_METRICS 1

/**
 * @brief Concept for types that can be logged through fmt
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = fmt::is_formattable<T>::value && requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Enumeration of available log levels in ascending order of severity
 */
enum class log_level : int8_t
{
    debug = 0, ///< Debugging information
    info  = 1, ///< General information
    warn  = 2, ///< Warning messages
    error = 3, ///< Error messages
};

// Log level names for rendering
inline const std::array<const char *, 4> log_level_names = {"DEBUG", "INFO", "WARN", "ERROR"};

inline const char *log_level_name(log_level level)
{
    auto idx = static_cast<size_t>(level);
    return idx < log_level_names.size() ? log_level_names[idx] : "UNKNOWN";
}

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or std::nullopt if invalid
 *
 * Recognized values: "debug", "info", "warn", "warning", "error"
 */
inline std::optional<log_level> log_level_from_string(const char *str)
{
    if (!str) return std::nullopt;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;

    return std::nullopt;
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return Lower-case name of the level
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    default: return "unknown";
    }
}

/**
 * @brief ANSI escape codes used by the text renderer
 */
namespace ansi
{
inline constexpr const char *reset         = "\033[0m";
inline constexpr const char *red           = "\033[31m";
inline constexpr const char *faint         = "\033[90m";
inline constexpr const char *green         = "\033[32m";
inline constexpr const char *yellow        = "\033[33m";
inline constexpr const char *blue          = "\033[34m";
inline constexpr const char *magenta       = "\033[35m";
inline constexpr const char *cyan          = "\033[36m";
inline constexpr const char *bright_green  = "\033[92m";
inline constexpr const char *bright_yellow = "\033[93m";

inline constexpr char esc = '\033';
} // namespace ansi

/**
 * @brief Color table shared by every handler derived from one root
 *
 * A colorless palette has every entry empty, so the rendering code never
 * branches on whether color is enabled.
 */
struct palette
{
    const char *reset         = "";
    const char *red           = "";
    const char *faint         = "";
    const char *green         = "";
    const char *yellow        = "";
    const char *blue          = "";
    const char *magenta       = "";
    const char *cyan          = "";
    const char *bright_green  = "";
    const char *bright_yellow = "";

    static constexpr palette colored()
    {
        return palette{ansi::reset,
                       ansi::red,
                       ansi::faint,
                       ansi::green,
                       ansi::yellow,
                       ansi::blue,
                       ansi::magenta,
                       ansi::cyan,
                       ansi::bright_green,
                       ansi::bright_yellow};
    }

    static constexpr palette plain() { return palette{}; }

    const char *level_color(log_level level) const
    {
        switch (level)
        {
        case log_level::info: return bright_green;
        case log_level::warn: return bright_yellow;
        default: return red;
        }
    }
};

} // namespace devlog
