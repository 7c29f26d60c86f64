/**
 * @file log_options.hpp
 * @brief Construction options for handlers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdlib>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "log_types.hpp"
#include "log_writers.hpp"

namespace devlog
{

enum class color_mode : uint8_t
{
    always,    ///< Always emit ANSI codes
    never,     ///< Plain text
    automatic, ///< Color only for terminals, unless NO_COLOR or DEVLOG_NO_COLOR is set
};

/**
 * @brief Options for dev_handler, handler_middleware and json_handler
 *
 * @code
 * devlog::options opts;
 * opts.add_ctx_attr   = {"request_id"};
 * opts.source         = true;
 * opts.slow_threshold = std::chrono::milliseconds(200);
 * auto h = std::make_shared<devlog::dev_handler>(opts);
 * @endcode
 */
struct options
{
    std::vector<std::string> add_ctx_attr;    ///< Context keys surfaced on each record, in this order
    std::shared_ptr<writer> output;           ///< Destination; stdout when null
    bool source = false;                      ///< Resolve and render the caller
    std::chrono::nanoseconds slow_threshold{}; ///< SQL duration above this renders in red; 0 means 1s
    log_level level = log_level::debug;       ///< Minimum level handled
    std::string time_format = DEFAULT_TIME_FORMAT;
    color_mode color = color_mode::always;
};

/**
 * @brief Resolve a color_mode against a concrete writer
 */
inline bool detect_color(color_mode mode, const writer &out)
{
    switch (mode)
    {
    case color_mode::always: return true;
    case color_mode::never: return false;
    case color_mode::automatic: break;
    }

    // Environment checks run per call so that later handlers see changes
    if (std::getenv("NO_COLOR") != nullptr) return false;

    const char *no_color = std::getenv("DEVLOG_NO_COLOR");
    if (no_color && no_color[0] != '\0') return false;

    return out.is_terminal();
}

} // namespace devlog
