/**
 * @file log_record.hpp
 * @brief One structured log event
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>
#include <vector>
#include <chrono>

#include "log_types.hpp"
#include "log_source.hpp"
#include "log_value.hpp"

namespace devlog
{

/**
 * @brief A leveled, timestamped message with attributes and its call site
 *
 * Built at the log call and read by one render pass. A zero timestamp
 * (the clock's epoch) suppresses the time column; an empty call site means
 * the origin is unknown.
 */
struct log_record
{
    std::chrono::system_clock::time_point time{};
    log_level level = log_level::info;
    std::string message;
    call_site site{};
    std::vector<attr> attrs;

    log_record() = default;

    log_record(std::chrono::system_clock::time_point t, log_level l, std::string msg, call_site s = {})
        : time(t), level(l), message(std::move(msg)), site(s)
    {
    }

    bool has_time() const noexcept { return time.time_since_epoch().count() != 0; }

    void add_attrs(const std::vector<attr> &more) { attrs.insert(attrs.end(), more.begin(), more.end()); }

    void add_attr(attr a) { attrs.push_back(std::move(a)); }
};

} // namespace devlog
