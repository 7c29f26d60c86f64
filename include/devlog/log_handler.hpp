/**
 * @file log_handler.hpp
 * @brief Record-handling contract shared by renderers and decorators
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string_view>
#include <system_error>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_record.hpp"
#include "log_context.hpp"

namespace devlog
{

/**
 * @brief Consumer of log records
 *
 * Handlers are shared through std::shared_ptr and never change after
 * construction. with_attrs() and with_group() derive a new handler and
 * leave the receiver untouched; given an empty list or name they return
 * the receiver itself.
 */
class handler : public std::enable_shared_from_this<handler>
{
  public:
    virtual ~handler() = default;

    /// Whether records at @p level are handled at all
    virtual bool enabled(log_level level) const = 0;

    /**
     * @brief Handle one record
     * @return The output error, if writing failed
     */
    virtual std::error_code handle(const log_context &ctx, const log_record &record) = 0;

    virtual std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) = 0;

    virtual std::shared_ptr<handler> with_group(std::string_view name) = 0;
};

/**
 * @brief Handler that drops everything
 */
class discard_handler : public handler
{
  public:
    bool enabled(log_level) const override { return false; }

    std::error_code handle(const log_context &, const log_record &) override { return {}; }

    std::shared_ptr<handler> with_attrs(std::vector<attr>) override { return shared_from_this(); }

    std::shared_ptr<handler> with_group(std::string_view) override { return shared_from_this(); }
};

} // namespace devlog
