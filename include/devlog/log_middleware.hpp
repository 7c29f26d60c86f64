/**
 * @file log_middleware.hpp
 * @brief Decorator that copies context values onto records before forwarding
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Structured downstream handlers (JSON) never look at the log_context, so
 * anything a request carries must become a record attribute to show up in
 * their output. handler_middleware does that for the configured keys, for
 * the traced SQL statement and, when enabled, for the caller's location.
 *
 * @code
 * devlog::options opts;
 * opts.add_ctx_attr = {"request_id"};
 * opts.source       = true;
 * auto json = std::make_shared<devlog::json_handler>(opts);
 * auto h    = std::make_shared<devlog::handler_middleware>(json, opts);
 * @endcode
 *
 * Handlers derived through with_attrs()/with_group() wrap the derived
 * downstream handler but carry no enrichment settings of their own: they
 * forward records unchanged.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_source.hpp"
#include "log_record.hpp"
#include "log_context.hpp"
#include "log_handler.hpp"
#include "log_options.hpp"

namespace devlog
{

class handler_middleware : public handler
{
    std::shared_ptr<handler> next_;
    std::vector<std::string> add_ctx_attr_;
    bool source_ = false;

  public:
    /// Pass-through wrapper without enrichment
    explicit handler_middleware(std::shared_ptr<handler> next) : next_(std::move(next)) {}

    handler_middleware(std::shared_ptr<handler> next, const options &opts)
        : next_(std::move(next)), add_ctx_attr_(opts.add_ctx_attr), source_(opts.source)
    {
    }

    bool enabled(log_level level) const override { return next_->enabled(level); }

    std::error_code handle(const log_context &ctx, const log_record &record) override
    {
        log_record enriched = record;

        for (const auto &key : add_ctx_attr_)
        {
            if (auto v = ctx.lookup(key)) enriched.add_attr(attr(key, std::move(*v)));
        }

        if (ctx.sql()) enriched.add_attr(attr(SQL_KEY, value(*ctx.sql())));

        if (source_ && !ctx.source() && !record.site.empty())
        {
            enriched.add_attr(attr(SOURCE_KEY, value(make_source(record.site))));
        }

        return next_->handle(ctx, enriched);
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) override
    {
        if (attrs.empty()) return shared_from_this();
        return std::make_shared<handler_middleware>(next_->with_attrs(std::move(attrs)));
    }

    std::shared_ptr<handler> with_group(std::string_view name) override
    {
        if (name.empty()) return shared_from_this();
        return std::make_shared<handler_middleware>(next_->with_group(name));
    }

    const std::shared_ptr<handler> &next() const noexcept { return next_; }
    const std::vector<std::string> &add_ctx_attr() const noexcept { return add_ctx_attr_; }
    bool source() const noexcept { return source_; }
};

} // namespace devlog
