/**
 * @file log_logger.hpp
 * @brief Logging front end, process default logger and bootstrap helpers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A logger is a cheap, copyable handle on a handler. Components that log
 * should be given one; the process-wide default exists for code that has
 * no better way to get one and for the one-time bootstrap in main().
 *
 * @code
 * int main()
 * {
 *     devlog::options opts;
 *     opts.source       = true;
 *     opts.add_ctx_attr = {"request_id"};
 *     auto log = devlog::init_dev_logger(opts);
 *
 *     auto ctx = devlog::log_context{}.with_value("request_id", "7f3a");
 *     log.info(ctx, "started", {devlog::int64("port", 8080)});
 *
 *     // Macro form records __PRETTY_FUNCTION__ for the source column
 *     DEVLOG(log, ctx, warn, "disk almost full", devlog::float64("used", 0.93));
 * }
 * @endcode
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <source_location>
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
#include "log_dev_handler.hpp"
#include "log_json_handler.hpp"
#include "log_middleware.hpp"

namespace devlog
{

class logger
{
    std::shared_ptr<handler> handler_;

  public:
    /// A logger that drops everything
    logger() : handler_(std::make_shared<discard_handler>()) {}

    explicit logger(std::shared_ptr<handler> h) : handler_(h ? std::move(h) : std::make_shared<discard_handler>()) {}

    const std::shared_ptr<handler> &get_handler() const noexcept { return handler_; }

    bool enabled(log_level level) const { return handler_->enabled(level); }

    /**
     * @brief Emit a record attributed to an explicit call site
     * @return The handler's output error; empty when the level is disabled
     */
    std::error_code
    log_at(const log_context &ctx, log_level level, std::string msg, std::vector<attr> attrs, call_site site) const
    {
        if (!handler_->enabled(level)) return {};

        log_record record(std::chrono::system_clock::now(), level, std::move(msg), site);
        record.attrs = std::move(attrs);
        return handler_->handle(ctx, record);
    }

    std::error_code log(const log_context &ctx,
                        log_level level,
                        std::string msg,
                        std::vector<attr> attrs  = {},
                        std::source_location loc = std::source_location::current()) const
    {
        return log_at(ctx, level, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code debug(const log_context &ctx,
                          std::string msg,
                          std::vector<attr> attrs  = {},
                          std::source_location loc = std::source_location::current()) const
    {
        return log_at(ctx, log_level::debug, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code info(const log_context &ctx,
                         std::string msg,
                         std::vector<attr> attrs  = {},
                         std::source_location loc = std::source_location::current()) const
    {
        return log_at(ctx, log_level::info, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code warn(const log_context &ctx,
                         std::string msg,
                         std::vector<attr> attrs  = {},
                         std::source_location loc = std::source_location::current()) const
    {
        return log_at(ctx, log_level::warn, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code error(const log_context &ctx,
                          std::string msg,
                          std::vector<attr> attrs  = {},
                          std::source_location loc = std::source_location::current()) const
    {
        return log_at(ctx, log_level::error, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    /// Logger whose records carry @p attrs
    logger with(std::vector<attr> attrs) const { return logger(handler_->with_attrs(std::move(attrs))); }

    /// Logger whose subsequent attributes are qualified by @p name
    logger with_group(std::string_view name) const { return logger(handler_->with_group(name)); }
};

namespace detail
{

struct default_logger_slot
{
    std::shared_mutex mutex;
    logger current;

    static default_logger_slot &instance()
    {
        static default_logger_slot slot;
        return slot;
    }
};

} // namespace detail

/**
 * @brief Install the process default logger
 */
inline void set_default_logger(logger l)
{
    auto &slot = detail::default_logger_slot::instance();
    std::unique_lock lock(slot.mutex);
    slot.current = std::move(l);
}

/**
 * @brief The installed default logger; a discarding logger until one is set
 */
inline logger default_logger()
{
    auto &slot = detail::default_logger_slot::instance();
    std::shared_lock lock(slot.mutex);
    return slot.current;
}

/**
 * @brief Install JSON output to stdout, enriched from the context, as the default
 */
inline logger init_logger(options opts)
{
    auto next = std::make_shared<json_handler>(opts);
    logger l(std::make_shared<handler_middleware>(std::move(next), opts));
    set_default_logger(l);
    return l;
}

/**
 * @brief Install the colorized console renderer as the default
 */
inline logger init_dev_logger(options opts)
{
    logger l(std::make_shared<dev_handler>(std::move(opts)));
    set_default_logger(l);
    return l;
}

} // namespace devlog

/**
 * @brief Log through @p _logger with the current function as the call site
 *
 * @param _logger A devlog::logger
 * @param _ctx A devlog::log_context
 * @param _level debug, info, warn or error
 * @param _msg Message text
 * @param ... devlog::attr values
 *
 * @code
 * DEVLOG(log, ctx, info, "user created", devlog::int64("id", id));
 * @endcode
 */
#define DEVLOG(_logger, _ctx, _level, _msg, ...)                                                                       \
    (_logger).log_at((_ctx),                                                                                           \
                     ::devlog::log_level::_level,                                                                      \
                     (_msg),                                                                                           \
                     std::vector<::devlog::attr>{__VA_ARGS__},                                                         \
                     ::devlog::call_site{__FILE__, __LINE__, __PRETTY_FUNCTION__})

#define DEVLOG_DEBUG(_logger, _ctx, _msg, ...) DEVLOG(_logger, _ctx, debug, _msg, __VA_ARGS__)
#define DEVLOG_INFO(_logger, _ctx, _msg, ...)  DEVLOG(_logger, _ctx, info, _msg, __VA_ARGS__)
#define DEVLOG_WARN(_logger, _ctx, _msg, ...)  DEVLOG(_logger, _ctx, warn, _msg, __VA_ARGS__)
#define DEVLOG_ERROR(_logger, _ctx, _msg, ...) DEVLOG(_logger, _ctx, error, _msg, __VA_ARGS__)
