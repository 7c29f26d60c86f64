/**
 * @file log_sql_trace.hpp
 * @brief Adapter that logs executed SQL statements with timing and caller
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A database layer calls trace() once per statement. The tracer measures
 * the elapsed time, asks for the statement text and affected row count,
 * walks the stack to find the application frame that issued the query and
 * logs a record whose context carries all of it. The dev handler renders
 * that context as a trailing block:
 *
 * @code
 * 13:04:05 INFO bin/server find_user
 * [0.0021] rows:1 SELECT * FROM users WHERE id = ?
 * @endcode
 *
 * Frames belonging to the database library are skipped by namespace; add
 * the library's namespace to frame_filter::library_prefixes.
 *
 * @code
 * devlog::frame_filter filter;
 * filter.library_prefixes.push_back("orm::");
 * devlog::sql_tracer tracer(log, {}, false, nullptr, filter);
 *
 * auto begin = std::chrono::steady_clock::now();
 * auto ec    = db.exec(query);
 * tracer.trace(ctx, begin, [&] { return std::pair{query.text(), db.affected_rows()}; }, ec);
 * @endcode
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_source.hpp"
#include "log_context.hpp"
#include "log_logger.hpp"

namespace devlog
{

/**
 * @brief Verbosity of a sql_tracer, least to most verbose
 */
enum class trace_mode : uint8_t
{
    silent = 1, ///< Nothing
    error  = 2, ///< Failed statements and error()
    warn   = 3, ///< Also warn()
    info   = 4, ///< Every statement and info()
};

class sql_tracer
{
  public:
    /// Yields the executed statement and the affected row count
    using result_provider = std::function<std::pair<std::string, int64_t>()>;

  private:
    logger logger_;
    std::vector<attr> attrs_;
    bool show_params_ = true;
    std::shared_ptr<const caller_resolver> resolver_;
    frame_filter filter_;
    trace_mode mode_ = trace_mode::info;

  public:
    /**
     * @param l Logger records are sent to
     * @param attrs Attributes added to every successful statement's record
     * @param show_params Keep bound parameters in params_filter()
     * @param resolver Stack introspection; backtrace_resolver when null
     * @param filter Frames that may not be reported as the caller
     */
    explicit sql_tracer(logger l,
                        std::vector<attr> attrs                          = {},
                        bool show_params                                 = true,
                        std::shared_ptr<const caller_resolver> resolver  = nullptr,
                        frame_filter filter                              = {})
        : logger_(std::move(l)),
          attrs_(std::move(attrs)),
          show_params_(show_params),
          resolver_(resolver ? std::move(resolver) : std::make_shared<backtrace_resolver>()),
          filter_(std::move(filter))
    {
    }

    /// Tracer logging through the process default logger
    sql_tracer(bool show_params, std::vector<attr> attrs) : sql_tracer(default_logger(), std::move(attrs), show_params)
    {
    }

    /// Copy with a different verbosity
    sql_tracer log_mode(trace_mode mode) const
    {
        sql_tracer copy(*this);
        copy.mode_ = mode;
        return copy;
    }

    trace_mode mode() const noexcept { return mode_; }

    std::error_code info(const log_context &ctx,
                         std::string msg,
                         std::vector<attr> attrs  = {},
                         std::source_location loc = std::source_location::current()) const
    {
        if (mode_ < trace_mode::info) return {};
        return logger_.log_at(ctx, log_level::info, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code warn(const log_context &ctx,
                         std::string msg,
                         std::vector<attr> attrs  = {},
                         std::source_location loc = std::source_location::current()) const
    {
        if (mode_ < trace_mode::warn) return {};
        return logger_.log_at(ctx, log_level::warn, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    std::error_code error(const log_context &ctx,
                          std::string msg,
                          std::vector<attr> attrs  = {},
                          std::source_location loc = std::source_location::current()) const
    {
        if (mode_ < trace_mode::error) return {};
        return logger_.log_at(ctx, log_level::error, std::move(msg), std::move(attrs), call_site::current(loc));
    }

    /**
     * @brief Log one executed statement
     * @param ctx Request context; the statement details are added to a copy
     * @param begin When the statement started
     * @param fc Called once for the statement text and row count
     * @param err Failure of the statement, if any; logged at error level
     * @return The logger's output error
     */
    [[gnu::noinline]] std::error_code trace(const log_context &ctx,
                                            std::chrono::steady_clock::time_point begin,
                                            const result_provider &fc,
                                            std::error_code err      = {},
                                            std::source_location loc = std::source_location::current()) const
    {
        if (mode_ <= trace_mode::silent) return {};
        if (!err && mode_ < trace_mode::info) return {};

        auto [sql, rows] = fc();

        auto traced = ctx.with_sql(std::move(sql))
                          .with_rows(rows)
                          .with_duration(std::chrono::steady_clock::now() - begin);

        if (auto src = resolve_caller(*resolver_, filter_, TRACE_CALLER_SKIP)) traced = traced.with_source(*src);

        if (err) return logger_.log_at(traced, log_level::error, err.message(), {}, call_site::current(loc));

        return logger_.log_at(traced, log_level::info, "", attrs_, call_site::current(loc));
    }

    /**
     * @brief Drop bound parameters unless the tracer shows them
     */
    std::pair<std::string, std::vector<std::string>> params_filter(std::string sql,
                                                                   std::vector<std::string> params) const
    {
        if (!show_params_) return {std::move(sql), {}};
        return {std::move(sql), std::move(params)};
    }

    bool show_params() const noexcept { return show_params_; }
    const std::vector<attr> &attrs() const noexcept { return attrs_; }
};

} // namespace devlog
