/**
 * @file log_context.hpp
 * @brief Request-scoped values merged into records at render time
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A log_context travels with a request and carries what the call site does
 * not know: an explicitly resolved source location, the SQL statement being
 * traced with its duration and row count, and arbitrary named values that
 * handlers surface when configured to (options::add_ctx_attr).
 *
 * Contexts are immutable; every with_*() call returns a modified copy.
 *
 * @code
 * auto ctx = devlog::log_context{}
 *                .with_value("request_id", "7f3a")
 *                .with_value("user", int64_t{42});
 * logger.info(ctx, "loaded profile");
 * @endcode
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <chrono>

#include "robin_hood.h"

#include "log_types.hpp"
#include "log_source.hpp"
#include "log_value.hpp"

namespace devlog
{

class log_context
{
  public:
    using value_map = robin_hood::unordered_map<std::string, value>;

  private:
    std::optional<source_descriptor> source_;
    std::optional<std::string> sql_;
    std::optional<std::chrono::nanoseconds> duration_;
    std::optional<int64_t> rows_;
    std::shared_ptr<const value_map> values_; // shared between copies until one changes it

  public:
    log_context() = default;

    /// The empty context
    static const log_context &background()
    {
        static const log_context ctx;
        return ctx;
    }

    log_context with_source(source_descriptor source) const
    {
        log_context copy(*this);
        copy.source_ = std::move(source);
        return copy;
    }

    log_context with_sql(std::string sql) const
    {
        log_context copy(*this);
        copy.sql_ = std::move(sql);
        return copy;
    }

    template <typename Rep, typename Period> log_context with_duration(std::chrono::duration<Rep, Period> d) const
    {
        log_context copy(*this);
        copy.duration_ = std::chrono::duration_cast<std::chrono::nanoseconds>(d);
        return copy;
    }

    log_context with_rows(int64_t rows) const
    {
        log_context copy(*this);
        copy.rows_ = rows;
        return copy;
    }

    /**
     * @brief Attach a named value
     *
     * The reserved names "source", "sql", "duration" and "rows" are ignored;
     * use the typed setters for those.
     */
    log_context with_value(std::string key, value v) const
    {
        log_context copy(*this);
        if (key == SOURCE_KEY || key == SQL_KEY || key == DURATION_KEY || key == ROWS_KEY) return copy;
        auto map = values_ ? std::make_shared<value_map>(*values_) : std::make_shared<value_map>();
        (*map)[std::move(key)] = std::move(v);
        copy.values_ = std::move(map);
        return copy;
    }

    const std::optional<source_descriptor> &source() const noexcept { return source_; }
    const std::optional<std::string> &sql() const noexcept { return sql_; }
    const std::optional<std::chrono::nanoseconds> &duration() const noexcept { return duration_; }
    const std::optional<int64_t> &rows() const noexcept { return rows_; }

    /**
     * @brief Find the value stored under @p key
     *
     * Reserved names resolve to the typed fields, so "sql" listed in
     * add_ctx_attr surfaces the traced statement.
     */
    std::optional<value> lookup(std::string_view key) const
    {
        if (key == SOURCE_KEY) return source_ ? std::optional<value>(value(*source_)) : std::nullopt;
        if (key == SQL_KEY) return sql_ ? std::optional<value>(value(*sql_)) : std::nullopt;
        if (key == DURATION_KEY) return duration_ ? std::optional<value>(value(*duration_)) : std::nullopt;
        if (key == ROWS_KEY) return rows_ ? std::optional<value>(value(*rows_)) : std::nullopt;

        if (!values_) return std::nullopt;
        auto it = values_->find(std::string(key));
        if (it == values_->end()) return std::nullopt;
        return it->second;
    }
};

} // namespace devlog
