/**
 * @file log_dev_handler.hpp
 * @brief Colorized human-readable renderer for development consoles
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Each record becomes one line (or a block when an SQL statement is traced):
 *
 *   <time> <LEVEL> [dir/file:line func] <message> [key=value ]* [ctxkey=value ]*
 *   [<duration>] rows:<n> <sql>
 *
 * The line is assembled into a private pooled buffer and written with a
 * single call under the writer mutex, so concurrent records never
 * interleave. Handlers derived through with_attrs()/with_group() share the
 * writer, mutex and settings of their root and differ only in the
 * pre-rendered attributes and the group prefix.
 */
#pragma once

#include <cerrno>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "log_types.hpp"
#include "log_buffer.hpp"
#include "log_value.hpp"
#include "log_encoder.hpp"
#include "log_source.hpp"
#include "log_record.hpp"
#include "log_context.hpp"
#include "log_handler.hpp"
#include "log_options.hpp"
#include "log_writers.hpp"

namespace devlog
{

class dev_handler : public handler
{
    // Settings shared by a root handler and everything derived from it
    struct shared_config
    {
        std::shared_ptr<writer> out;
        std::mutex mutex; ///< Serializes writes to out
        palette colors;
        bool color = true;
        std::string time_spec; ///< "{:<time_format>}"
        log_level level = log_level::debug;
        bool source     = false;
        std::chrono::nanoseconds slow_threshold{DEFAULT_SLOW_THRESHOLD};
        std::vector<std::string> add_ctx_attr;
    };

    std::shared_ptr<shared_config> config_;
    std::string attrs_prefix_; ///< Attributes bound by with_attrs(), already rendered
    std::string group_prefix_; ///< "a.b." for with_group("a").with_group("b")
    std::vector<std::string> groups_;

    dev_handler(std::shared_ptr<shared_config> config,
                std::string attrs_prefix,
                std::string group_prefix,
                std::vector<std::string> groups)
        : config_(std::move(config)),
          attrs_prefix_(std::move(attrs_prefix)),
          group_prefix_(std::move(group_prefix)),
          groups_(std::move(groups))
    {
    }

  public:
    /**
     * @throws std::invalid_argument if options::time_format is not a valid
     *         chrono format specification
     */
    explicit dev_handler(options opts) : config_(std::make_shared<shared_config>())
    {
        config_->out            = opts.output ? std::move(opts.output) : make_stdout_writer();
        config_->color          = detect_color(opts.color, *config_->out);
        config_->colors         = config_->color ? palette::colored() : palette::plain();
        config_->time_spec      = "{:" + opts.time_format + "}";
        config_->level          = opts.level;
        config_->source         = opts.source;
        config_->slow_threshold = opts.slow_threshold.count() > 0 ? opts.slow_threshold
                                                                  : std::chrono::nanoseconds(DEFAULT_SLOW_THRESHOLD);
        config_->add_ctx_attr   = std::move(opts.add_ctx_attr);

        try
        {
            std::tm probe{};
            (void)fmt::format(fmt::runtime(config_->time_spec), probe);
        }
        catch (const fmt::format_error &e)
        {
            throw std::invalid_argument("Invalid time format '" + opts.time_format + "': " + e.what());
        }
    }

    bool enabled(log_level level) const override { return level >= config_->level; }

    std::error_code handle(const log_context &ctx, const log_record &record) override
    {
        pooled_buffer buf;

        if (record.has_time())
        {
            append_time(*buf, record.time);
            buf->push_back(' ');
        }

        append_level(*buf, record.level);
        buf->push_back(' ');

        if (config_->source && !record.site.empty())
        {
            // an explicitly resolved source (SQL tracer) wins over the call site
            if (ctx.source()) { append_source(*buf, *ctx.source()); }
            else { append_source(*buf, make_source(record.site)); }
            buf->push_back(' ');
        }

        append_message(*buf, record.level, record.message);

        for (const auto &a : record.attrs) { append_attr(*buf, a, group_prefix_); }

        append_ctx_values(*buf, ctx);

        if (!attrs_prefix_.empty()) buf->append(attrs_prefix_);

        append_sql(*buf, ctx, record.level);

        if (buf->empty()) return {};
        buf->back() = '\n';

        std::lock_guard<std::mutex> lock(config_->mutex);
        if (config_->out->write(buf->data(), buf->size()) < 0) return last_write_error();
        return {};
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) override
    {
        if (attrs.empty()) return shared_from_this();

        pooled_buffer buf;
        for (const auto &a : attrs) { append_attr(*buf, a, group_prefix_); }

        return std::shared_ptr<dev_handler>(new dev_handler(config_, attrs_prefix_ + buf->str(), group_prefix_, groups_));
    }

    std::shared_ptr<handler> with_group(std::string_view name) override
    {
        if (name.empty()) return shared_from_this();

        auto groups = groups_;
        groups.emplace_back(name);
        std::string prefix = group_prefix_;
        prefix.append(name).push_back('.');
        return std::shared_ptr<dev_handler>(new dev_handler(config_, attrs_prefix_, std::move(prefix), std::move(groups)));
    }

    const std::string &attrs_prefix() const noexcept { return attrs_prefix_; }
    const std::string &group_prefix() const noexcept { return group_prefix_; }
    const std::vector<std::string> &groups() const noexcept { return groups_; }
    bool color() const noexcept { return config_->color; }

  private:
    void append_time(line_buffer &buf, std::chrono::system_clock::time_point t) const
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(t);
        std::tm tm{};
        localtime_r(&tt, &tm);

        buf.append(config_->colors.faint);
        buf.append(fmt::format(fmt::runtime(config_->time_spec), tm));
        buf.append(config_->colors.reset);
    }

    void append_level(line_buffer &buf, log_level level) const
    {
        buf.append(config_->colors.level_color(level));
        buf.append(log_level_name(level));
        buf.append(config_->colors.reset);
    }

    // "dir/file:line func" without a trailing separator
    void append_source(line_buffer &buf, const source_descriptor &src) const
    {
        const auto &c = config_->colors;

        buf.append(c.faint);
        buf.append(short_file_path(src.file));
        if (src.line != 0)
        {
            buf.push_back(':');
            buf.append_int(src.line);
        }
        buf.append(c.reset);
        buf.push_back(' ');

        buf.append(c.blue);
        buf.append(short_function_name(src.function));
        buf.append(c.reset);
    }

    void append_message(line_buffer &buf, log_level level, std::string_view msg) const
    {
        if (msg.empty()) return;

        const auto &c = config_->colors;
        buf.append(level == log_level::error ? c.red : c.cyan);
        buf.append(msg);
        buf.append(c.reset);
        buf.push_back(' ');
    }

    void append_attr(line_buffer &buf, const attr &a, const std::string &prefix) const
    {
        if (a.is_zero()) return;

        switch (a.val.kind())
        {
        case value_kind::any:
            if (const auto *e = a.val.error_if())
            {
                append_error(buf, *e, a.key, prefix);
                buf.push_back(' ');
                return;
            }
            break;
        case value_kind::group:
        {
            std::string nested = prefix;
            if (!a.key.empty()) nested.append(a.key).push_back('.');
            for (const auto &member : a.val.as_group()) { append_attr(buf, member, nested); }
            return;
        }
        default: break;
        }

        append_key(buf, a.key, prefix);
        append_value(buf, a.val, true);
        buf.push_back(' ');
    }

    void append_key(line_buffer &buf, std::string_view key, const std::string &prefix) const
    {
        buf.append(config_->colors.faint);
        buf.append(prefix);
        buf.append(key);
        buf.push_back('=');
        buf.append(config_->colors.reset);
    }

    void append_value(line_buffer &buf, const value &v, bool quote) const
    {
        const bool color = config_->color;

        switch (v.kind())
        {
        case value_kind::string: append_string(buf, v.as_string(), quote, color); return;
        case value_kind::int64: buf.append_int(v.as_int64()); return;
        case value_kind::uint64: buf.append_int(v.as_uint64()); return;
        case value_kind::float64: append_float(buf, v.as_float64()); return;
        case value_kind::boolean: buf.append_bool(v.as_bool()); return;
        case value_kind::duration: append_string(buf, format_duration(v.as_duration()), quote, color); return;
        case value_kind::time: append_string(buf, format_time(v.as_time()), quote, color); return;
        case value_kind::group: return; // handled by append_attr
        case value_kind::any: break;
        }

        if (const auto *level = v.level_if())
        {
            append_level(buf, *level);
        }
        else if (const auto *src = v.source_if())
        {
            append_source(buf, *src);
        }
        else if (const auto *e = v.error_if())
        {
            append_string(buf, e->message, quote, color);
        }
        else if (const auto *m = v.marshaler_if())
        {
            auto result = try_marshal(m->get());
            switch (result.state)
            {
            case encode_result::status::ok: append_string(buf, result.text, quote, color); break;
            case encode_result::status::failed: break;
            case encode_result::status::nil: append_string(buf, "<nil>", false, false); break;
            case encode_result::status::panic: append_string(buf, result.text, true, color); break;
            }
        }
        else
        {
            append_string(buf, "<nil>", quote, color);
        }
    }

    void append_error(line_buffer &buf, const error_value &e, std::string_view key, const std::string &prefix) const
    {
        const auto &c    = config_->colors;
        const bool color = config_->color;

        std::string full_key = prefix;
        full_key.append(key);

        buf.append(c.blue);
        append_string(buf, full_key, true, color);
        buf.push_back('=');
        buf.append(c.reset);
        buf.append(c.faint);
        append_string(buf, e.message, true, color);
        buf.append(c.reset);
    }

    void append_ctx_values(line_buffer &buf, const log_context &ctx) const
    {
        const auto &c = config_->colors;
        for (const auto &key : config_->add_ctx_attr)
        {
            auto v = ctx.lookup(key);
            if (!v) continue;

            buf.append(c.faint);
            buf.append(key);
            buf.push_back('=');
            buf.append(c.reset);
            append_value(buf, *v, false);
            buf.push_back(' ');
        }
    }

    void append_sql(line_buffer &buf, const log_context &ctx, log_level level) const
    {
        if (!ctx.sql()) return;

        const auto &c = config_->colors;
        buf.push_back('\n');

        if (const auto &d = ctx.duration())
        {
            buf.append(*d > config_->slow_threshold ? c.red : c.green);
            buf.format("[{:.4f}] ", std::chrono::duration<double>(*d).count());
            buf.append(c.reset);
        }

        if (const auto &rows = ctx.rows())
        {
            buf.append(c.yellow);
            buf.append("rows:").append_int(*rows).push_back(' ');
            buf.append(c.reset);
        }

        buf.append(level == log_level::error ? c.red : c.magenta);
        buf.append(*ctx.sql()).push_back(' ');
        buf.append(c.reset);

        buf.push_back('\n');
    }
};

} // namespace devlog
