/**
 * @file log_json_handler.hpp
 * @brief One JSON object per record, serialized with taocpp/json events
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Output shape:
 * @code
 * {"time":"2024-05-01T13:04:05.123Z","level":"INFO","msg":"done","request_id":"7f3a","db":{"rows":3}}
 * @endcode
 *
 * Groups opened with with_group() become nested objects holding everything
 * added after them; a group that ends up with no members is left out.
 * Durations are written as integer nanoseconds, times as RFC 3339 strings.
 * This handler does not read the log_context; wrap it in a
 * handler_middleware to surface context values.
 */
#pragma once

#include <cerrno>
#include <cmath>
#include <memory>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tao/json/events/to_stream.hpp>

#include "log_types.hpp"
#include "log_buffer.hpp"
#include "log_value.hpp"
#include "log_encoder.hpp"
#include "log_record.hpp"
#include "log_context.hpp"
#include "log_handler.hpp"
#include "log_options.hpp"
#include "log_writers.hpp"

namespace devlog
{

class json_handler : public handler
{
    /**
     * @brief streambuf appending to a line_buffer
     *
     * Lets taocpp/json's stream consumer write straight into the pooled
     * buffer without an intermediate string.
     */
    class line_buffer_streambuf : public std::streambuf
    {
        line_buffer &buf_;

      public:
        explicit line_buffer_streambuf(line_buffer &buf) : buf_(buf) {}

      protected:
        int_type overflow(int_type ch) override
        {
            if (ch != traits_type::eof()) { buf_.push_back(traits_type::to_char_type(ch)); }
            return ch;
        }

        std::streamsize xsputn(const char *s, std::streamsize n) override
        {
            buf_.append(std::string_view(s, static_cast<size_t>(n)));
            return n;
        }
    };

    struct shared_config
    {
        std::shared_ptr<writer> out;
        std::mutex mutex;
        log_level level = log_level::debug;
    };

    // Attributes bound at one nesting level; frame 0 is the top level
    struct frame
    {
        std::string group;
        std::vector<attr> attrs;
    };

    std::shared_ptr<shared_config> config_;
    std::vector<frame> frames_;

    json_handler(std::shared_ptr<shared_config> config, std::vector<frame> frames)
        : config_(std::move(config)), frames_(std::move(frames))
    {
    }

  public:
    explicit json_handler(options opts) : config_(std::make_shared<shared_config>()), frames_(1)
    {
        config_->out   = opts.output ? std::move(opts.output) : make_stdout_writer();
        config_->level = opts.level;
    }

    bool enabled(log_level level) const override { return level >= config_->level; }

    std::error_code handle(const log_context &, const log_record &record) override
    {
        pooled_buffer buf;
        {
            line_buffer_streambuf sb(*buf);
            std::ostream stream(&sb);
            tao::json::events::to_stream consumer(stream);
            produce(consumer, record);
            stream.flush();
        }
        buf->push_back('\n');

        std::lock_guard<std::mutex> lock(config_->mutex);
        if (config_->out->write(buf->data(), buf->size()) < 0) return last_write_error();
        return {};
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) override
    {
        if (attrs.empty()) return shared_from_this();

        auto frames = frames_;
        auto &last  = frames.back().attrs;
        last.insert(last.end(), std::make_move_iterator(attrs.begin()), std::make_move_iterator(attrs.end()));
        return std::shared_ptr<json_handler>(new json_handler(config_, std::move(frames)));
    }

    std::shared_ptr<handler> with_group(std::string_view name) override
    {
        if (name.empty()) return shared_from_this();

        auto frames = frames_;
        frames.push_back(frame{std::string(name), {}});
        return std::shared_ptr<json_handler>(new json_handler(config_, std::move(frames)));
    }

    /**
     * @brief Emit the JSON events for one record
     *
     * Public so that other consumers (pretty printers, tests) can reuse it.
     */
    template <typename Consumer> void produce(Consumer &c, const log_record &record) const
    {
        c.begin_object();

        if (record.has_time())
        {
            c.key("time");
            c.string(format_rfc3339(record.time));
            c.member();
        }

        c.key("level");
        c.string(log_level_name(record.level));
        c.member();

        c.key("msg");
        c.string(record.message);
        c.member();

        // bound attrs level by level, record attrs in the innermost group
        produce_frames(c, record, 0);

        c.end_object();
    }

  private:
    static bool has_members(const std::vector<attr> &attrs)
    {
        for (const auto &a : attrs)
        {
            if (a.is_zero()) continue;
            if (a.val.kind() == value_kind::group && !has_members(a.val.as_group())) continue;
            return true;
        }
        return false;
    }

    bool frame_has_content(const log_record &record, size_t index) const
    {
        for (size_t i = index; i < frames_.size(); ++i)
        {
            if (has_members(frames_[i].attrs)) return true;
        }
        return has_members(record.attrs);
    }

    template <typename Consumer> void produce_frames(Consumer &c, const log_record &record, size_t index) const
    {
        const auto &f = frames_[index];
        for (const auto &a : f.attrs) produce_attr(c, a);

        if (index + 1 < frames_.size())
        {
            if (!frame_has_content(record, index + 1)) return;

            c.key(frames_[index + 1].group);
            c.begin_object();
            produce_frames(c, record, index + 1);
            c.end_object();
            c.member();
            return;
        }

        for (const auto &a : record.attrs) produce_attr(c, a);
    }

    template <typename Consumer> static void produce_attr(Consumer &c, const attr &a)
    {
        if (a.is_zero()) return;

        if (a.val.kind() == value_kind::group)
        {
            const auto &members = a.val.as_group();
            if (!has_members(members)) return;

            // an unnamed group inlines its members
            if (a.key.empty())
            {
                for (const auto &m : members) produce_attr(c, m);
                return;
            }

            c.key(a.key);
            c.begin_object();
            for (const auto &m : members) produce_attr(c, m);
            c.end_object();
            c.member();
            return;
        }

        c.key(a.key);
        produce_value(c, a.val);
        c.member();
    }

    template <typename Consumer> static void produce_value(Consumer &c, const value &v)
    {
        switch (v.kind())
        {
        case value_kind::string: c.string(v.as_string()); return;
        case value_kind::int64: c.number(static_cast<std::int64_t>(v.as_int64())); return;
        case value_kind::uint64: c.number(static_cast<std::uint64_t>(v.as_uint64())); return;
        case value_kind::float64:
        {
            double d = v.as_float64();
            if (std::isfinite(d)) { c.number(d); }
            else
            {
                // JSON has no NaN or Inf
                pooled_buffer tmp;
                append_float(*tmp, d);
                c.string(tmp->view());
            }
            return;
        }
        case value_kind::boolean: c.boolean(v.as_bool()); return;
        case value_kind::duration: c.number(static_cast<std::int64_t>(v.as_duration().count())); return;
        case value_kind::time: c.string(format_rfc3339(v.as_time())); return;
        case value_kind::group: c.null(); return; // handled by produce_attr
        case value_kind::any: break;
        }

        if (const auto *level = v.level_if()) { c.string(log_level_name(*level)); }
        else if (const auto *src = v.source_if())
        {
            c.begin_object();
            c.key("function");
            c.string(src->function);
            c.member();
            c.key("file");
            c.string(src->file);
            c.member();
            c.key("line");
            c.number(static_cast<std::int64_t>(src->line));
            c.member();
            c.end_object();
        }
        else if (const auto *e = v.error_if()) { c.string(e->message); }
        else if (const auto *m = v.marshaler_if())
        {
            auto result = try_marshal(m->get());
            switch (result.state)
            {
            case encode_result::status::ok:
            case encode_result::status::panic: c.string(result.text); break;
            case encode_result::status::failed:
            case encode_result::status::nil: c.null(); break;
            }
        }
        else { c.null(); }
    }
};

} // namespace devlog
