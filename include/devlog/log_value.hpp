/**
 * @file log_value.hpp
 * @brief Typed attribute values and key/value attributes
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A value is one of: string, signed or unsigned 64-bit integer, double,
 * bool, duration, time point, group (nested attributes) or "any". An any
 * value holds nothing (the zero value), a log_level, a source_descriptor,
 * an error_value or a text_marshaler.
 *
 * Example:
 * @code
 * logger.info(ctx, "request done", {
 *     devlog::string("path", "/users"),
 *     devlog::int64("status", 200),
 *     devlog::duration("took", 12ms),
 *     devlog::group("client", {devlog::string("ip", ip), devlog::uint64("port", port)}),
 *     devlog::any("user", user),   // any fmt-formattable type
 * });
 * @endcode
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <variant>
#include <chrono>
#include <concepts>
#include <system_error>
#include <stdexcept>
#include <type_traits>
#include <iterator>

#include "log_types.hpp"
#include "log_source.hpp"

namespace devlog
{

struct attr;

/**
 * @brief Capability of producing a text form for an arbitrary value
 *
 * marshal_text() appends the text form to @p out and returns true, or
 * returns false when no text form can be produced. It may throw; the
 * renderer contains the failure to the one attribute.
 */
class text_marshaler
{
  public:
    virtual ~text_marshaler() = default;

    virtual bool marshal_text(std::string &out) const = 0;

    /// True for pointer-like marshalers that currently refer to nothing
    virtual bool is_nil() const noexcept { return false; }
};

/**
 * @brief Marks an attribute as an error; rendered with its own colors
 */
struct error_value
{
    std::string message;

    bool operator==(const error_value &) const = default;
};

enum class value_kind : uint8_t
{
    any,
    boolean,
    duration,
    float64,
    int64,
    string,
    time,
    uint64,
    group,
};

class value
{
  public:
    using time_point     = std::chrono::system_clock::time_point;
    using group_ptr      = std::shared_ptr<const std::vector<attr>>;
    using marshaler_ptr  = std::shared_ptr<const text_marshaler>;

  private:
    // index order matters for kind()
    using storage = std::variant<std::monostate,
                                 std::string,
                                 int64_t,
                                 uint64_t,
                                 double,
                                 bool,
                                 std::chrono::nanoseconds,
                                 time_point,
                                 group_ptr,
                                 log_level,
                                 source_descriptor,
                                 error_value,
                                 marshaler_ptr>;
    storage data_;

    explicit value(storage data) : data_(std::move(data)) {}

  public:
    value() = default;

    value(std::string v) : data_(std::move(v)) {}
    value(std::string_view v) : data_(std::string(v)) {}
    value(const char *v) : data_(std::string(v ? v : "")) {}

    template <typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
    value(T v)
    {
        if constexpr (std::is_signed_v<T>) { data_ = static_cast<int64_t>(v); }
        else { data_ = static_cast<uint64_t>(v); }
    }

    template <typename T>
        requires std::is_floating_point_v<T>
    value(T v) : data_(static_cast<double>(v))
    {
    }

    value(bool v) : data_(v) {}

    template <typename Rep, typename Period>
    value(std::chrono::duration<Rep, Period> d) : data_(std::chrono::duration_cast<std::chrono::nanoseconds>(d))
    {
    }

    value(time_point t) : data_(t) {}
    value(log_level l) : data_(l) {}
    value(source_descriptor s) : data_(std::move(s)) {}
    value(error_value e) : data_(std::move(e)) {}
    value(marshaler_ptr m) : data_(std::move(m)) {}

    static value group(std::vector<attr> members);

    value_kind kind() const noexcept
    {
        switch (data_.index())
        {
        case 1: return value_kind::string;
        case 2: return value_kind::int64;
        case 3: return value_kind::uint64;
        case 4: return value_kind::float64;
        case 5: return value_kind::boolean;
        case 6: return value_kind::duration;
        case 7: return value_kind::time;
        case 8: return value_kind::group;
        default: return value_kind::any;
        }
    }

    /// The zero value: an any holding nothing
    bool is_zero() const noexcept { return data_.index() == 0; }

    const std::string &as_string() const { return std::get<std::string>(data_); }
    int64_t as_int64() const { return std::get<int64_t>(data_); }
    uint64_t as_uint64() const { return std::get<uint64_t>(data_); }
    double as_float64() const { return std::get<double>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    std::chrono::nanoseconds as_duration() const { return std::get<std::chrono::nanoseconds>(data_); }
    time_point as_time() const { return std::get<time_point>(data_); }

    const std::vector<attr> &as_group() const;

    // any payloads; nullptr when the value holds something else
    const log_level *level_if() const noexcept { return std::get_if<log_level>(&data_); }
    const source_descriptor *source_if() const noexcept { return std::get_if<source_descriptor>(&data_); }
    const error_value *error_if() const noexcept { return std::get_if<error_value>(&data_); }
    const marshaler_ptr *marshaler_if() const noexcept { return std::get_if<marshaler_ptr>(&data_); }

    bool operator==(const value &other) const;
};

/**
 * @brief Key/value pair attached to a record or a group
 *
 * attr{} (empty key, zero value) is the zero attribute and is never rendered.
 */
struct attr
{
    std::string key;
    value val;

    attr() = default;
    attr(std::string k, value v) : key(std::move(k)), val(std::move(v)) {}

    bool is_zero() const noexcept { return key.empty() && val.is_zero(); }

    bool operator==(const attr &) const = default;
};

inline value value::group(std::vector<attr> members)
{
    return value(storage(std::make_shared<const std::vector<attr>>(std::move(members))));
}

inline const std::vector<attr> &value::as_group() const
{
    static const std::vector<attr> empty;
    const auto &g = std::get<group_ptr>(data_);
    return g ? *g : empty;
}

inline bool value::operator==(const value &other) const
{
    if (data_.index() != other.data_.index()) return false;
    if (auto g = std::get_if<group_ptr>(&data_))
    {
        const auto &rhs = std::get<group_ptr>(other.data_);
        if (*g == rhs) return true;
        return as_group() == other.as_group();
    }
    return data_ == other.data_;
}

/**
 * @brief text_marshaler for any type fmt can format
 */
template <Loggable T> class formatted_value : public text_marshaler
{
    T value_;

  public:
    explicit formatted_value(T v) : value_(std::move(v)) {}

    bool marshal_text(std::string &out) const override
    {
        fmt::format_to(std::back_inserter(out), "{}", value_);
        return true;
    }
};

/**
 * @brief text_marshaler referring to a value it does not own
 *
 * Formatting through a null pointer throws; is_nil() lets the renderer
 * recognise that case.
 */
template <Loggable T> class pointer_value : public text_marshaler
{
    const T *ptr_;

  public:
    explicit pointer_value(const T *p) : ptr_(p) {}

    bool marshal_text(std::string &out) const override
    {
        if (!ptr_) throw std::invalid_argument("nil pointer dereference");
        fmt::format_to(std::back_inserter(out), "{}", *ptr_);
        return true;
    }

    bool is_nil() const noexcept override { return ptr_ == nullptr; }
};

// Attribute constructors

inline attr string(std::string key, std::string_view v) { return attr(std::move(key), value(v)); }

template <typename T>
    requires std::is_integral_v<T> && std::is_signed_v<T> && (!std::is_same_v<T, bool>)
attr int64(std::string key, T v)
{
    return attr(std::move(key), value(static_cast<int64_t>(v)));
}

template <typename T>
    requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
attr uint64(std::string key, T v)
{
    return attr(std::move(key), value(static_cast<uint64_t>(v)));
}

inline attr float64(std::string key, double v) { return attr(std::move(key), value(v)); }

inline attr boolean(std::string key, bool v) { return attr(std::move(key), value(v)); }

template <typename Rep, typename Period> attr duration(std::string key, std::chrono::duration<Rep, Period> d)
{
    return attr(std::move(key), value(d));
}

inline attr timestamp(std::string key, std::chrono::system_clock::time_point t) { return attr(std::move(key), value(t)); }

inline attr group(std::string key, std::vector<attr> members)
{
    return attr(std::move(key), value::group(std::move(members)));
}

inline attr any(std::string key, log_level l) { return attr(std::move(key), value(l)); }

inline attr any(std::string key, source_descriptor s) { return attr(std::move(key), value(std::move(s))); }

template <typename M>
    requires std::derived_from<M, text_marshaler>
attr any(std::string key, std::shared_ptr<M> m)
{
    return attr(std::move(key), value(value::marshaler_ptr(std::move(m))));
}

template <Loggable T> attr any(std::string key, const T *p)
{
    return attr(std::move(key), value(value::marshaler_ptr(std::make_shared<pointer_value<T>>(p))));
}

inline attr any(std::string key, const char *s) { return attr(std::move(key), value(s)); }

inline attr any(std::string key, std::string_view s) { return attr(std::move(key), value(s)); }

template <typename T>
    requires std::is_arithmetic_v<T>
attr any(std::string key, T v)
{
    return attr(std::move(key), value(v));
}

template <typename Rep, typename Period> attr any(std::string key, std::chrono::duration<Rep, Period> d)
{
    return attr(std::move(key), value(d));
}

inline attr any(std::string key, std::chrono::system_clock::time_point t) { return attr(std::move(key), value(t)); }

namespace detail
{
template <typename T> struct is_chrono_duration : std::false_type
{
};
template <typename Rep, typename Period>
struct is_chrono_duration<std::chrono::duration<Rep, Period>> : std::true_type
{
};

// Types with a dedicated any() overload
template <typename T>
concept plain_any = std::is_arithmetic_v<T> || std::is_pointer_v<T> || std::is_convertible_v<T, std::string_view> ||
                    is_chrono_duration<T>::value || std::is_same_v<T, std::chrono::system_clock::time_point> ||
                    std::is_same_v<T, log_level> || std::is_same_v<T, source_descriptor>;
} // namespace detail

template <typename T>
    requires Loggable<std::decay_t<T>> && (!detail::plain_any<std::decay_t<T>>)
attr any(std::string key, T &&v)
{
    using stored = std::decay_t<T>;
    return attr(std::move(key),
                value(value::marshaler_ptr(std::make_shared<formatted_value<stored>>(std::forward<T>(v)))));
}

/// An any attribute holding nothing; renders as <nil>
inline attr nil(std::string key) { return attr(std::move(key), value()); }

inline attr err(std::string key, std::string_view message)
{
    return attr(std::move(key), value(error_value{std::string(message)}));
}

inline attr err(std::string key, const std::exception &e) { return err(std::move(key), e.what()); }

inline attr err(std::string key, const std::error_code &ec) { return err(std::move(key), ec.message()); }

} // namespace devlog
