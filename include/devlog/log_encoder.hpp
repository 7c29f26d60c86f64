/**
 * @file log_encoder.hpp
 * @brief Text encoding of single values: quoting, escaping and number/time forms
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Everything here is a pure function appending to a line_buffer. The quoting
 * rules follow the key=value text convention: a string stays bare unless it
 * is empty or contains a space, '=', a byte outside the safe ASCII set or a
 * non-printable or space code point, in which case it is written as a
 * double-quoted escaped literal.
 */
#pragma once

#include <cstdint>
#include <cmath>
#include <cctype>
#include <ctime>
#include <array>
#include <string>
#include <string_view>
#include <charconv>
#include <chrono>
#include <exception>
#include <utility>

#include "log_types.hpp"
#include "log_buffer.hpp"
#include "log_value.hpp"

namespace devlog
{

// Printable ASCII that may appear unquoted. '"' and '\\' are excluded;
// DEL and ESC are let through so that color codes do not force quoting.
inline constexpr std::array<bool, 128> safe_set = []() {
    std::array<bool, 128> set{};
    for (int c = 0x20; c < 0x7f; ++c) set[c] = true;
    set['"']  = false;
    set['\\'] = false;
    set[0x7f] = true;
    set[0x1b] = true;
    return set;
}();

inline constexpr char32_t RUNE_ERROR = 0xFFFD;
inline constexpr char32_t MAX_RUNE   = 0x10FFFF;

/**
 * @brief Decode one UTF-8 sequence at @p i
 * @return Code point and width; {RUNE_ERROR, 1} for an invalid, overlong,
 *         surrogate or truncated sequence
 */
inline std::pair<char32_t, size_t> decode_rune(std::string_view s, size_t i) noexcept
{
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    auto cont = [&](size_t k) { return k < s.size() && (byte(k) & 0xC0) == 0x80; };

    unsigned char b0 = byte(i);
    if (b0 < 0x80) return {b0, 1};

    if (b0 >= 0xC2 && b0 <= 0xDF)
    {
        if (!cont(i + 1)) return {RUNE_ERROR, 1};
        return {static_cast<char32_t>(((b0 & 0x1F) << 6) | (byte(i + 1) & 0x3F)), 2};
    }

    if (b0 >= 0xE0 && b0 <= 0xEF)
    {
        if (!cont(i + 1) || !cont(i + 2)) return {RUNE_ERROR, 1};
        unsigned char b1 = byte(i + 1);
        if (b0 == 0xE0 && b1 < 0xA0) return {RUNE_ERROR, 1}; // overlong
        if (b0 == 0xED && b1 > 0x9F) return {RUNE_ERROR, 1}; // surrogate
        return {static_cast<char32_t>(((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (byte(i + 2) & 0x3F)), 3};
    }

    if (b0 >= 0xF0 && b0 <= 0xF4)
    {
        if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return {RUNE_ERROR, 1};
        unsigned char b1 = byte(i + 1);
        if (b0 == 0xF0 && b1 < 0x90) return {RUNE_ERROR, 1};
        if (b0 == 0xF4 && b1 > 0x8F) return {RUNE_ERROR, 1};
        return {static_cast<char32_t>(((b0 & 0x07) << 18) | ((b1 & 0x3F) << 12) | ((byte(i + 2) & 0x3F) << 6) |
                                      (byte(i + 3) & 0x3F)),
                4};
    }

    return {RUNE_ERROR, 1};
}

/**
 * @brief White space as defined by the Unicode White_Space property
 */
inline bool is_space(char32_t r) noexcept
{
    switch (r)
    {
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case ' ':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000: return true;
    default: return r >= 0x2000 && r <= 0x200A;
    }
}

/**
 * @brief Printable code point: graphic characters plus U+0020
 *
 * Controls, non-ASCII spaces, line/paragraph separators, the common format
 * characters, surrogates, private use and noncharacters are non-printable.
 * Unassigned code points are treated as printable.
 */
inline bool is_print(char32_t r) noexcept
{
    if (r < 0x20 || (r >= 0x7F && r <= 0x9F)) return false;
    if (r < 0x7F) return true;
    if (r > MAX_RUNE) return false;
    if (r == 0xA0 || r == 0xAD || r == 0x1680 || r == 0x3000 || r == 0xFEFF) return false;
    if (r >= 0x2000 && r <= 0x200F) return false;
    if (r >= 0x2028 && r <= 0x202F) return false;
    if (r >= 0x205F && r <= 0x206F) return false;
    if (r >= 0xD800 && r <= 0xDFFF) return false;
    if (r >= 0xE000 && r <= 0xF8FF) return false;
    if (r >= 0xFFF9 && r <= 0xFFFB) return false;
    if ((r & 0xFFFE) == 0xFFFE) return false;
    return true;
}

/**
 * @brief Whether @p s must be written as a quoted literal
 */
inline bool needs_quoting(std::string_view s) noexcept
{
    if (s.empty()) return true;

    for (size_t i = 0; i < s.size();)
    {
        auto b = static_cast<unsigned char>(s[i]);
        if (b < 0x80)
        {
            // backslash alone never forces quoting
            if (b != '\\' && (b == ' ' || b == '=' || !safe_set[b])) return true;
            ++i;
            continue;
        }
        auto [r, width] = decode_rune(s, i);
        if (r == RUNE_ERROR || is_space(r) || !is_print(r)) return true;
        i += width;
    }
    return false;
}

namespace detail
{

inline constexpr const char *lower_hex = "0123456789abcdef";

inline void append_hex(line_buffer &buf, uint32_t v, int digits)
{
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) buf.push_back(lower_hex[(v >> shift) & 0xF]);
}

} // namespace detail

/**
 * @brief Append @p s as a double-quoted escaped literal
 *
 * Printable code points are copied, '"' and '\\' are backslash escaped,
 * the usual control characters use their short escapes, other bytes below
 * 0x20 and DEL use \\xNN and remaining non-printable code points \\uNNNN or
 * \\UNNNNNNNN. Invalid UTF-8 bytes are written as \\xNN.
 *
 * @param keep_esc Write ESC as a raw byte instead of \\x1b so that color
 *                 codes inside the literal stay live
 */
inline void append_quoted(line_buffer &buf, std::string_view s, bool keep_esc = false)
{
    buf.push_back('"');
    for (size_t i = 0; i < s.size();)
    {
        auto [r, width] = decode_rune(s, i);
        if (width == 1 && r == RUNE_ERROR)
        {
            buf.append("\\x");
            detail::append_hex(buf, static_cast<unsigned char>(s[i]), 2);
            ++i;
            continue;
        }

        if (r == '"' || r == '\\')
        {
            buf.push_back('\\').push_back(static_cast<char>(r));
        }
        else if (is_print(r)) { buf.append(s.substr(i, width)); }
        else
        {
            switch (r)
            {
            case '\a': buf.append("\\a"); break;
            case '\b': buf.append("\\b"); break;
            case '\f': buf.append("\\f"); break;
            case '\n': buf.append("\\n"); break;
            case '\r': buf.append("\\r"); break;
            case '\t': buf.append("\\t"); break;
            case '\v': buf.append("\\v"); break;
            default:
                if (r == 0x1b && keep_esc) { buf.push_back(ansi::esc); }
                else if (r < ' ' || r == 0x7F)
                {
                    buf.append("\\x");
                    detail::append_hex(buf, r, 2);
                }
                else if (r < 0x10000)
                {
                    buf.append("\\u");
                    detail::append_hex(buf, r, 4);
                }
                else
                {
                    buf.append("\\U");
                    detail::append_hex(buf, r, 8);
                }
                break;
            }
        }
        i += width;
    }
    buf.push_back('"');
}

/**
 * @brief Remove ANSI escape runs: ESC up to and including the next letter
 *
 * Decoding stops at the first invalid UTF-8 sequence; the rest is dropped.
 */
inline std::string strip_ansi(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    bool in_escape = false;
    for (size_t i = 0; i < s.size();)
    {
        auto [r, width] = decode_rune(s, i);
        if (r == RUNE_ERROR) break;

        bool drop = false;
        if (r == static_cast<char32_t>(ansi::esc)) { in_escape = true; }
        else if (in_escape && r < 0x80 && std::isalpha(static_cast<int>(r)))
        {
            in_escape = false;
            drop      = true;
        }
        if (!drop && !in_escape) out.append(s.substr(i, width));
        i += width;
    }
    return out;
}

/**
 * @brief Append a string value
 * @param quote Quote when needs_quoting() says so
 * @param color Destination renders ANSI codes; when false and quoting is
 *              requested, embedded color runs are stripped first
 */
inline void append_string(line_buffer &buf, std::string_view s, bool quote, bool color)
{
    std::string stripped;
    if (quote && !color)
    {
        stripped = strip_ansi(s);
        s        = stripped;
    }

    quote = quote && needs_quoting(s);
    if (quote) { append_quoted(buf, s, color); }
    else { buf.append(s); }
}

/**
 * @brief Shortest round-trip form of a double
 *
 * Plain decimal for exponents in [-4, 6), scientific notation with a signed
 * two-digit (or longer) exponent otherwise. NaN and infinities are written
 * as NaN, +Inf and -Inf.
 */
inline void append_float(line_buffer &buf, double v)
{
    if (std::isnan(v))
    {
        buf.append("NaN");
        return;
    }
    if (std::isinf(v))
    {
        buf.append(v > 0 ? "+Inf" : "-Inf");
        return;
    }

    char sci[64];
    auto res = std::to_chars(sci, sci + sizeof(sci), v, std::chars_format::scientific);
    std::string_view sci_text(sci, static_cast<size_t>(res.ptr - sci));

    int exp = 0;
    if (auto e = sci_text.find('e'); e != std::string_view::npos)
    {
        auto digits = sci_text.substr(e + 1);
        if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
        std::from_chars(digits.data(), digits.data() + digits.size(), exp);
    }

    if (v != 0 && (exp < -4 || exp >= 6))
    {
        buf.append(sci_text);
        return;
    }

    char fixed[400];
    auto fres = std::to_chars(fixed, fixed + sizeof(fixed), v, std::chars_format::fixed);
    buf.append(std::string_view(fixed, static_cast<size_t>(fres.ptr - fixed)));
}

namespace detail
{

// Append "<int>[.<frac>]" where frac has @p prec digits with trailing zeros removed
inline void append_fraction(std::string &out, uint64_t whole, uint64_t frac, int prec)
{
    out.append(std::to_string(whole));
    if (frac == 0) return;

    char digits[20];
    for (int k = prec - 1; k >= 0; --k)
    {
        digits[k] = static_cast<char>('0' + frac % 10);
        frac /= 10;
    }
    int len = prec;
    while (len > 0 && digits[len - 1] == '0') --len;
    out.push_back('.');
    out.append(digits, static_cast<size_t>(len));
}

} // namespace detail

/**
 * @brief Human form of a duration: "0s", "850ns", "1.5µs", "250ms", "1h2m3.5s"
 */
inline std::string format_duration(std::chrono::nanoseconds d)
{
    int64_t v = d.count();
    if (v == 0) return "0s";

    bool neg   = v < 0;
    uint64_t u = neg ? uint64_t(0) - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);

    std::string out;
    if (neg) out.push_back('-');

    constexpr uint64_t us = 1000;
    constexpr uint64_t ms = 1000 * us;
    constexpr uint64_t s  = 1000 * ms;

    if (u < s)
    {
        if (u < us)
        {
            out.append(std::to_string(u)).append("ns");
        }
        else if (u < ms)
        {
            detail::append_fraction(out, u / us, u % us, 3);
            out.append("\xc2\xb5s"); // U+00B5 MICRO SIGN
        }
        else
        {
            detail::append_fraction(out, u / ms, u % ms, 6);
            out.append("ms");
        }
        return out;
    }

    uint64_t total_seconds = u / s;
    uint64_t hours         = total_seconds / 3600;
    uint64_t minutes       = (total_seconds / 60) % 60;
    uint64_t seconds       = total_seconds % 60;

    if (hours > 0) out.append(std::to_string(hours)).push_back('h');
    if (hours > 0 || minutes > 0) out.append(std::to_string(minutes)).push_back('m');
    detail::append_fraction(out, seconds, u % s, 9);
    out.push_back('s');
    return out;
}

/**
 * @brief Full UTC timestamp: "2024-05-01 13:04:05.123 +0000 UTC"
 */
inline std::string format_time(std::chrono::system_clock::time_point t)
{
    using namespace std::chrono;

    auto secs = floor<seconds>(t);
    auto frac = duration_cast<nanoseconds>(t - secs).count();

    std::time_t tt = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::string out = fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
    if (frac != 0)
    {
        std::string digits = fmt::format("{:09d}", frac);
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out.push_back('.');
        out.append(digits);
    }
    out.append(" +0000 UTC");
    return out;
}

/**
 * @brief RFC 3339 UTC timestamp with nanoseconds: "2024-05-01T13:04:05.123Z"
 */
inline std::string format_rfc3339(std::chrono::system_clock::time_point t)
{
    using namespace std::chrono;

    auto secs = floor<seconds>(t);
    auto frac = duration_cast<nanoseconds>(t - secs).count();

    std::time_t tt = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::string out = fmt::format("{:%Y-%m-%dT%H:%M:%S}", tm);
    if (frac != 0)
    {
        std::string digits = fmt::format("{:09d}", frac);
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out.push_back('.');
        out.append(digits);
    }
    out.push_back('Z');
    return out;
}

/**
 * @brief Outcome of asking a text_marshaler for its text form
 */
struct encode_result
{
    enum class status : uint8_t
    {
        ok,     ///< text holds the marshaled form
        failed, ///< the marshaler reported that it has no text form
        nil,    ///< the marshaler is null or refers to nothing
        panic,  ///< marshaling threw; text holds "!PANIC: <what>"
    };

    status state = status::ok;
    std::string text;
};

/**
 * @brief Run a marshaler, converting anything it throws into a result
 *
 * A std::exception keeps its what() text; other thrown types are reported
 * as "unknown exception".
 */
inline encode_result try_marshal(const text_marshaler *m)
{
    if (!m) return {encode_result::status::nil, {}};

    std::string out;
    try
    {
        if (!m->marshal_text(out)) return {encode_result::status::failed, {}};
    }
    catch (const std::exception &e)
    {
        if (m->is_nil()) return {encode_result::status::nil, {}};
        return {encode_result::status::panic, fmt::format("!PANIC: {}", e.what())};
    }
    catch (...)
    {
        // user formatters may throw anything; the failure stays in this value
        if (m->is_nil()) return {encode_result::status::nil, {}};
        return {encode_result::status::panic, "!PANIC: unknown exception"};
    }
    return {encode_result::status::ok, std::move(out)};
}

} // namespace devlog
