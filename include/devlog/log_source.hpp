/**
 * @file log_source.hpp
 * @brief Call-site capture and caller resolution
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A log call records a call_site (file, line, function) at the point of the
 * call. For display the function is reduced to a short name and the file to
 * its parent directory plus base name.
 *
 * Code that logs on behalf of a caller (the SQL tracer) cannot use its own
 * call site, so it walks the stack through a caller_resolver and picks the
 * first frame that does not belong to a library namespace.
 */
#pragma once

#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <source_location>

#include <boost/stacktrace.hpp>

#include "log_types.hpp"

namespace devlog
{

/**
 * @brief Resolved origin of a record: short function name, short file path, line
 */
struct source_descriptor
{
    std::string function;
    std::string file;
    int line = 0;

    bool empty() const noexcept { return function.empty() && file.empty() && line == 0; }

    bool operator==(const source_descriptor &) const = default;
};

/**
 * @brief Raw location of a log call as captured by the compiler
 *
 * The strings are expected to outlive the record, which holds for
 * __FILE__, __PRETTY_FUNCTION__ and std::source_location data.
 * A default constructed call_site is "absent".
 */
struct call_site
{
    std::string_view file;
    int line = 0;
    std::string_view function;

    bool empty() const noexcept { return file.empty(); }

    static call_site current(std::source_location loc = std::source_location::current()) noexcept
    {
        return call_site{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    }
};

namespace detail
{

inline bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

inline bool all_digits(std::string_view s)
{
    if (s.empty()) return false;
    for (char c : s)
    {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// "func", "func1", "lambda", "lambda2": the prefix followed by digits or nothing
inline bool is_closure_segment(std::string_view seg)
{
    for (std::string_view prefix : {std::string_view("func"), std::string_view("lambda")})
    {
        if (!seg.starts_with(prefix)) continue;
        auto tail = seg.substr(prefix.size());
        return tail.empty() || all_digits(tail);
    }
    return all_digits(seg);
}

// Skip a balanced bracket run starting at s[i] (which must be the opener).
// Returns the index one past the matching closer.
inline size_t skip_balanced(std::string_view s, size_t i)
{
    int depth = 0;
    for (; i < s.size(); ++i)
    {
        char c = s[i];
        if (c == '(' || c == '<' || c == '{' || c == '[') { ++depth; }
        else if (c == ')' || c == '>' || c == '}' || c == ']')
        {
            if (--depth == 0) return i + 1;
        }
    }
    return s.size();
}

} // namespace detail

/**
 * @brief Turn a C++ function signature into a dotted path
 *
 * Accepts what __PRETTY_FUNCTION__, std::source_location and the demangler
 * produce, and drops the return type, parameter lists, template arguments
 * and cv/ref qualifiers. Anonymous namespaces disappear, lambdas become
 * "lambda" (GCC's "{lambda()#2}" becomes "lambda2") and the call operator of
 * a lambda is dropped, so
 * @code
 * void app::service::run(int)::<lambda()>   ->  app.service.run.lambda
 * app::(anonymous namespace)::helper()      ->  app.helper
 * @endcode
 */
inline std::string normalize_function_name(std::string_view pretty)
{
    if (auto with = pretty.find(" [with "); with != std::string_view::npos) pretty = pretty.substr(0, with);

    std::vector<std::string> parts;
    std::string current;
    bool anonymous  = false;
    bool had_params = false;
    bool qualifiers = false;

    auto flush = [&]() {
        if (!anonymous && !current.empty()) parts.push_back(current);
        current.clear();
        anonymous  = false;
        had_params = false;
        qualifiers = false;
    };

    size_t i = 0;
    while (i < pretty.size())
    {
        char c = pretty[i];

        if (c == ':' && i + 1 < pretty.size() && pretty[i + 1] == ':')
        {
            flush();
            i += 2;
            continue;
        }

        if (qualifiers)
        {
            // cv/ref/noexcept after a parameter list; only "::" ends it
            if (c == '(' || c == '<' || c == '{' || c == '[') { i = detail::skip_balanced(pretty, i); }
            else { ++i; }
            continue;
        }

        if (c == ' ')
        {
            if (had_params) { qualifiers = true; }
            else
            {
                // everything so far was the return type
                parts.clear();
                current.clear();
                anonymous = false;
            }
            ++i;
            continue;
        }

        if (c == '(')
        {
            auto rest = pretty.substr(i);
            if (current.empty() && rest.starts_with("(anonymous namespace)"))
            {
                anonymous = true;
                i += std::string_view("(anonymous namespace)").size();
                continue;
            }
            if (current.empty() && (rest.starts_with("(anonymous class)") || rest.starts_with("(lambda at ")))
            {
                current = "lambda";
                i       = detail::skip_balanced(pretty, i);
                continue;
            }
            had_params = true;
            i          = detail::skip_balanced(pretty, i);
            continue;
        }

        if (c == '<')
        {
            if (current.empty() && pretty.substr(i).starts_with("<lambda")) { current = "lambda"; }
            i = detail::skip_balanced(pretty, i);
            continue;
        }

        if (c == '{')
        {
            auto rest = pretty.substr(i);
            if (current.empty() && rest.starts_with("{anonymous}"))
            {
                anonymous = true;
                i += std::string_view("{anonymous}").size();
                continue;
            }
            if (current.empty() && rest.starts_with("{lambda"))
            {
                size_t end = detail::skip_balanced(pretty, i);
                auto body  = pretty.substr(i, end - i);
                current    = "lambda";
                if (auto hash = body.find('#'); hash != std::string_view::npos)
                {
                    current.append(body.substr(hash + 1, body.size() - hash - 2));
                }
                i = end;
                continue;
            }
            i = detail::skip_balanced(pretty, i);
            continue;
        }

        if (detail::is_ident_char(c))
        {
            size_t start = i;
            while (i < pretty.size() && detail::is_ident_char(pretty[i])) ++i;
            current.append(pretty.substr(start, i - start));

            if (current == "operator")
            {
                if (pretty.substr(i).starts_with("()"))
                {
                    current.append("()");
                    i += 2;
                }
                else
                {
                    while (i < pretty.size() && pretty[i] != '(') current.push_back(pretty[i++]);
                    while (!current.empty() && current.back() == ' ') current.pop_back();
                }
            }
            continue;
        }

        // pointer/reference punctuation in a return type, '~' of a destructor
        if (c == '~') current.push_back(c);
        ++i;
    }
    flush();

    std::string result;
    for (size_t p = 0; p < parts.size(); ++p)
    {
        if (parts[p] == "operator()" && p > 0 && parts[p - 1].starts_with("lambda")) continue;
        if (!result.empty()) result.push_back('.');
        result.append(parts[p]);
    }
    return result;
}

/**
 * @brief Dotted path of a function name; C++ signatures are normalized,
 *        names that are already dotted are returned as they are
 */
inline std::string dotted_function_name(std::string_view name)
{
    if (name.find("::") != std::string_view::npos || name.find(' ') != std::string_view::npos || name.ends_with(')'))
    {
        return normalize_function_name(name);
    }
    return std::string(name);
}

/**
 * @brief Reduce a dotted function path to its display name
 *
 * Segments are taken from the end: numeric segments and "func" or "lambda"
 * optionally followed by digits mark nested closures and are kept as a suffix
 * until the first real segment is reached.
 * @code
 * pkg.(*Type).Method.func1.1   ->  Method.func1.1
 * app.service.run.lambda       ->  run.lambda
 * @endcode
 * C++ signatures are normalized first (see dotted_function_name()).
 */
inline std::string short_function_name(std::string_view name)
{
    std::string dotted = dotted_function_name(name);

    std::vector<std::string_view> segments;
    std::string_view rest(dotted);
    while (true)
    {
        auto dot = rest.find('.');
        segments.push_back(rest.substr(0, dot));
        if (dot == std::string_view::npos) break;
        rest.remove_prefix(dot + 1);
    }

    std::string result;
    for (size_t i = segments.size(); i-- > 0;)
    {
        auto seg = segments[i];
        if (detail::is_closure_segment(seg))
        {
            result.insert(0, seg);
            result.insert(0, ".");
            continue;
        }
        result.insert(0, seg);
        break;
    }
    // nothing but closure segments
    if (!result.empty() && result.front() == '.') result.erase(0, 1);
    return result;
}

/**
 * @brief Keep the parent directory's name and the file name: "/a/b/c.cpp" -> "b/c.cpp"
 */
inline std::string short_file_path(std::string_view path)
{
    auto is_sep = [](char c) { return c == '/' || c == '\\'; };

    size_t file_start = path.size();
    while (file_start > 0 && !is_sep(path[file_start - 1])) --file_start;
    auto file = path.substr(file_start);
    if (file_start == 0) return std::string(file);

    // directory without its trailing separators
    size_t dir_end = file_start;
    while (dir_end > 0 && is_sep(path[dir_end - 1])) --dir_end;
    if (dir_end == 0) return std::string(file);

    size_t dir_start = dir_end;
    while (dir_start > 0 && !is_sep(path[dir_start - 1])) --dir_start;
    auto dir = path.substr(dir_start, dir_end - dir_start);
    if (dir == ".") return std::string(file);

    std::string result;
    result.reserve(dir.size() + 1 + file.size());
    result.append(dir).push_back('/');
    result.append(file);
    return result;
}

/**
 * @brief Build a source descriptor from a captured call site
 */
inline source_descriptor make_source(const call_site &site)
{
    return source_descriptor{short_function_name(site.function), short_file_path(site.file), site.line};
}

/**
 * @brief One frame of a stack walk
 *
 * @c function is the demangled symbol, @c file the source file and @c line
 * its line; file is empty and line 0 when they are unknown.
 */
struct stack_frame
{
    std::string function;
    std::string file;
    int line = 0;
};

/**
 * @brief Stack introspection capability
 *
 * Implementations return up to @p depth frames, outermost last, starting
 * @p skip frames above the caller of walk().
 */
class caller_resolver
{
  public:
    virtual ~caller_resolver() = default;

    virtual std::vector<stack_frame> walk(int skip, int depth) const = 0;
};

/**
 * @brief caller_resolver built on Boost.Stacktrace
 *
 * Frames are symbolized through libbacktrace, so source files and lines are
 * known wherever the binary carries debug info (-g). Without it the file is
 * empty and the line 0.
 */
class backtrace_resolver : public caller_resolver
{
  public:
    [[gnu::noinline]] std::vector<stack_frame> walk(int skip, int depth) const override
    {
        std::vector<stack_frame> frames;
        if (skip < 0 || depth <= 0) return frames;

        // +1 for walk() itself
        boost::stacktrace::stacktrace stack(static_cast<std::size_t>(skip) + 1, static_cast<std::size_t>(depth));
        frames.reserve(stack.size());
        for (const auto &entry : stack)
        {
            stack_frame frame;
            frame.function = entry.name();
            frame.file     = entry.source_file();
            frame.line     = static_cast<int>(entry.source_line());
            frames.push_back(std::move(frame));
        }
        return frames;
    }

    static const backtrace_resolver &instance()
    {
        static backtrace_resolver resolver;
        return resolver;
    }
};

/**
 * @brief Decides which frames of a walk may be reported as the caller
 *
 * A frame is rejected when its function contains one of the library
 * prefixes (unless it comes from a test file) or when its file carries the
 * generated-code marker.
 */
struct frame_filter
{
    std::vector<std::string> library_prefixes{"devlog::"};
    std::string generated_marker{".gen."};

    static bool is_test_file(std::string_view file)
    {
        auto slash = file.find_last_of("/\\");
        auto base  = slash == std::string_view::npos ? file : file.substr(slash + 1);
        if (base.starts_with("test_")) return true;

        auto dot  = base.rfind('.');
        auto stem = dot == std::string_view::npos ? base : base.substr(0, dot);
        return stem.ends_with("_test");
    }

    bool accept(const stack_frame &frame) const
    {
        if (!generated_marker.empty() && frame.file.find(generated_marker) != std::string::npos) return false;

        for (const auto &prefix : library_prefixes)
        {
            if (!prefix.empty() && frame.function.find(prefix) != std::string::npos) return is_test_file(frame.file);
        }
        return true;
    }
};

/**
 * @brief Find the first acceptable frame above the caller
 * @param resolver Stack introspection to use
 * @param filter Frame acceptance rules
 * @param skip Frames to skip above the caller of resolve_caller()
 * @return Last dotted component of the frame's function, short file path and
 *         line; std::nullopt when no frame qualifies
 */
[[gnu::noinline]] inline std::optional<source_descriptor>
resolve_caller(const caller_resolver &resolver, const frame_filter &filter, int skip = TRACE_CALLER_SKIP)
{
    for (const auto &frame : resolver.walk(skip, MAX_CALLER_DEPTH))
    {
        if (!filter.accept(frame)) continue;

        std::string dotted = dotted_function_name(frame.function);
        auto dot           = dotted.rfind('.');
        std::string name   = dot == std::string::npos ? dotted : dotted.substr(dot + 1);
        return source_descriptor{std::move(name), short_file_path(frame.file), frame.line};
    }
    return std::nullopt;
}

} // namespace devlog
