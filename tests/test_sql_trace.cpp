/**
 * @file test_sql_trace.cpp
 * @brief Tests for the SQL statement tracer
 */

#include <catch2/catch_test_macros.hpp>
#include "devlog/log_sql_trace.hpp"
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using namespace devlog;
using namespace std::chrono_literals;

namespace
{

class capturing_handler : public handler
{
  public:
    struct entry
    {
        log_context ctx;
        log_record record;
    };

    std::vector<entry> entries;

    bool enabled(log_level) const override { return true; }

    std::error_code handle(const log_context &ctx, const log_record &record) override
    {
        entries.push_back({ctx, record});
        return {};
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr>) override { return shared_from_this(); }
    std::shared_ptr<handler> with_group(std::string_view) override { return shared_from_this(); }
};

class stub_resolver : public caller_resolver
{
  public:
    std::vector<stack_frame> frames;

    std::vector<stack_frame> walk(int, int) const override { return frames; }
};

std::vector<stack_frame> orm_stack()
{
    return {
        {"devlog::sql_tracer::trace(...) const", "/x/include/devlog/log_sql_trace.hpp", 0},
        {"orm::callbacks::query(orm::session&)", "/x/orm/callbacks.cpp", 0},
        {"orm::session::find(orm::query const&)", "/x/orm/session.cpp", 0},
        {"app::models::users_query()", "/srv/app/models.gen.cpp", 18},
        {"app::repo::find_user(int)", "/srv/app/repo.cpp", 42},
        {"main", "/srv/app/main.cpp", 7},
    };
}

frame_filter orm_filter()
{
    frame_filter filter;
    filter.library_prefixes.push_back("orm::");
    return filter;
}

struct fixture
{
    std::shared_ptr<capturing_handler> sink = std::make_shared<capturing_handler>();
    std::shared_ptr<stub_resolver> resolver = std::make_shared<stub_resolver>();
    int calls                               = 0;

    fixture() { resolver->frames = orm_stack(); }

    sql_tracer tracer(std::vector<attr> attrs = {}, bool show_params = true)
    {
        return sql_tracer(logger(sink), std::move(attrs), show_params, resolver, orm_filter());
    }

    sql_tracer::result_provider provider(std::string sql, int64_t rows)
    {
        return [this, sql, rows] {
            ++calls;
            return std::pair<std::string, int64_t>{sql, rows};
        };
    }
};

} // namespace

TEST_CASE("Tracing a successful statement", "[sql_trace]")
{
    fixture f;
    auto tracer = f.tracer({string("db", "main")});

    auto begin = std::chrono::steady_clock::now() - 20ms;
    REQUIRE_FALSE(tracer.trace(log_context{}, begin, f.provider("SELECT * FROM users WHERE id = ?", 1)));

    REQUIRE(f.calls == 1);
    REQUIRE(f.sink->entries.size() == 1);

    const auto &e = f.sink->entries[0];
    REQUIRE(e.record.level == log_level::info);
    REQUIRE(e.record.message.empty());
    REQUIRE(e.record.attrs.size() == 1);
    REQUIRE(e.record.attrs[0].key == "db");
    REQUIRE_FALSE(e.record.site.empty());

    REQUIRE(e.ctx.sql() == "SELECT * FROM users WHERE id = ?");
    REQUIRE(e.ctx.rows() == 1);
    REQUIRE(e.ctx.duration());
    REQUIRE(*e.ctx.duration() >= 20ms);
    REQUIRE(e.ctx.source());
    REQUIRE(*e.ctx.source() == source_descriptor{"find_user", "app/repo.cpp", 42});
}

TEST_CASE("Tracing keeps the caller's context", "[sql_trace]")
{
    fixture f;
    auto tracer = f.tracer();

    auto ctx = log_context{}.with_value("request_id", "7f3a");
    REQUIRE_FALSE(tracer.trace(ctx, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0)));

    const auto &traced = f.sink->entries.at(0).ctx;
    REQUIRE(traced.lookup("request_id"));
    REQUIRE(traced.lookup("request_id")->as_string() == "7f3a");
    REQUIRE_FALSE(ctx.sql());
}

TEST_CASE("Caller resolution while tracing", "[sql_trace]")
{
    fixture f;

    SECTION("Library frames in test files count as callers")
    {
        f.resolver->frames.insert(f.resolver->frames.begin() + 1,
                                  stack_frame{"devlog::checks::lookup_case()", "/x/tests/test_lookup.cpp", 9});
        auto tracer = f.tracer();
        REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0)));
        REQUIRE(*f.sink->entries.at(0).ctx.source() == source_descriptor{"lookup_case", "tests/test_lookup.cpp", 9});
    }

    SECTION("No acceptable frame leaves the source unset")
    {
        f.resolver->frames.resize(3);
        auto tracer = f.tracer();
        REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0)));
        REQUIRE_FALSE(f.sink->entries.at(0).ctx.source());
    }
}

TEST_CASE("Tracing a failed statement", "[sql_trace]")
{
    fixture f;
    auto tracer = f.tracer({string("db", "main")});

    auto failure = std::make_error_code(std::errc::timed_out);
    REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("UPDATE t SET x = 1", 0), failure));

    REQUIRE(f.calls == 1);
    const auto &e = f.sink->entries.at(0);
    REQUIRE(e.record.level == log_level::error);
    REQUIRE(e.record.message == failure.message());
    REQUIRE(e.record.attrs.empty());
    REQUIRE(e.ctx.sql() == "UPDATE t SET x = 1");
}

TEST_CASE("Trace modes", "[sql_trace]")
{
    fixture f;
    auto failure = std::make_error_code(std::errc::io_error);

    SECTION("Silent logs nothing and never asks for the statement")
    {
        auto tracer = f.tracer().log_mode(trace_mode::silent);
        REQUIRE(tracer.mode() == trace_mode::silent);
        REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0), failure));
        REQUIRE_FALSE(tracer.info(log_context{}, "i"));
        REQUIRE_FALSE(tracer.error(log_context{}, "e"));
        REQUIRE(f.calls == 0);
        REQUIRE(f.sink->entries.empty());
    }

    SECTION("Error mode logs failures only")
    {
        auto tracer = f.tracer().log_mode(trace_mode::error);
        REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0)));
        REQUIRE(f.calls == 0);
        REQUIRE(f.sink->entries.empty());

        REQUIRE_FALSE(tracer.trace(log_context{}, std::chrono::steady_clock::now(), f.provider("SELECT 1", 0), failure));
        REQUIRE(f.calls == 1);
        REQUIRE(f.sink->entries.size() == 1);
    }

    SECTION("Message methods follow the mode")
    {
        auto tracer = f.tracer().log_mode(trace_mode::warn);
        REQUIRE_FALSE(tracer.info(log_context{}, "i"));
        REQUIRE_FALSE(tracer.warn(log_context{}, "w", {int64("n", 1)}));
        REQUIRE_FALSE(tracer.error(log_context{}, "e"));
        REQUIRE(f.sink->entries.size() == 2);
        REQUIRE(f.sink->entries[0].record.level == log_level::warn);
        REQUIRE(f.sink->entries[0].record.message == "w");
        REQUIRE(f.sink->entries[1].record.level == log_level::error);
    }

    SECTION("log_mode returns a copy")
    {
        auto base  = f.tracer();
        auto quiet = base.log_mode(trace_mode::silent);
        REQUIRE(base.mode() == trace_mode::info);
        REQUIRE(quiet.mode() == trace_mode::silent);
    }
}

TEST_CASE("Bound parameters", "[sql_trace]")
{
    fixture f;

    SECTION("Shown")
    {
        auto [sql, params] = f.tracer({}, true).params_filter("SELECT ?", {"42"});
        REQUIRE(sql == "SELECT ?");
        REQUIRE(params == std::vector<std::string>{"42"});
    }

    SECTION("Hidden")
    {
        auto tracer        = f.tracer({}, false);
        auto [sql, params] = tracer.params_filter("SELECT ?", {"42"});
        REQUIRE(sql == "SELECT ?");
        REQUIRE(params.empty());
        REQUIRE_FALSE(tracer.show_params());
    }
}

TEST_CASE("Traced statements through the dev handler", "[sql_trace][dev_handler]")
{
    std::ostringstream stream;
    options opts;
    opts.output = std::make_shared<ostream_writer>(stream);
    opts.color  = color_mode::never;
    opts.source = true;

    auto resolver    = std::make_shared<stub_resolver>();
    resolver->frames = orm_stack();
    sql_tracer tracer(logger(std::make_shared<dev_handler>(opts)), {}, true, resolver, orm_filter());

    auto begin = std::chrono::steady_clock::now();
    REQUIRE_FALSE(tracer.trace(log_context{}, begin, [] { return std::pair<std::string, int64_t>{"SELECT 1", 1}; }));

    auto out = stream.str();
    // "<time> INFO app/repo.cpp:42 find_user \n[0.0000] rows:1 SELECT 1 \n"
    REQUIRE(out.find(" INFO app/repo.cpp:42 find_user \n[") != std::string::npos);
    REQUIRE(out.ends_with("] rows:1 SELECT 1 \n"));
}

TEST_CASE("Tracer on the default logger", "[sql_trace]")
{
    auto sink = std::make_shared<capturing_handler>();
    set_default_logger(logger(sink));

    sql_tracer tracer(false, {string("db", "main")});
    REQUIRE_FALSE(tracer.show_params());
    REQUIRE(tracer.attrs().size() == 1);

    REQUIRE_FALSE(tracer.info(log_context{}, "hello"));
    REQUIRE(sink->entries.size() == 1);

    set_default_logger(logger());
}
