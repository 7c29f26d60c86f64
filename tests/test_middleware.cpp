/**
 * @file test_middleware.cpp
 * @brief Tests for context enrichment in handler_middleware
 */

#include <catch2/catch_test_macros.hpp>
#include "devlog/log_middleware.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace devlog;
using namespace std::chrono_literals;

namespace
{

// Remembers everything it is handed; derived handlers share the journal
class recording_handler : public handler
{
  public:
    struct journal
    {
        std::vector<log_record> records;
        std::vector<std::string> derivations;
    };

    std::shared_ptr<journal> log = std::make_shared<journal>();
    log_level floor              = log_level::debug;
    std::string name             = "root";

    bool enabled(log_level level) const override { return level >= floor; }

    std::error_code handle(const log_context &, const log_record &record) override
    {
        log->records.push_back(record);
        return {};
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) override
    {
        log->derivations.push_back("attrs:" + std::to_string(attrs.size()));
        return derive(name + "+attrs");
    }

    std::shared_ptr<handler> with_group(std::string_view group) override
    {
        log->derivations.push_back("group:" + std::string(group));
        return derive(name + "+" + std::string(group));
    }

  private:
    std::shared_ptr<handler> derive(std::string derived_name)
    {
        auto h   = std::make_shared<recording_handler>();
        h->log   = log;
        h->floor = floor;
        h->name  = std::move(derived_name);
        return h;
    }
};

const attr *find_attr(const log_record &r, std::string_view key)
{
    for (const auto &a : r.attrs)
    {
        if (a.key == key) return &a;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Middleware delegates enabled()", "[middleware]")
{
    auto next   = std::make_shared<recording_handler>();
    next->floor = log_level::warn;
    handler_middleware mw(next);

    REQUIRE_FALSE(mw.enabled(log_level::info));
    REQUIRE(mw.enabled(log_level::warn));
    REQUIRE(mw.enabled(log_level::error));
}

TEST_CASE("Middleware adds context values", "[middleware]")
{
    auto next = std::make_shared<recording_handler>();
    options opts;
    opts.add_ctx_attr = {"request_id", "missing", "user"};
    auto mw           = std::make_shared<handler_middleware>(next, opts);

    auto ctx = log_context{}.with_value("request_id", "7f3a").with_value("user", int64_t{42});
    log_record r({}, log_level::info, "m");
    r.add_attr(string("k", "v"));

    REQUIRE_FALSE(mw->handle(ctx, r));
    REQUIRE(next->log->records.size() == 1);

    const auto &got = next->log->records[0];
    REQUIRE(got.attrs.size() == 3);
    REQUIRE(got.attrs[0].key == "k");
    REQUIRE(got.attrs[1].key == "request_id");
    REQUIRE(got.attrs[1].val.as_string() == "7f3a");
    REQUIRE(got.attrs[2].key == "user");
    REQUIRE(got.attrs[2].val.as_int64() == 42);

    SECTION("The caller's record is left alone")
    {
        REQUIRE(r.attrs.size() == 1);
    }
}

TEST_CASE("Reserved context names only come from the typed setters", "[middleware]")
{
    auto ctx = log_context{}.with_value("sql", "DROP TABLE users").with_value("rows", int64_t{3}).with_value("user", "ann");
    REQUIRE_FALSE(ctx.lookup("sql"));
    REQUIRE_FALSE(ctx.lookup("rows"));
    REQUIRE(ctx.lookup("user"));

    auto traced = ctx.with_sql("SELECT 1").with_value("sql", "ignored");
    REQUIRE(traced.lookup("sql")->as_string() == "SELECT 1");
}

TEST_CASE("Middleware surfaces traced SQL", "[middleware]")
{
    auto next = std::make_shared<recording_handler>();
    handler_middleware mw(next, options{});

    auto ctx = log_context{}.with_sql("SELECT 1").with_duration(5ms).with_rows(1);
    REQUIRE_FALSE(mw.handle(ctx, log_record({}, log_level::info, "")));

    const auto &got = next->log->records.at(0);
    const auto *sql = find_attr(got, SQL_KEY);
    REQUIRE(sql);
    REQUIRE(sql->val.as_string() == "SELECT 1");
    REQUIRE(find_attr(got, ROWS_KEY) == nullptr);
}

TEST_CASE("Middleware resolves the source", "[middleware]")
{
    auto next = std::make_shared<recording_handler>();
    options opts;
    opts.source = true;
    handler_middleware mw(next, opts);

    call_site site{"/srv/app/main.cpp", 12, "void app::serve(int)"};

    SECTION("From the call site")
    {
        REQUIRE_FALSE(mw.handle(log_context{}, log_record({}, log_level::info, "m", site)));
        const auto *src = find_attr(next->log->records.at(0), SOURCE_KEY);
        REQUIRE(src);
        REQUIRE(src->val.source_if());
        REQUIRE(*src->val.source_if() == source_descriptor{"serve", "app/main.cpp", 12});
    }

    SECTION("Not when the context already has one")
    {
        auto ctx = log_context{}.with_source({"find_user", "app/repo.cpp", 42});
        REQUIRE_FALSE(mw.handle(ctx, log_record({}, log_level::info, "m", site)));
        REQUIRE(find_attr(next->log->records.at(0), SOURCE_KEY) == nullptr);
    }

    SECTION("Not without a call site")
    {
        REQUIRE_FALSE(mw.handle(log_context{}, log_record({}, log_level::info, "m")));
        REQUIRE(find_attr(next->log->records.at(0), SOURCE_KEY) == nullptr);
    }

    SECTION("Not when disabled")
    {
        handler_middleware plain(next, options{});
        REQUIRE_FALSE(plain.handle(log_context{}, log_record({}, log_level::info, "m", site)));
        REQUIRE(find_attr(next->log->records.at(0), SOURCE_KEY) == nullptr);
    }
}

TEST_CASE("Middleware derivation", "[middleware]")
{
    auto next = std::make_shared<recording_handler>();
    options opts;
    opts.add_ctx_attr = {"request_id"};
    opts.source       = true;
    std::shared_ptr<handler> mw = std::make_shared<handler_middleware>(next, opts);

    SECTION("Empty derivations return the same handler")
    {
        REQUIRE(mw->with_attrs({}) == mw);
        REQUIRE(mw->with_group("") == mw);
        REQUIRE(next->log->derivations.empty());
    }

    SECTION("Derivation is forwarded to the wrapped handler")
    {
        auto derived = std::dynamic_pointer_cast<handler_middleware>(mw->with_group("db")->with_attrs({int64("n", 1)}));
        REQUIRE(derived);
        REQUIRE(next->log->derivations == std::vector<std::string>{"group:db", "attrs:1"});

        auto inner = std::dynamic_pointer_cast<recording_handler>(derived->next());
        REQUIRE(inner);
        REQUIRE(inner->name == "root+db+attrs");
    }

    SECTION("Derived middleware does not inherit the enrichment settings")
    {
        auto derived = std::dynamic_pointer_cast<handler_middleware>(mw->with_attrs({int64("n", 1)}));
        REQUIRE(derived);
        REQUIRE(derived->add_ctx_attr().empty());
        REQUIRE_FALSE(derived->source());

        auto ctx = log_context{}.with_value("request_id", "7f3a");
        REQUIRE_FALSE(derived->handle(ctx, log_record({}, log_level::info, "m", call_site::current())));
        REQUIRE(next->log->records.at(0).attrs.empty());
    }
}
