/**
 * @file test_logger.cpp
 * @brief Tests for the logger front end, the default logger and the macros
 */

#include <catch2/catch_test_macros.hpp>
#include "devlog/log.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace devlog;

namespace
{

class capturing_handler : public handler
{
  public:
    std::vector<log_record> records;
    std::vector<attr> bound;
    log_level floor = log_level::debug;

    bool enabled(log_level level) const override { return level >= floor; }

    std::error_code handle(const log_context &, const log_record &record) override
    {
        records.push_back(record);
        return {};
    }

    std::shared_ptr<handler> with_attrs(std::vector<attr> attrs) override
    {
        bound.insert(bound.end(), attrs.begin(), attrs.end());
        return shared_from_this();
    }

    std::shared_ptr<handler> with_group(std::string_view) override { return shared_from_this(); }
};

void report_status(const logger &log)
{
    DEVLOG_INFO(log, log_context{}, "status", int64("code", 200));
}

} // namespace

TEST_CASE("Default logger", "[logger]")
{
    SECTION("Discards until one is installed")
    {
        set_default_logger(logger());
        auto log = default_logger();
        REQUIRE(std::dynamic_pointer_cast<discard_handler>(log.get_handler()));
        REQUIRE_FALSE(log.enabled(log_level::error));
        REQUIRE_FALSE(log.info(log_context{}, "dropped"));
    }

    SECTION("Installed logger is returned")
    {
        auto sink = std::make_shared<capturing_handler>();
        set_default_logger(logger(sink));
        REQUIRE(default_logger().get_handler() == sink);
        set_default_logger(logger());
    }

    SECTION("Null handlers discard")
    {
        logger log(nullptr);
        REQUIRE(log.get_handler());
        REQUIRE_FALSE(log.enabled(log_level::info));
    }
}

TEST_CASE("Logger methods build records", "[logger]")
{
    auto sink = std::make_shared<capturing_handler>();
    logger log(sink);

    REQUIRE_FALSE(log.debug(log_context{}, "d"));
    REQUIRE_FALSE(log.info(log_context{}, "i", {int64("n", 1)}));
    REQUIRE_FALSE(log.warn(log_context{}, "w"));
    REQUIRE_FALSE(log.error(log_context{}, "e"));
    REQUIRE_FALSE(log.log(log_context{}, log_level::info, "l"));

    REQUIRE(sink->records.size() == 5);
    REQUIRE(sink->records[0].level == log_level::debug);
    REQUIRE(sink->records[1].attrs.size() == 1);
    REQUIRE(sink->records[2].level == log_level::warn);
    REQUIRE(sink->records[3].level == log_level::error);
    REQUIRE(sink->records[4].message == "l");

    for (const auto &r : sink->records)
    {
        REQUIRE(r.has_time());
        REQUIRE(r.site.file.find("test_logger") != std::string_view::npos);
    }
}

TEST_CASE("Disabled levels never reach the handler", "[logger]")
{
    auto sink   = std::make_shared<capturing_handler>();
    sink->floor = log_level::warn;
    logger log(sink);

    REQUIRE_FALSE(log.info(log_context{}, "skipped"));
    REQUIRE_FALSE(log.warn(log_context{}, "kept"));
    REQUIRE(sink->records.size() == 1);
    REQUIRE(sink->records[0].message == "kept");
}

TEST_CASE("Logger derivation", "[logger]")
{
    auto sink = std::make_shared<capturing_handler>();
    logger log(sink);

    auto derived = log.with({string("component", "db")});
    REQUIRE(sink->bound.size() == 1);
    REQUIRE(derived.get_handler() == sink);
    REQUIRE(log.with_group("g").get_handler() == sink);
}

TEST_CASE("Macros record the calling function", "[logger]")
{
    auto sink = std::make_shared<capturing_handler>();
    logger log(sink);

    report_status(log);
    DEVLOG(log, log_context{}, warn, "plain");

    REQUIRE(sink->records.size() == 2);

    const auto &first = sink->records[0];
    REQUIRE(first.level == log_level::info);
    REQUIRE(first.message == "status");
    REQUIRE(first.attrs.size() == 1);
    REQUIRE(make_source(first.site).function == "report_status");
    REQUIRE(make_source(first.site).file == "tests/test_logger.cpp");

    REQUIRE(sink->records[1].level == log_level::warn);
    REQUIRE(sink->records[1].attrs.empty());
}

TEST_CASE("Bootstrap helpers install the default logger", "[logger]")
{
    std::ostringstream stream;
    options opts;
    opts.output = std::make_shared<ostream_writer>(stream);
    opts.color  = color_mode::never;

    SECTION("Dev logger")
    {
        auto log = init_dev_logger(opts);
        REQUIRE(std::dynamic_pointer_cast<dev_handler>(log.get_handler()));
        REQUIRE(default_logger().get_handler() == log.get_handler());

        REQUIRE_FALSE(default_logger().info(log_context{}, "hello"));
        REQUIRE(stream.str().ends_with(" INFO hello\n"));
    }

    SECTION("JSON logger")
    {
        opts.add_ctx_attr = {"request_id"};
        auto log          = init_logger(opts);
        auto mw           = std::dynamic_pointer_cast<handler_middleware>(log.get_handler());
        REQUIRE(mw);
        REQUIRE(std::dynamic_pointer_cast<json_handler>(mw->next()));

        REQUIRE_FALSE(log.info(log_context{}.with_value("request_id", "7f3a"), "hello"));
        REQUIRE(stream.str().find("\"msg\":\"hello\",\"request_id\":\"7f3a\"}\n") != std::string::npos);
    }

    set_default_logger(logger());
}
