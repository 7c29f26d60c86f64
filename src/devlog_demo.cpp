#include <iostream>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include "devlog/log.hpp"

using namespace devlog;
using namespace std::chrono_literals;

struct point
{
    int x;
    int y;
};

template <> struct fmt::formatter<point> : formatter<string_view>
{
    auto format(point p, format_context &ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "({}, {})", p.x, p.y);
    }
};

namespace app
{

// Pretends to be a database call so the tracer has something to report
std::error_code find_user(const sql_tracer &tracer, const log_context &ctx, int id, bool fail)
{
    auto begin = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(fail ? 3ms : 1ms);

    std::error_code ec;
    if (fail) ec = std::make_error_code(std::errc::timed_out);

    return tracer.trace(
        ctx,
        begin,
        [&] { return std::pair<std::string, int64_t>{fmt::format("SELECT * FROM users WHERE id = {}", id), fail ? 0 : 1}; },
        ec);
}

} // namespace app

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -j                JSON output instead of the console renderer\n"
              << "  -c <mode>         Color: always, never, auto (default: auto)\n"
              << "  -l <level>        Minimum level: debug, info, warn, error (default: debug)\n"
              << "  -s                Show the caller of each record\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    bool json = false;
    options opts;
    opts.color          = color_mode::automatic;
    opts.add_ctx_attr   = {"request_id"};
    opts.slow_threshold = 2ms;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-j") == 0) { json = true; }
        else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc)
        {
            std::string mode = argv[++i];
            if (mode == "always") { opts.color = color_mode::always; }
            else if (mode == "never") { opts.color = color_mode::never; }
            else if (mode == "auto") { opts.color = color_mode::automatic; }
            else
            {
                std::cerr << "Unknown color mode: " << mode << "\n";
                return 1;
            }
        }
        else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc)
        {
            auto level = log_level_from_string(argv[++i]);
            if (!level)
            {
                std::cerr << "Unknown level: " << argv[i] << "\n";
                return 1;
            }
            opts.level = *level;
        }
        else if (strcmp(argv[i], "-s") == 0) { opts.source = true; }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    logger log;
    try
    {
        log = json ? init_logger(opts) : init_dev_logger(opts);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto ctx = log_context{}.with_value("request_id", "7f3a");

    log.info(ctx, "server started", {int64("port", 8080), duration("warmup", 1500ms)});
    log.debug(ctx, "config loaded", {string("path", "/etc/app/config.toml"), boolean("cached", true)});
    DEVLOG_WARN(log, ctx, "disk almost full", float64("used", 0.93), string("mount", "/var lib"));
    DEVLOG_ERROR(log, ctx, "upstream failed", err("error", std::make_error_code(std::errc::connection_refused)));

    auto db = log.with({string("component", "db")}).with_group("pool");
    db.info(ctx, "pool ready", {int64("size", 8), any("origin", point{3, 4})});

    frame_filter filter;
    sql_tracer tracer(log, {string("db", "users")}, true, nullptr, filter);
    if (auto ec = app::find_user(tracer, ctx, 42, false)) std::cerr << "write failed: " << ec.message() << "\n";
    if (auto ec = app::find_user(tracer, ctx, 7, true)) std::cerr << "write failed: " << ec.message() << "\n";

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
    auto stats = buffer_pool::instance().get_stats();
    std::cerr << "buffers: acquires=" << stats.total_acquires << " allocations=" << stats.allocations
              << " high_water=" << stats.high_water_mark << "\n";
#endif

    return 0;
}
