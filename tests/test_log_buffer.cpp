/**
 * @file test_log_buffer.cpp
 * @brief Tests for line_buffer and the pooled buffer handles
 */

#include <catch2/catch_test_macros.hpp>
#include "devlog/log_buffer.hpp"
#include <atomic>
#include <thread>
#include <vector>
#include <string>

using namespace devlog;

TEST_CASE("line_buffer appends", "[log_buffer]")
{
    line_buffer buf;
    REQUIRE(buf.empty());

    SECTION("strings, characters and numbers")
    {
        buf.append("key").push_back('=');
        buf.append_int(-42).push_back(' ');
        buf.append_int(uint64_t{18446744073709551615ull}).push_back(' ');
        buf.append_bool(true);
        REQUIRE(buf.view() == "key=-42 18446744073709551615 true");
    }

    SECTION("null C string appends nothing")
    {
        const char *nothing = nullptr;
        buf.append(nothing);
        REQUIRE(buf.empty());
    }

    SECTION("format writes in place")
    {
        buf.format("[{:.4f}] ", 0.25);
        REQUIRE(buf.str() == "[0.2500] ");
    }

    SECTION("back can be overwritten")
    {
        buf.append("abc ");
        buf.back() = '\n';
        REQUIRE(buf.view() == "abc\n");
    }

    SECTION("grows past the inline storage")
    {
        std::string big(10000, 'x');
        buf.append(big);
        REQUIRE(buf.size() == big.size());
        REQUIRE(buf.view() == big);
    }
}

TEST_CASE("reset keeps capacity", "[log_buffer]")
{
    line_buffer buf;
    buf.append(std::string(4000, 'y'));
    auto capacity = buf.capacity();

    buf.reset();
    REQUIRE(buf.empty());
    REQUIRE(buf.capacity() == capacity);
}

TEST_CASE("pooled_buffer returns its buffer", "[log_buffer]")
{
    auto &pool = buffer_pool::instance();

    SECTION("released buffers come back empty")
    {
        {
            pooled_buffer buf;
            buf->append("leftover");
        }

        // the idle buffer is handed out again, cleared
        pooled_buffer again;
        REQUIRE(again->empty());
    }

    SECTION("move transfers ownership")
    {
        size_t idle_before = pool.pooled();
        {
            pooled_buffer a;
            line_buffer *raw = a.get();
            pooled_buffer b(std::move(a));
            REQUIRE(a.get() == nullptr);
            REQUIRE(b.get() == raw);
        }
        // exactly one buffer went back
        REQUIRE(pool.pooled() <= idle_before + 1);
    }

    SECTION("oversized buffers are not kept")
    {
        {
            pooled_buffer warm;
        }
        size_t idle_before = pool.pooled();
        {
            pooled_buffer big;
            big->append(std::string(MAX_POOLED_CAPACITY * 2, 'z'));
        }
        REQUIRE(pool.pooled() <= idle_before);
    }
}

TEST_CASE("buffer pool under concurrent use", "[log_buffer]")
{
    constexpr int threads    = 8;
    constexpr int iterations = 2000;

    std::vector<std::thread> workers;
    std::atomic<int> dirty{0};

    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < iterations; ++i)
            {
                pooled_buffer buf;
                if (!buf->empty()) dirty.fetch_add(1);
                buf->append("thread ").append_int(t);
            }
        });
    }
    for (auto &w : workers) w.join();

    REQUIRE(dirty.load() == 0);
    REQUIRE(buffer_pool::instance().pooled() <= BUFFER_POOL_SIZE);
}

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
TEST_CASE("buffer pool statistics", "[log_buffer]")
{
    auto &pool = buffer_pool::instance();
    pool.reset_stats();

    {
        pooled_buffer a;
        pooled_buffer b;
    }

    auto stats = pool.get_stats();
    REQUIRE(stats.total_acquires == 2);
    REQUIRE(stats.total_releases == 2);
    REQUIRE(stats.in_use_buffers == 0);
    REQUIRE(stats.high_water_mark >= 2);
}
#endif
