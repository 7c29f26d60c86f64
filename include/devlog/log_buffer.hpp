/**
 * @file log_buffer.hpp
 * @brief Pooled, growable line buffers used to assemble one rendered record
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <charconv>
#include <atomic>
#include <memory>
#include <utility>
#include <type_traits>

#include "moodycamel/concurrentqueue.h"

#include "log_types.hpp"

namespace devlog
{

/**
 * @brief Growable byte sequence holding one rendered line
 *
 * Backed by an fmt::memory_buffer so that small lines never touch the heap.
 * All append operations succeed; the buffer grows as needed. reset() drops
 * the content but keeps the backing capacity for the next user.
 */
class line_buffer
{
  public:
    using storage_type = fmt::basic_memory_buffer<char, 512>;

    line_buffer() = default;

    line_buffer(const line_buffer &)            = delete;
    line_buffer &operator=(const line_buffer &) = delete;

    size_t size() const noexcept { return data_.size(); }
    size_t capacity() const noexcept { return data_.capacity(); }
    bool empty() const noexcept { return data_.size() == 0; }

    const char *data() const noexcept { return data_.data(); }
    std::string_view view() const noexcept { return std::string_view(data_.data(), data_.size()); }
    std::string str() const { return std::string(data_.data(), data_.size()); }

    char &back() { return data_[data_.size() - 1]; }

    void reset() noexcept { data_.clear(); }

    line_buffer &append(std::string_view str)
    {
        data_.append(str.data(), str.data() + str.size());
        return *this;
    }

    line_buffer &append(const char *str)
    {
        if (str) append(std::string_view(str));
        return *this;
    }

    line_buffer &push_back(char c)
    {
        data_.push_back(c);
        return *this;
    }

    template <typename IntType>
        requires std::is_integral_v<IntType> && (!std::is_same_v<IntType, bool>)
    line_buffer &append_int(IntType value)
    {
        char temp[24];
        auto [ptr, ec] = std::to_chars(temp, temp + sizeof(temp), value);
        (void)ec; // 24 bytes always hold a 64-bit integer
        return append(std::string_view(temp, static_cast<size_t>(ptr - temp)));
    }

    line_buffer &append_bool(bool value) { return append(value ? "true" : "false"); }

    // Format directly into the buffer
    template <typename... Args> line_buffer &format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        fmt::format_to(fmt::appender(data_), fmt, std::forward<Args>(args)...);
        return *this;
    }

  private:
    storage_type data_;
};

/**
 * @brief Global pool of reusable line buffers
 *
 * Buffers are handed out through pooled_buffer, which returns them on
 * destruction. The pool never fails: when it runs dry a fresh buffer is
 * allocated, and buffers that grew past MAX_POOLED_CAPACITY are freed
 * instead of being kept, so one huge record cannot pin memory forever.
 */
class buffer_pool
{
  public:
#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
    /**
     * @brief Buffer pool statistics for monitoring and diagnostics
     */
    struct stats
    {
        uint64_t total_acquires;  ///< Total acquire operations
        uint64_t total_releases;  ///< Total release operations
        uint64_t allocations;     ///< Buffers allocated because the pool was empty
        uint64_t discarded;       ///< Oversized or surplus buffers freed on release
        size_t in_use_buffers;    ///< Buffers currently handed out
        uint64_t high_water_mark; ///< Maximum buffers ever in use
    };
#endif

  private:
    moodycamel::ConcurrentQueue<line_buffer *> available_buffers_;
    std::atomic<size_t> pooled_count_{0};

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
    std::atomic<uint64_t> total_acquires_{0};
    std::atomic<uint64_t> total_releases_{0};
    std::atomic<uint64_t> allocations_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<size_t> in_use_{0};
    std::atomic<uint64_t> high_water_mark_{0};
#endif

    buffer_pool() : available_buffers_(BUFFER_POOL_SIZE) {}

  public:
    buffer_pool(const buffer_pool &)            = delete;
    buffer_pool &operator=(const buffer_pool &) = delete;

    ~buffer_pool()
    {
        line_buffer *buffer = nullptr;
        while (available_buffers_.try_dequeue(buffer)) { delete buffer; }
    }

    static buffer_pool &instance()
    {
        static buffer_pool instance;
        return instance;
    }

    /**
     * @brief Take a buffer out of the pool, allocating one if none is free
     * @return An empty buffer; never nullptr
     */
    line_buffer *acquire()
    {
        line_buffer *buffer = nullptr;
        if (available_buffers_.try_dequeue(buffer)) { pooled_count_.fetch_sub(1, std::memory_order_relaxed); }
        else
        {
            buffer = new line_buffer();
#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
            allocations_.fetch_add(1, std::memory_order_relaxed);
#endif
        }

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
        total_acquires_.fetch_add(1, std::memory_order_relaxed);
        auto in_use = in_use_.fetch_add(1, std::memory_order_relaxed) + 1;

        uint64_t current_hwm = high_water_mark_.load(std::memory_order_relaxed);
        while (in_use > current_hwm)
        {
            if (high_water_mark_.compare_exchange_weak(current_hwm, in_use, std::memory_order_relaxed, std::memory_order_relaxed))
            {
                break;
            }
        }
#endif
        return buffer;
    }

    /**
     * @brief Return a buffer; its content is cleared, its capacity kept
     */
    void release(line_buffer *buffer)
    {
        if (!buffer) return;

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
        total_releases_.fetch_add(1, std::memory_order_relaxed);
        in_use_.fetch_sub(1, std::memory_order_relaxed);
#endif

        if (buffer->capacity() > MAX_POOLED_CAPACITY ||
            pooled_count_.load(std::memory_order_relaxed) >= BUFFER_POOL_SIZE)
        {
#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
            discarded_.fetch_add(1, std::memory_order_relaxed);
#endif
            delete buffer;
            return;
        }

        buffer->reset();
        pooled_count_.fetch_add(1, std::memory_order_relaxed);
        available_buffers_.enqueue(buffer);
    }

    /**
     * @brief Number of idle buffers currently held by the pool
     */
    size_t pooled() const { return pooled_count_.load(std::memory_order_relaxed); }

#ifdef DEVLOG_COLLECT_BUFFER_POOL_METRICS
    stats get_stats() const
    {
        stats s;
        s.total_acquires  = total_acquires_.load(std::memory_order_relaxed);
        s.total_releases  = total_releases_.load(std::memory_order_relaxed);
        s.allocations     = allocations_.load(std::memory_order_relaxed);
        s.discarded       = discarded_.load(std::memory_order_relaxed);
        s.in_use_buffers  = in_use_.load(std::memory_order_relaxed);
        s.high_water_mark = high_water_mark_.load(std::memory_order_relaxed);
        return s;
    }

    /**
     * @brief Reset statistics counters (useful for testing)
     */
    void reset_stats()
    {
        total_acquires_.store(0, std::memory_order_relaxed);
        total_releases_.store(0, std::memory_order_relaxed);
        allocations_.store(0, std::memory_order_relaxed);
        discarded_.store(0, std::memory_order_relaxed);
        high_water_mark_.store(in_use_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }
#endif
};

/**
 * @brief Scoped handle on a pooled line_buffer
 *
 * Acquire one at the top of a render call; the buffer goes back to the pool
 * exactly once when the handle is destroyed, whichever way the call exits.
 * The handle is move-only, so a buffer cannot be released twice.
 *
 * @code
 * pooled_buffer buf;
 * buf->append("text");
 * sink.write(buf->data(), buf->size());
 * @endcode
 */
class pooled_buffer
{
    line_buffer *buffer_;

  public:
    pooled_buffer() : buffer_(buffer_pool::instance().acquire()) {}

    pooled_buffer(pooled_buffer &&other) noexcept : buffer_(std::exchange(other.buffer_, nullptr)) {}

    pooled_buffer &operator=(pooled_buffer &&other) noexcept
    {
        if (this != &other)
        {
            buffer_pool::instance().release(buffer_);
            buffer_ = std::exchange(other.buffer_, nullptr);
        }
        return *this;
    }

    pooled_buffer(const pooled_buffer &)            = delete;
    pooled_buffer &operator=(const pooled_buffer &) = delete;

    ~pooled_buffer() { buffer_pool::instance().release(buffer_); }

    line_buffer *operator->() const noexcept { return buffer_; }
    line_buffer &operator*() const noexcept { return *buffer_; }
    line_buffer *get() const noexcept { return buffer_; }
};

} // namespace devlog
