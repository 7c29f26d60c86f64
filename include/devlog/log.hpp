/**
 * @file log.hpp
 * @brief Structured logging with a colorized development renderer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * devlog provides:
 * - dev_handler: one colorized, human-readable line per record, with the
 *   caller's file, line and function, request context values and a
 *   trailing block for traced SQL statements
 * - json_handler: one JSON object per record
 * - handler_middleware: copies request context values onto records for
 *   handlers that only see the record
 * - sql_tracer: logs executed statements with duration, row count and the
 *   application frame that issued them
 *
 * Basic Usage:
 * @code
 * #include "devlog/log.hpp"
 *
 * devlog::options opts;
 * opts.source = true;
 * auto log = devlog::init_dev_logger(opts);
 *
 * log.info({}, "server started", {devlog::int64("port", 8080)});
 * // Output: 13:04:05 INFO src/main.cpp:12 main server started port=8080
 *
 * auto db = log.with_group("db").with({devlog::string("name", "users")});
 * DEVLOG(db, ctx, warn, "slow pool", devlog::duration("wait", 250ms));
 * // Output: 13:04:06 WARN src/main.cpp:15 main slow pool db.wait=250ms db.name=users
 * @endcode
 *
 * Define DEVLOG_COLLECT_BUFFER_POOL_METRICS before including this header
 * to collect buffer pool statistics.
 */
#pragma once

#include "fmt_config.hpp"       // IWYU pragma: keep
#include "log_types.hpp"        // IWYU pragma: keep
#include "log_buffer.hpp"       // IWYU pragma: keep
#include "log_source.hpp"       // IWYU pragma: keep
#include "log_value.hpp"        // IWYU pragma: keep
#include "log_encoder.hpp"      // IWYU pragma: keep
#include "log_record.hpp"       // IWYU pragma: keep
#include "log_context.hpp"      // IWYU pragma: keep
#include "log_handler.hpp"      // IWYU pragma: keep
#include "log_options.hpp"      // IWYU pragma: keep
#include "log_writers.hpp"      // IWYU pragma: keep
#include "log_dev_handler.hpp"  // IWYU pragma: keep
#include "log_json_handler.hpp" // IWYU pragma: keep
#include "log_middleware.hpp"   // IWYU pragma: keep
#include "log_logger.hpp"       // IWYU pragma: keep
#include "log_sql_trace.hpp"    // IWYU pragma: keep
