/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * devlog is header-only; fmt is pulled in the same way so that consumers
 * do not need to link a compiled fmt.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>
