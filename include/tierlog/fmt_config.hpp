/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * tierlog is header-only, so fmt is pulled in the same way: no separate fmt
 * compilation is required. The dynamic argument store is needed to render
 * records whose argument count is only known at runtime.
 */
#pragma once

// Enable fmt header-only mode
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/args.h>
