/**
 * @file log_version.hpp
 * @brief Version information for tierlog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace tierlog
{

#ifndef TIERLOG_VERSION_STRING
    #define TIERLOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = TIERLOG_VERSION_STRING;

} // namespace tierlog
