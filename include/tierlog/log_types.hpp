/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <array>
#include <atomic>
#include <string>
#include <chrono>
#include <concepts>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace tierlog
{

// Async delivery constants
inline constexpr size_t DEFAULT_ASYNC_WORKERS = 4;                               // Worker threads of the async task pool
inline constexpr auto TASK_POOL_POLL_INTERVAL = std::chrono::milliseconds(100); // Worker wake-up interval while idle

// Sink constants
inline constexpr unsigned DEFAULT_FILE_PERM   = 0666;                      // Permission bits for newly created log files
inline constexpr auto DEFAULT_HTTP_TIMEOUT    = std::chrono::seconds(2);   // Per-request timeout of the HTTP sink
inline constexpr size_t HTTP_RESPONSE_MAX     = 4096;                      // Bytes of the HTTP response we bother reading

/**
 * @brief Concept for types that can be logged
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Enumeration of available log levels in ascending order of severity
 *
 * A record passes a threshold when its level is at least as severe as the
 * threshold, i.e. `level >= threshold`.
 */
enum class log_level : int8_t
{
    debug    = 0, ///< Debugging information
    info     = 1, ///< General information
    notice   = 2, ///< Normal but significant events
    warning  = 3, ///< Warning messages
    error    = 4, ///< Error messages
    critical = 5, ///< Critical errors, also used by fatal() and panic()
};

inline constexpr size_t LOG_LEVEL_COUNT = 6;

// Level names for formatting
inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_names = {
    "DEBUG", "INFO", "NOTICE", "WARNING", "ERROR", "CRITICAL",
};

// Four letter names used by the text formatter
inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_short_names = {
    "DEBU", "INFO", "NOTI", "WARN", "ERRO", "CRIT",
};

inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_colors = {
    "\033[36m", // debug
    "\033[37m", // info
    "\033[32m", // notice
    "\033[33m", // warning
    "\033[31m", // error
    "\033[35m", // critical
};

inline constexpr const char *LOG_COLOR_RESET = "\033[0m";

inline constexpr bool is_valid_level(log_level level) noexcept
{
    return level >= log_level::debug && level <= log_level::critical;
}

/**
 * @brief Convert log_level to its upper case name
 * @param level The log level
 * @return "DEBUG" ... "CRITICAL", or "UNKNOWN" for out of range values
 */
inline const char *string_from_log_level(log_level level)
{
    if (!is_valid_level(level)) return "UNKNOWN";
    return log_level_names[static_cast<size_t>(level)];
}

/**
 * @brief Replaceable wall clock used to stamp records
 *
 * The source is a plain function pointer so it can be swapped atomically
 * while other threads are creating records. Tests install a function that
 * returns a frozen time point and call reset() afterwards.
 */
class log_clock
{
  public:
    using time_point = std::chrono::system_clock::time_point;
    using source_fn  = time_point (*)();

    static time_point now() { return source().load(std::memory_order_acquire)(); }

    static void set(source_fn fn) { source().store(fn ? fn : &system_now, std::memory_order_release); }

    static void reset() { set(&system_now); }

  private:
    static time_point system_now() { return std::chrono::system_clock::now(); }

    static std::atomic<source_fn> &source()
    {
        static std::atomic<source_fn> fn{&system_now};
        return fn;
    }
};

} // namespace tierlog

template <> struct fmt::formatter<tierlog::log_level> : fmt::formatter<fmt::string_view>
{
    auto format(tierlog::log_level level, fmt::format_context &ctx) const
    {
        return fmt::formatter<fmt::string_view>::format(tierlog::string_from_log_level(level), ctx);
    }
};
