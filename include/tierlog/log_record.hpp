/**
 * @file log_record.hpp
 * @brief Log record with lazily rendered, cached message and formatted line
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A record is created once per logging call. Its message and its formatted
 * line are computed on first use and cached in the record instance, so the
 * caching members are written by whoever asks first.
 *
 * Thread Safety:
 * - A record must not be materialized from two threads at once
 * - Every delivery path that may run concurrently with another one gets its
 *   own snapshot(); snapshots share the argument payloads but have their
 *   own caches
 * - Copying a record is only possible through snapshot()
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_arg.hpp"

namespace tierlog
{

class record;

/**
 * @brief Renders a full log line for a record
 *
 * Implementations write into the memory buffer they are given; the record
 * caches the result. The calldepth is a hint for source attribution and is
 * free to be ignored.
 */
class log_formatter
{
  public:
    virtual ~log_formatter() = default;

    virtual void format(int calldepth, record &rec, fmt::memory_buffer &out) const = 0;
};

/**
 * @brief Fully evaluated, immutable view of a record
 */
struct record_data
{
    uint64_t id;
    std::chrono::system_clock::time_point time;
    std::string module;
    log_level level;
    std::string message;
};

/**
 * @brief Process-wide record sequence number
 *
 * Every record created anywhere in the process draws its id from this
 * counter, so ids are unique and strictly increasing in creation order.
 */
class record_sequence
{
  public:
    static uint64_t next() noexcept { return counter().fetch_add(1, std::memory_order_relaxed) + 1; }

    /// Last id handed out
    static uint64_t current() noexcept { return counter().load(std::memory_order_relaxed); }

    /// Restart numbering at 1 (tests and full state reset only)
    static void reset() noexcept { counter().store(0, std::memory_order_relaxed); }

  private:
    static std::atomic<uint64_t> &counter()
    {
        static std::atomic<uint64_t> sequence{0};
        return sequence;
    }
};

class record
{
  public:
    record(std::string module, log_level level, std::optional<std::string> format, arg_list args)
    : id_(record_sequence::next()),
      time_(log_clock::now()),
      module_(std::move(module)),
      level_(level),
      format_(std::move(format)),
      args_(std::move(args))
    {
    }

    record(record &&) noexcept            = default;
    record &operator=(record &&) noexcept = default;
    record &operator=(const record &)     = delete;

    uint64_t id() const noexcept { return id_; }
    std::chrono::system_clock::time_point time() const noexcept { return time_; }
    const std::string &module() const noexcept { return module_; }
    log_level level() const noexcept { return level_; }
    const std::optional<std::string> &format() const noexcept { return format_; }
    const arg_list &args() const noexcept { return args_; }

    const char *file() const noexcept { return file_; }
    uint32_t line() const noexcept { return line_; }

    /**
     * @brief Attach the source location of the logging call
     * @param file Source file name (must have static storage duration)
     * @param line Source line
     */
    void set_source(const char *file, uint32_t line) noexcept
    {
        file_ = file ? file : "";
        line_ = line;
    }

    /**
     * @brief Message text, redacting and rendering the arguments on first call
     */
    const std::string &message()
    {
        if (!message_)
        {
            redact_args(args_);
            message_ = render_message(format_, args_);
        }
        return *message_;
    }

    /**
     * @brief Full log line as rendered by @p formatter, cached on first call
     */
    const std::string &formatted(int calldepth, const log_formatter &formatter)
    {
        if (!formatted_)
        {
            fmt::memory_buffer buf;
            formatter.format(calldepth + 1, *this, buf);
            formatted_ = fmt::to_string(buf);
        }
        return *formatted_;
    }

    record_data data()
    {
        const auto &msg = message();
        return record_data{id_, time_, module_, level_, msg};
    }

    bool has_message() const noexcept { return message_.has_value(); }
    bool has_formatted() const noexcept { return formatted_.has_value(); }

    /**
     * @brief Shallow copy for an independent delivery path
     *
     * Argument payloads are shared, whatever is already cached is carried
     * over, and from then on each copy caches on its own.
     */
    record snapshot() const { return record(*this); }

  private:
    record(const record &) = default;

    uint64_t id_;
    std::chrono::system_clock::time_point time_;
    std::string module_;
    log_level level_;
    std::optional<std::string> format_;
    arg_list args_;

    const char *file_ = "";
    uint32_t line_    = 0;

    std::optional<std::string> message_;
    std::optional<std::string> formatted_;
};

/**
 * @brief Create a record whose message is the space separated arguments
 */
template <typename... Args> record make_record(std::string module, log_level level, Args &&...args)
{
    return record(std::move(module), level, std::nullopt, make_args(std::forward<Args>(args)...));
}

/**
 * @brief Create a record whose message is rendered from an fmt format string
 */
template <typename... Args>
record make_recordf(std::string module, log_level level, std::string format, Args &&...args)
{
    return record(std::move(module), level, std::move(format), make_args(std::forward<Args>(args)...));
}

} // namespace tierlog
