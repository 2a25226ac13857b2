/**
 * @file log_sink.hpp
 * @brief Sink interface and the formatter + writer sink implementation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <concepts>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "log_types.hpp"
#include "log_error.hpp"
#include "log_arg.hpp"
#include "log_record.hpp"

namespace tierlog
{

/**
 * @brief Destination of log records
 *
 * This interface defines the contract the dispatch core relies on: log()
 * is mandatory, print() and close() are optional capabilities whose
 * default implementations report "unsupported" and "nothing to release".
 * The core never looks past these three operations.
 */
class log_sink
{
  public:
    explicit log_sink(std::string name) : name_(std::move(name)) {}
    virtual ~log_sink() = default;

    log_sink(const log_sink &)            = delete;
    log_sink &operator=(const log_sink &) = delete;

    /**
     * @brief Deliver one record
     * @param level Level the record is emitted at
     * @param calldepth Stack depth hint for source attribution
     * @param rec Record to deliver; sinks may materialize its caches
     * @return Empty on success
     */
    virtual log_error log(log_level level, int calldepth, record &rec) = 0;

    /**
     * @brief Write the space separated arguments as a raw line
     */
    virtual log_error print(const arg_list &) { return log_error::unsupported(name_, "print"); }

    /**
     * @brief Release the resource the sink owns (file handle, connection)
     */
    virtual log_error close() { return {}; }

    const std::string &name() const noexcept { return name_; }

  private:
    std::string name_;
};

/**
 * @brief Requirements for the output side of a writer_sink
 */
template <typename W>
concept log_writer = requires(W &w, std::string_view line) {
    { w.write_line(line) } -> std::same_as<log_error>;
    { w.close() } -> std::same_as<log_error>;
};

/**
 * @brief Sink that renders records with a formatter and hands lines to a writer
 *
 * Writes are serialized under a mutex so concurrent callers never interleave
 * partial lines and each caller's records land in the order it logged them.
 *
 * @code
 * auto sink = std::make_shared<writer_sink<fd_writer>>(
 *     "stderr", std::make_shared<text_formatter>(), fd_writer{STDERR_FILENO});
 * @endcode
 */
template <log_writer Writer> class writer_sink final : public log_sink
{
  public:
    writer_sink(std::string name, std::shared_ptr<const log_formatter> formatter, Writer writer)
    : log_sink(std::move(name)),
      formatter_(std::move(formatter)),
      writer_(std::move(writer))
    {
    }

    log_error log(log_level, int calldepth, record &rec) override
    {
        const auto &line = rec.formatted(calldepth + 1, *formatter_);
        std::lock_guard<std::mutex> lock(mutex_);
        return writer_.write_line(line);
    }

    log_error print(const arg_list &args) override
    {
        auto text = join_args(args);
        std::lock_guard<std::mutex> lock(mutex_);
        return writer_.write_line(text);
    }

    log_error close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return writer_.close();
    }

    const log_formatter &formatter() const noexcept { return *formatter_; }

  private:
    std::shared_ptr<const log_formatter> formatter_;
    std::mutex mutex_;
    Writer writer_;
};

} // namespace tierlog
