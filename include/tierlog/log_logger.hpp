/**
 * @file log_logger.hpp
 * @brief Logger façade with per-level convenience methods
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every level has two forms: the plain one joins its arguments with a single
 * space, the `f` one renders an fmt format string.
 *
 * @code
 * auto api = std::make_shared<logger>("svc.api", backend);
 * api->info("request", id, "took", elapsed_ms, "ms");
 * api->warningf("retry {} of {}", attempt, max_attempts);
 *
 * prefix_logger conn(api, "conn#42");
 * conn.debug("closed");           // "conn#42 -> closed"
 *
 * TIERLOG_ERRORF(*api, "bind failed: {}", strerror(errno)); // with file:line
 * @endcode
 */
#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_error.hpp"
#include "log_arg.hpp"
#include "log_record.hpp"
#include "log_backend.hpp"

namespace tierlog
{

/**
 * @brief Source location of a logging call, filled in by the TIERLOG_* macros
 */
struct log_source
{
    const char *file = nullptr; ///< Must have static storage duration
    uint32_t line    = 0;
};

/**
 * @brief Interface shared by loggers and logger decorators
 *
 * Implementations provide write() and is_enabled_for(); decorate() lets a
 * wrapper rewrite the format and arguments before they reach its parent.
 */
class logger_base
{
  public:
    virtual ~logger_base() = default;

    /**
     * @brief Create and deliver one record
     * @param calldepth Stack depth hint, incremented by every layer
     * @param format fmt format string, or nullopt to join the arguments
     */
    virtual void write(log_level level, int calldepth, std::optional<std::string> format, arg_list args,
                       log_source source = {}) = 0;

    virtual bool is_enabled_for(log_level level) const = 0;

    virtual const std::string &module() const = 0;

    virtual void decorate(std::optional<std::string> &, arg_list &) const {}

    template <typename... Args> void critical(Args &&...args) { emit(log_level::critical, std::forward<Args>(args)...); }
    template <typename... Args> void error(Args &&...args) { emit(log_level::error, std::forward<Args>(args)...); }
    template <typename... Args> void warning(Args &&...args) { emit(log_level::warning, std::forward<Args>(args)...); }
    template <typename... Args> void notice(Args &&...args) { emit(log_level::notice, std::forward<Args>(args)...); }
    template <typename... Args> void info(Args &&...args) { emit(log_level::info, std::forward<Args>(args)...); }
    template <typename... Args> void debug(Args &&...args) { emit(log_level::debug, std::forward<Args>(args)...); }

    template <typename... Args> void criticalf(std::string format, Args &&...args)
    {
        emitf(log_level::critical, std::move(format), std::forward<Args>(args)...);
    }
    template <typename... Args> void errorf(std::string format, Args &&...args)
    {
        emitf(log_level::error, std::move(format), std::forward<Args>(args)...);
    }
    template <typename... Args> void warningf(std::string format, Args &&...args)
    {
        emitf(log_level::warning, std::move(format), std::forward<Args>(args)...);
    }
    template <typename... Args> void noticef(std::string format, Args &&...args)
    {
        emitf(log_level::notice, std::move(format), std::forward<Args>(args)...);
    }
    template <typename... Args> void infof(std::string format, Args &&...args)
    {
        emitf(log_level::info, std::move(format), std::forward<Args>(args)...);
    }
    template <typename... Args> void debugf(std::string format, Args &&...args)
    {
        emitf(log_level::debug, std::move(format), std::forward<Args>(args)...);
    }

    /**
     * @brief Log at CRITICAL, then terminate the process with exit code 1
     */
    template <typename... Args> [[noreturn]] void fatal(Args &&...args)
    {
        emit(log_level::critical, std::forward<Args>(args)...);
        std::exit(1);
    }

    template <typename... Args> [[noreturn]] void fatalf(std::string format, Args &&...args)
    {
        emitf(log_level::critical, std::move(format), std::forward<Args>(args)...);
        std::exit(1);
    }

    /**
     * @brief Log at CRITICAL, then throw log_panic carrying the message
     *
     * The exception is thrown whether or not CRITICAL is enabled. Its text
     * is rendered from redacted arguments.
     */
    template <typename... Args> [[noreturn]] void panic(Args &&...args)
    {
        raise(std::nullopt, make_args(std::forward<Args>(args)...));
    }

    template <typename... Args> [[noreturn]] void panicf(std::string format, Args &&...args)
    {
        raise(std::move(format), make_args(std::forward<Args>(args)...));
    }

    /**
     * @brief Log with a caller supplied source location (used by the macros)
     */
    template <typename... Args>
    void logf_at(log_source source, log_level level, std::string format, Args &&...args)
    {
        std::optional<std::string> fmt_str(std::move(format));
        auto list = make_args(std::forward<Args>(args)...);
        decorate(fmt_str, list);
        write(level, 1, std::move(fmt_str), std::move(list), source);
    }

  private:
    template <typename... Args> void emit(log_level level, Args &&...args)
    {
        std::optional<std::string> format;
        auto list = make_args(std::forward<Args>(args)...);
        decorate(format, list);
        write(level, 2, std::move(format), std::move(list));
    }

    template <typename... Args> void emitf(log_level level, std::string format, Args &&...args)
    {
        std::optional<std::string> fmt_str(std::move(format));
        auto list = make_args(std::forward<Args>(args)...);
        decorate(fmt_str, list);
        write(level, 2, std::move(fmt_str), std::move(list));
    }

    [[noreturn]] void raise(std::optional<std::string> format, arg_list args)
    {
        decorate(format, args);

        arg_list shown = args;
        redact_args(shown);
        auto message = render_message(format, shown);

        write(log_level::critical, 2, std::move(format), std::move(args));
        throw log_panic(message);
    }
};

/**
 * @brief Logger bound to one module and one leveled backend
 *
 * Records are only created when the backend is enabled for the level and
 * module. Delivery errors coming back from the backend are printed to
 * stderr; the caller is never interrupted by them.
 */
class logger final : public logger_base
{
  public:
    logger(std::string module, std::shared_ptr<leveled_backend> backend)
    : module_(std::move(module)),
      backend_(std::move(backend))
    {
        if (!backend_) throw std::invalid_argument("logger requires a backend");
    }

    void write(log_level level, int calldepth, std::optional<std::string> format, arg_list args,
               log_source source = {}) override
    {
        if (!backend_->is_enabled_for(level, module_)) return;

        record rec(module_, level, std::move(format), std::move(args));
        if (source.file) rec.set_source(source.file, source.line);

        if (auto err = backend_->log(level, calldepth + 1 + extra_calldepth, rec))
        {
            fmt::print(stderr, "tierlog: delivery to {} failed for module '{}': {}\n", backend_->name(), module_,
                       err.message());
        }
    }

    bool is_enabled_for(log_level level) const override { return backend_->is_enabled_for(level, module_); }

    const std::string &module() const override { return module_; }

    const std::shared_ptr<leveled_backend> &backend() const noexcept { return backend_; }

    /// Added to the stack depth hint, for code wrapping this logger
    int extra_calldepth = 0;

  private:
    std::string module_;
    std::shared_ptr<leveled_backend> backend_;
};

namespace detail
{

// The prefix ends up inside a format string, so its braces must be literal
inline std::string escape_format(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        out.push_back(c);
        if (c == '{' || c == '}') out.push_back(c);
    }
    return out;
}

inline std::string_view trim(std::string_view text)
{
    const char *ws = " \t\r\n\f\v";
    auto first     = text.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // namespace detail

/**
 * @brief Logger decorator prepending a fixed prefix to every message
 *
 * The prefix is trimmed and followed by @p separator (" ->" by default).
 * It becomes the first argument of joined messages and is placed, followed
 * by a space, in front of format strings.
 */
class prefix_logger final : public logger_base
{
  public:
    prefix_logger(std::shared_ptr<logger_base> parent, std::string_view prefix, std::string_view separator = " ->")
    : parent_(std::move(parent)),
      prefix_(std::string(detail::trim(prefix)) + std::string(separator))
    {
        if (!parent_) throw std::invalid_argument("prefix_logger requires a parent logger");
    }

    void decorate(std::optional<std::string> &format, arg_list &args) const override
    {
        if (format) { *format = detail::escape_format(prefix_) + " " + *format; }
        else { args.insert(args.begin(), log_arg(prefix_)); }
    }

    void write(log_level level, int calldepth, std::optional<std::string> format, arg_list args,
               log_source source = {}) override
    {
        parent_->decorate(format, args);
        parent_->write(level, calldepth + 1, std::move(format), std::move(args), source);
    }

    bool is_enabled_for(log_level level) const override { return parent_->is_enabled_for(level); }

    const std::string &module() const override { return parent_->module(); }

    const std::string &prefix() const noexcept { return prefix_; }

    const std::shared_ptr<logger_base> &parent() const noexcept { return parent_; }

  private:
    std::shared_ptr<logger_base> parent_;
    std::string prefix_;
};

} // namespace tierlog

/**
 * @brief Log through @p logger with the current file and line attached
 * @code
 * TIERLOG_LOGF(log, tierlog::log_level::notice, "listening on {}", port);
 * @endcode
 */
#define TIERLOG_LOGF(logger, level, ...) (logger).logf_at(::tierlog::log_source{__FILE__, __LINE__}, level, __VA_ARGS__)

#define TIERLOG_CRITICALF(logger, ...) TIERLOG_LOGF(logger, ::tierlog::log_level::critical, __VA_ARGS__)
#define TIERLOG_ERRORF(logger, ...)    TIERLOG_LOGF(logger, ::tierlog::log_level::error, __VA_ARGS__)
#define TIERLOG_WARNINGF(logger, ...)  TIERLOG_LOGF(logger, ::tierlog::log_level::warning, __VA_ARGS__)
#define TIERLOG_NOTICEF(logger, ...)   TIERLOG_LOGF(logger, ::tierlog::log_level::notice, __VA_ARGS__)
#define TIERLOG_INFOF(logger, ...)     TIERLOG_LOGF(logger, ::tierlog::log_level::info, __VA_ARGS__)
#define TIERLOG_DEBUGF(logger, ...)    TIERLOG_LOGF(logger, ::tierlog::log_level::debug, __VA_ARGS__)
