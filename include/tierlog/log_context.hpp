/**
 * @file log_context.hpp
 * @brief Explicitly owned logging state: default backend, loggers, task pool
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A program creates one logging_context at its entry point and passes it to
 * whatever needs to build loggers or sinks. Nothing in tierlog reaches for
 * hidden global state except the record sequence, the clock and the file
 * sink cache, which are process-wide by nature.
 *
 * @code
 * tierlog::logging_context ctx;
 * ctx.set_backend({tierlog::make_stderr_sink(), ctx.files().acquire("app.log", {}, ctx.services())});
 * ctx.set_level(tierlog::log_level::info);
 * ctx.set_level(tierlog::log_level::warning, "svc.api");
 *
 * auto log = ctx.get_or_create_logger("svc.api.http");
 * log->notice("listening");   // suppressed, svc.api is at WARNING
 * log->error("bind failed");  // delivered to stderr and app.log
 * @endcode
 */
#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <unistd.h>

#include <robin_hood.h>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"
#include "log_sinks.hpp"
#include "log_backend.hpp"
#include "log_multi_sink.hpp"
#include "log_task_pool.hpp"
#include "log_async_sink.hpp"
#include "log_file_sink.hpp"
#include "log_logger.hpp"

namespace tierlog
{

inline constexpr const char *DIAGNOSTICS_MODULE = "tierlog.sinks";

struct context_options
{
    size_t async_workers    = DEFAULT_ASYNC_WORKERS;                ///< Threads of the async task pool
    log_level default_level = log_level::debug;                     ///< Default entry of the initial backend
    bool use_color          = ::isatty(STDERR_FILENO) == 1;         ///< Color the stderr text sink
    file_sink_cache *files  = nullptr;                              ///< nullptr selects file_sink_cache::instance()
    std::shared_ptr<log_sink> diagnostics_sink;                     ///< nullptr selects stderr
};

class logging_context
{
  private:
    // Shared with every proxy handed out, so proxies outliving the context stay valid
    struct backend_slot
    {
        mutable std::shared_mutex mutex;
        std::shared_ptr<leveled_backend> backend;

        std::shared_ptr<leveled_backend> get() const
        {
            std::shared_lock lock(mutex);
            return backend;
        }

        void set(std::shared_ptr<leveled_backend> b)
        {
            std::unique_lock lock(mutex);
            backend = std::move(b);
        }
    };

  public:
    explicit logging_context(context_options options = {})
    : options_(options),
      files_(options.files ? options.files : &file_sink_cache::instance()),
      slot_(std::make_shared<backend_slot>()),
      tasks_(std::make_shared<task_pool>(options.async_workers))
    {
        auto diag_sink = options_.diagnostics_sink ? options_.diagnostics_sink
                                                   : make_stderr_sink(make_text_formatter(options_.use_color));
        auto diag_backend = std::make_shared<module_level_backend>(std::move(diag_sink), "diagnostics");
        diagnostics_ = std::make_shared<logger>(DIAGNOSTICS_MODULE, std::move(diag_backend));

        auto backend = set_backend(make_stderr_sink(make_text_formatter(options_.use_color)));
        backend->set_level(options_.default_level);

        auto slot = slot_;
        proxy_    = std::make_shared<leveled_backend_proxy>([slot]() { return slot->get(); });
    }

    logging_context(const logging_context &)            = delete;
    logging_context &operator=(const logging_context &) = delete;

    ~logging_context()
    {
        files_->release(*tasks_);
        tasks_->shutdown();
    }

    /**
     * @brief Replace the default backend
     *
     * One sink is wrapped directly, several are fanned out through a
     * multi_sink. The new backend starts with an empty level table.
     *
     * @throws std::invalid_argument if @p sinks is empty
     */
    std::shared_ptr<module_level_backend> set_backend(std::vector<std::shared_ptr<log_sink>> sinks)
    {
        if (sinks.empty()) throw std::invalid_argument("set_backend requires at least one sink");

        std::shared_ptr<log_sink> sink;
        if (sinks.size() == 1) { sink = std::move(sinks.front()); }
        else { sink = std::make_shared<multi_sink>(std::move(sinks)); }

        auto backend = std::make_shared<module_level_backend>(std::move(sink));
        slot_->set(backend);
        return backend;
    }

    std::shared_ptr<module_level_backend> set_backend(std::shared_ptr<log_sink> sink)
    {
        std::vector<std::shared_ptr<log_sink>> sinks;
        sinks.push_back(std::move(sink));
        return set_backend(std::move(sinks));
    }

    std::shared_ptr<leveled_backend> default_backend() const { return slot_->get(); }

    /**
     * @brief Backend that always forwards to whatever default backend is current
     */
    std::shared_ptr<leveled_backend_proxy> default_backend_proxy() const { return proxy_; }

    void set_level(log_level level, std::string_view module = {}) { default_backend()->set_level(level, module); }

    log_level get_level(std::string_view module = {}) const { return default_backend()->get_level(module); }

    /**
     * @brief Registered logger for @p module, created on the default backend proxy if missing
     */
    std::shared_ptr<logger> get_or_create_logger(std::string_view module)
    {
        {
            std::shared_lock lock(loggers_mutex_);
            auto it = loggers_.find(std::string(module));
            if (it != loggers_.end()) return it->second;
        }

        std::unique_lock lock(loggers_mutex_);
        auto it = loggers_.find(std::string(module));
        if (it != loggers_.end()) return it->second;

        auto log = std::make_shared<logger>(std::string(module), proxy_);
        loggers_.emplace(std::string(module), log);
        return log;
    }

    /**
     * @brief Registered logger for @p module, or nullptr
     */
    std::shared_ptr<logger> get_logger(std::string_view module) const
    {
        std::shared_lock lock(loggers_mutex_);
        auto it = loggers_.find(std::string(module));
        return it != loggers_.end() ? it->second : nullptr;
    }

    /**
     * @brief Register a logger for @p module on its own backend, replacing any previous one
     *
     * Loggers obtained earlier keep their old backend.
     */
    std::shared_ptr<logger> bind_logger(std::string_view module, std::shared_ptr<leveled_backend> backend)
    {
        auto log = std::make_shared<logger>(std::string(module), std::move(backend));
        std::unique_lock lock(loggers_mutex_);
        loggers_[std::string(module)] = log;
        return log;
    }

    const std::shared_ptr<task_pool> &tasks() const noexcept { return tasks_; }

    /**
     * @brief Synchronous stderr logger receiving the library's own problems
     */
    const std::shared_ptr<logger> &diagnostics() const noexcept { return diagnostics_; }

    file_sink_cache &files() const noexcept { return *files_; }

    sink_services services(std::shared_ptr<const log_formatter> formatter = nullptr) const
    {
        return sink_services{tasks_, diagnostics_, std::move(formatter)};
    }

    /**
     * @brief Back to the initial state
     *
     * Restarts record numbering, installs a fresh stderr backend at DEBUG
     * and restores the system clock. Registered loggers are kept; those
     * created through get_or_create_logger() follow the new backend.
     */
    void reset()
    {
        record_sequence::reset();
        auto backend = set_backend(make_stderr_sink(make_text_formatter(options_.use_color)));
        backend->set_level(log_level::debug);
        log_clock::reset();
    }

  private:
    context_options options_;
    file_sink_cache *files_;
    std::shared_ptr<backend_slot> slot_;
    std::shared_ptr<leveled_backend_proxy> proxy_;
    std::shared_ptr<task_pool> tasks_;
    std::shared_ptr<logger> diagnostics_;

    robin_hood::unordered_node_map<std::string, std::shared_ptr<logger>> loggers_;
    mutable std::shared_mutex loggers_mutex_;
};

} // namespace tierlog
