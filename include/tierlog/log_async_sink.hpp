/**
 * @file log_async_sink.hpp
 * @brief Synchronous or fire-and-forget delivery in front of a sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_error.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"
#include "log_task_pool.hpp"
#include "log_logger.hpp"

namespace tierlog
{

enum class delivery_mode
{
    sync, ///< Run the inner sink on the caller's thread and return its result
    async ///< Hand a snapshot to the task pool and return immediately
};

/**
 * @brief Wrapper deciding on which thread the inner sink runs
 *
 * In async mode log() and print() always succeed from the caller's point of
 * view. What goes wrong later (the inner sink failing or throwing, the pool
 * refusing the task after shutdown) is reported to the diagnostic logger, or to stderr
 * when none is given. Async deliveries carry no ordering guarantee.
 *
 * The task owns a shared reference to the inner sink, so a sink dropped by
 * its last user stays alive until its queued deliveries have run.
 */
class async_sink final : public log_sink
{
  public:
    async_sink(std::string name,
               std::shared_ptr<log_sink> inner,
               delivery_mode mode,
               std::shared_ptr<task_pool> pool,
               std::shared_ptr<logger_base> diagnostics = nullptr)
    : log_sink(std::move(name)),
      inner_(std::move(inner)),
      mode_(mode),
      pool_(std::move(pool)),
      diagnostics_(std::move(diagnostics))
    {
        if (!inner_) throw std::invalid_argument("async_sink requires an inner sink");
        if (mode_ == delivery_mode::async && !pool_) throw std::invalid_argument("async delivery requires a task pool");
    }

    log_error log(log_level level, int calldepth, record &rec) override
    {
        if (mode_ == delivery_mode::sync) return inner_->log(level, calldepth + 1, rec);

        auto copy = std::make_shared<record>(rec.snapshot());
        bool queued =
            pool_->submit([inner = inner_, diagnostics = diagnostics_, level, calldepth, copy, sink_name = name()]()
                          {
                              guarded(diagnostics, sink_name, "log",
                                      [&]() { return inner->log(level, calldepth + 1, *copy); });
                          });
        if (!queued) report(diagnostics_, name(), "log", "task pool refused the delivery");
        return {};
    }

    log_error print(const arg_list &args) override
    {
        if (mode_ == delivery_mode::sync) return inner_->print(args);

        bool queued = pool_->submit([inner = inner_, diagnostics = diagnostics_, args, sink_name = name()]()
                                    { guarded(diagnostics, sink_name, "print", [&]() { return inner->print(args); }); });
        if (!queued) report(diagnostics_, name(), "print", "task pool refused the delivery");
        return {};
    }

    // close() always runs on the caller's thread
    log_error close() override { return inner_->close(); }

    delivery_mode mode() const noexcept { return mode_; }
    const std::shared_ptr<log_sink> &inner() const noexcept { return inner_; }

    const std::shared_ptr<task_pool> &pool() const noexcept { return pool_; }

  private:
    // Runs one background delivery; a returned error or a throw both end up in report()
    template <typename Deliver>
    static void guarded(const std::shared_ptr<logger_base> &diagnostics,
                        const std::string &sink,
                        const char *operation,
                        Deliver &&deliver)
    {
        try
        {
            if (auto err = deliver()) report(diagnostics, sink, operation, err.message());
        }
        catch (const std::exception &e)
        {
            report(diagnostics, sink, operation, e.what());
        }
        catch (...)
        {
            report(diagnostics, sink, operation, "unknown exception");
        }
    }

    static void report(const std::shared_ptr<logger_base> &diagnostics,
                       const std::string &sink,
                       const char *operation,
                       const std::string &what)
    {
        if (diagnostics)
        {
            diagnostics->errorf("async {} to {} failed: {}", operation, sink, what);
            return;
        }
        fmt::print(stderr, "tierlog: async {} to {} failed: {}\n", operation, sink, what);
    }

    std::shared_ptr<log_sink> inner_;
    delivery_mode mode_;
    std::shared_ptr<task_pool> pool_;
    std::shared_ptr<logger_base> diagnostics_;
};

/**
 * @brief What a sink factory needs besides its own options
 */
struct sink_services
{
    std::shared_ptr<task_pool> tasks;              ///< Runs async deliveries
    std::shared_ptr<logger_base> diagnostics;      ///< Receives async failures
    std::shared_ptr<const log_formatter> formatter; ///< Renders lines for text sinks
};

inline std::shared_ptr<async_sink> make_async_sink(std::string name,
                                                   std::shared_ptr<log_sink> inner,
                                                   bool async,
                                                   const sink_services &services)
{
    return std::make_shared<async_sink>(std::move(name), std::move(inner),
                                        async ? delivery_mode::async : delivery_mode::sync, services.tasks,
                                        services.diagnostics);
}

} // namespace tierlog
