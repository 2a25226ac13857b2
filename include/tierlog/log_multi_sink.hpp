/**
 * @file log_multi_sink.hpp
 * @brief Fan-out of one record to several sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_error.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"

namespace tierlog
{

/**
 * @brief Sink delivering every record to a fixed list of sinks, in order
 *
 * The message is rendered once on the incoming record; each downstream sink
 * then gets its own snapshot so a sink that caches a formatted line, or
 * hands the record to another thread, never races with its siblings.
 *
 * A failing sink does not stop delivery to the ones after it. All failures
 * are returned together as one aggregated log_error.
 */
class multi_sink final : public log_sink
{
  public:
    explicit multi_sink(std::vector<std::shared_ptr<log_sink>> sinks, std::string name = "multi")
    : log_sink(std::move(name)),
      sinks_(std::move(sinks))
    {
        if (sinks_.empty()) throw std::invalid_argument("multi_sink requires at least one sink");
        for (const auto &sink : sinks_)
        {
            if (!sink) throw std::invalid_argument("multi_sink given a null sink");
        }
    }

    log_error log(log_level level, int calldepth, record &rec) override
    {
        rec.message();

        std::vector<log_error> errors;
        errors.reserve(sinks_.size());
        for (const auto &sink : sinks_)
        {
            auto copy = rec.snapshot();
            errors.push_back(sink->log(level, calldepth + 1, copy));
        }
        return log_error::aggregate(std::move(errors));
    }

    log_error print(const arg_list &args) override
    {
        std::vector<log_error> errors;
        errors.reserve(sinks_.size());
        for (const auto &sink : sinks_) { errors.push_back(sink->print(args)); }
        return log_error::aggregate(std::move(errors));
    }

    log_error close() override
    {
        std::vector<log_error> errors;
        errors.reserve(sinks_.size());
        for (const auto &sink : sinks_) { errors.push_back(sink->close()); }
        return log_error::aggregate(std::move(errors));
    }

    const std::vector<std::shared_ptr<log_sink>> &sinks() const noexcept { return sinks_; }

  private:
    std::vector<std::shared_ptr<log_sink>> sinks_;
};

} // namespace tierlog
