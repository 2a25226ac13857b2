/**
 * @file log_error.hpp
 * @brief Delivery error value returned by sinks and backends
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Sinks report delivery failures by value instead of throwing: a default
 * constructed log_error means success, and an error converts to true the
 * same way std::error_code does. Construction failures (opening a file,
 * parsing a destination) are not log_errors; they throw.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <stdexcept>
#include <system_error>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace tierlog
{

class log_error
{
  public:
    log_error() = default;

    explicit log_error(std::string message)
    : failed_(true),
      code_(std::make_error_code(std::errc::io_error)),
      message_(std::move(message))
    {
    }

    log_error(std::error_code code, std::string message)
    : failed_(true),
      code_(code),
      message_(std::move(message))
    {
    }

    /**
     * @brief Build an error from errno after a failed system call
     */
    static log_error from_errno(int err, std::string_view what)
    {
        std::error_code code(err, std::generic_category());
        return log_error(code, fmt::format("{}: {}", what, code.message()));
    }

    /**
     * @brief Sink does not implement an optional operation
     */
    static log_error unsupported(std::string_view sink, std::string_view operation)
    {
        return log_error(std::make_error_code(std::errc::operation_not_supported),
                         fmt::format("{} does not support {}", sink, operation));
    }

    /**
     * @brief Combine the failures of several sinks into one error
     *
     * Successful entries are skipped. No failure yields a success value, a
     * single failure is returned as is, several become an error whose
     * message joins the causes with "; " and whose causes() lists them.
     */
    static log_error aggregate(std::vector<log_error> errors)
    {
        std::vector<log_error> failed;
        for (auto &err : errors)
        {
            if (err) failed.push_back(std::move(err));
        }

        if (failed.empty()) return {};
        if (failed.size() == 1) return std::move(failed.front());

        log_error result(failed.front().code(), fmt::format("{} sinks failed: ", failed.size()));
        for (size_t i = 0; i < failed.size(); ++i)
        {
            if (i > 0) result.message_ += "; ";
            result.message_ += failed[i].message();
        }
        result.causes_ = std::move(failed);
        return result;
    }

    explicit operator bool() const noexcept { return failed_; }

    const std::error_code &code() const noexcept { return code_; }
    const std::string &message() const noexcept { return message_; }

    /// Individual failures when this error aggregates several sinks
    const std::vector<log_error> &causes() const noexcept { return causes_; }

  private:
    bool failed_ = false;
    std::error_code code_;
    std::string message_;
    std::vector<log_error> causes_;
};

/**
 * @brief Raised by logger::panic() after the record has been logged
 */
class log_panic : public std::runtime_error
{
  public:
    explicit log_panic(const std::string &message) : std::runtime_error(message) {}
};

} // namespace tierlog
