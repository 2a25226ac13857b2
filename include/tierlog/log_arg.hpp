/**
 * @file log_arg.hpp
 * @brief Type-erased log arguments with redaction support
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A record keeps its arguments as an ordered list of log_arg values. Each
 * log_arg shares an immutable payload, so copying an argument list (which
 * is what record snapshots do) never copies the logged values themselves.
 *
 * Values whose type provides a `redacted()` member are Redactable: the raw
 * value is never rendered, neither by the message nor by any formatter.
 *
 * @code
 * struct password
 * {
 *     std::string value;
 *     std::string redacted() const { return tierlog::redact(value); }
 * };
 *
 * auto rec = make_record("auth", log_level::info, "login", user, password{"hunter2"});
 * rec.message(); // "login alice *******"
 * @endcode
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <iterator>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"

namespace tierlog
{

/**
 * @brief Types that know how to hide their sensitive content
 */
template <typename T>
concept Redactable = requires(const T &value) {
    { value.redacted() } -> Loggable;
};

/**
 * @brief Mask a string with '*', keeping its length
 */
inline std::string redact(std::string_view s) { return std::string(s.size(), '*'); }

using dynamic_arg_store = fmt::dynamic_format_arg_store<fmt::format_context>;

namespace detail
{

struct arg_concept
{
    virtual ~arg_concept() = default;

    virtual void append_to(fmt::memory_buffer &out) const = 0;
    virtual void push_to(dynamic_arg_store &store) const  = 0;

    virtual bool redactable() const noexcept { return false; }
    virtual std::shared_ptr<const arg_concept> redacted() const { return nullptr; }
};

// Strings are stored by value so a record never points into caller memory
template <typename T>
using arg_storage_t =
    std::conditional_t<std::is_convertible_v<const std::decay_t<T> &, std::string_view>, std::string, std::decay_t<T>>;

template <typename T> struct arg_model final : arg_concept
{
    T value_;

    explicit arg_model(T value) : value_(std::move(value)) {}

    void append_to(fmt::memory_buffer &out) const override { fmt::format_to(std::back_inserter(out), "{}", value_); }

    void push_to(dynamic_arg_store &store) const override { store.push_back(value_); }
};

template <typename T> std::shared_ptr<const arg_concept> make_arg_model(T &&value)
{
    using storage = arg_storage_t<T>;
    if constexpr (std::is_pointer_v<std::remove_reference_t<T>> && std::is_same_v<storage, std::string>)
    {
        return std::make_shared<arg_model<std::string>>(value ? std::string(value) : std::string("(null)"));
    }
    else if constexpr (std::is_same_v<storage, std::string>)
    {
        return std::make_shared<arg_model<std::string>>(std::string(std::string_view(value)));
    }
    else
    {
        return std::make_shared<arg_model<storage>>(storage(std::forward<T>(value)));
    }
}

// Both renderings go through redacted() so the raw value cannot leak even
// before the record swaps the argument out.
template <typename T> struct redactable_model final : arg_concept
{
    T value_;

    explicit redactable_model(T value) : value_(std::move(value)) {}

    void append_to(fmt::memory_buffer &out) const override
    {
        fmt::format_to(std::back_inserter(out), "{}", value_.redacted());
    }

    void push_to(dynamic_arg_store &store) const override { store.push_back(arg_storage_t<decltype(value_.redacted())>(value_.redacted())); }

    bool redactable() const noexcept override { return true; }

    std::shared_ptr<const arg_concept> redacted() const override { return make_arg_model(value_.redacted()); }
};

} // namespace detail

/**
 * @brief One opaque argument of a log record
 */
class log_arg
{
  public:
    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, log_arg> &&
                 (Redactable<std::remove_cvref_t<T>> || Loggable<detail::arg_storage_t<T>>))
    log_arg(T &&value)
    {
        if constexpr (Redactable<std::remove_cvref_t<T>>)
        {
            impl_ = std::make_shared<detail::redactable_model<std::remove_cvref_t<T>>>(std::forward<T>(value));
        }
        else { impl_ = detail::make_arg_model(std::forward<T>(value)); }
    }

    bool is_redactable() const noexcept { return impl_->redactable(); }

    /**
     * @brief Argument holding the redacted form of this one
     * @return *this when the argument is not redactable
     */
    log_arg redacted() const
    {
        if (!impl_->redactable()) return *this;
        return log_arg(impl_->redacted());
    }

    void append_to(fmt::memory_buffer &out) const { impl_->append_to(out); }
    void push_to(dynamic_arg_store &store) const { impl_->push_to(store); }

    std::string to_string() const
    {
        fmt::memory_buffer buf;
        append_to(buf);
        return fmt::to_string(buf);
    }

    /// True when both arguments share the same payload
    bool same_payload(const log_arg &other) const noexcept { return impl_ == other.impl_; }

  private:
    explicit log_arg(std::shared_ptr<const detail::arg_concept> impl) : impl_(std::move(impl)) {}

    std::shared_ptr<const detail::arg_concept> impl_;
};

using arg_list = std::vector<log_arg>;

template <typename... Args> arg_list make_args(Args &&...args)
{
    arg_list list;
    list.reserve(sizeof...(Args));
    (list.emplace_back(std::forward<Args>(args)), ...);
    return list;
}

/**
 * @brief Replace every redactable argument by its redacted form, in place
 */
inline void redact_args(arg_list &args)
{
    for (auto &arg : args)
    {
        if (arg.is_redactable()) arg = arg.redacted();
    }
}

/**
 * @brief Render arguments separated by a single space, no trailing separator
 */
inline std::string join_args(const arg_list &args)
{
    fmt::memory_buffer buf;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0) buf.push_back(' ');
        args[i].append_to(buf);
    }
    return fmt::to_string(buf);
}

/**
 * @brief Render a message from an optional fmt format string and arguments
 *
 * A format string fmt rejects (bad syntax, too few arguments) does not
 * throw: the result keeps the format string, the rendered arguments and
 * the fmt error so nothing logged is lost.
 */
inline std::string render_message(const std::optional<std::string> &format, const arg_list &args)
{
    if (!format) return join_args(args);

    dynamic_arg_store store;
    store.reserve(args.size(), args.size());
    for (const auto &arg : args) arg.push_to(store);

    try
    {
        return fmt::vformat(*format, store);
    }
    catch (const fmt::format_error &e)
    {
        if (args.empty()) return fmt::format("{} (format error: {})", *format, e.what());
        return fmt::format("{} {} (format error: {})", *format, join_args(args), e.what());
    }
}

} // namespace tierlog
