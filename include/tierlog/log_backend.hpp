/**
 * @file log_backend.hpp
 * @brief Leveled backends: per-module level resolution in front of a sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Modules are dot separated hierarchical names ("svc.api.auth"). A level set
 * for "svc" applies to every module below it unless a longer prefix has its
 * own entry. The empty module name is the default entry. When nothing
 * matches, every level is enabled.
 *
 * @code
 * auto backend = std::make_shared<module_level_backend>(make_stderr_sink());
 * backend->set_level(log_level::debug);               // default
 * backend->set_level(log_level::warning, "svc.api");  // svc.api and below
 *
 * backend->is_enabled_for(log_level::info, "svc.api.auth"); // false
 * backend->is_enabled_for(log_level::info, "svc.db");       // true
 * @endcode
 */
#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <robin_hood.h>

#include "log_types.hpp"
#include "log_error.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"

namespace tierlog
{

/**
 * @brief A sink that also decides which records it wants
 */
class leveled_backend : public log_sink
{
  public:
    using log_sink::log_sink;

    virtual bool is_enabled_for(log_level level, std::string_view module) const = 0;

    virtual void set_level(log_level level, std::string_view module = {}) = 0;

    virtual log_level get_level(std::string_view module = {}) const = 0;
};

namespace detail
{

// Transparent hashing so lookups by string_view don't allocate
struct module_name_hash
{
    using is_transparent = void;

    size_t operator()(std::string_view name) const noexcept { return robin_hood::hash_bytes(name.data(), name.size()); }
    size_t operator()(const std::string &name) const noexcept { return operator()(std::string_view(name)); }
};

struct module_name_equal
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept { return lhs == rhs; }
};

/**
 * @brief Drop the last dot segment of a module name
 * @return "svc.api" for "svc.api.auth", "" for "svc" and for ""
 */
inline std::string_view parent_module(std::string_view module) noexcept
{
    auto dot = module.rfind('.');
    if (dot == std::string_view::npos) return {};
    return module.substr(0, dot);
}

} // namespace detail

/**
 * @brief Leveled backend wrapping a single sink with a module level table
 *
 * Thread Safety:
 * - Lookups take a shared lock, set_level() an exclusive one
 * - log() does not touch the table and adds no locking of its own
 */
class module_level_backend final : public leveled_backend
{
  public:
    explicit module_level_backend(std::shared_ptr<log_sink> sink, std::string name = "module_level")
    : leveled_backend(std::move(name)),
      sink_(std::move(sink))
    {
        if (!sink_) throw std::invalid_argument("module_level_backend requires a sink");
    }

    bool is_enabled_for(log_level level, std::string_view module) const override
    {
        log_level threshold;
        if (!resolve(module, threshold)) return true; // nothing configured: let everything through
        return level >= threshold;
    }

    void set_level(log_level level, std::string_view module = {}) override
    {
        std::unique_lock lock(mutex_);
        auto it = levels_.find(module);
        if (it != levels_.end()) { it->second = level; }
        else { levels_.emplace(std::string(module), level); }
    }

    log_level get_level(std::string_view module = {}) const override
    {
        log_level threshold;
        if (!resolve(module, threshold)) return log_level::debug;
        return threshold;
    }

    log_error log(log_level level, int calldepth, record &rec) override { return sink_->log(level, calldepth + 1, rec); }

    log_error print(const arg_list &args) override { return sink_->print(args); }

    log_error close() override { return sink_->close(); }

    /**
     * @brief Explicit entries sorted by module name, "" (the default) first
     */
    std::vector<std::pair<std::string, log_level>> levels() const
    {
        std::vector<std::pair<std::string, log_level>> result;
        {
            std::shared_lock lock(mutex_);
            result.reserve(levels_.size());
            for (const auto &[module, level] : levels_) { result.emplace_back(module, level); }
        }
        std::sort(result.begin(), result.end(), [](const auto &a, const auto &b) { return a.first < b.first; });
        return result;
    }

    const std::shared_ptr<log_sink> &sink() const noexcept { return sink_; }

  private:
    // Longest matching prefix, then "", walking one dot segment at a time
    bool resolve(std::string_view module, log_level &out) const
    {
        std::shared_lock lock(mutex_);
        while (true)
        {
            auto it = levels_.find(module);
            if (it != levels_.end())
            {
                out = it->second;
                return true;
            }
            if (module.empty()) return false;
            module = detail::parent_module(module);
        }
    }

    std::shared_ptr<log_sink> sink_;
    robin_hood::unordered_map<std::string, log_level, detail::module_name_hash, detail::module_name_equal> levels_;
    mutable std::shared_mutex mutex_; // Allow concurrent reads
};

/**
 * @brief Late-bound leveled backend
 *
 * Resolves the target through an accessor on every call, so whatever the
 * accessor returns at call time (typically a context's current default
 * backend) receives the operation. Loggers holding a proxy follow later
 * reconfiguration without being rebuilt.
 */
class leveled_backend_proxy final : public leveled_backend
{
  public:
    using accessor = std::function<std::shared_ptr<leveled_backend>()>;

    explicit leveled_backend_proxy(accessor target, std::string name = "default_backend")
    : leveled_backend(std::move(name)),
      target_(std::move(target))
    {
        if (!target_) throw std::invalid_argument("leveled_backend_proxy requires an accessor");
    }

    bool is_enabled_for(log_level level, std::string_view module) const override
    {
        return current()->is_enabled_for(level, module);
    }

    void set_level(log_level level, std::string_view module = {}) override { current()->set_level(level, module); }

    log_level get_level(std::string_view module = {}) const override { return current()->get_level(module); }

    log_error log(log_level level, int calldepth, record &rec) override
    {
        return current()->log(level, calldepth + 1, rec);
    }

    log_error print(const arg_list &args) override { return current()->print(args); }

    // The proxy owns nothing; closing it must not close the target
    log_error close() override { return {}; }

  private:
    std::shared_ptr<leveled_backend> current() const
    {
        auto backend = target_();
        if (!backend) throw std::logic_error("leveled_backend_proxy target is not set");
        return backend;
    }

    accessor target_;
};

} // namespace tierlog
