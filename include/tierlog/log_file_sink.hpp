/**
 * @file log_file_sink.hpp
 * @brief Path-keyed cache of file sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Two configuration entries naming the same file must not end up with two
 * descriptors appending independently to it. The cache hands out one sink
 * per file, keyed by the absolute, lexically normalized path.
 *
 * The options of the call that created the sink stay in effect; options
 * passed by later callers for the same path are ignored. Entries live until
 * clear(), or until release() drops those bound to a stopping task pool.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <robin_hood.h>

#include "log_types.hpp"
#include "log_sink.hpp"
#include "log_writers.hpp"
#include "log_sinks.hpp"
#include "log_task_pool.hpp"
#include "log_async_sink.hpp"

namespace tierlog
{

class file_sink_cache
{
  public:
    file_sink_cache() = default;

    file_sink_cache(const file_sink_cache &)            = delete;
    file_sink_cache &operator=(const file_sink_cache &) = delete;

    static file_sink_cache &instance()
    {
        static file_sink_cache inst;
        return inst;
    }

    /**
     * @brief Get the sink for @p path, opening the file on first use
     *
     * @throws std::system_error if the file cannot be opened; nothing is
     *         cached and a later call tries again
     */
    std::shared_ptr<async_sink> acquire(std::string_view path, const file_options &options, const sink_services &services)
    {
        auto key = cache_key(path);

        // Held across the open so concurrent callers for one path open it once
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = sinks_.find(key);
        if (it != sinks_.end()) { return it->second; }

        auto formatter = services.formatter ? services.formatter : make_text_formatter(false);
        auto writer    = std::make_shared<writer_sink<file_writer>>("file:" + key, std::move(formatter),
                                                                 file_writer{key, options});
        auto sink      = make_async_sink("file:" + key, std::move(writer), options.async, services);

        sinks_.emplace(key, sink);
        return sink;
    }

    bool contains(std::string_view path) const
    {
        auto key = cache_key(path);
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.find(key) != sinks_.end();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }

    /**
     * @brief Forget every cached sink
     *
     * Sinks still referenced elsewhere stay open; they are closed when
     * their last owner lets go.
     */
    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    /**
     * @brief Forget the sinks delivering through @p pool
     *
     * Called by a context before it stops its pool, so a later acquire()
     * for the same path opens a fresh sink instead of one whose async
     * deliveries would be refused.
     * @return number of entries removed
     */
    size_t release(const task_pool &pool)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = sinks_.begin(); it != sinks_.end();)
        {
            if (it->second->pool().get() == &pool)
            {
                it = sinks_.erase(it);
                ++removed;
            }
            else { ++it; }
        }
        return removed;
    }

    /**
     * @brief Normalized absolute form of @p path used as the cache key
     */
    static std::string cache_key(std::string_view path)
    {
        return std::filesystem::absolute(std::filesystem::path(path)).lexically_normal().string();
    }

  private:
    robin_hood::unordered_node_map<std::string, std::shared_ptr<async_sink>> sinks_;
    mutable std::mutex mutex_;
};

} // namespace tierlog
