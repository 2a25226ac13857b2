/**
 * @file log_config.hpp
 * @brief Configuration boundary: level names and destination descriptions to sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The core never parses configuration. Whatever reads the application's
 * settings fills the plain structs below; this adapter turns them into
 * levels and sinks and applies them to a logging_context.
 *
 * @code
 * tierlog::logging_config cfg;
 * cfg.level = "info";
 * cfg.modules.push_back({"svc.api", "W", {{"-", {}}, {"/var/log/api.log", {{"truncate", "true"}}}}});
 * tierlog::apply(cfg, ctx);
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_sink.hpp"
#include "log_backend.hpp"
#include "log_multi_sink.hpp"
#include "log_writers.hpp"
#include "log_file_sink.hpp"
#include "log_http_sink.hpp"
#include "log_context.hpp"

namespace tierlog
{

/**
 * @brief Parse a level name or its one letter alias, case-insensitive
 * @return nullopt for unknown text
 */
inline std::optional<log_level> level_from_string(std::string_view text)
{
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "CRITICAL" || upper == "C") return log_level::critical;
    if (upper == "ERROR" || upper == "E") return log_level::error;
    if (upper == "WARNING" || upper == "WARN" || upper == "W") return log_level::warning;
    if (upper == "NOTICE" || upper == "N") return log_level::notice;
    if (upper == "INFO" || upper == "I") return log_level::info;
    if (upper == "DEBUG" || upper == "D") return log_level::debug;
    return std::nullopt;
}

inline log_level level_or(std::string_view text, log_level fallback = log_level::debug)
{
    return level_from_string(text).value_or(fallback);
}

/**
 * @brief Configure a backend's level table from a compact string
 * @return true if configuration was valid, false otherwise
 *
 * Format examples:
 * - "info" - Set the default entry
 * - "svc.api=warning,svc.db=e" - Set specific modules
 * - "info,svc.api=debug" - Default to info, svc.api (and below) to debug
 * - "*=warn" - Same as a bare level
 * - "svc.*=error" - Same as "svc=error"
 *
 * Parts are applied in order up to the first invalid one.
 */
inline bool configure_levels(leveled_backend &backend, std::string_view config)
{
    std::string config_str(config);
    config_str.erase(std::remove_if(config_str.begin(), config_str.end(), [](unsigned char c) { return std::isspace(c); }),
                     config_str.end());
    if (config_str.empty()) return false;

    size_t pos = 0;
    while (pos <= config_str.length())
    {
        size_t comma_pos = config_str.find(',', pos);
        if (comma_pos == std::string::npos) comma_pos = config_str.length();

        std::string part = config_str.substr(pos, comma_pos - pos);
        pos              = comma_pos + 1;

        if (part.empty()) continue;

        size_t eq_pos = part.find('=');
        if (eq_pos == std::string::npos)
        {
            auto level = level_from_string(part);
            if (!level) return false;
            backend.set_level(*level);
            continue;
        }

        std::string module    = part.substr(0, eq_pos);
        std::string level_str = part.substr(eq_pos + 1);
        if (module.empty() || level_str.empty()) return false;

        auto level = level_from_string(level_str);
        if (!level) return false;

        if (module == "*") { module.clear(); }
        else if (module.size() > 2 && module.compare(module.size() - 2, 2, ".*") == 0) { module.resize(module.size() - 2); }
        else if (module.find('*') != std::string::npos) { return false; }

        backend.set_level(*level, module);
    }
    return true;
}

using option_map = std::map<std::string, std::string>;

/**
 * @brief One destination of a module: a file path, an http URL, or "-"/"_" for the default backend
 */
struct destination_config
{
    std::string dst;
    option_map options;
};

struct module_config
{
    std::string name;
    std::string level;
    std::vector<destination_config> destinations;
};

struct logging_config
{
    std::string level; ///< Default level, DEBUG when empty or unknown
    std::vector<module_config> modules;
};

namespace detail
{

inline bool parse_bool_option(const option_map &options, const char *key, bool fallback)
{
    auto it = options.find(key);
    if (it == options.end()) return fallback;

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::invalid_argument(fmt::format("option '{}' expects a boolean, got '{}'", key, it->second));
}

inline unsigned long parse_unsigned_option(const option_map &options, const char *key, unsigned long fallback, int base)
{
    auto it = options.find(key);
    if (it == options.end()) return fallback;

    const std::string &value = it->second;
    if (value.empty() || value.find_first_not_of(base == 8 ? "01234567" : "0123456789") != std::string::npos)
    {
        throw std::invalid_argument(fmt::format("option '{}' expects a number, got '{}'", key, value));
    }
    return std::stoul(value, nullptr, base);
}

inline bool is_http_destination(std::string_view dst)
{
    auto starts = [&](std::string_view prefix)
    {
        if (dst.size() < prefix.size()) return false;
        for (size_t i = 0; i < prefix.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(dst[i])) != prefix[i]) return false;
        }
        return true;
    };
    return starts("http:") || starts("https:");
}

} // namespace detail

/**
 * @brief File options from a destination's option map
 *
 * Keys: async (default true), truncate (default false), perm (octal, default
 * 0666). Unknown keys are ignored.
 *
 * @throws std::invalid_argument for a value of the wrong kind
 */
inline file_options decode_file_options(const option_map &options)
{
    file_options result;
    result.async    = detail::parse_bool_option(options, "async", true);
    result.truncate = detail::parse_bool_option(options, "truncate", false);
    result.perm     = static_cast<unsigned>(detail::parse_unsigned_option(options, "perm", DEFAULT_FILE_PERM, 8));
    if (result.perm > 07777) throw std::invalid_argument(fmt::format("option 'perm' out of range: {:o}", result.perm));
    return result;
}

/**
 * @brief HTTP options from a destination's option map
 *
 * Keys: timeout (seconds, 0 keeps the default of 2), http_get, formatted,
 * async (default true). Unknown keys are ignored.
 *
 * @throws std::invalid_argument for a value of the wrong kind
 */
inline http_options decode_http_options(const option_map &options)
{
    http_options result;
    auto timeout     = detail::parse_unsigned_option(options, "timeout", 0, 10);
    result.timeout   = timeout == 0 ? std::chrono::seconds(DEFAULT_HTTP_TIMEOUT)
                                    : std::chrono::seconds(static_cast<std::chrono::seconds::rep>(timeout));
    result.http_get  = detail::parse_bool_option(options, "http_get", false);
    result.formatted = detail::parse_bool_option(options, "formatted", false);
    result.async     = detail::parse_bool_option(options, "async", true);
    return result;
}

/**
 * @brief Turn a module's destinations into sinks
 *
 * A destination that cannot be built (bad URL, bad option, file that
 * cannot be opened) is reported on the context's diagnostic logger and
 * skipped; the others are still returned.
 */
inline std::vector<std::shared_ptr<log_sink>> build_sinks(const module_config &module, logging_context &ctx)
{
    std::vector<std::shared_ptr<log_sink>> sinks;

    for (size_t i = 0; i < module.destinations.size(); ++i)
    {
        const auto &dest = module.destinations[i];
        try
        {
            if (detail::is_http_destination(dest.dst))
            {
                sinks.push_back(make_http_sink(dest.dst, decode_http_options(dest.options), ctx.services()));
            }
            else if (dest.dst == "-" || dest.dst == "_") { sinks.push_back(ctx.default_backend_proxy()); }
            else
            {
                if (dest.dst.empty()) throw std::invalid_argument("empty destination");
                sinks.push_back(ctx.files().acquire(dest.dst, decode_file_options(dest.options), ctx.services()));
            }
        }
        catch (const std::exception &e)
        {
            ctx.diagnostics()->errorf("module {}: destination #{} `{}` skipped: {}", module.name, i, dest.dst, e.what());
        }
    }
    return sinks;
}

/**
 * @brief Apply a decoded configuration to a context
 *
 * Sets the default level, then each module's level on the default backend.
 * A module with destinations gets a registered logger on its own backend
 * over those sinks, at the module's level.
 */
inline void apply(const logging_config &config, logging_context &ctx)
{
    ctx.set_level(level_or(config.level));

    for (const auto &module : config.modules)
    {
        auto level = level_or(module.level);
        ctx.set_level(level, module.name);

        if (module.destinations.empty()) continue;

        auto sinks = build_sinks(module, ctx);
        if (sinks.empty())
        {
            ctx.diagnostics()->warningf("module {}: no usable destination, using the default backend", module.name);
            continue;
        }

        std::shared_ptr<log_sink> sink;
        if (sinks.size() == 1) { sink = std::move(sinks.front()); }
        else { sink = std::make_shared<multi_sink>(std::move(sinks)); }

        auto backend = std::make_shared<module_level_backend>(std::move(sink), "module:" + module.name);
        backend->set_level(level, module.name);
        ctx.bind_logger(module.name, std::move(backend));
    }
}

} // namespace tierlog
