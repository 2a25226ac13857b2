/**
 * @file log.hpp
 * @brief Leveled logging with per-module verbosity and pluggable sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging system provides:
 * - Hierarchical modules ("svc.api.http") whose level is resolved by
 *   longest matching prefix, adjustable at runtime
 * - Records that render their message once, lazily, with redaction of
 *   sensitive arguments
 * - Fan-out to several sinks, each on its own record snapshot
 * - Synchronous or fire-and-forget delivery per sink
 * - One sink per file no matter how often the file is configured
 * - Text, JSON and HTTP outputs
 *
 * Basic Usage:
 * @code
 * #include <tierlog/log.hpp>
 *
 * int main()
 * {
 *     tierlog::logging_context ctx;
 *     ctx.set_level(tierlog::log_level::info);
 *
 *     auto log = ctx.get_or_create_logger("app");
 *     log->info("started, pid", getpid());
 *     log->debugf("not shown: {}", 42);
 *     log->errorf("open {} failed: {}", path, strerror(errno));
 * }
 * @endcode
 *
 * Redaction:
 * @code
 * struct secret
 * {
 *     std::string value;
 *     std::string redacted() const { return tierlog::redact(value); }
 * };
 *
 * log->info("token", secret{"abc123"}); // "token ******"
 * @endcode
 *
 * Configuration:
 * @code
 * tierlog::configure_levels(*ctx.default_backend(), "info,svc.api=warning");
 *
 * tierlog::logging_config cfg;
 * cfg.level = "I";
 * cfg.modules.push_back({"audit", "N", {{"/var/log/audit.log", {{"truncate", "false"}}}, {"-", {}}}});
 * tierlog::apply(cfg, ctx);
 * @endcode
 */
#pragma once

#include "log_version.hpp"
#include "log_types.hpp"
#include "log_error.hpp"
#include "log_arg.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"
#include "log_writers.hpp"
#include "log_formatters.hpp"
#include "log_sinks.hpp"
#include "log_backend.hpp"
#include "log_multi_sink.hpp"
#include "log_task_pool.hpp"
#include "log_logger.hpp"
#include "log_async_sink.hpp"
#include "log_file_sink.hpp"
#include "log_http_sink.hpp"
#include "log_context.hpp"
#include "log_config.hpp"
