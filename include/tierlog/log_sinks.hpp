/**
 * @file log_sinks.hpp
 * @brief Factory functions for creating common log sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unistd.h> // For STDOUT_FILENO, STDERR_FILENO and isatty()

#include "log_sink.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace tierlog
{

inline std::shared_ptr<const log_formatter> make_text_formatter(bool use_color = false)
{
    auto formatter       = std::make_shared<text_formatter>();
    formatter->use_color = use_color;
    return formatter;
}

inline std::shared_ptr<const log_formatter> make_json_formatter(bool pretty_print = false)
{
    auto formatter          = std::make_shared<json_formatter>();
    formatter->pretty_print = pretty_print;
    return formatter;
}

/**
 * @brief Text lines on stderr, colored when stderr is a terminal
 */
inline std::shared_ptr<log_sink> make_stderr_sink(std::shared_ptr<const log_formatter> formatter = nullptr)
{
    if (!formatter) formatter = make_text_formatter(::isatty(STDERR_FILENO) == 1);
    return std::make_shared<writer_sink<fd_writer>>("stderr", std::move(formatter), fd_writer{STDERR_FILENO});
}

inline std::shared_ptr<log_sink> make_stdout_sink(std::shared_ptr<const log_formatter> formatter = nullptr)
{
    if (!formatter) formatter = make_text_formatter(::isatty(STDOUT_FILENO) == 1);
    return std::make_shared<writer_sink<fd_writer>>("stdout", std::move(formatter), fd_writer{STDOUT_FILENO});
}

/**
 * @brief Synchronous sink writing to @p filename
 *
 * This opens a new descriptor on every call. Code that may name the same
 * file twice goes through file_sink_cache instead.
 *
 * @throws std::system_error if the file cannot be opened
 */
inline std::shared_ptr<log_sink> make_file_sink(std::string_view filename,
                                                const file_options &options                    = {},
                                                std::shared_ptr<const log_formatter> formatter = nullptr)
{
    if (!formatter) formatter = make_text_formatter(false);
    std::string name(filename);
    return std::make_shared<writer_sink<file_writer>>(name, std::move(formatter), file_writer{name, options});
}

inline std::shared_ptr<log_sink> make_json_file_sink(std::string_view filename, const file_options &options = {})
{
    return make_file_sink(filename, options, make_json_formatter(false));
}

/**
 * @brief Sink accepting everything and writing nothing
 */
inline std::shared_ptr<log_sink> make_discard_sink()
{
    return std::make_shared<writer_sink<discard_writer>>("discard", make_text_formatter(false), discard_writer{});
}

} // namespace tierlog
