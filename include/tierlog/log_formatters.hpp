/**
 * @file log_formatters.hpp
 * @brief Log record formatting implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <ctime>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <streambuf>
#include <string>
#include <iterator>
#include <unistd.h>
#include <tao/json/events/to_stream.hpp>
#include <tao/json/events/to_pretty_stream.hpp>

#include "fmt_config.hpp" // IWYU pragma: keep
#include <fmt/chrono.h>

#include "log_types.hpp"
#include "log_record.hpp"

namespace tierlog
{

namespace detail
{

inline void split_time(std::chrono::system_clock::time_point tp, std::time_t &seconds, long &nanos)
{
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    seconds = static_cast<std::time_t>(ns / 1000000000);
    nanos   = static_cast<long>(ns % 1000000000);
    if (nanos < 0)
    {
        nanos += 1000000000;
        seconds -= 1;
    }
}

/**
 * @brief RFC 3339 UTC timestamp with nanoseconds, e.g. "2025-08-02T08:24:22.000000123Z"
 */
inline std::string rfc3339_utc(std::chrono::system_clock::time_point tp)
{
    std::time_t seconds;
    long nanos;
    split_time(tp, seconds, nanos);

    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:09d}Z", tm, nanos);
}

} // namespace detail

/**
 * @brief Human readable single line formatter
 *
 * Layout (brackets mark optional parts):
 * @code
 * 2025-08-02 08:24:22.123 +02:00 [pid ]INFO [module] [file:line]: message
 * @endcode
 * With use_color the part after the timestamp is wrapped in the level's
 * ANSI color.
 */
class text_formatter final : public log_formatter
{
  public:
    bool use_color   = false;
    bool show_pid    = true;
    bool show_source = true;
    bool utc         = false;

    void format(int, record &rec, fmt::memory_buffer &out) const override
    {
        auto it = std::back_inserter(out);

        std::time_t seconds;
        long nanos;
        detail::split_time(rec.time(), seconds, nanos);

        std::tm tm{};
        if (utc) { gmtime_r(&seconds, &tm); }
        else { localtime_r(&seconds, &tm); }

        long offset_min = utc ? 0 : tm.tm_gmtoff / 60;
        char sign       = offset_min < 0 ? '-' : '+';
        if (offset_min < 0) offset_min = -offset_min;
        fmt::format_to(it, "{:%Y-%m-%d %H:%M:%S}.{:03d} {}{:02d}:{:02d}", tm, nanos / 1000000, sign, offset_min / 60,
                       offset_min % 60);

        bool colored = use_color && is_valid_level(rec.level());
        if (colored) { fmt::format_to(it, "{}", log_level_colors[static_cast<size_t>(rec.level())]); }

        if (show_pid) { fmt::format_to(it, " {}", static_cast<long>(::getpid())); }

        const char *level_name = is_valid_level(rec.level()) ? log_level_short_names[static_cast<size_t>(rec.level())] : "????";
        fmt::format_to(it, " {} [{}]", level_name, rec.module());

        if (show_source && rec.line() > 0) { fmt::format_to(it, " {}:{}", rec.file(), rec.line()); }

        fmt::format_to(it, ": {}", rec.message());

        if (colored) { fmt::format_to(it, "{}", LOG_COLOR_RESET); }
    }
};

/**
 * @brief JSON formatter using taocpp/json library
 *
 * Renders the record_data projection of a record as one JSON object:
 * @code
 * {"id":42,"time":"2025-08-02T08:24:22.000000123Z","module":"svc.api","level":"ERROR","message":"..."}
 * @endcode
 * Producing the object finalizes the record's message.
 */
class json_formatter final : public log_formatter
{
  private:
    /**
     * @brief Custom streambuf that appends directly to an fmt memory buffer
     *
     * Lets taocpp/json's stream based consumers write into the buffer the
     * record caches from, without an intermediate std::string.
     */
    class memory_buffer_streambuf : public std::streambuf
    {
      private:
        fmt::memory_buffer &out_;

      public:
        explicit memory_buffer_streambuf(fmt::memory_buffer &out) : out_(out) {}

      protected:
        int_type overflow(int_type ch) override
        {
            if (ch != traits_type::eof()) { out_.push_back(static_cast<char>(ch)); }
            return ch;
        }

        std::streamsize xsputn(const char *s, std::streamsize n) override
        {
            out_.append(s, s + n);
            return n;
        }
    };

  public:
    bool pretty_print = false;

    /**
     * @brief Produce JSON events for a record_data
     *
     * Follows taocpp/json's producer pattern so the same code serves every
     * consumer (compact, pretty, value builders).
     */
    template <typename Consumer> static void produce(Consumer &c, const record_data &data)
    {
        c.begin_object();

        c.key("id");
        c.number(static_cast<std::uint64_t>(data.id));
        c.member();

        c.key("time");
        c.string(detail::rfc3339_utc(data.time));
        c.member();

        c.key("module");
        c.string(data.module);
        c.member();

        c.key("level");
        c.string(string_from_log_level(data.level));
        c.member();

        c.key("message");
        c.string(data.message);
        c.member();

        c.end_object();
    }

    /**
     * @brief Render a record_data as a JSON document
     */
    static void write(const record_data &data, fmt::memory_buffer &out, bool pretty = false)
    {
        memory_buffer_streambuf streambuf(out);
        std::ostream stream(&streambuf);

        if (pretty)
        {
            tao::json::events::to_pretty_stream consumer(stream, 2);
            produce(consumer, data);
        }
        else
        {
            tao::json::events::to_stream consumer(stream);
            produce(consumer, data);
        }
        stream.flush();
    }

    static std::string to_json(const record_data &data, bool pretty = false)
    {
        fmt::memory_buffer buf;
        write(data, buf, pretty);
        return fmt::to_string(buf);
    }

    void format(int, record &rec, fmt::memory_buffer &out) const override { write(rec.data(), out, pretty_print); }
};

} // namespace tierlog
