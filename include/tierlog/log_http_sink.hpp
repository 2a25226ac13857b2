/**
 * @file log_http_sink.hpp
 * @brief Sink posting records to an HTTP endpoint
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Each delivery is one HTTP/1.1 request on a fresh connection:
 * - POST (default): the record as JSON (or the formatted line) in the body,
 *   Content-Type application/json
 * - GET (http_get): the same text URL encoded in the `message` query
 *   parameter
 *
 * print() sends the space joined arguments, as the `string` parameter for
 * GET or as the body of a POST carrying `string=true` in its query.
 *
 * Only transport problems (resolve, connect, send, receive, timeout) count
 * as failures; the response status is not inspected. Plain http only.
 *
 * The transport is asio: every request runs on a private io_context with a
 * steady_timer bounding the whole exchange.
 */
#pragma once

#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_version.hpp"
#include "log_error.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"
#include "log_formatters.hpp"
#include "log_sinks.hpp"
#include "log_async_sink.hpp"

namespace tierlog
{

struct http_options
{
    std::chrono::seconds timeout = DEFAULT_HTTP_TIMEOUT; ///< Applied to connect, send and receive
    bool http_get                = false;                ///< Send as GET query parameter instead of POST body
    bool formatted               = false;                ///< Send the formatted line instead of JSON
    bool async                   = false;                ///< Deliver from the task pool
};

/**
 * @brief Parsed http:// URL
 */
struct http_url
{
    std::string host;
    std::string port = "80";
    std::string path = "/";
    std::string query; ///< Without the leading '?'

    /**
     * @throws std::invalid_argument for anything but a well formed http URL
     */
    static http_url parse(std::string_view text)
    {
        auto lower_prefix = [&](std::string_view prefix)
        {
            if (text.size() < prefix.size()) return false;
            for (size_t i = 0; i < prefix.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) return false;
            }
            return true;
        };

        if (lower_prefix("https:"))
        {
            throw std::invalid_argument(fmt::format("https is not supported for log destinations: {}", text));
        }
        if (!lower_prefix("http://")) { throw std::invalid_argument(fmt::format("not an http URL: {}", text)); }

        http_url url;
        std::string_view rest = text.substr(7);

        auto fragment = rest.find('#');
        if (fragment != std::string_view::npos) rest = rest.substr(0, fragment);

        auto path_start       = rest.find_first_of("/?");
        std::string_view auth = rest.substr(0, path_start);
        if (auth.find('@') != std::string_view::npos)
        {
            throw std::invalid_argument(fmt::format("credentials in log URLs are not supported: {}", text));
        }

        if (!auth.empty() && auth.front() == '[')
        {
            auto close = auth.find(']');
            if (close == std::string_view::npos) throw std::invalid_argument(fmt::format("bad IPv6 host in URL: {}", text));
            url.host = std::string(auth.substr(1, close - 1));
            auth     = auth.substr(close + 1);
            if (!auth.empty() && auth.front() != ':') throw std::invalid_argument(fmt::format("bad URL: {}", text));
            if (!auth.empty()) url.port = std::string(auth.substr(1));
        }
        else
        {
            auto colon = auth.rfind(':');
            url.host   = std::string(auth.substr(0, colon));
            if (colon != std::string_view::npos) url.port = std::string(auth.substr(colon + 1));
        }

        if (url.host.empty()) throw std::invalid_argument(fmt::format("URL has no host: {}", text));
        if (url.port.empty() || url.port.find_first_not_of("0123456789") != std::string::npos)
        {
            throw std::invalid_argument(fmt::format("bad port in URL: {}", text));
        }

        if (path_start != std::string_view::npos)
        {
            std::string_view tail = rest.substr(path_start);
            auto q                = tail.find('?');
            std::string_view path = tail.substr(0, q);
            if (!path.empty()) url.path = std::string(path);
            if (q != std::string_view::npos) url.query = std::string(tail.substr(q + 1));
        }
        return url;
    }

    /**
     * @brief Request target with @p extra appended to the query
     */
    std::string target(std::string_view extra = {}) const
    {
        std::string result = path;
        if (query.empty() && extra.empty()) return result;
        result += '?';
        result += query;
        if (!query.empty() && !extra.empty()) result += '&';
        result += extra;
        return result;
    }

    std::string host_header() const
    {
        bool ipv6        = host.find(':') != std::string::npos;
        std::string name = ipv6 ? "[" + host + "]" : host;
        return port == "80" ? name : name + ":" + port;
    }

    std::string to_string() const { return "http://" + host_header() + target(); }
};

namespace detail
{

/**
 * @brief Percent-encode for a query parameter value (RFC 3986 unreserved kept)
 */
inline std::string url_encode(std::string_view text)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') { out.push_back(static_cast<char>(c)); }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

/**
 * @brief One request/response exchange on its own io_context
 *
 * Resolve, connect, write and read run as a chain of asynchronous steps
 * under a single deadline timer. When the timer fires first it cancels the
 * resolver and closes the socket, and the step in flight reports timed_out.
 */
class http_exchange
{
  public:
    http_exchange(const http_url &url, std::chrono::milliseconds timeout)
    : url_(url), resolver_(io_), socket_(io_), deadline_(io_, timeout)
    {
    }

    http_exchange(const http_exchange &)            = delete;
    http_exchange &operator=(const http_exchange &) = delete;

    /**
     * @brief Send @p request and read the response head; the status itself is not judged
     */
    log_error run(std::string request)
    {
        request_ = std::move(request);

        deadline_.async_wait(
            [this](const std::error_code &ec)
            {
                if (!ec) expire();
            });
        resolver_.async_resolve(url_.host, url_.port,
                                [this](const std::error_code &error, asio::ip::tcp::resolver::results_type endpoints)
                                { on_resolve(error, std::move(endpoints)); });
        io_.run();
        return std::move(result_);
    }

  private:
    void on_resolve(const std::error_code &ec, asio::ip::tcp::resolver::results_type endpoints)
    {
        if (ec) return fail(ec, "resolve");
        // Stop walking the address list once the deadline has passed
        asio::async_connect(
            socket_, endpoints, [this](const std::error_code &, const asio::ip::tcp::endpoint &) { return !timed_out_; },
            [this](const std::error_code &error, const asio::ip::tcp::endpoint &) { on_connect(error); });
    }

    void on_connect(const std::error_code &ec)
    {
        if (ec) return fail(ec, "connect");
        asio::async_write(socket_, asio::buffer(request_),
                          [this](const std::error_code &error, size_t) { on_write(error); });
    }

    void on_write(const std::error_code &ec)
    {
        if (ec) return fail(ec, "send");
        asio::async_read_until(socket_, asio::dynamic_buffer(response_, HTTP_RESPONSE_MAX), "\r\n\r\n",
                               [this](const std::error_code &error, size_t) { on_read(error); });
    }

    void on_read(const std::error_code &ec)
    {
        // eof and a full buffer still leave a response head worth checking
        if (ec && ec != asio::error::eof && ec != asio::error::not_found) return fail(ec, "receive");

        if (response_.compare(0, 5, "HTTP/") != 0)
        {
            return finish(log_error(std::make_error_code(std::errc::protocol_error),
                                    fmt::format("malformed HTTP response from {}:{}", url_.host, url_.port)));
        }
        finish({});
    }

    void fail(const std::error_code &ec, std::string_view step)
    {
        if (timed_out_)
        {
            return finish(log_error(std::make_error_code(std::errc::timed_out),
                                    fmt::format("{} {}:{} timed out", step, url_.host, url_.port)));
        }
        finish(log_error(ec, fmt::format("{} {}:{}: {}", step, url_.host, url_.port, ec.message())));
    }

    void finish(log_error result)
    {
        result_ = std::move(result);
        deadline_.cancel();
        std::error_code ignored;
        socket_.close(ignored);
    }

    void expire()
    {
        timed_out_ = true;
        resolver_.cancel();
        std::error_code ignored;
        socket_.close(ignored);
    }

    const http_url &url_;
    asio::io_context io_;
    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_;
    std::string request_;
    std::string response_;
    log_error result_;
    bool timed_out_ = false;
};

} // namespace detail

class http_sink final : public log_sink
{
  public:
    http_sink(http_url url, http_options options, std::shared_ptr<const log_formatter> formatter = nullptr)
    : log_sink("http:" + url.to_string()),
      url_(std::move(url)),
      options_(options),
      formatter_(formatter ? std::move(formatter) : make_text_formatter(false))
    {
    }

    log_error log(log_level, int calldepth, record &rec) override
    {
        std::string body =
            options_.formatted ? rec.formatted(calldepth + 1, *formatter_) : json_formatter::to_json(rec.data());

        if (options_.http_get) return request("GET", url_.target("message=" + detail::url_encode(body)), {});
        return request("POST", url_.target(), body);
    }

    log_error print(const arg_list &args) override
    {
        auto text = join_args(args);
        if (options_.http_get) return request("GET", url_.target("string=" + detail::url_encode(text)), {});
        return request("POST", url_.target("string=true"), text);
    }

    const http_url &url() const noexcept { return url_; }
    const http_options &options() const noexcept { return options_; }

  private:
    log_error request(std::string_view method, const std::string &target, std::string_view body) const
    {
        auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout);

        std::string req = fmt::format("{} {} HTTP/1.1\r\n"
                                      "Host: {}\r\n"
                                      "User-Agent: tierlog/{}\r\n"
                                      "Connection: close\r\n",
                                      method, target, url_.host_header(), VERSION);
        if (method == "POST")
        {
            req += fmt::format("Content-Type: application/json\r\nContent-Length: {}\r\n", body.size());
        }
        req += "\r\n";
        req.append(body.data(), body.size());

        detail::http_exchange exchange(url_, timeout);
        return exchange.run(std::move(req));
    }

    http_url url_;
    http_options options_;
    std::shared_ptr<const log_formatter> formatter_;
};

/**
 * @brief HTTP sink behind the sync/async wrapper
 * @throws std::invalid_argument for a malformed or non-http URL
 */
inline std::shared_ptr<async_sink> make_http_sink(std::string_view url,
                                                  const http_options &options,
                                                  const sink_services &services)
{
    auto inner = std::make_shared<http_sink>(http_url::parse(url), options, services.formatter);
    auto name  = inner->name();
    return make_async_sink(std::move(name), std::move(inner), options.async, services);
}

} // namespace tierlog
