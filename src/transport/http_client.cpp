#include "transport/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace toolhub::transport::http_client {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using core::errors::ErrorCategory;
using core::errors::ToolhubError;

namespace {

ToolhubError io_error(const Url& url, const std::string& step, const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return ToolhubError{ErrorCategory::RequestTimeout,
                            "HTTP " + step + " to " + url.to_string() + " timed out",
                            "http_timeout"};
    }
    return ToolhubError{ErrorCategory::Transport,
                        "HTTP " + step + " to " + url.to_string() + " failed: " + ec.message(),
                        step == "connect" ? "connection_failed" : "http_io_failed"};
}

core::errors::Result<Response> perform(const Url& url, http::request<http::string_body> req,
                                       const std::chrono::milliseconds timeout) {
    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return io_error(url, "connect", ec);
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(timeout);

    stream.async_connect(endpoints, [&ec](const beast::error_code& result,
                                          const tcp::endpoint&) { ec = result; });
    ioc.run();
    if (ec) {
        return io_error(url, "connect", ec);
    }

    ioc.restart();
    http::async_write(stream, req,
                      [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    ioc.run();
    if (ec) {
        return io_error(url, "write", ec);
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ioc.restart();
    http::async_read(stream, buffer, res,
                     [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    ioc.run();
    if (ec) {
        return io_error(url, "read", ec);
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    Response response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    const auto content_type = res.find(http::field::content_type);
    if (content_type != res.end()) {
        const auto value = content_type->value();
        response.content_type = std::string(value.data(), value.size());
    }
    return response;
}

http::request<http::string_body> make_request(const http::verb verb, const Url& url,
                                              const std::string& path,
                                              const Headers& headers) {
    http::request<http::string_body> req{verb, url.target(path), 11};
    req.set(http::field::host, url.host + ":" + url.port);
    req.set(http::field::user_agent, "toolhub");
    req.set(http::field::connection, "close");
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    return req;
}

}  // namespace

std::string Url::target(const std::string& path) const {
    if (path.empty()) {
        return base_path.empty() ? "/" : base_path;
    }
    if (path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

std::string Url::to_string() const {
    return scheme + "://" + host + ":" + port + base_path;
}

core::errors::Result<Url> parse_url(const std::string& text) {
    Url url;
    std::size_t pos = 0;
    const auto scheme_end = text.find("://");
    if (scheme_end != std::string::npos) {
        url.scheme = text.substr(0, scheme_end);
        pos = scheme_end + 3;
    }
    if (url.scheme != "http") {
        return ToolhubError{ErrorCategory::Configuration,
                            "Unsupported URL scheme '" + url.scheme + "' in " + text,
                            "unsupported_url_scheme", "Only http:// provider URLs are supported."};
    }

    const auto slash = text.find('/', pos);
    const std::string host_port =
        slash == std::string::npos ? text.substr(pos) : text.substr(pos, slash - pos);
    if (slash != std::string::npos) {
        url.base_path = text.substr(slash);
        while (!url.base_path.empty() && url.base_path.back() == '/') {
            url.base_path.pop_back();
        }
    }

    const auto colon = host_port.rfind(':');
    if (colon == std::string::npos) {
        url.host = host_port;
    } else {
        url.host = host_port.substr(0, colon);
        url.port = host_port.substr(colon + 1);
    }

    if (url.host.empty()) {
        return ToolhubError{ErrorCategory::Configuration, "URL has no host: " + text,
                            "invalid_url"};
    }
    if (url.port.empty() ||
        url.port.find_first_not_of("0123456789") != std::string::npos) {
        return ToolhubError{ErrorCategory::Configuration, "URL has an invalid port: " + text,
                            "invalid_url"};
    }
    return url;
}

core::errors::Result<Response> post_json(const Url& url, const std::string& path,
                                         const std::string& body, const Headers& headers,
                                         const std::chrono::milliseconds timeout) {
    auto req = make_request(http::verb::post, url, path, headers);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json, text/event-stream");
    req.body() = body;
    req.prepare_payload();
    return perform(url, std::move(req), timeout);
}

core::errors::Result<Response> get(const Url& url, const std::string& path,
                                   const Headers& headers,
                                   const std::chrono::milliseconds timeout) {
    auto req = make_request(http::verb::get, url, path, headers);
    return perform(url, std::move(req), timeout);
}

}  // namespace toolhub::transport::http_client
