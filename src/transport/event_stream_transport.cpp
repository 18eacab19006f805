#include "transport/event_stream_transport.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

namespace toolhub::transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kAttachTimeout{5000};
constexpr std::chrono::milliseconds kStopPollInterval{200};

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

EventStreamTransport::EventStreamTransport(EventStreamOptions options,
                                           RequestTimeouts timeouts, LineSink sink)
    : Transport(timeouts), options_(std::move(options)), sink_(std::move(sink)) {
    listener_ = std::thread(&EventStreamTransport::listener_loop, this);
}

EventStreamTransport::~EventStreamTransport() {
    close();
}

bool EventStreamTransport::is_connected() const {
    return !closed_.load();
}

void EventStreamTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_ = true;
    }
    stop_cv_.notify_all();
    if (listener_.joinable()) {
        listener_.join();
    }
    correlator_.close(ToolhubError{ErrorCategory::Transport, "event-stream transport closed",
                                   "transport_closed"});
}

http_client::Headers EventStreamTransport::base_headers() const {
    http_client::Headers headers;
    headers["X-Client-Id"] = options_.client_id;
    if (options_.credential.has_value() && !options_.credential->empty()) {
        headers["Authorization"] = "Bearer " + *options_.credential;
    }
    return headers;
}

core::errors::Result<std::optional<json>> EventStreamTransport::send_message(
    const json& message, const std::chrono::milliseconds timeout) {
    auto posted = http_client::post_json(options_.base_url, options_.rpc_path, message.dump(),
                                         base_headers(), timeout);
    if (core::errors::is_error(posted)) {
        return core::errors::get_error(posted);
    }
    const auto& response = core::errors::get_value(posted);

    if (response.status == 202 || response.status == 204) {
        return std::optional<json>{};
    }
    if (response.status < 200 || response.status >= 300) {
        return ToolhubError{ErrorCategory::Transport,
                            "Provider answered HTTP " + std::to_string(response.status) +
                                (response.body.empty() ? "" : ": " + response.body),
                            "http_status"};
    }
    if (is_blank(response.body)) {
        return std::optional<json>{};
    }

    // Some providers answer a POST with a short event stream instead of JSON.
    if (response.content_type.rfind("text/event-stream", 0) == 0) {
        std::string pending = response.body + "\n";
        std::size_t start = 0;
        std::size_t newline = 0;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            handle_event_line(pending.substr(start, newline - start));
            start = newline + 1;
        }
        return std::optional<json>{};
    }

    auto parsed = protocol::json_rpc::parse_frame(response.body);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    json body = std::move(core::errors::get_value(parsed));
    if (protocol::json_rpc::is_response(body)) {
        return std::optional<json>{std::move(body)};
    }
    dispatch_incoming(body);
    return std::optional<json>{};
}

void EventStreamTransport::handle_event_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty() || line.front() == ':') {
        return;
    }
    if (sink_) {
        sink_(protocol::LogStream::Out, line);
    }
    if (line.rfind("data:", 0) != 0) {
        return;
    }

    std::string data = line.substr(5);
    if (!data.empty() && data.front() == ' ') {
        data.erase(0, 1);
    }
    auto parsed = protocol::json_rpc::parse_frame(data);
    if (core::errors::is_error(parsed)) {
        LOG_DEBUG("event-stream: ignoring non-JSON event data: " + data);
        return;
    }
    dispatch_incoming(core::errors::get_value(parsed));
}

bool EventStreamTransport::sleep_unless_stopped(const std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, delay, [this]() { return stop_.load(); });
}

void EventStreamTransport::listener_loop() {
    auto delay = options_.reconnect_initial;
    while (!stop_.load()) {
        const bool attached = consume_stream();
        if (stop_.load()) {
            break;
        }
        if (attached) {
            delay = options_.reconnect_initial;
        }
        LOG_WARN("event-stream: push channel to " + options_.base_url.to_string() +
                 " dropped, reconnecting in " + std::to_string(delay.count()) + " ms");
        if (!sleep_unless_stopped(delay)) {
            break;
        }
        delay = std::min(delay * 2, options_.reconnect_max);
    }
}

bool EventStreamTransport::consume_stream() {
    const auto& url = options_.base_url;
    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        LOG_DEBUG("event-stream: resolve failed: " + ec.message());
        return false;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(kAttachTimeout);
    stream.async_connect(endpoints, [&ec](const beast::error_code& result,
                                          const tcp::endpoint&) { ec = result; });
    ioc.run();
    if (ec) {
        LOG_DEBUG("event-stream: connect failed: " + ec.message());
        return false;
    }

    http::request<http::empty_body> req{http::verb::get,
                                        url.target(options_.event_path + options_.client_id),
                                        11};
    req.set(http::field::host, url.host + ":" + url.port);
    req.set(http::field::accept, "text/event-stream");
    req.set(http::field::cache_control, "no-cache");
    for (const auto& header : base_headers()) {
        req.set(header.first, header.second);
    }

    ioc.restart();
    http::async_write(stream, req,
                      [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    ioc.run();
    if (ec) {
        LOG_DEBUG("event-stream: request failed: " + ec.message());
        return false;
    }

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

    ioc.restart();
    http::async_read_header(stream, buffer, parser,
                            [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    ioc.run();
    if (ec) {
        LOG_DEBUG("event-stream: reading headers failed: " + ec.message());
        return false;
    }
    if (parser.get().result() != http::status::ok) {
        LOG_WARN("event-stream: push channel refused with HTTP " +
                 std::to_string(parser.get().result_int()));
        return false;
    }

    stream.expires_never();
    stream_attached_ = true;
    LOG_DEBUG("event-stream: push channel attached as " + options_.client_id);

    std::string pending;
    char chunk[4096];
    while (!stop_.load() && !parser.is_done()) {
        parser.get().body().data = chunk;
        parser.get().body().size = sizeof(chunk);

        bool done = false;
        ioc.restart();
        http::async_read_some(stream, buffer, parser,
                              [&ec, &done](const beast::error_code& result, std::size_t) {
                                  ec = result;
                                  done = true;
                              });
        while (!done) {
            ioc.run_for(kStopPollInterval);
            if (!done && stop_.load()) {
                stream.cancel();
            }
        }
        if (ec == http::error::need_buffer) {
            ec = {};
        }

        const std::size_t used = sizeof(chunk) - parser.get().body().size;
        pending.append(chunk, used);
        std::size_t start = 0;
        std::size_t newline = 0;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            handle_event_line(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);

        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_DEBUG("event-stream: push channel read failed: " + ec.message());
            }
            break;
        }
    }

    stream_attached_ = false;
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return true;
}

}  // namespace toolhub::transport
