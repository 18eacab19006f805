#include "fake_event_server.hpp"

#include <cstdint>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace toolhub::testing {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using nlohmann::json;

struct FakeEventServer::Stream {
    std::shared_ptr<tcp::socket> socket;
    std::mutex write_mutex;
};

namespace {

std::string header_value(const http::request<http::string_body>& req, const char* name) {
    const auto it = req.find(name);
    if (it == req.end()) {
        return "";
    }
    return std::string(it->value().data(), it->value().size());
}

void respond(tcp::socket& socket, const http::status status, const std::string& content_type,
             const std::string& body) {
    http::response<http::string_body> res{status, 11};
    res.set(http::field::content_type, content_type);
    res.set(http::field::connection, "close");
    res.body() = body;
    res.prepare_payload();
    beast::error_code ec;
    http::write(socket, res, ec);
}

}  // namespace

FakeEventServer::FakeEventServer(const Mode mode)
    : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)), mode_(mode) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread(&FakeEventServer::accept_loop, this);
}

FakeEventServer::~FakeEventServer() {
    stop_ = true;

    // Unblock accept() with a throwaway connection.
    {
        net::io_context ioc;
        tcp::socket poke(ioc);
        beast::error_code ec;
        poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    drop_streams();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& socket : held_) {
            beast::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::string FakeEventServer::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

void FakeEventServer::accept_loop() {
    while (!stop_.load()) {
        auto socket = std::make_shared<tcp::socket>(ioc_);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);
        if (ec || stop_.load()) {
            continue;
        }
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace_back(&FakeEventServer::handle_connection, this, socket);
    }
}

void FakeEventServer::handle_connection(std::shared_ptr<tcp::socket> socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;
    http::read(*socket, buffer, req, ec);
    if (ec) {
        return;
    }

    const std::string target(req.target().data(), req.target().size());
    if (req.method() == http::verb::get && target == "/health") {
        respond(*socket, healthy_ ? http::status::ok : http::status::service_unavailable,
                "text/plain", healthy_ ? "ok" : "down");
        return;
    }

    if (req.method() == http::verb::get && target.rfind("/sse/", 0) == 0) {
        serve_stream(socket, target.substr(5));
        return;
    }

    if (req.method() != http::verb::post || target != "/jsonrpc") {
        respond(*socket, http::status::not_found, "text/plain", "not found");
        return;
    }

    const std::string client_id = header_value(req, "X-Client-Id");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_authorization_ = header_value(req, "Authorization");
        last_client_id_ = client_id;
    }

    const Mode mode = mode_.load();
    if (mode == Mode::Hang) {
        hold(socket);
        return;
    }
    if (mode == Mode::Refuse) {
        respond(*socket, http::status::internal_server_error, "text/plain", "refused");
        return;
    }

    const json request = json::parse(req.body(), nullptr, false);
    if (request.is_discarded() || !request.is_object() || !request.contains("id")) {
        respond(*socket, http::status::accepted, "text/plain", "");
        return;
    }

    json reply = answer(request);
    if (mode == Mode::WrongId) {
        reply["id"] = request["id"].is_number_integer()
                          ? json(request["id"].get<std::int64_t>() + 1000)
                          : json("other");
        respond(*socket, http::status::ok, "application/json", reply.dump());
        return;
    }
    if (mode == Mode::Sync) {
        respond(*socket, http::status::ok, "application/json", reply.dump());
        return;
    }

    respond(*socket, http::status::accepted, "text/plain", "");
    if (mode == Mode::Push) {
        // The channel may still be attaching right after the handshake.
        for (int attempt = 0; attempt < 50 && !push(client_id, reply); ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

void FakeEventServer::serve_stream(std::shared_ptr<tcp::socket> socket,
                                   const std::string& client_id) {
    const std::string header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n\r\n"
        ": attached\n\n";
    beast::error_code ec;
    net::write(*socket, net::buffer(header), ec);
    if (ec) {
        return;
    }

    auto stream = std::make_shared<Stream>();
    stream->socket = socket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams_[client_id] = stream;
    }
    ++streams_opened_;
    streams_cv_.notify_all();

    // Hold the channel until the client goes away or we drop it.
    char scratch[256];
    while (!stop_.load()) {
        socket->read_some(net::buffer(scratch), ec);
        if (ec) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = streams_.find(client_id);
    if (it != streams_.end() && it->second == stream) {
        streams_.erase(it);
    }
}

void FakeEventServer::hold(std::shared_ptr<tcp::socket> socket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load()) {
            return;
        }
        held_.push_back(socket);
    }
    char scratch[256];
    beast::error_code ec;
    while (!stop_.load()) {
        socket->read_some(net::buffer(scratch), ec);
        if (ec) {
            break;
        }
    }
}

bool FakeEventServer::push(const std::string& client_id, const json& message) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = streams_.find(client_id);
        if (it == streams_.end()) {
            return false;
        }
        stream = it->second;
    }
    const std::string event = "event: message\ndata: " + message.dump() + "\n\n";
    std::lock_guard<std::mutex> lock(stream->write_mutex);
    beast::error_code ec;
    net::write(*stream->socket, net::buffer(event), ec);
    return !ec;
}

void FakeEventServer::drop_streams() {
    std::map<std::string, std::shared_ptr<Stream>> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams.swap(streams_);
    }
    for (auto& item : streams) {
        std::lock_guard<std::mutex> lock(item.second->write_mutex);
        beast::error_code ec;
        item.second->socket->shutdown(tcp::socket::shutdown_both, ec);
    }
}

bool FakeEventServer::wait_for_streams(const int count, const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return streams_cv_.wait_for(lock, timeout,
                                [this, count]() { return streams_opened_.load() >= count; });
}

std::string FakeEventServer::last_authorization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_authorization_;
}

std::string FakeEventServer::last_client_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_client_id_;
}

json FakeEventServer::answer(const json& request) const {
    const json id = request["id"];
    const std::string method = request.value("method", "");
    const json params = request.value("params", json::object());
    auto result = [&id](const json& value) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", value}};
    };

    if (method == "initialize") {
        return result({{"protocolVersion", "2024-11-05"},
                       {"serverInfo", {{"name", "fake-event-server"}, {"version", "0.2.0"}}},
                       {"capabilities", {{"tools", json::object()}}}});
    }
    if (method == "listTools") {
        return result({{"tools",
                        {{{"name", "echo"},
                          {"description", "Echo text back"},
                          {"inputSchema",
                           {{"type", "object"},
                            {"properties", {{"text", {{"type", "string"}}}}}}}}}}});
    }
    if (method == "callTool" && params.value("name", "") == "echo") {
        const std::string text = params.value("arguments", json::object()).value("text", "");
        return result({{"content", {{{"type", "text"}, {"text", text}}}}});
    }
    if (method == "shutdown") {
        return result(json::object());
    }
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", -32601}, {"message", "Method not found: " + method}}}};
}

}  // namespace toolhub::testing
