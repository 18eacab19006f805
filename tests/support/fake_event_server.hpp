#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

namespace toolhub::testing {

// Minimal provider speaking the event-stream transport on 127.0.0.1 with an
// ephemeral port. One thread per connection; good enough for tests.
class FakeEventServer {
public:
    enum class Mode {
        Sync,    // replies in the POST body
        Push,    // 202 on POST, reply on the push channel
        Silent,  // 202 on POST, never replies
        Refuse,  // 500 on POST
        Hang,    // accepts the POST and never sends a status line
        WrongId  // replies in the POST body under another request id
    };

    explicit FakeEventServer(Mode mode = Mode::Sync);
    ~FakeEventServer();

    FakeEventServer(const FakeEventServer&) = delete;
    FakeEventServer& operator=(const FakeEventServer&) = delete;

    unsigned short port() const { return port_; }
    std::string base_url() const;

    void set_mode(Mode mode) { mode_ = mode; }
    void set_healthy(bool healthy) { healthy_ = healthy; }

    // Blocks until `count` push channels have been opened in total.
    bool wait_for_streams(int count, std::chrono::milliseconds timeout);
    int streams_opened() const { return streams_opened_.load(); }

    // Closes every open push channel; clients are expected to reconnect.
    void drop_streams();

    std::string last_authorization() const;
    std::string last_client_id() const;

private:
    struct Stream;

    void accept_loop();
    void handle_connection(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    void serve_stream(std::shared_ptr<boost::asio::ip::tcp::socket> socket,
                      const std::string& client_id);
    void hold(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    bool push(const std::string& client_id, const nlohmann::json& message);
    nlohmann::json answer(const nlohmann::json& request) const;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<Mode> mode_;
    std::atomic_bool healthy_{true};
    std::atomic_bool stop_{false};
    std::atomic_int streams_opened_{0};

    mutable std::mutex mutex_;
    std::condition_variable streams_cv_;
    std::map<std::string, std::shared_ptr<Stream>> streams_;
    std::vector<std::shared_ptr<boost::asio::ip::tcp::socket>> held_;
    std::string last_authorization_;
    std::string last_client_id_;

    std::thread accept_thread_;
    std::mutex workers_mutex_;
    std::vector<std::thread> workers_;
};

}  // namespace toolhub::testing
