#pragma once

#include "blocking_queue.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace live_proxy {

using tcp = boost::asio::ip::tcp;

// Open reload connections. Only membership is tracked: connections are
// added one at a time and dropped all at once. Nothing reads from them, so
// a tab closed by the user stays registered until the next refresh closes
// its dead socket.
class ConnectionRegistry {
public:
    using Connection = boost::beast::websocket::stream<tcp::socket>;

    void insert(std::unique_ptr<Connection> conn);

    // Removes and closes every connection in one critical section, so a
    // connection inserted concurrently is either closed now or kept for the
    // next round. Returns how many were closed.
    std::size_t close_all();

    std::size_t size() const;

private:
    mutable std::mutex mx_;
    std::vector<std::unique_ptr<Connection>> connections_;
};

// Tries to TCP-connect to `target` every `period` until it succeeds or
// `timeout` has elapsed. Returns whether the target became reachable.
bool wait_until_reachable(const tcp::endpoint& target,
                          std::chrono::milliseconds period = std::chrono::milliseconds(20),
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

// Accepts WebSocket connections from injected reload scripts and drops all
// of them whenever a refresh event arrives. The browser side reloads the
// page when its connection goes away.
class ReloadSignalServer {
public:
    struct Config {
        tcp::endpoint listen;
        // When set, a refresh first waits for the backend to accept
        // connections again.
        std::optional<tcp::endpoint> backend;
        std::chrono::milliseconds poll_period{20};
        std::chrono::milliseconds poll_timeout{3000};
    };

    explicit ReloadSignalServer(Config cfg);
    ~ReloadSignalServer();

    bool start(ErrorChannel* errors = nullptr);
    void stop();

    // Queue a refresh. Events are handled one at a time in arrival order.
    void trigger_refresh();
    BlockingQueue<RefreshEvent>& refresh_events() { return refresh_; }

    unsigned short port() const;
    const ConnectionRegistry& registry() const { return registry_; }

    // Number of refresh events fully handled so far.
    std::size_t refresh_count() const { return refreshes_.load(); }

private:
    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void refresh_loop();

    Config cfg_;
    BlockingQueue<RefreshEvent> refresh_;
    ConnectionRegistry registry_;

    boost::asio::io_context ioc_{1};
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::thread accept_thread_;
    std::thread refresh_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> refreshes_{0};
};

} // namespace live_proxy
