#include "reload_server.hpp"
#include "endpoint.hpp"
#include "log.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <iostream>

namespace live_proxy {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

using Clock = std::chrono::steady_clock;

// ---------------------------- ConnectionRegistry -----------------------------
void ConnectionRegistry::insert(std::unique_ptr<Connection> conn) {
    std::lock_guard<std::mutex> lk(mx_);
    connections_.push_back(std::move(conn));
}

std::size_t ConnectionRegistry::close_all() {
    std::lock_guard<std::mutex> lk(mx_);
    const std::size_t n = connections_.size();
    for (auto& conn : connections_) {
        // An abrupt close, no close frame: the script treats any close as
        // the reload signal.
        beast::error_code ec;
        auto& sock = conn->next_layer();
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
        if (ec && verbose()) std::cerr << "[reload] close: " << ec.message() << std::endl;
    }
    connections_.clear();
    return n;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mx_);
    return connections_.size();
}

// ---------------------------- availability poll ------------------------------
namespace {

bool try_connect(const tcp::endpoint& target, std::chrono::milliseconds timeout) {
    net::io_context ioc;
    tcp::socket sock(ioc);
    beast::error_code result = net::error::would_block;

    sock.async_connect(target, [&](beast::error_code ec) { result = ec; });
    ioc.run_for(timeout);
    if (!ioc.stopped()) {
        // Still connecting: abort and let the handler run.
        beast::error_code ignored;
        sock.close(ignored);
        ioc.run();
    }
    return !result;
}

} // namespace

bool wait_until_reachable(const tcp::endpoint& target,
                          std::chrono::milliseconds period,
                          std::chrono::milliseconds timeout) {
    const auto start = Clock::now();

    while (Clock::now() - start < timeout) {
        const auto before_connect = Clock::now();
        if (try_connect(target, period)) return true;
        std::this_thread::sleep_until(before_connect + period);
    }
    return false;
}

// ---------------------------- ReloadSignalServer -----------------------------
ReloadSignalServer::ReloadSignalServer(Config cfg) : cfg_(std::move(cfg)) {}

ReloadSignalServer::~ReloadSignalServer() { stop(); }

bool ReloadSignalServer::start(ErrorChannel* errors) {
    if (running_.exchange(true)) return true;

    beast::error_code ec;
    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);

    acceptor_->open(cfg_.listen.protocol(), ec);
    if (ec) { std::cerr << "[reload] acceptor open: " << ec.message() << "\n"; running_ = false; return false; }

    acceptor_->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) { std::cerr << "[reload] set_option: " << ec.message() << "\n"; running_ = false; return false; }

    acceptor_->bind(cfg_.listen, ec);
    if (ec) {
        std::cerr << "[reload] bind " << to_string(cfg_.listen) << ": " << ec.message() << "\n";
        running_ = false;
        return false;
    }

    acceptor_->listen(net::socket_base::max_listen_connections, ec);
    if (ec) { std::cerr << "[reload] listen: " << ec.message() << "\n"; running_ = false; return false; }

    do_accept();

    std::cout << "[reload] listening on ws://" << to_string(acceptor_->local_endpoint()) << std::endl;

    accept_thread_ = std::thread([this, errors]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            std::cerr << "[reload] accept loop failed: " << e.what() << std::endl;
            if (errors) errors->push(std::current_exception());
        }
    });

    refresh_thread_ = std::thread([this, errors]() {
        try {
            refresh_loop();
        } catch (const std::exception& e) {
            std::cerr << "[reload] refresh loop failed: " << e.what() << std::endl;
            if (errors) errors->push(std::current_exception());
        }
    });

    return true;
}

void ReloadSignalServer::stop() {
    if (!running_.exchange(false)) return;

    refresh_.close();
    beast::error_code ec;
    if (acceptor_) {
        acceptor_->cancel(ec);
        acceptor_->close(ec);
    }
    ioc_.stop();

    if (accept_thread_.joinable()) accept_thread_.join();
    if (refresh_thread_.joinable()) refresh_thread_.join();
    registry_.close_all();
}

void ReloadSignalServer::trigger_refresh() {
    refresh_.push(RefreshEvent{});
}

unsigned short ReloadSignalServer::port() const {
    if (!acceptor_ || !acceptor_->is_open()) return 0;
    beast::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void ReloadSignalServer::do_accept() {
    acceptor_->async_accept(
        [this](beast::error_code ec, tcp::socket socket) { on_accept(ec, std::move(socket)); });
}

void ReloadSignalServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (!running_.load()) return;

    if (ec) {
        std::cerr << "[reload] accept: " << ec.message() << std::endl;
    } else {
        // The handshake runs to completion before the next accept.
        auto ws = std::make_unique<ConnectionRegistry::Connection>(std::move(socket));
        ws->accept(ec);
        if (ec) {
            std::cerr << "[reload] WARNING: websocket handshake failed: " << ec.message() << std::endl;
        } else {
            if (verbose()) std::cout << "[reload] client connected" << std::endl;
            registry_.insert(std::move(ws));
        }
    }
    do_accept();
}

void ReloadSignalServer::refresh_loop() {
    while (auto event = refresh_.pop()) {
        if (cfg_.backend && !wait_until_reachable(*cfg_.backend, cfg_.poll_period, cfg_.poll_timeout)) {
            std::cerr << "[reload] WARNING: backend " << to_string(*cfg_.backend)
                      << " still unreachable after " << cfg_.poll_timeout.count()
                      << "ms, reloading anyway" << std::endl;
        }

        std::size_t n = registry_.close_all();
        if (verbose()) std::cout << "[reload] reload signal sent to " << n << " client(s)" << std::endl;
        ++refreshes_;
    }
}

} // namespace live_proxy
