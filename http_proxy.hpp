#pragma once

#include "blocking_queue.hpp"

#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace live_proxy {

using tcp = boost::asio::ip::tcp;

// HTTP reverse proxy in front of a single backend.
//
// Every request is forwarded with its path and query unchanged. Responses
// come back untouched, except that with auto_reload on, text/html bodies
// get the reload script injected and their Content-Length corrected.
// A backend that cannot be reached yields a 502 text/plain page.
class ProxyServer {
public:
    struct Config {
        tcp::endpoint listen;
        tcp::endpoint backend;
        bool auto_reload = true;
        unsigned short ws_port = 0;                 // port the injected script connects to
        std::chrono::seconds upstream_timeout{30};  // per connect / write / read
    };

    explicit ProxyServer(Config cfg);
    ~ProxyServer();

    // Binds and starts serving on a background thread. Returns false if the
    // listener cannot be set up. Errors escaping the event loop later on are
    // pushed to `errors` when given.
    bool start(ErrorChannel* errors = nullptr);
    void stop();

    // Bound port, useful when Config::listen asked for port 0.
    unsigned short port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::thread io_thread_;
};

} // namespace live_proxy
