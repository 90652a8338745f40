#include "http_proxy.hpp"
#include "endpoint.hpp"
#include "html_inject.hpp"
#include "log.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <iostream>
#include <limits>
#include <optional>

namespace live_proxy {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

constexpr auto kClientTimeout = std::chrono::seconds(60);

using Response = http::response<http::string_body>;

bool is_html(const Response& res) {
    auto it = res.find(http::field::content_type);
    return it != res.end() && it->value().starts_with("text/html");
}

bool is_encoded(const Response& res) {
    auto it = res.find(http::field::content_encoding);
    return it != res.end() && !beast::iequals(it->value(), "identity");
}

bool may_have_body(http::status status) {
    auto code = static_cast<unsigned>(status);
    return code >= 200 && code != 204 && code != 304;
}

// One client connection. Requests on it are forwarded over a single
// upstream connection that is kept open as long as the backend allows.
class ProxySession : public std::enable_shared_from_this<ProxySession> {
public:
    ProxySession(tcp::socket&& socket, std::shared_ptr<const ProxyServer::Config> cfg)
        : client_(std::move(socket)), upstream_(client_.get_executor()), cfg_(std::move(cfg)) {}

    void run() {
        net::dispatch(client_.get_executor(),
                      beast::bind_front_handler(&ProxySession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        // Request bodies are forwarded whatever their size.
        req_parser_.emplace();
        req_parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

        client_.expires_after(kClientTimeout);
        http::async_read(client_, client_buf_, *req_parser_,
                         beast::bind_front_handler(&ProxySession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) {
            if (ec != beast::error::timeout) {
                std::cerr << "[proxy] read from client: " << ec.message() << std::endl;
            }
            return;
        }
        req_ = req_parser_->release();
        req_parser_.reset();

        target_uri_ = "http://" + to_string(cfg_->backend) + std::string(req_.target());
        reused_ = upstream_open_;
        if (upstream_open_) return do_forward();
        do_connect();
    }

    void do_connect() {
        upstream_.expires_after(cfg_->upstream_timeout);
        upstream_.async_connect(cfg_->backend,
                                beast::bind_front_handler(&ProxySession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec) {
        if (ec) return on_upstream_error(ec);
        upstream_open_ = true;
        do_forward();
    }

    void do_forward() {
        upstream_.expires_after(cfg_->upstream_timeout);
        http::async_write(upstream_, req_,
                          beast::bind_front_handler(&ProxySession::on_forward, shared_from_this()));
    }

    void on_forward(beast::error_code ec, std::size_t) {
        if (ec) return on_upstream_error(ec);

        parser_.emplace();
        parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
        if (req_.method() == http::verb::head) parser_->skip(true);

        http::async_read(upstream_, upstream_buf_, *parser_,
                         beast::bind_front_handler(&ProxySession::on_upstream_read, shared_from_this()));
    }

    void on_upstream_read(beast::error_code ec, std::size_t) {
        if (ec) return on_upstream_error(ec);

        res_ = parser_->release();
        parser_.reset();
        if (!res_.keep_alive()) close_upstream();

        if (cfg_->auto_reload) maybe_inject();
        do_write();
    }

    void on_upstream_error(beast::error_code ec) {
        close_upstream();

        // The backend dropped a kept-alive connection before answering.
        // Retry once on a fresh one.
        const bool stale = ec == http::error::end_of_stream
                        || ec == net::error::connection_reset
                        || ec == net::error::broken_pipe;
        if (reused_ && stale) {
            reused_ = false;
            return do_connect();
        }

        std::cerr << "[proxy] failed to reach " << target_uri_ << ": " << ec.message() << std::endl;

        res_ = Response{http::status::bad_gateway, req_.version()};
        res_.set(http::field::content_type, "text/plain");
        res_.keep_alive(req_.keep_alive());
        res_.body() = "failed to reach " + target_uri_ + "\nError:\n\n" + ec.message();
        res_.prepare_payload();
        do_write();
    }

    void maybe_inject() {
        if (req_.method() == http::verb::head || !may_have_body(res_.result()) || !is_html(res_)) return;
        if (is_encoded(res_)) {
            if (verbose()) {
                std::cout << "[proxy] not injecting into encoded response for " << target_uri_ << std::endl;
            }
            return;
        }

        res_.body() = inject_reload_script(res_.body(), cfg_->ws_port);
        if (res_.has_content_length()) res_.content_length(res_.body().size());
    }

    void do_write() {
        client_.expires_after(kClientTimeout);
        http::async_write(client_, res_,
                          beast::bind_front_handler(&ProxySession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            if (verbose()) std::cerr << "[proxy] write to client: " << ec.message() << std::endl;
            return;
        }
        if (!req_.keep_alive() || res_.need_eof()) return do_close();
        do_read();
    }

    void close_upstream() {
        beast::error_code ec;
        upstream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        upstream_.close();
        upstream_buf_.consume(upstream_buf_.size());
        upstream_open_ = false;
    }

    void do_close() {
        beast::error_code ec;
        client_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != net::error::not_connected && verbose()) {
            std::cerr << "[proxy] shutdown: " << ec.message() << std::endl;
        }
    }

    beast::tcp_stream client_;
    beast::tcp_stream upstream_;
    beast::flat_buffer client_buf_;
    beast::flat_buffer upstream_buf_;

    std::optional<http::request_parser<http::string_body>> req_parser_;
    http::request<http::string_body> req_;
    std::optional<http::response_parser<http::string_body>> parser_;
    Response res_;

    std::shared_ptr<const ProxyServer::Config> cfg_;
    std::string target_uri_;
    bool upstream_open_ = false;
    bool reused_ = false;
};

} // namespace

struct ProxyServer::Impl {
    explicit Impl(Config c) : cfg(std::make_shared<const Config>(std::move(c))), ioc(1) {}

    std::shared_ptr<const Config> cfg;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::atomic<bool> running{false};

    void do_accept() {
        acceptor->async_accept(
            net::make_strand(ioc),
            [this](beast::error_code ec, tcp::socket socket) {
                if (!running.load()) return;

                if (!ec) {
                    std::make_shared<ProxySession>(std::move(socket), cfg)->run();
                } else {
                    std::cerr << "[proxy] accept: " << ec.message() << std::endl;
                }
                do_accept();
            });
    }
};

ProxyServer::ProxyServer(Config cfg) : impl_(std::make_unique<Impl>(std::move(cfg))) {}

ProxyServer::~ProxyServer() { stop(); }

bool ProxyServer::start(ErrorChannel* errors) {
    if (impl_->running.exchange(true)) return true;

    beast::error_code ec;
    const tcp::endpoint endpoint = impl_->cfg->listen;

    impl_->acceptor = std::make_unique<tcp::acceptor>(impl_->ioc);

    impl_->acceptor->open(endpoint.protocol(), ec);
    if (ec) { std::cerr << "[proxy] acceptor open: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) { std::cerr << "[proxy] set_option: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->acceptor->bind(endpoint, ec);
    if (ec) {
        std::cerr << "[proxy] bind " << to_string(endpoint) << ": " << ec.message() << "\n";
        impl_->running = false;
        return false;
    }

    impl_->acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) { std::cerr << "[proxy] listen: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->do_accept();

    std::cout << "[proxy] listening on http://" << to_string(impl_->acceptor->local_endpoint())
              << " -> " << to_string(impl_->cfg->backend) << std::endl;

    io_thread_ = std::thread([this, errors]() {
        try {
            impl_->ioc.run();
        } catch (const std::exception& e) {
            std::cerr << "[proxy] event loop failed: " << e.what() << std::endl;
            if (errors) errors->push(std::current_exception());
        }
    });

    return true;
}

void ProxyServer::stop() {
    if (!impl_->running.exchange(false)) return;
    beast::error_code ec;
    if (impl_->acceptor) {
        impl_->acceptor->cancel(ec);
        impl_->acceptor->close(ec);
    }
    impl_->ioc.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

unsigned short ProxyServer::port() const {
    if (!impl_->acceptor || !impl_->acceptor->is_open()) return 0;
    beast::error_code ec;
    auto ep = impl_->acceptor->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

} // namespace live_proxy
