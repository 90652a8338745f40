// Checks forwarding, HTML injection and the 502 page of the proxy.
#include <atomic>
#include <cassert>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "html_inject.hpp"
#include "http_proxy.hpp"

using namespace live_proxy;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

const net::ip::address kLoopback = net::ip::make_address("127.0.0.1");
constexpr unsigned short kWsPort = 35729;

const std::string kPage = "<html><body><h1>hello</h1></body></html>";
const std::string kJson = R"({"ok":true,"html":"</body>"})";

// Serves one connection at a time until stopped.
class FakeBackend {
public:
    FakeBackend() : acceptor_(ioc_, tcp::endpoint(kLoopback, 0)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeBackend() {
        stopping_ = true;
        // Wake the blocking accept.
        beast::error_code ec;
        tcp::socket poke(ioc_);
        poke.connect(acceptor_.local_endpoint(), ec);
        thread_.join();
    }

    tcp::endpoint endpoint() const { return acceptor_.local_endpoint(); }
    int requests() const { return requests_.load(); }

private:
    void serve() {
        while (!stopping_) {
            beast::error_code ec;
            tcp::socket sock(ioc_);
            acceptor_.accept(sock, ec);
            if (ec || stopping_) break;

            beast::flat_buffer buf;
            while (true) {
                http::request_parser<http::string_body> parser;
                parser.body_limit(std::numeric_limits<std::uint64_t>::max());
                http::read(sock, buf, parser, ec);
                if (ec) break;
                http::request<http::string_body> req = parser.release();
                ++requests_;

                http::response<http::string_body> res{http::status::ok, req.version()};
                res.set("X-Seen-Target", std::string(req.target()));
                res.set("X-Seen-Method", std::string(req.method_string()));
                res.keep_alive(req.keep_alive());

                const std::string target(req.target());
                if (target.rfind("/data.json", 0) == 0) {
                    res.set(http::field::content_type, "application/json");
                    res.body() = kJson;
                    res.prepare_payload();
                } else if (target == "/chunked") {
                    res.set(http::field::content_type, "text/html");
                    res.body() = kPage;
                    res.chunked(true);
                } else if (target == "/echo") {
                    res.set(http::field::content_type, "text/plain");
                    res.body() = req.body();
                    res.prepare_payload();
                } else {
                    res.set(http::field::content_type, "text/html; charset=utf-8");
                    res.body() = kPage;
                    res.prepare_payload();
                }

                http::write(sock, res, ec);
                if (ec || !req.keep_alive()) break;
            }
            sock.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> requests_{0};
};

http::response<http::string_body> fetch(unsigned short port, http::verb method, const std::string& target,
                                        const std::string& body = "") {
    net::io_context ioc;
    tcp::socket sock(ioc);
    sock.connect(tcp::endpoint(kLoopback, port));

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(false);
    req.body() = body;
    req.prepare_payload();
    http::write(sock, req);

    beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::read(sock, buf, res);

    beast::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

ProxyServer::Config proxy_config(const tcp::endpoint& backend, bool auto_reload = true) {
    ProxyServer::Config cfg;
    cfg.listen = tcp::endpoint(kLoopback, 0);
    cfg.backend = backend;
    cfg.auto_reload = auto_reload;
    cfg.ws_port = kWsPort;
    cfg.upstream_timeout = std::chrono::seconds(5);
    return cfg;
}

void test_html_gets_script_and_new_length() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint()));
    assert(proxy.start());

    auto res = fetch(proxy.port(), http::verb::get, "/page?x=1&y=two");
    assert(res.result() == http::status::ok);
    assert(res["X-Seen-Target"] == "/page?x=1&y=two");

    const std::string expected = inject_reload_script(kPage, kWsPort);
    assert(res.body() == expected);
    assert(res[http::field::content_length] == std::to_string(expected.size()));
    assert(res[http::field::content_type] == "text/html; charset=utf-8");

    proxy.stop();
}

void test_chunked_html_is_injected() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint()));
    assert(proxy.start());

    auto res = fetch(proxy.port(), http::verb::get, "/chunked");
    assert(res.body() == inject_reload_script(kPage, kWsPort));

    proxy.stop();
}

void test_other_content_passes_through() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint()));
    assert(proxy.start());

    auto res = fetch(proxy.port(), http::verb::get, "/data.json?v=3");
    assert(res.result() == http::status::ok);
    assert(res.body() == kJson);
    assert(res[http::field::content_length] == std::to_string(kJson.size()));
    assert(res["X-Seen-Target"] == "/data.json?v=3");

    auto echoed = fetch(proxy.port(), http::verb::post, "/echo", "name=value");
    assert(echoed["X-Seen-Method"] == "POST");
    assert(echoed.body() == "name=value");

    proxy.stop();
}

void test_large_upload_is_forwarded() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint()));
    assert(proxy.start());

    // Larger than the default request body limit of the HTTP parser.
    const std::string upload(2 * 1024 * 1024 + 17, 'x');
    auto echoed = fetch(proxy.port(), http::verb::post, "/echo", upload);
    assert(echoed.result() == http::status::ok);
    assert(echoed["X-Seen-Method"] == "POST");
    assert(echoed.body().size() == upload.size());
    assert(echoed.body() == upload);
    assert(backend.requests() == 1);

    proxy.stop();
}

void test_html_untouched_without_auto_reload() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint(), false));
    assert(proxy.start());

    auto res = fetch(proxy.port(), http::verb::get, "/");
    assert(res.body() == kPage);
    assert(res[http::field::content_length] == std::to_string(kPage.size()));

    proxy.stop();
}

void test_keep_alive_client_reuses_session() {
    FakeBackend backend;
    ProxyServer proxy(proxy_config(backend.endpoint()));
    assert(proxy.start());

    net::io_context ioc;
    tcp::socket sock(ioc);
    sock.connect(tcp::endpoint(kLoopback, proxy.port()));
    beast::flat_buffer buf;

    for (int i = 0; i < 3; ++i) {
        http::request<http::empty_body> req{http::verb::get, "/data.json?i=" + std::to_string(i), 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(sock, req);

        http::response<http::string_body> res;
        http::read(sock, buf, res);
        assert(res.body() == kJson);
        assert(res["X-Seen-Target"] == "/data.json?i=" + std::to_string(i));
    }
    assert(backend.requests() == 3);

    beast::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
    sock.close(ec);
    proxy.stop();
}

void test_unreachable_backend_is_502() {
    tcp::endpoint dead;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(kLoopback, 0));
        dead = acceptor.local_endpoint();
    }

    ProxyServer proxy(proxy_config(dead));
    assert(proxy.start());

    auto res = fetch(proxy.port(), http::verb::get, "/missing?q=1");
    assert(res.result() == http::status::bad_gateway);
    assert(res[http::field::content_type] == "text/plain");
    const std::string uri = "http://127.0.0.1:" + std::to_string(dead.port()) + "/missing?q=1";
    assert(res.body().find("failed to reach " + uri) != std::string::npos);

    // The server keeps serving after a failed upstream call.
    auto again = fetch(proxy.port(), http::verb::get, "/");
    assert(again.result() == http::status::bad_gateway);

    proxy.stop();
}

void test_bind_failure_is_reported() {
    net::io_context ioc;
    tcp::acceptor taken(ioc, tcp::endpoint(kLoopback, 0));

    ProxyServer::Config cfg = proxy_config(taken.local_endpoint());
    cfg.listen = taken.local_endpoint();
    ProxyServer proxy(cfg);
    assert(!proxy.start());
}

} // namespace

int main() {
    test_html_gets_script_and_new_length();
    test_chunked_html_is_injected();
    test_other_content_passes_through();
    test_large_upload_is_forwarded();
    test_html_untouched_without_auto_reload();
    test_keep_alive_client_reuses_session();
    test_unreachable_backend_is_502();
    test_bind_failure_is_reported();

    std::cout << "http_proxy tests passed" << std::endl;
    return 0;
}
