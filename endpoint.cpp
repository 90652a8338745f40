#include "endpoint.hpp"
#include "errors.hpp"

#include <boost/asio/ip/address.hpp>

#include <cctype>

namespace live_proxy {

namespace net = boost::asio;

tcp::endpoint parse_endpoint(const std::string& text) {
    std::string host;
    std::string port;

    if (!text.empty() && text.front() == '[') {
        auto close = text.find("]:");
        if (close == std::string::npos) {
            throw ConfigError("invalid address '" + text + "': expected [IPV6]:PORT");
        }
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            throw ConfigError("invalid address '" + text + "': expected HOST:PORT");
        }
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    if (port.empty() || port.size() > 5) {
        throw ConfigError("invalid port in address '" + text + "'");
    }
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("invalid port in address '" + text + "'");
        }
    }
    unsigned long port_num = std::stoul(port);
    if (port_num > 65535) {
        throw ConfigError("port out of range in address '" + text + "'");
    }

    if (host == "localhost") host = "127.0.0.1";

    boost::system::error_code ec;
    auto addr = net::ip::make_address(host, ec);
    if (ec) {
        throw ConfigError("invalid host in address '" + text + "': " + ec.message());
    }
    return tcp::endpoint{addr, static_cast<unsigned short>(port_num)};
}

std::string to_string(const tcp::endpoint& ep) {
    if (ep.address().is_v6()) {
        return "[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace live_proxy
