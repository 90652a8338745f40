#pragma once

#include <boost/asio/ip/tcp.hpp>

#include <string>

namespace live_proxy {

using tcp = boost::asio::ip::tcp;

// Parses "HOST:PORT" where HOST is an IPv4 literal, "localhost" or a
// bracketed IPv6 literal. Throws ConfigError on malformed input.
tcp::endpoint parse_endpoint(const std::string& text);

// Inverse of parse_endpoint: "127.0.0.1:8080" or "[::1]:8080".
std::string to_string(const tcp::endpoint& ep);

} // namespace live_proxy
