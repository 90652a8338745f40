#pragma once

#include "task.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace live_proxy {

using tcp = boost::asio::ip::tcp;

struct HttpConfig {
    tcp::endpoint addr;     // where the proxy listens
    tcp::endpoint proxy;    // the backend every request is forwarded to
    tcp::endpoint ws_addr;  // where reload scripts connect
    bool auto_reload = true;
};

// Example config (live_proxy.json):
// {
//   "verbose": false,
//   "workdir": ".",                          // relative to this file
//   "http": {
//     "addr": "127.0.0.1:8030",
//     "proxy": "127.0.0.1:8080",
//     "ws_addr": "127.0.0.1:8031",           // default: addr port + 1
//     "auto_reload": true
//   },
//   "tasks": [
//     { "name": "build", "operations": [
//         { "set-workdir": "backend" },
//         { "command": "cargo build" },
//         { "command": { "run": ["cp", "a b", "c"], "workdir": "out" } },
//         { "copy": { "src": "static", "dst": "public/static" } } ] }
//   ]
// }
struct Config {
    bool verbose = false;
    std::filesystem::path workdir;
    std::optional<HttpConfig> http;
    std::vector<Task> tasks;

    // Relative "workdir" values are resolved against `config_dir`. Throws
    // ConfigError on any malformed or unknown entry.
    static Config from_json(const nlohmann::json& j, const std::filesystem::path& config_dir);

    // Reads and decodes a JSON file.
    static nlohmann::json read_file(const std::filesystem::path& file);
};

} // namespace live_proxy
