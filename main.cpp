// main.cpp - development proxy with live reload and a task pipeline
//
// Forwards HTTP traffic to a backend, injects a reload script into HTML
// pages and drops the browsers' reload connections each time the task
// pipeline finishes successfully. See config.hpp for the config format.
//
// Run:
//   ./live_proxy --config ./live_proxy.json
//
// CLI flags override the config file:
//   ./live_proxy --addr 127.0.0.1:8030 --proxy 127.0.0.1:8080
//
// The pipeline runs once at startup; every line read on stdin runs it again.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "blocking_queue.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_proxy.hpp"
#include "log.hpp"
#include "reload_server.hpp"
#include "task.hpp"

using json = nlohmann::json;

namespace live_proxy {

// --------------------------- signals -----------------------------------------
static std::atomic<bool> g_interrupted = false;
static void handle_signal(int) { g_interrupted = true; }

struct PipelineTrigger {};

static void print_usage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " [--config FILE.json]\n"
    "               [--addr HOST:PORT] [--proxy HOST:PORT] [--ws-addr HOST:PORT]\n"
    "               [--no-reload] [--once] [--verbose]\n";
}

} // namespace live_proxy

int main(int argc, char** argv) {
    using namespace live_proxy;
    namespace fs = std::filesystem;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::optional<std::string> config_path;
    std::optional<std::string> addr, proxy, ws_addr;
    bool no_reload = false;
    bool once = false;
    bool verbose_flag = false;

    // -------------------------- CLI parse --------------------------
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* name) {
            if (i + 1 >= argc) { std::cerr << name << " requires value\n"; print_usage(argv[0]); std::exit(2); }
            return std::string(argv[++i]);
        };
        if (a == "--config") config_path = need("--config");
        else if (a == "--addr") addr = need("--addr");
        else if (a == "--proxy") proxy = need("--proxy");
        else if (a == "--ws-addr") ws_addr = need("--ws-addr");
        else if (a == "--no-reload") no_reload = true;
        else if (a == "--once") once = true;
        else if (a == "--verbose" || a == "-v") verbose_flag = true;
        else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return 2; }
    }

    // -------------------------- Load config --------------------------
    Config cfg;
    try {
        json j = json::object();
        fs::path config_dir = fs::current_path();

        const fs::path file = config_path.value_or("live_proxy.json");
        if (config_path || fs::exists(file)) {
            j = Config::read_file(file);
            config_dir = fs::absolute(file).parent_path();
        }

        if (addr || proxy || ws_addr || no_reload) {
            json& http = j["http"];
            if (http.is_null()) http = json::object();
            if (addr) http["addr"] = *addr;
            if (proxy) http["proxy"] = *proxy;
            if (ws_addr) http["ws_addr"] = *ws_addr;
            if (no_reload) http["auto_reload"] = false;
        }
        if (verbose_flag) j["verbose"] = true;

        cfg = Config::from_json(j, config_dir);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 2;
    }
    set_verbose(cfg.verbose);

    TaskRunner runner(std::move(cfg.tasks), cfg.workdir);
    try {
        runner.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 2;
    }

    if (once) {
        return is_failure(runner.run_all()) ? 1 : 0;
    }

    // -------------------------- Servers --------------------------
    ErrorChannel errors;
    std::unique_ptr<ReloadSignalServer> reload;
    std::unique_ptr<ProxyServer> proxy_server;

    if (cfg.http) {
        const HttpConfig& http = *cfg.http;
        if (http.auto_reload) {
            ReloadSignalServer::Config rc;
            rc.listen = http.ws_addr;
            rc.backend = http.proxy;
            reload = std::make_unique<ReloadSignalServer>(rc);
            if (!reload->start(&errors)) return 1;
        }

        ProxyServer::Config pc;
        pc.listen = http.addr;
        pc.backend = http.proxy;
        pc.auto_reload = http.auto_reload;
        pc.ws_port = reload ? reload->port() : http.ws_addr.port();
        proxy_server = std::make_unique<ProxyServer>(pc);
        if (!proxy_server->start(&errors)) return 1;
    }

    if (reload) runner.set_refresh_queue(&reload->refresh_events());

    // -------------------------- Pipeline --------------------------
    auto triggers = std::make_shared<BlockingQueue<PipelineTrigger>>();
    triggers->push(PipelineTrigger{});

    std::thread pipeline([&runner, triggers]() {
        while (triggers->pop()) {
            // Shutdown closes the queue before it cancels, so a cancel that
            // lands after this reset is seen by run_all().
            runner.reset();
            if (triggers->closed()) break;

            // Changes that piled up during the last run are handled by one run.
            while (triggers->try_pop()) {}
            runner.run_all();
        }
    });

    // Blocked in getline until exit; only holds a reference to the queue.
    std::thread([triggers]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!triggers->push(PipelineTrigger{})) break;
        }
    }).detach();

    // -------------------------- Wait loop --------------------------
    int rc = 0;
    while (!g_interrupted) {
        if (auto err = errors.pop_for(std::chrono::milliseconds(200))) {
            try {
                std::rethrow_exception(*err);
            } catch (const std::exception& e) {
                std::cerr << "[main] fatal: " << e.what() << std::endl;
            }
            rc = 1;
            break;
        }
    }
    if (g_interrupted) std::cout << "\n[main] Interrupt received, shutting down..." << std::endl;

    triggers->close();
    try {
        runner.cancel();
    } catch (const OperationError& e) {
        std::cerr << "[main] " << e.what() << std::endl;
    }
    pipeline.join();

    if (proxy_server) proxy_server->stop();
    if (reload) reload->stop();
    return rc;
}
