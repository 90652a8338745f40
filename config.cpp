#include "config.hpp"
#include "endpoint.hpp"
#include "errors.hpp"

#include <fstream>
#include <set>

namespace live_proxy {

namespace {

void reject_unknown(const nlohmann::json& j, const std::set<std::string>& known, const std::string& where) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.count(it.key())) {
            throw ConfigError("unknown field '" + it.key() + "' in " + where);
        }
    }
}

tcp::endpoint endpoint_field(const nlohmann::json& j, const char* name) {
    if (!j[name].is_string()) throw ConfigError(std::string("'http.") + name + "' must be a \"HOST:PORT\" string");
    return parse_endpoint(j[name].get<std::string>());
}

HttpConfig http_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("'http' must be an object");
    reject_unknown(j, {"addr", "proxy", "ws_addr", "auto_reload"}, "'http'");

    HttpConfig http;
    http.addr = j.contains("addr") ? endpoint_field(j, "addr") : parse_endpoint("127.0.0.1:8030");

    if (!j.contains("proxy")) throw ConfigError("'http.proxy' is required");
    http.proxy = endpoint_field(j, "proxy");

    if (j.contains("ws_addr")) {
        http.ws_addr = endpoint_field(j, "ws_addr");
    } else {
        if (http.addr.port() == 0 || http.addr.port() == 65535) {
            throw ConfigError("'http.ws_addr' must be given when 'http.addr' has port " +
                              std::to_string(http.addr.port()));
        }
        http.ws_addr = tcp::endpoint{http.addr.address(), static_cast<unsigned short>(http.addr.port() + 1)};
    }

    if (j.contains("auto_reload")) {
        if (!j["auto_reload"].is_boolean()) throw ConfigError("'http.auto_reload' must be a boolean");
        http.auto_reload = j["auto_reload"].get<bool>();
    }
    return http;
}

} // namespace

Config Config::from_json(const nlohmann::json& j, const std::filesystem::path& config_dir) {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");
    reject_unknown(j, {"verbose", "workdir", "http", "tasks"}, "configuration");

    Config cfg;

    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) throw ConfigError("'verbose' must be a boolean");
        cfg.verbose = j["verbose"].get<bool>();
    }

    cfg.workdir = config_dir;
    if (j.contains("workdir")) {
        if (!j["workdir"].is_string()) throw ConfigError("'workdir' must be a string");
        std::filesystem::path p = j["workdir"].get<std::string>();
        cfg.workdir = p.is_absolute() ? p : config_dir / p;
    }
    cfg.workdir = cfg.workdir.lexically_normal();

    if (j.contains("http") && !j["http"].is_null()) {
        cfg.http = http_from_json(j["http"]);
    }

    if (j.contains("tasks")) {
        if (!j["tasks"].is_array()) throw ConfigError("'tasks' must be a list");
        std::set<std::string> names;
        for (const auto& jt : j["tasks"]) {
            Task task = Task::from_json(jt);
            if (!names.insert(task.name()).second) {
                throw ConfigError("duplicate task name '" + task.name() + "'");
            }
            cfg.tasks.push_back(std::move(task));
        }
    }

    return cfg;
}

nlohmann::json Config::read_file(const std::filesystem::path& file) {
    std::ifstream f(file);
    if (!f) throw ConfigError("cannot open " + file.string());

    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded()) throw ConfigError(file.string() + " is not valid JSON");
    return j;
}

} // namespace live_proxy
