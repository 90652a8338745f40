#include "html_inject.hpp"

namespace live_proxy {

namespace {

constexpr std::string_view kPortPlaceholder = "INSERT_PORT_HERE";

// Reloads on an unexpected close. Until the first successful connection it
// keeps retrying instead, so a page served while the reload port is not up
// yet does not end in a reload loop.
constexpr std::string_view kClientScript = R"JS((function() {
    var port = INSERT_PORT_HERE;
    var url = (location.protocol === "https:" ? "wss://" : "ws://")
        + (location.hostname || "127.0.0.1") + ":" + port;
    var connected = false;

    function connect() {
        var socket = new WebSocket(url);
        socket.onopen = function() {
            connected = true;
        };
        socket.onclose = function() {
            if (connected) {
                location.reload();
            } else {
                setTimeout(connect, 1000);
            }
        };
    }

    connect();
})();
)JS";

bool starts_with(std::string_view s, std::size_t pos, std::string_view prefix) {
    return s.compare(pos, prefix.size(), prefix) == 0;
}

} // namespace

std::string reload_script(unsigned short ws_port) {
    std::string js(kClientScript);
    auto pos = js.find(kPortPlaceholder);
    if (pos != std::string::npos) {
        js.replace(pos, kPortPlaceholder.size(), std::to_string(ws_port));
    }
    return "<script>\n" + js + "</script>";
}

std::optional<std::size_t> find_body_close(std::string_view html) {
    bool inside_comment = false;
    for (std::size_t i = 0; i < html.size(); ++i) {
        if (!inside_comment) {
            if (starts_with(html, i, "</body>")) return i;
            if (starts_with(html, i, "<!--")) inside_comment = true;
        } else if (starts_with(html, i, "-->")) {
            inside_comment = false;
        }
    }
    return std::nullopt;
}

std::string inject_reload_script(std::string_view html, unsigned short ws_port) {
    const std::string script = reload_script(ws_port);
    const std::size_t at = find_body_close(html).value_or(html.size());

    std::string out;
    out.reserve(html.size() + script.size());
    out.append(html.substr(0, at));
    out.append(script);
    out.append(html.substr(at));
    return out;
}

} // namespace live_proxy
