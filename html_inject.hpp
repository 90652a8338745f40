#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace live_proxy {

// The <script> block that connects back to the reload port and reloads the
// page when that connection is dropped.
std::string reload_script(unsigned short ws_port);

// Offset of the first "</body>" that is not inside an HTML comment.
std::optional<std::size_t> find_body_close(std::string_view html);

// Inserts reload_script() right before the first unguarded "</body>", or
// appends it when there is none. Never fails.
std::string inject_reload_script(std::string_view html, unsigned short ws_port);

} // namespace live_proxy
