#pragma once

#include <atomic>

namespace live_proxy {

// Lines are written straight to std::cout / std::cerr with a "[tag]" prefix.
// This only holds the process-wide switch for the chatty ones.
inline std::atomic<bool> g_verbose{false};

inline void set_verbose(bool on) { g_verbose = on; }
inline bool verbose() { return g_verbose.load(); }

} // namespace live_proxy
