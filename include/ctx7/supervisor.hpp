#pragma once
#include <functional>

namespace ctx7 {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;

/// Route std::terminate (an exception escaping a worker thread) to a critical
/// log line and exit status 1. Call once, early in main().
void install_fatal_handlers();

/// Run `body` and map its outcome to a process exit status: kExitOk when it
/// returns, kExitFatal after logging when anything escapes it.
[[nodiscard]] int supervise(const std::function<void()>& body);

} // namespace ctx7
