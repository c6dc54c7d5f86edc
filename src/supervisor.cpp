#include "ctx7/supervisor.hpp"
#include "ctx7/error.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <thread>

namespace ctx7 {

namespace {

void log_fatal(const char* what) {
    spdlog::critical("FATAL: {}", what);
    spdlog::default_logger()->flush();
}

} // namespace

void install_fatal_handlers() {
    std::set_terminate([]() noexcept {
        if (auto ep = std::current_exception()) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                log_fatal(e.what());
            } catch (...) {
                log_fatal("unknown exception");
            }
        } else {
            log_fatal("std::terminate called");
        }
        // Give the sink a moment to drain.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(kExitFatal);
    });
}

int supervise(const std::function<void()>& body) {
    try {
        body();
    } catch (const FatalError& e) {
        log_fatal(e.what());
        return kExitFatal;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        log_fatal("shutting down");
        return kExitFatal;
    }
    return kExitOk;
}

} // namespace ctx7
