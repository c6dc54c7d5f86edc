#include "ctx7/event_logger.hpp"
#include <spdlog/spdlog.h>

namespace ctx7 {

SpdlogEventLogger::SpdlogEventLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
}

void SpdlogEventLogger::log_event(const std::string& event, const nlohmann::json& details) {
    auto logger = logger_ ? logger_ : spdlog::default_logger();
    if (!logger) return;

    if (details.is_null()) {
        logger->info("{}", event);
        return;
    }
    // Replace invalid UTF-8 instead of throwing from dump().
    logger->info("{} {}", event, details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace ctx7
