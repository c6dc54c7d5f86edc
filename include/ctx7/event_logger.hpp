#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace spdlog { class logger; }

namespace ctx7 {

/// Sink for tool lifecycle events ("resolve-library-id invoked", ...).
class IEventLogger {
public:
    virtual ~IEventLogger() = default;

    /// `details` may be null. Never throws.
    virtual void log_event(const std::string& event, const nlohmann::json& details) = 0;

    void log_event(const std::string& event) { log_event(event, nullptr); }
};

/// Writes events at info level through spdlog. Uses the default logger
/// unless one is given.
class SpdlogEventLogger : public IEventLogger {
public:
    SpdlogEventLogger() = default;
    explicit SpdlogEventLogger(std::shared_ptr<spdlog::logger> logger);

    using IEventLogger::log_event;
    void log_event(const std::string& event, const nlohmann::json& details) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ctx7
