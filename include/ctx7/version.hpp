#pragma once
#include <string_view>

namespace ctx7 {

constexpr std::string_view SERVER_NAME         = "Context7";
constexpr std::string_view SERVER_VERSION      = "1.0.6";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace ctx7
