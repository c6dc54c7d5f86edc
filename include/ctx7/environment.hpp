#pragma once
#include <cstdint>
#include <string>

namespace ctx7 {

namespace env {
    constexpr const char* MinimumTokens = "DEFAULT_MINIMUM_TOKENS";
    constexpr const char* Transport     = "TRANSPORT";
    constexpr const char* ApiUrl        = "CONTEXT7_API_URL";
} // namespace env

constexpr int64_t kDefaultMinimumTokens = 10000;
constexpr const char* kDefaultApiUrl = "https://context7.com/api";

/// Interpret a DEFAULT_MINIMUM_TOKENS value. Unset or empty gives the default;
/// anything without a leading positive integer gives the default with a warning.
/// Trailing garbage after the digits is ignored ("250abc" is 250).
[[nodiscard]] int64_t parse_minimum_tokens(const char* raw);

/// parse_minimum_tokens() applied to the process environment.
[[nodiscard]] int64_t minimum_tokens_from_env();

/// Value of an environment variable, or `fallback` when unset or empty.
[[nodiscard]] std::string env_or(const char* name, std::string fallback);

} // namespace ctx7
