#include "ctx7/environment.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>

namespace ctx7 {

int64_t parse_minimum_tokens(const char* raw) {
    if (raw == nullptr || *raw == '\0') {
        return kDefaultMinimumTokens;
    }

    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(raw, &end, 10);
    if (end == raw || errno == ERANGE || value <= 0) {
        spdlog::warn("Invalid {} value '{}' provided in environment. Using default value of {}",
                     env::MinimumTokens, raw, kDefaultMinimumTokens);
        return kDefaultMinimumTokens;
    }
    return static_cast<int64_t>(value);
}

int64_t minimum_tokens_from_env() {
    return parse_minimum_tokens(std::getenv(env::MinimumTokens));
}

std::string env_or(const char* name, std::string fallback) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return fallback;
    return v;
}

} // namespace ctx7
