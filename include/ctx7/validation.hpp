#pragma once
#include "config.hpp"
#include "environment.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace ctx7 {

constexpr int64_t kMinTokens = 100;
constexpr int64_t kMaxTokens = 100000;
constexpr std::size_t kMinLibraryNameLength = 2;
constexpr std::size_t kMaxLibraryNameLength = 100;
constexpr std::size_t kMinLibraryIdLength = 3;
constexpr std::string_view kFoldersMarker = "?folders=";

/// Rejected tool input. Carried as a value, never thrown.
struct ValidationError {
    std::string message;

    bool operator==(const ValidationError& o) const { return message == o.message; }
};

template <typename T>
using Validated = std::variant<T, ValidationError>;

struct TokenPolicy {
    int64_t minimum = kDefaultMinimumTokens;
};

struct ResolveQuery {
    std::string query;
};

/// Effective parameters of one get-library-docs call after precedence
/// resolution: request value, then project config, then built-in constant.
struct DocsRequest {
    std::string library_id;
    std::string folders;
    std::string topic;
    int64_t tokens = kDefaultMinimumTokens;
    std::string lang;
    std::optional<std::string> version;
};

/// Length of a UTF-8 string in UTF-16 code units: one per code point, two for
/// code points outside the Basic Multilingual Plane.
[[nodiscard]] std::size_t utf16_length(std::string_view s);

/// Keep only [A-Za-z0-9_.-] and space.
[[nodiscard]] std::string sanitize_library_name(std::string_view raw);

/// Keep only [A-Za-z0-9_./-]. The first "?folders=" marker survives; the text
/// on either side of it is filtered independently.
[[nodiscard]] std::string sanitize_library_id(std::string_view raw);

/// Split a sanitized id on the first "?folders=" into {id, folders}.
/// folders is empty when the marker is absent.
[[nodiscard]] std::pair<std::string, std::string> split_folders(std::string_view sanitized);

/// Coerce, clamp up to the policy minimum, then range-check a raw `tokens`
/// argument. Absent or null yields the minimum.
[[nodiscard]] Validated<int64_t> coerce_tokens(const nlohmann::json* raw, const TokenPolicy& policy);

[[nodiscard]] Validated<ResolveQuery> validate_resolve(const nlohmann::json& args,
                                                       const ConfigSnapshot& config);

[[nodiscard]] Validated<DocsRequest> validate_docs(const nlohmann::json& args,
                                                   const ConfigSnapshot& config,
                                                   const TokenPolicy& policy);

} // namespace ctx7
