#include "ctx7/validation.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <tuple>

namespace ctx7 {

namespace {

const char* const kInvalidName = "Invalid library name. Must be 2-100 characters.";
const char* const kInvalidId = "Invalid Context7-compatible library ID.";
const char* const kTokenRange = "Token count must be between 100 and 100000.";
const char* const kTokenNotNumber = "Token count must be a number.";

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

template <typename Pred>
std::string keep_if(std::string_view raw, Pred pred) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (pred(c)) out.push_back(c);
    }
    return out;
}

bool id_char(char c) {
    return is_alnum(c) || c == '_' || c == '.' || c == '/' || c == '-';
}

std::string_view trim(std::string_view s) {
    auto ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && ws(s.front())) s.remove_prefix(1);
    while (!s.empty() && ws(s.back())) s.remove_suffix(1);
    return s;
}

// Number() semantics for a string argument: blank is zero, anything not
// fully consumed by the parser is not a number.
std::optional<double> parse_number(std::string_view s) {
    s = trim(s);
    if (s.empty()) return 0.0;
    std::string buf(s);
    char* end = nullptr;
    double v = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return std::nullopt;
    return v;
}

// Optional string field; empty counts as absent.
Validated<std::optional<std::string>> optional_string(const nlohmann::json& args,
                                                      const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return ValidationError{std::string(key) + " must be a string."};
    }
    auto value = it->get<std::string>();
    if (value.empty()) return std::optional<std::string>{};
    return std::optional<std::string>{std::move(value)};
}

} // namespace

std::size_t utf16_length(std::string_view s) {
    std::size_t n = 0;
    for (char c : s) {
        auto b = static_cast<unsigned char>(c);
        if ((b & 0xC0) == 0x80) continue;
        // Four-byte sequences lie outside the BMP and take a surrogate pair.
        n += (b >= 0xF0) ? 2 : 1;
    }
    return n;
}

std::string sanitize_library_name(std::string_view raw) {
    return keep_if(raw, [](char c) {
        return is_alnum(c) || c == '_' || c == '.' || c == '-' || c == ' ';
    });
}

std::string sanitize_library_id(std::string_view raw) {
    auto pos = raw.find(kFoldersMarker);
    if (pos == std::string_view::npos) {
        return keep_if(raw, id_char);
    }
    std::string out = keep_if(raw.substr(0, pos), id_char);
    out.append(kFoldersMarker);
    out += keep_if(raw.substr(pos + kFoldersMarker.size()), id_char);
    return out;
}

std::pair<std::string, std::string> split_folders(std::string_view sanitized) {
    auto pos = sanitized.find(kFoldersMarker);
    if (pos == std::string_view::npos) {
        return {std::string(sanitized), std::string()};
    }
    return {std::string(sanitized.substr(0, pos)),
            std::string(sanitized.substr(pos + kFoldersMarker.size()))};
}

Validated<int64_t> coerce_tokens(const nlohmann::json* raw, const TokenPolicy& policy) {
    double value = 0.0;
    if (raw == nullptr || raw->is_null()) {
        value = static_cast<double>(policy.minimum);
    } else if (raw->is_number()) {
        value = raw->get<double>();
    } else if (raw->is_string()) {
        auto parsed = parse_number(raw->get_ref<const std::string&>());
        if (!parsed) return ValidationError{kTokenNotNumber};
        value = *parsed;
    } else {
        return ValidationError{kTokenNotNumber};
    }

    if (!std::isfinite(value)) {
        return ValidationError{kTokenNotNumber};
    }
    value = std::trunc(value);

    // Low values are raised, never rejected. The range check still applies
    // afterwards, so a configured minimum outside it fails every call.
    if (value < static_cast<double>(policy.minimum)) {
        value = static_cast<double>(policy.minimum);
    }
    if (value < static_cast<double>(kMinTokens) || value > static_cast<double>(kMaxTokens)) {
        return ValidationError{kTokenRange};
    }
    return static_cast<int64_t>(value);
}

Validated<ResolveQuery> validate_resolve(const nlohmann::json& args, const ConfigSnapshot& config) {
    auto it = args.find("libraryName");
    if (it == args.end() || !it->is_string()) {
        return ValidationError{kInvalidName};
    }
    const auto& name = it->get_ref<const std::string&>();
    auto len = utf16_length(name);
    if (len < kMinLibraryNameLength || len > kMaxLibraryNameLength) {
        return ValidationError{kInvalidName};
    }

    ResolveQuery q;
    q.query = sanitize_library_name(name);
    if (q.query.empty()) {
        q.query = config.default_lang + " " + config.default_version;
    }
    return q;
}

Validated<DocsRequest> validate_docs(const nlohmann::json& args,
                                     const ConfigSnapshot& config,
                                     const TokenPolicy& policy) {
    auto it = args.find("context7CompatibleLibraryID");
    if (it == args.end() || !it->is_string()
        || utf16_length(it->get_ref<const std::string&>()) < kMinLibraryIdLength) {
        return ValidationError{kInvalidId};
    }

    auto tokens_it = args.find("tokens");
    auto tokens = coerce_tokens(tokens_it == args.end() ? nullptr : &*tokens_it, policy);
    if (auto* err = std::get_if<ValidationError>(&tokens)) {
        return *err;
    }

    auto topic = optional_string(args, "topic");
    if (auto* err = std::get_if<ValidationError>(&topic)) return *err;
    auto lang = optional_string(args, "lang");
    if (auto* err = std::get_if<ValidationError>(&lang)) return *err;
    auto python = optional_string(args, "python");
    if (auto* err = std::get_if<ValidationError>(&python)) return *err;

    DocsRequest req;
    std::tie(req.library_id, req.folders) =
        split_folders(sanitize_library_id(it->get_ref<const std::string&>()));
    req.tokens = std::get<int64_t>(tokens);
    req.topic = std::get<std::optional<std::string>>(topic).value_or("");
    req.lang = std::get<std::optional<std::string>>(lang).value_or(config.default_lang);

    auto& explicit_version = std::get<std::optional<std::string>>(python);
    if (explicit_version) {
        req.version = *explicit_version;
    } else if (req.lang == "python") {
        req.version = config.default_version;
    }
    return req;
}

} // namespace ctx7
