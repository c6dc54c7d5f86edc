#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace ctx7 {

/// Project language/version defaults. Built once at startup and shared
/// read-only by every handler.
struct ConfigSnapshot {
    std::string default_lang = "python";
    std::string default_version = "3.11";
    std::set<std::string> supported_langs{"python"};
    std::map<std::string, std::set<std::string>> supported_versions{{"python", {"3.11"}}};

    bool operator==(const ConfigSnapshot& o) const {
        return default_lang == o.default_lang && default_version == o.default_version
               && supported_langs == o.supported_langs
               && supported_versions == o.supported_versions;
    }
};

using ConfigPtr = std::shared_ptr<const ConfigSnapshot>;

/// Shallow merge: each recognized top-level key present in `doc` replaces
/// the corresponding field of `base` wholesale. Unknown keys are ignored.
/// Throws std::invalid_argument when `doc` is not an object and
/// nlohmann::json::type_error when a recognized key has the wrong type.
ConfigSnapshot merge_config(ConfigSnapshot base, const nlohmann::json& doc);

class ConfigResolver {
public:
    static constexpr const char* kFileName = ".context7rc.json";

    /// Resolve against `.context7rc.json` in the working directory.
    ConfigResolver();
    explicit ConfigResolver(std::filesystem::path path);

    /// Never throws. A missing file yields the defaults; an unreadable or
    /// malformed one is reported with a warning and ignored entirely.
    [[nodiscard]] ConfigSnapshot load() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace ctx7
