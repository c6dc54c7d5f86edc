#include "ctx7/config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace ctx7 {

ConfigSnapshot merge_config(ConfigSnapshot base, const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }
    if (auto it = doc.find("defaultLang"); it != doc.end()) {
        base.default_lang = it->get<std::string>();
    }
    if (auto it = doc.find("defaultVersion"); it != doc.end()) {
        base.default_version = it->get<std::string>();
    }
    if (auto it = doc.find("supportedLangs"); it != doc.end()) {
        base.supported_langs = it->get<std::set<std::string>>();
    }
    if (auto it = doc.find("supportedVersions"); it != doc.end()) {
        base.supported_versions = it->get<std::map<std::string, std::set<std::string>>>();
    }
    return base;
}

ConfigResolver::ConfigResolver()
    : path_(kFileName) {
}

ConfigResolver::ConfigResolver(std::filesystem::path path)
    : path_(std::move(path)) {
}

ConfigSnapshot ConfigResolver::load() const {
    ConfigSnapshot defaults;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("No {} found, using built-in defaults", path_.string());
        return defaults;
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::warn("Failed to read {}, using defaults", path_.string());
        return defaults;
    }
    std::stringstream raw;
    raw << in.rdbuf();

    try {
        auto doc = nlohmann::json::parse(raw.str());
        auto merged = merge_config(std::move(defaults), doc);
        spdlog::info("Loaded project config from {} (defaultLang={}, defaultVersion={})",
                     path_.string(), merged.default_lang, merged.default_version);
        return merged;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse {}, using defaults: {}", path_.string(), e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Ignoring {}, using defaults: {}", path_.string(), e.what());
    }
    return ConfigSnapshot{};
}

} // namespace ctx7
