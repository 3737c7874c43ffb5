#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace gcscache {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseBool(const std::string& value) {
    const auto v = toLower(value);
    return v == "true" || v == "yes" || v == "1" || v == "on";
}

int parseInt(const std::string& name, const std::string& value) {
    try {
        std::size_t pos = 0;
        const int result = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for " + name + ": '" + value + "'");
    }
}

std::optional<std::string> getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

CacheConfig CacheConfig::load(const std::optional<std::string>& config_path) {
    CacheConfig config;
    config.loadDefaults();

    auto path = config_path ? config_path : getEnv("GCSCACHE_CONFIG");
    if (path && !config.loadFromYAML(*path)) {
        throw std::runtime_error("Config file not found: " + *path);
    }

    config.loadFromEnv();
    config.validate();
    return config;
}

void CacheConfig::loadDefaults() {
    *this = CacheConfig{};
}

bool CacheConfig::loadFromYAML(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        return false;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid YAML in " + config_path + ": " + e.what());
    }

    if (root.IsNull()) {
        return true;  // empty file
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid config file " + config_path + ": expected key: value pairs");
    }

    try {
        if (root["bucket_name"]) bucket_name = root["bucket_name"].as<std::string>();
        if (root["cache_dir"]) cache_dir = root["cache_dir"].as<std::string>();
        if (root["list_page_size"]) list_page_size = root["list_page_size"].as<int>();
        if (root["verbosity"]) verbosity = root["verbosity"].as<int>();
        if (root["on_download_error"]) {
            download_failure_policy = parsePolicy(root["on_download_error"].as<std::string>());
        }
        if (root["impersonate_service_account"]) {
            impersonate_service_account = root["impersonate_service_account"].as<std::string>();
        }
        if (root["session_name"]) session_name = root["session_name"].as<std::string>();
        if (root["endpoint"]) endpoint = root["endpoint"].as<std::string>();
        if (root["debug"]) debug_mode = root["debug"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in " + config_path + ": " + e.what());
    }

    return true;
}

void CacheConfig::loadFromEnv() {
    if (auto v = getEnv("GCSCACHE_BUCKET")) bucket_name = *v;
    if (auto v = getEnv("GCSCACHE_CACHE_DIR")) cache_dir = *v;
    if (auto v = getEnv("GCSCACHE_PAGE_SIZE")) list_page_size = parseInt("GCSCACHE_PAGE_SIZE", *v);
    if (auto v = getEnv("GCSCACHE_VERBOSITY")) verbosity = parseInt("GCSCACHE_VERBOSITY", *v);
    if (auto v = getEnv("GCSCACHE_ON_DOWNLOAD_ERROR")) download_failure_policy = parsePolicy(*v);
    if (auto v = getEnv("GCSCACHE_IMPERSONATE_SERVICE_ACCOUNT")) impersonate_service_account = *v;
    if (auto v = getEnv("GCSCACHE_SESSION_NAME")) session_name = *v;
    if (auto v = getEnv("GCSCACHE_ENDPOINT")) endpoint = *v;
    if (auto v = getEnv("GCSCACHE_DEBUG")) debug_mode = parseBool(*v);
}

void CacheConfig::validate() const {
    if (bucket_name.empty()) {
        throw std::runtime_error("Bucket name is required");
    }
    if (cache_dir.empty()) {
        throw std::runtime_error("Cache directory must not be empty");
    }
    if (list_page_size <= 0) {
        throw std::runtime_error("List page size must be positive");
    }
    if (!impersonate_service_account.empty() && session_name.empty()) {
        throw std::runtime_error("Session name is required when impersonating a service account");
    }
}

DownloadFailurePolicy CacheConfig::parsePolicy(const std::string& value) {
    const auto v = toLower(value);
    if (v == "propagate") {
        return DownloadFailurePolicy::kPropagate;
    }
    if (v == "ignore") {
        return DownloadFailurePolicy::kIgnore;
    }
    throw std::runtime_error("Invalid download failure policy: '" + value + "' (expected propagate or ignore)");
}

} // namespace gcscache
