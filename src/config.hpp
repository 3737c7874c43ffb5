#pragma once

#include <string>
#include <optional>

namespace gcscache {

/**
 * What ObjectCache::open does when materializing an object fails
 */
enum class DownloadFailurePolicy {
    kPropagate,  // remove the partial file and throw DownloadError
    kIgnore      // report on the progress sink and open whatever was written
};

/**
 * CacheConfig - Configuration options for a RemoteStore
 * 
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables (highest priority)
 */
struct CacheConfig {
    // Bucket name (required)
    std::string bucket_name;

    // Cached copies live under <cache_dir>/<bucket_name>
    std::string cache_dir = "/tmp";

    // Maximum number of objects per listing page
    int list_page_size = 1000;

    // Progress messages with a level below this are written
    int verbosity = 3;

    DownloadFailurePolicy download_failure_policy = DownloadFailurePolicy::kPropagate;

    // Service account to impersonate; empty uses application default credentials
    std::string impersonate_service_account;
    std::string session_name = "gcscache";

    // Storage endpoint override, e.g. for an emulator
    std::string endpoint;

    // Logging settings
    bool debug_mode = false;

    /**
     * Load configuration from all sources in priority order
     * 
     * @param config_path YAML file to read; falls back to GCSCACHE_CONFIG
     * @return Validated configuration
     * @throws std::runtime_error if the configuration is invalid
     */
    static CacheConfig load(const std::optional<std::string>& config_path = std::nullopt);

    /**
     * Load configuration from YAML file
     * 
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);
    
    /**
     * Load configuration from environment variables
     * Recognizes: GCSCACHE_* variables
     */
    void loadFromEnv();
    
    /**
     * Set default values
     */
    void loadDefaults();
    
    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    /**
     * Parse "propagate" or "ignore"
     * @throws std::runtime_error for any other value
     */
    static DownloadFailurePolicy parsePolicy(const std::string& value);
};

} // namespace gcscache
