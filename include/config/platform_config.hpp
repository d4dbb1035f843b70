// File: include/config/platform_config.hpp
//
// YAML Configuration Support for ModelStore platforms
// Maps platform names to a backend class and its engine options

#ifndef MODELSTORE_CONFIG_PLATFORM_CONFIG_HPP
#define MODELSTORE_CONFIG_PLATFORM_CONFIG_HPP

#include <string>
#include <optional>
#include <map>
#include <vector>

namespace modelstore {

/// One named platform: the backend class and the options passed to it
struct PlatformInfo {
    /// Registered backend class, e.g. "memory" or "sqlite"
    std::string backend_class;

    /// Engine options, plus the platform-level "cache" and "cache_size"
    std::map<std::string, std::string> options;
};

/// Configuration structure listing the known platforms
///
/// Example:
///   default: local
///   platforms:
///     local:
///       class: sqlite
///       path: /tmp/models.db
///     scratch:
///       class: memory
struct PlatformConfig {
    /// Platform used when no name is given
    std::string default_platform;

    std::map<std::string, PlatformInfo> platforms;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return PlatformConfig structure if successful, std::nullopt on error
    static std::optional<PlatformConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return PlatformConfig structure if successful, std::nullopt on error
    static std::optional<PlatformConfig> LoadFromString(const std::string& yaml_content);

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Look up a platform; an empty name selects the default platform
    /// @return nullptr if no such platform is configured
    const PlatformInfo* GetPlatformInfo(const std::string& name = "") const;

    /// Create default configuration: one in-memory platform named "local"
    static PlatformConfig Default();
};

} // namespace modelstore

#endif // MODELSTORE_CONFIG_PLATFORM_CONFIG_HPP
