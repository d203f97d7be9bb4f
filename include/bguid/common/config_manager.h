/**
 * @file config_manager.h
 * @brief Environment-backed configuration
 *
 * Values set explicitly take precedence over environment variables.
 * Lookups are thread-safe.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace bguid {
namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value
     */
    void unset(const std::string& key);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    static constexpr const char* LOG_LEVEL = "BGUID_LOG_LEVEL";
    static constexpr const char* LOG_FILE = "BGUID_LOG_FILE";
    static constexpr const char* ALLOW_EXTRA_SEGMENTS = "BGUID_ALLOW_EXTRA_SEGMENTS";
    static constexpr const char* ALLOW_OVERSIZED_GROUPS = "BGUID_ALLOW_OVERSIZED_GROUPS";
};

} // namespace common
} // namespace bguid
