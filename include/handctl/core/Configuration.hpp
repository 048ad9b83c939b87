#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <yaml-cpp/yaml.h>

namespace handctl {
namespace core {

/**
 * Configuration management class
 *
 * Holds one YAML document and resolves dotted keys ("gesture.pinch.distance")
 * against it. Missing or mistyped values fall back to the caller's default,
 * so a partial file only overrides what it names.
 */
class Configuration {
public:
    /**
     * Get the process-wide instance
     */
    static Configuration& getInstance();

    Configuration() = default;
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    /**
     * Load configuration from a YAML file
     * @return false if the file is missing or not valid YAML (previous
     *         contents are kept)
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from YAML text
     */
    bool loadFromString(const std::string& text);

    /**
     * Reload the file passed to the last successful load()
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if a dotted key resolves to a value
     */
    bool has(const std::string& key) const;

    /**
     * Child keys of the map at a dotted key (empty if not a map)
     */
    std::vector<std::string> keys(const std::string& key) const;

    /**
     * Get value at a dotted key, or @p defaultValue when missing or not
     * convertible to T
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = resolve(key);
        if (!node.IsDefined() || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Last error from load()/loadFromString()
     */
    std::string getLastError() const;

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    YAML::Node resolve(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
    std::string lastError_;
};

} // namespace core
} // namespace handctl
