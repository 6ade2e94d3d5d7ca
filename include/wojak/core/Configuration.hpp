#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>
#include <mutex>

namespace wojak {
namespace core {

/**
 * Configuration management class
 *
 * Holds a YAML document and resolves dotted keys ("validator.max_yaw_deg")
 * against nested maps. All accessors are thread-safe.
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    Configuration() = default;
    ~Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    /**
     * Load configuration from file, replaces the current document
     * @return false if the file is missing or not valid YAML (document unchanged)
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from an in-memory YAML string
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Save configuration to file
     */
    bool save(const std::string& filename) const;

    /**
     * Reload the file last passed to load()
     */
    bool reload();

    void clear();

    /**
     * Get value at a dotted key, defaultValue if absent or not convertible
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Set value at a dotted key, creating intermediate maps
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        assign(key, YAML::Node(value));
    }

    bool has(const std::string& key) const;

    int getInt(const std::string& key, int defaultValue = 0) const { return get<int>(key, defaultValue); }
    double getDouble(const std::string& key, double defaultValue = 0.0) const { return get<double>(key, defaultValue); }
    bool getBool(const std::string& key, bool defaultValue = false) const { return get<bool>(key, defaultValue); }
    std::string getString(const std::string& key, const std::string& defaultValue = "") const {
        return get<std::string>(key, defaultValue);
    }

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    static std::vector<std::string> splitKey(const std::string& key);

    YAML::Node lookup(const std::string& key) const;
    void assign(const std::string& key, const YAML::Node& value);

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace wojak
