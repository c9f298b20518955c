#pragma once

#include "skintone/core/exception.h"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace skintone {
namespace core {

/**
 * Configuration document backed by yaml-cpp
 *
 * Keys are dot-separated paths into nested YAML maps, e.g.
 * "locator.min_skin_ratio". Missing keys resolve to the caller's default.
 */
class Configuration {
public:
    Configuration() = default;

    /**
     * Load configuration from a YAML file
     * @throws ConfigurationException if the file is missing or not valid YAML
     */
    void load(const std::string& filename);

    /**
     * Load configuration from YAML text
     * @throws ConfigurationException if the text is not valid YAML
     */
    void loadFromString(const std::string& text);

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * Get value, or defaultValue when the key is absent
     * @throws ConfigurationException when the value cannot be converted to T
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        YAML::Node node = find(key);
        if (!node.IsDefined() || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            SKINTONE_THROW(ConfigurationException,
                           "Invalid value for '" + key + "': " + e.what());
        }
    }

    /**
     * Get configuration filename (empty when loaded from a string)
     */
    std::string getFilename() const { return currentFile_; }

private:
    YAML::Node find(const std::string& key) const;
    static YAML::Node resolve(const YAML::Node& node,
                              const std::vector<std::string>& parts,
                              size_t index);

    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace skintone
