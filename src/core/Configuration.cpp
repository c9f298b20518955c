#include "skintone/core/Configuration.hpp"
#include "skintone/core/Logger.hpp"
#include <sstream>

namespace skintone {
namespace core {

void Configuration::load(const std::string& filename) {
    try {
        root_ = YAML::LoadFile(filename);
    } catch (const YAML::BadFile&) {
        SKINTONE_THROW(ConfigurationException, "Cannot open configuration file " + filename);
    } catch (const YAML::Exception& e) {
        SKINTONE_THROW(ConfigurationException,
                       "Failed to parse configuration file " + filename + ": " + e.what());
    }
    currentFile_ = filename;
    LOG_INFO("Configuration loaded from " + filename);
}

void Configuration::loadFromString(const std::string& text) {
    try {
        root_ = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        SKINTONE_THROW(ConfigurationException, std::string("Failed to parse configuration: ") + e.what());
    }
    currentFile_.clear();
}

void Configuration::clear() {
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    YAML::Node node = find(key);
    return node.IsDefined() && !node.IsNull();
}

YAML::Node Configuration::find(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    if (parts.empty() || !root_.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return resolve(root_, parts, 0);
}

YAML::Node Configuration::resolve(const YAML::Node& node,
                                  const std::vector<std::string>& parts,
                                  size_t index) {
    if (index == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node child = node[parts[index]];
    if (!child.IsDefined()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return resolve(child, parts, index + 1);
}

} // namespace core
} // namespace skintone
