#include "handctl/core/Configuration.hpp"
#include "handctl/core/Logger.hpp"

namespace handctl {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node parsed;
    try {
        parsed = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = "Failed to load " + filename + ": " + e.what();
        LOG_ERROR("Configuration: " + lastError_);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_ = filename;
    lastError_.clear();
    LOG_INFO("Configuration: loaded " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& text) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = std::string("Failed to parse configuration text: ") + e.what();
        LOG_ERROR("Configuration: " + lastError_);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = parsed;
    currentFile_.clear();
    lastError_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = resolve(key);
    return node.IsDefined() && !node.IsNull();
}

std::vector<std::string> Configuration::keys(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    YAML::Node node = resolve(key);
    if (!node.IsMap()) {
        return result;
    }
    for (const auto& entry : node) {
        result.push_back(entry.first.as<std::string>());
    }
    return result;
}

std::string Configuration::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

YAML::Node Configuration::resolve(const std::string& key) const {
    // Walk a const view so missing keys are never inserted into root_
    YAML::Node current;
    current.reset(root_);

    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(next);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return current;
}

} // namespace core
} // namespace handctl
