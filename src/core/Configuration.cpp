#include "wojak/core/Configuration.hpp"
#include "wojak/core/Logger.hpp"
#include <fstream>
#include <sstream>

namespace wojak {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    try {
        YAML::Node loaded = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = loaded;
        currentFile_ = filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load configuration " + filename + ": " + e.what());
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml) {
    try {
        YAML::Node loaded = YAML::Load(yaml);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = loaded;
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Failed to parse configuration: ") + e.what());
        return false;
    }
}

bool Configuration::save(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }
    YAML::Emitter emitter;
    emitter << root_;
    out << emitter.c_str() << '\n';
    return out.good();
}

bool Configuration::reload() {
    std::string file = getFilename();
    if (file.empty()) {
        return false;
    }
    return load(file);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookup(key);
    return node && !node.IsNull();
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

std::vector<std::string> Configuration::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

YAML::Node Configuration::lookup(const std::string& key) const {
    // Const node handles: operator[] never inserts
    std::vector<YAML::Node> chain;
    chain.push_back(root_);
    for (const auto& part : splitKey(key)) {
        const YAML::Node& current = chain.back();
        if (!current.IsMap()) {
            return YAML::Node();
        }
        YAML::Node next = current[part];
        if (!next) {
            return YAML::Node();
        }
        chain.push_back(next);
    }
    return chain.back();
}

void Configuration::assign(const std::string& key, const YAML::Node& value) {
    auto parts = splitKey(key);
    if (parts.empty()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    std::vector<YAML::Node> chain;
    chain.push_back(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = chain.back()[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        chain.push_back(child);
    }
    chain.back()[parts.back()] = value;
}

} // namespace core
} // namespace wojak
