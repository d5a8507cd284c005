#include "default_config.h"

#if __has_include(<jsoncpp/json/reader.h>)
#include <jsoncpp/json/reader.h>
#include <jsoncpp/json/value.h>  // Ubuntu
#else
#include <json/reader.h>
#include <json/value.h>  // CentOS
#endif

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace shufflenet {

namespace {
bool hasExtension(const std::string& path, const std::string& ext) {
    return path.size() >= ext.size() &&
           path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}
}  // namespace

void DefaultConfig::Load() {
    if (path_.empty()) {
        throw std::runtime_error("Config path is not set");
    }
    LOG(INFO) << "Loading config from: " << path_;
    data_.clear();
    if (hasExtension(path_, ".yaml") || hasExtension(path_, ".yml")) {
        loadFromYAML();
        type_ = ConfigType::YAML;
    } else if (hasExtension(path_, ".json")) {
        loadFromJSON();
        type_ = ConfigType::JSON;
    } else {
        type_ = ConfigType::UNKNOWN;
        throw std::runtime_error("Unsupported config file format: " + path_);
    }
}

void DefaultConfig::loadFromYAML() {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path_);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file: " +
                                 std::string(e.what()));
    }
    processNode(node, "");
}

void DefaultConfig::loadFromJSON() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open JSON file: " + path_);
    }

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(file, root, false)) {
        throw std::runtime_error("Failed to parse JSON file: " +
                                 reader.getFormattedErrorMessages());
    }
    processNode(root, "");
}

void DefaultConfig::processNode(const YAML::Node& node, std::string key) {
    if (node.IsScalar()) {
        data_[key] = Node{.yaml_node_ = node, .json_value_ = Json::nullValue};
    } else if (node.IsMap()) {
        for (const auto& iter : node) {
            std::string new_key =
                key.empty() ? iter.first.as<std::string>()
                            : key + "." + iter.first.as<std::string>();
            processNode(iter.second, new_key);
        }
    } else if (!node.IsNull()) {
        throw std::runtime_error("Unsupported YAML node type at key: " + key);
    }
}

void DefaultConfig::processNode(const Json::Value& node, std::string key) {
    if (node.isObject()) {
        for (const auto& member : node.getMemberNames()) {
            std::string new_key = key.empty() ? member : key + "." + member;
            processNode(node[member], new_key);
        }
    } else if (node.isArray()) {
        throw std::runtime_error("Unsupported JSON node type at key: " + key);
    } else if (!node.isNull()) {
        data_[key] = Node{.yaml_node_ = YAML::Node(), .json_value_ = node};
    }
}

void DefaultConfig::GetInt32(const std::string& key, int32_t* val,
                             int32_t default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<int32_t>(); },
        [](const Json::Value& v) { return static_cast<int32_t>(v.asInt()); });
}

void DefaultConfig::GetUInt32(const std::string& key, uint32_t* val,
                              uint32_t default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<uint32_t>(); },
        [](const Json::Value& v) { return static_cast<uint32_t>(v.asUInt()); });
}

void DefaultConfig::GetInt64(const std::string& key, int64_t* val,
                             int64_t default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<int64_t>(); },
        [](const Json::Value& v) { return static_cast<int64_t>(v.asInt64()); });
}

void DefaultConfig::GetUInt64(const std::string& key, uint64_t* val,
                              uint64_t default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<uint64_t>(); },
        [](const Json::Value& v) {
            return static_cast<uint64_t>(v.asUInt64());
        });
}

void DefaultConfig::GetDouble(const std::string& key, double* val,
                              double default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<double>(); },
        [](const Json::Value& v) { return v.asDouble(); });
}

void DefaultConfig::GetBool(const std::string& key, bool* val,
                            bool default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<bool>(); },
        [](const Json::Value& v) { return v.asBool(); });
}

void DefaultConfig::GetString(const std::string& key, std::string* val,
                              const std::string& default_value) const {
    getTyped(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<std::string>(); },
        [](const Json::Value& v) { return v.asString(); });
}

}  // namespace shufflenet
