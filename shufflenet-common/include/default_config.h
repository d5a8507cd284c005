#pragma once

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <unordered_map>

namespace shufflenet {

/**
 * @brief DefaultConfig loads a YAML or JSON configuration file and exposes
 * its scalar values by flattened key, e.g. `shuffle.io.serverThreads`.
 *
 * The format is chosen by file extension (`.yaml` or `.json`). Nested maps
 * are flattened with '.' separators; sequences are not supported.
 */
class DefaultConfig {
   public:
    struct Node {
        YAML::Node yaml_node_;
        Json::Value json_value_;
    };

    enum ConfigType {
        YAML = 1,
        JSON = 2,
        UNKNOWN = 3,
    };

   public:
    /**
     * @brief Load parses the file set by SetPath
     * @throws std::runtime_error if the path is unset, the extension is not
     * supported or the file cannot be parsed
     */
    void Load();

    /**
     * @brief Contains reports whether the flattened key was present in the
     * loaded file
     */
    bool Contains(const std::string& key) const {
        return data_.find(key) != data_.end();
    }

    // The getters below assign default_value to val if the key is absent.
    void GetInt32(const std::string& key, int32_t* val,
                  int32_t default_value = 0) const;

    void GetUInt32(const std::string& key, uint32_t* val,
                   uint32_t default_value = 0) const;

    void GetInt64(const std::string& key, int64_t* val,
                  int64_t default_value = 0) const;

    void GetUInt64(const std::string& key, uint64_t* val,
                   uint64_t default_value = 0) const;

    void GetDouble(const std::string& key, double* val,
                   double default_value = 0.0) const;

    void GetBool(const std::string& key, bool* val,
                 bool default_value = false) const;

    void GetString(const std::string& key, std::string* val,
                   const std::string& default_value = "") const;

    void SetPath(const std::string& path) { path_ = path; }

    const std::string& GetPath() const { return path_; }

    ConfigType GetType() const { return type_; }

   private:
    void processNode(const YAML::Node& node, std::string key);

    void processNode(const Json::Value& node, std::string key);

    void loadFromYAML();

    void loadFromJSON();

    // Looks the key up and converts it with the converter matching the
    // loaded format; falls back to default_value when absent.
    template <typename T, typename FromYaml, typename FromJson>
    void getTyped(const std::string& key, T* val, const T& default_value,
                  FromYaml from_yaml, FromJson from_json) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            *val = default_value;
            return;
        }
        if (type_ == ConfigType::YAML) {
            *val = from_yaml(it->second.yaml_node_);
        } else if (type_ == ConfigType::JSON) {
            *val = from_json(it->second.json_value_);
        } else {
            *val = default_value;
        }
    }

   private:
    std::string path_;
    ConfigType type_ = ConfigType::UNKNOWN;
    std::unordered_map<std::string, Node> data_;
};

}  // namespace shufflenet
