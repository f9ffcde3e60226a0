//===----------------------------------------------------------------------===//
//                         GateWire
//
// config/yaml_config.hpp
//
// YAML configuration file parser
//===----------------------------------------------------------------------===//

#pragma once

#include "config/config_file.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace gatewire {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
            return true;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        YAML::Node node = GetNode(path);
        if (!node || !node.IsScalar()) {
            return default_val;
        }
        return node.Scalar();
    }

    // False, with GetError() set, when the node is not an unsigned integer
    bool GetUnsigned(const std::string& path, uint64_t& out) {
        YAML::Node node = GetNode(path);
        if (!node || !node.IsScalar() || !ParseUnsigned(node.Scalar(), out)) {
            error_ = "Invalid value for '" + path + "': expected a non-negative integer";
            return false;
        }
        return true;
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    const std::string& GetError() const { return error_; }

private:
    // Node at a dot-separated path (e.g. "limits.max_value_bytes"); an
    // undefined node when any segment is missing
    YAML::Node GetNode(const std::string& path) const {
        YAML::Node current;
        current.reset(root_);

        size_t start = 0;
        while (true) {
            size_t end = path.find('.', start);
            std::string key = path.substr(start, end == std::string::npos ? end : end - start);
            if (!current.IsMap()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            const YAML::Node& parent = current;
            YAML::Node next = parent[key];
            if (!next) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current.reset(next);
            if (end == std::string::npos) {
                return current;
            }
            start = end + 1;
        }
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace gatewire
