//===----------------------------------------------------------------------===//
//                         GateWire
//
// config/marshal_config.hpp
//
// Marshalling layer configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/marshal_limits.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace gatewire {

struct MarshalConfig {
    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Limits
    uint32_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
    uint32_t max_collection_elements = DEFAULT_MAX_COLLECTION_ELEMENTS;
    uint64_t max_value_bytes = DEFAULT_MAX_VALUE_BYTES;

    // Path the config was loaded from, if any
    std::string config_file;

    bool Validate(std::string& error) const {
        if (max_nesting_depth == 0) {
            error = "Max nesting depth must be greater than 0";
            return false;
        }
        if (max_collection_elements == 0) {
            error = "Max collection elements must be greater than 0";
            return false;
        }
        if (max_value_bytes == 0) {
            error = "Max value bytes must be greater than 0";
            return false;
        }
        return true;
    }

    MarshalLimits ToLimits() const {
        MarshalLimits limits;
        limits.max_nesting_depth = max_nesting_depth;
        limits.max_collection_elements = max_collection_elements;
        limits.max_value_bytes = max_value_bytes;
        return limits;
    }

    // Load from config file (auto-detects format by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        bool ok = (ext == ".yaml" || ext == ".yml") ? LoadFromYaml(path, error)
                                                    : LoadFromIni(path, error);
        if (ok) {
            config_file = path;
        }
        return ok;
    }

    // Load from INI-style config file (legacy format)
    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        if (cfg.Has("log_file")) log_file = cfg.GetString("log_file");
        if (cfg.Has("log_level")) log_level = cfg.GetString("log_level");

        uint64_t value;
        if (cfg.Has("max_nesting_depth")) {
            if (!cfg.GetUnsigned("max_nesting_depth", value)) {
                error = cfg.GetError();
                return false;
            }
            if (!AssignUint32("max_nesting_depth", value, max_nesting_depth, error)) {
                return false;
            }
        }
        if (cfg.Has("max_collection_elements")) {
            if (!cfg.GetUnsigned("max_collection_elements", value)) {
                error = cfg.GetError();
                return false;
            }
            if (!AssignUint32("max_collection_elements", value, max_collection_elements, error)) {
                return false;
            }
        }
        if (cfg.Has("max_value_bytes")) {
            if (!cfg.GetUnsigned("max_value_bytes", value)) {
                error = cfg.GetError();
                return false;
            }
            max_value_bytes = value;
        }
        return true;
    }

    // Load from YAML config file
    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        return LoadFromYamlConfig(cfg, error);
    }

    bool LoadFromYamlConfig(YamlConfig& cfg, std::string& error) {
        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");

        // Limits section
        uint64_t value;
        if (cfg.Has("limits.max_nesting_depth")) {
            if (!cfg.GetUnsigned("limits.max_nesting_depth", value)) {
                error = cfg.GetError();
                return false;
            }
            if (!AssignUint32("limits.max_nesting_depth", value, max_nesting_depth, error)) {
                return false;
            }
        }
        if (cfg.Has("limits.max_collection_elements")) {
            if (!cfg.GetUnsigned("limits.max_collection_elements", value)) {
                error = cfg.GetError();
                return false;
            }
            if (!AssignUint32("limits.max_collection_elements", value, max_collection_elements, error)) {
                return false;
            }
        }
        if (cfg.Has("limits.max_value_bytes")) {
            if (!cfg.GetUnsigned("limits.max_value_bytes", value)) {
                error = cfg.GetError();
                return false;
            }
            max_value_bytes = value;
        }
        return true;
    }

private:
    static bool AssignUint32(const char* key, uint64_t value, uint32_t& out, std::string& error) {
        if (value > UINT32_MAX) {
            error = std::string("Value for '") + key + "' is out of range";
            return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    }
};

//===----------------------------------------------------------------------===//
// Command line
//===----------------------------------------------------------------------===//
struct CommandLine {
    MarshalConfig config;
    bool show_version = false;
    bool show_help = false;
    // Command and its operands
    std::vector<std::string> arguments;
};

inline bool OptionTakesValue(const std::string& arg) {
    return arg == "-c" || arg == "--config" || arg == "--log-level" || arg == "--log-file" ||
           arg == "--max-depth" || arg == "--max-elements" || arg == "--max-value-bytes";
}

// Options stop at the first positional argument or at "--", so operands
// such as negative literals are never taken for options. The config file
// is applied first; explicit options override it.
inline bool ParseCommandLine(int argc, char* argv[], CommandLine& out, std::string& error) {
    CommandLine result;

    int first_operand = argc;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            first_operand = i + 1;
            break;
        }
        if (arg.empty() || arg[0] != '-') {
            first_operand = i;
            break;
        }
        if (OptionTakesValue(arg)) {
            if (i + 1 >= argc) {
                error = "Option " + arg + " requires a value";
                return false;
            }
            ++i;
        }
    }

    // First pass: config file
    for (int i = 1; i < first_operand; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (!result.config.LoadFromFile(argv[++i], error)) {
                error = "Error loading config file: " + error;
                return false;
            }
        } else if (OptionTakesValue(arg)) {
            ++i;
        }
    }

    // Second pass: overrides
    for (int i = 1; i < first_operand; ++i) {
        std::string arg = argv[i];
        uint64_t value;

        if (arg == "--") {
            break;
        } else if (arg == "--help") {
            result.show_help = true;
        } else if (arg == "--version") {
            result.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            ++i;  // Already processed
        } else if (arg == "--log-level") {
            result.config.log_level = argv[++i];
        } else if (arg == "--log-file") {
            result.config.log_file = argv[++i];
        } else if (arg == "--max-depth" || arg == "--max-elements") {
            if (!ParseUnsigned(argv[++i], value) || value > UINT32_MAX) {
                error = "Invalid value for " + arg + ": " + argv[i];
                return false;
            }
            if (arg == "--max-depth") {
                result.config.max_nesting_depth = static_cast<uint32_t>(value);
            } else {
                result.config.max_collection_elements = static_cast<uint32_t>(value);
            }
        } else if (arg == "--max-value-bytes") {
            if (!ParseUnsigned(argv[++i], value)) {
                error = "Invalid value for " + arg + ": " + argv[i];
                return false;
            }
            result.config.max_value_bytes = value;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    for (int i = first_operand; i < argc; ++i) {
        result.arguments.emplace_back(argv[i]);
    }

    out = std::move(result);
    return true;
}

} // namespace gatewire
