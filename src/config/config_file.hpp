//===----------------------------------------------------------------------===//
//                         GateWire
//
// config/config_file.hpp
//
// Legacy configuration file parser (key = value)
//===----------------------------------------------------------------------===//

#pragma once

#include <parallel_hashmap/phmap.h>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <string>

namespace gatewire {

// Parses an unsigned decimal, rejecting signs, spaces and trailing junk
inline bool ParseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = first + text.size();
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }

        std::string line;
        int line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            line.erase(0, line.find_first_not_of(" \t\r"));
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = "Invalid syntax at line " + std::to_string(line_num);
                return false;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);

            if (key.empty()) {
                error_ = "Missing key at line " + std::to_string(line_num);
                return false;
            }

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            entries_[key] = Entry{value, line_num};
        }

        return true;
    }

    std::string GetString(const std::string& key, const std::string& default_val = "") const {
        auto it = entries_.find(key);
        return it != entries_.end() ? it->second.value : default_val;
    }

    // False, with GetError() set, when the value is not an unsigned integer
    bool GetUnsigned(const std::string& key, uint64_t& out) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            error_ = "Missing key: " + key;
            return false;
        }
        if (!ParseUnsigned(it->second.value, out)) {
            error_ = "Invalid value for '" + key + "' at line " +
                     std::to_string(it->second.line) + ": expected a non-negative integer";
            return false;
        }
        return true;
    }

    bool Has(const std::string& key) const {
        return entries_.find(key) != entries_.end();
    }

    const std::string& GetError() const { return error_; }

private:
    struct Entry {
        std::string value;
        int line;
    };

    phmap::flat_hash_map<std::string, Entry> entries_;
    std::string error_;
};

} // namespace gatewire
