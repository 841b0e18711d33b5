#pragma once

#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <vector>

namespace mediapush::core {

// Flat key=value store. Holds the contents of a .env-style file, optionally
// overlaid by process environment variables.
class Config {
public:
    Config() = default;
    
    bool load_from_file(const std::filesystem::path& filename);
    
    // Copies the listed variables from the process environment, replacing
    // values loaded from file.
    void load_from_environment(const std::vector<std::string>& keys);
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
private:
    std::map<std::string, std::string> values_;
    
    static std::string unquote(const std::string& value);
};

}
