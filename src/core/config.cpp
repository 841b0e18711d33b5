#include "mediapush/core/config.hpp"
#include "mediapush/core/utils.hpp"
#include <cstdlib>

namespace mediapush::core {

bool Config::load_from_file(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = utils::StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        if (utils::StringUtils::starts_with(line, "export ")) {
            line = utils::StringUtils::trim(line.substr(7));
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = utils::StringUtils::trim(line.substr(0, eq_pos));
        std::string value = unquote(utils::StringUtils::trim(line.substr(eq_pos + 1)));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

void Config::load_from_environment(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            values_[key] = value;
        }
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = utils::StringUtils::to_lower(utils::StringUtils::trim(*value));
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::string Config::unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    
    // Unquoted values may carry a trailing comment.
    auto hash_pos = value.find(" #");
    if (hash_pos != std::string::npos) {
        return utils::StringUtils::trim(value.substr(0, hash_pos));
    }
    return value;
}

}
