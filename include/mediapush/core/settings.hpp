#pragma once

#include "mediapush/core/config.hpp"
#include "mediapush/network/proxy.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace mediapush::core {

// Every key the application reads. Process environment overrides the file.
extern const std::vector<std::string> SETTINGS_KEYS;

struct Settings {
    std::int64_t api_id = 0;
    std::string api_hash;
    std::filesystem::path session_path;
    std::string phone;
    std::string target;
    std::filesystem::path download_dir;
    std::optional<network::ProxySettings> proxy;
    
    std::string gateway_host = "127.0.0.1";
    std::uint16_t gateway_port = 8443;
    std::filesystem::path log_file = "mediapush.log";
    
    // Validates and resolves everything once. base_dir anchors the default
    // session file and download directory. Throws ConfigurationError with a
    // message naming the offending key.
    static Settings load(const Config& config, const std::filesystem::path& base_dir, bool no_proxy);
};

}
