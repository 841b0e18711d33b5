#include "mediapush/core/settings.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/logger.hpp"
#include "mediapush/core/utils.hpp"

namespace mediapush::core {

const std::vector<std::string> SETTINGS_KEYS = {
    "UPLOAD_API_ID",
    "UPLOAD_API_HASH",
    "UPLOAD_SESSION",
    "UPLOAD_PHONE",
    "UPLOAD_TARGET",
    "UPLOAD_DIR",
    "UPLOAD_PROXY",
    "PROXY_ENABLED",
    "PROXY_HOST",
    "PROXY_PORT",
    "PROXY_USER",
    "PROXY_PASS",
    "GATEWAY_HOST",
    "GATEWAY_PORT",
    "LOG_FILE"
};

Settings Settings::load(const Config& config, const std::filesystem::path& base_dir, bool no_proxy) {
    using utils::StringUtils;
    using utils::FileUtils;
    
    Settings settings;
    
    auto api_id = StringUtils::trim(config.get_string("UPLOAD_API_ID"));
    if (api_id.empty() || !StringUtils::is_integer(api_id) || api_id[0] == '-') {
        throw ConfigurationError("Missing UPLOAD_API_ID (must be an integer)");
    }
    try {
        settings.api_id = std::stoll(api_id);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("UPLOAD_API_ID is out of range: " + api_id);
    }
    
    settings.api_hash = StringUtils::trim(config.get_string("UPLOAD_API_HASH"));
    if (settings.api_hash.empty()) {
        throw ConfigurationError("Missing UPLOAD_API_HASH");
    }
    
    settings.target = StringUtils::trim(config.get_string("UPLOAD_TARGET"));
    if (settings.target.empty()) {
        throw ConfigurationError("Missing UPLOAD_TARGET");
    }
    
    settings.phone = StringUtils::trim(config.get_string("UPLOAD_PHONE"));
    settings.session_path = FileUtils::expand_user(
        config.get_string("UPLOAD_SESSION", (base_dir / "session.session").string()));
    
    auto download_dir = config.get_string("UPLOAD_DIR");
    if (download_dir.empty()) {
        download_dir = (base_dir / "downloads").string();
    }
    settings.download_dir = std::filesystem::weakly_canonical(
        std::filesystem::absolute(FileUtils::expand_user(download_dir)));
    if (!FileUtils::is_directory(settings.download_dir)) {
        throw ConfigurationError("Download directory does not exist: " + settings.download_dir.string());
    }
    
    if (!no_proxy) {
        auto proxy_url = config.get("UPLOAD_PROXY");
        if (!proxy_url || StringUtils::trim(*proxy_url).empty()) {
            proxy_url = network::proxy_url_from_config(config);
        }
        if (proxy_url) {
            settings.proxy = network::parse_proxy_url(*proxy_url);
        }
    }
    
    settings.gateway_host = StringUtils::trim(config.get_string("GATEWAY_HOST", settings.gateway_host));
    if (settings.gateway_host.empty()) {
        throw ConfigurationError("GATEWAY_HOST is empty");
    }
    
    auto gateway_port = config.get_as<int>("GATEWAY_PORT");
    if (config.contains("GATEWAY_PORT")) {
        if (!gateway_port || *gateway_port <= 0 || *gateway_port > 65535) {
            throw ConfigurationError("GATEWAY_PORT must be a port number between 1 and 65535");
        }
        settings.gateway_port = static_cast<std::uint16_t>(*gateway_port);
    }
    
    settings.log_file = config.get_string("LOG_FILE", settings.log_file.string());
    
    LOG_DEBUG("Settings loaded: target={}, download_dir={}, gateway={}:{}, proxy={}",
              settings.target, settings.download_dir.string(), settings.gateway_host,
              settings.gateway_port, settings.proxy ? network::describe(*settings.proxy) : "none");
    
    return settings;
}

}
