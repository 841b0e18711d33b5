#pragma once

#include "mediapush/core/config.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace mediapush::network {

enum class ProxyType {
    SOCKS5,
    SOCKS4,
    HTTP
};

struct ProxySettings {
    ProxyType type = ProxyType::SOCKS5;
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;
    // Hostnames are resolved by the proxy, never locally.
    bool remote_dns = true;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

// Parses "scheme://[user[:pass]@]host:port". Accepted schemes: socks5,
// socks5h, socks4, http, https. An empty string yields no proxy.
// Throws core::ConfigurationError on anything else.
std::optional<ProxySettings> parse_proxy_url(const std::string& url);

// Builds a socks5 URL from PROXY_ENABLED, PROXY_HOST, PROXY_PORT, PROXY_USER
// and PROXY_PASS. Returns nothing when the proxy is disabled or incomplete.
// Credentials are only embedded when a username is present.
std::optional<std::string> proxy_url_from_config(const core::Config& config);

// Runs the proxy handshake on an already connected socket so that the socket
// ends up tunnelled to target_host:target_port.
void establish_tunnel(boost::asio::ip::tcp::socket& socket,
                      const ProxySettings& proxy,
                      const std::string& target_host,
                      std::uint16_t target_port);

std::string describe(const ProxySettings& proxy);

}
