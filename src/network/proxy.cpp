#include "mediapush/network/proxy.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/logger.hpp"
#include "mediapush/core/utils.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/ip/address.hpp>
#include <sodium.h>
#include <array>
#include <istream>
#include <vector>

namespace mediapush::network {

using core::utils::StringUtils;

namespace {
    constexpr std::uint8_t SOCKS5_VERSION = 0x05;
    constexpr std::uint8_t SOCKS5_AUTH_NONE = 0x00;
    constexpr std::uint8_t SOCKS5_AUTH_USERPASS = 0x02;
    constexpr std::uint8_t SOCKS5_AUTH_REJECTED = 0xFF;
    constexpr std::uint8_t SOCKS5_CMD_CONNECT = 0x01;
    constexpr std::uint8_t SOCKS5_ATYP_IPV4 = 0x01;
    constexpr std::uint8_t SOCKS5_ATYP_DOMAIN = 0x03;
    constexpr std::uint8_t SOCKS5_ATYP_IPV6 = 0x04;
    
    constexpr std::uint8_t SOCKS4_VERSION = 0x04;
    constexpr std::uint8_t SOCKS4_GRANTED = 0x5A;
    
    std::optional<std::uint16_t> parse_port(const std::string& text) {
        if (text.empty() || text.size() > 5 || !StringUtils::is_integer(text) || text[0] == '-') {
            return std::nullopt;
        }
        auto value = std::stoul(text);
        if (value == 0 || value > 65535) {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    }
    
    void append_port(std::vector<std::uint8_t>& buffer, std::uint16_t port) {
        buffer.push_back(static_cast<std::uint8_t>((port >> 8) & 0xFF));
        buffer.push_back(static_cast<std::uint8_t>(port & 0xFF));
    }
    
    std::string base64_encode(const std::string& input) {
        std::string output(sodium_base64_encoded_len(input.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
        sodium_bin2base64(output.data(), output.size(),
                          reinterpret_cast<const unsigned char*>(input.data()), input.size(),
                          sodium_base64_VARIANT_ORIGINAL);
        output.resize(output.find('\0'));
        return output;
    }
    
    void socks5_authenticate(boost::asio::ip::tcp::socket& socket, const ProxySettings& proxy) {
        bool with_credentials = proxy.username.has_value();
        
        std::vector<std::uint8_t> greeting{SOCKS5_VERSION};
        if (with_credentials) {
            greeting.insert(greeting.end(), {2, SOCKS5_AUTH_NONE, SOCKS5_AUTH_USERPASS});
        } else {
            greeting.insert(greeting.end(), {1, SOCKS5_AUTH_NONE});
        }
        boost::asio::write(socket, boost::asio::buffer(greeting));
        
        std::array<std::uint8_t, 2> choice{};
        boost::asio::read(socket, boost::asio::buffer(choice));
        if (choice[0] != SOCKS5_VERSION || choice[1] == SOCKS5_AUTH_REJECTED) {
            throw core::TransferError("SOCKS5 proxy rejected all authentication methods");
        }
        
        if (choice[1] != SOCKS5_AUTH_USERPASS) {
            return;
        }
        if (!with_credentials) {
            throw core::TransferError("SOCKS5 proxy requires a username and password");
        }
        
        const std::string& user = *proxy.username;
        std::string pass = proxy.password.value_or("");
        if (user.size() > 255 || pass.size() > 255) {
            throw core::ConfigurationError("SOCKS5 credentials longer than 255 bytes");
        }
        
        std::vector<std::uint8_t> request{0x01, static_cast<std::uint8_t>(user.size())};
        request.insert(request.end(), user.begin(), user.end());
        request.push_back(static_cast<std::uint8_t>(pass.size()));
        request.insert(request.end(), pass.begin(), pass.end());
        boost::asio::write(socket, boost::asio::buffer(request));
        
        std::array<std::uint8_t, 2> status{};
        boost::asio::read(socket, boost::asio::buffer(status));
        if (status[1] != 0x00) {
            throw core::TransferError("SOCKS5 proxy authentication failed");
        }
    }
    
    void socks5_connect(boost::asio::ip::tcp::socket& socket,
                        const ProxySettings& proxy,
                        const std::string& host,
                        std::uint16_t port) {
        socks5_authenticate(socket, proxy);
        
        std::vector<std::uint8_t> request{SOCKS5_VERSION, SOCKS5_CMD_CONNECT, 0x00};
        
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(host, ec);
        if (!ec && address.is_v4()) {
            request.push_back(SOCKS5_ATYP_IPV4);
            auto bytes = address.to_v4().to_bytes();
            request.insert(request.end(), bytes.begin(), bytes.end());
        } else if (!ec && address.is_v6()) {
            request.push_back(SOCKS5_ATYP_IPV6);
            auto bytes = address.to_v6().to_bytes();
            request.insert(request.end(), bytes.begin(), bytes.end());
        } else {
            if (host.size() > 255) {
                throw core::ConfigurationError("Gateway host name too long for SOCKS5: " + host);
            }
            request.push_back(SOCKS5_ATYP_DOMAIN);
            request.push_back(static_cast<std::uint8_t>(host.size()));
            request.insert(request.end(), host.begin(), host.end());
        }
        append_port(request, port);
        boost::asio::write(socket, boost::asio::buffer(request));
        
        std::array<std::uint8_t, 4> reply{};
        boost::asio::read(socket, boost::asio::buffer(reply));
        if (reply[0] != SOCKS5_VERSION || reply[1] != 0x00) {
            throw core::TransferError("SOCKS5 proxy refused connection to " + host + ":" +
                                      std::to_string(port) + " (code " + std::to_string(reply[1]) + ")");
        }
        
        // Drain the bound address; its length depends on the address type.
        size_t remaining = 2;
        switch (reply[3]) {
            case SOCKS5_ATYP_IPV4: remaining += 4; break;
            case SOCKS5_ATYP_IPV6: remaining += 16; break;
            case SOCKS5_ATYP_DOMAIN: {
                std::array<std::uint8_t, 1> length{};
                boost::asio::read(socket, boost::asio::buffer(length));
                remaining += length[0];
                break;
            }
            default:
                throw core::ProtocolError("SOCKS5 proxy sent unknown address type");
        }
        std::vector<std::uint8_t> bound(remaining);
        boost::asio::read(socket, boost::asio::buffer(bound));
    }
    
    void socks4_connect(boost::asio::ip::tcp::socket& socket,
                        const ProxySettings& proxy,
                        const std::string& host,
                        std::uint16_t port) {
        std::vector<std::uint8_t> request{SOCKS4_VERSION, 0x01};
        append_port(request, port);
        
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(host, ec);
        bool literal_v4 = !ec && address.is_v4();
        if (literal_v4) {
            auto bytes = address.to_v4().to_bytes();
            request.insert(request.end(), bytes.begin(), bytes.end());
        } else {
            // SOCKS4a: invalid address 0.0.0.x, host name follows the user id.
            request.insert(request.end(), {0, 0, 0, 1});
        }
        
        std::string user = proxy.username.value_or("");
        request.insert(request.end(), user.begin(), user.end());
        request.push_back(0x00);
        
        if (!literal_v4) {
            request.insert(request.end(), host.begin(), host.end());
            request.push_back(0x00);
        }
        boost::asio::write(socket, boost::asio::buffer(request));
        
        std::array<std::uint8_t, 8> reply{};
        boost::asio::read(socket, boost::asio::buffer(reply));
        if (reply[1] != SOCKS4_GRANTED) {
            throw core::TransferError("SOCKS4 proxy refused connection to " + host + ":" +
                                      std::to_string(port));
        }
    }
    
    void http_connect(boost::asio::ip::tcp::socket& socket,
                      const ProxySettings& proxy,
                      const std::string& host,
                      std::uint16_t port) {
        std::string authority = host + ":" + std::to_string(port);
        std::string request = "CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n";
        if (proxy.username) {
            request += "Proxy-Authorization: Basic " +
                       base64_encode(*proxy.username + ":" + proxy.password.value_or("")) + "\r\n";
        }
        request += "\r\n";
        boost::asio::write(socket, boost::asio::buffer(request));
        
        boost::asio::streambuf response;
        boost::asio::read_until(socket, response, "\r\n\r\n");
        
        std::istream stream(&response);
        std::string version;
        unsigned int status = 0;
        stream >> version >> status;
        if (!StringUtils::starts_with(version, "HTTP/") || status != 200) {
            throw core::TransferError("HTTP proxy refused CONNECT to " + authority +
                                      " (status " + std::to_string(status) + ")");
        }
    }
}

std::optional<ProxySettings> parse_proxy_url(const std::string& url) {
    auto trimmed = StringUtils::trim(url);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    
    auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw core::ConfigurationError("Proxy URL is missing scheme/host/port: " + trimmed);
    }
    
    ProxySettings proxy;
    proxy.scheme = StringUtils::to_lower(trimmed.substr(0, scheme_end));
    if (proxy.scheme == "socks5" || proxy.scheme == "socks5h") {
        proxy.type = ProxyType::SOCKS5;
    } else if (proxy.scheme == "socks4") {
        proxy.type = ProxyType::SOCKS4;
    } else if (proxy.scheme == "http" || proxy.scheme == "https") {
        proxy.type = ProxyType::HTTP;
    } else {
        throw core::ConfigurationError("Unsupported proxy type: " + proxy.scheme);
    }
    
    std::string rest = trimmed.substr(scheme_end + 3);
    rest = rest.substr(0, rest.find_first_of("/?#"));
    
    auto at_pos = rest.rfind('@');
    if (at_pos != std::string::npos) {
        std::string userinfo = rest.substr(0, at_pos);
        rest = rest.substr(at_pos + 1);
        
        auto colon = userinfo.find(':');
        std::string user = userinfo.substr(0, colon);
        if (!user.empty()) {
            proxy.username = user;
        }
        if (colon != std::string::npos) {
            proxy.password = userinfo.substr(colon + 1);
        }
    }
    
    std::string port_text;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            throw core::ConfigurationError("Proxy URL has an unterminated IPv6 address: " + trimmed);
        }
        proxy.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':') {
            port_text = rest.substr(close + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        proxy.host = rest.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = rest.substr(colon + 1);
        }
    }
    
    auto port = parse_port(port_text);
    if (proxy.host.empty() || !port) {
        throw core::ConfigurationError("Proxy URL is missing scheme/host/port: " + trimmed);
    }
    proxy.port = *port;
    
    return proxy;
}

std::optional<std::string> proxy_url_from_config(const core::Config& config) {
    if (!config.get_bool("PROXY_ENABLED", false)) {
        return std::nullopt;
    }
    
    auto host = StringUtils::trim(config.get_string("PROXY_HOST"));
    auto port = StringUtils::trim(config.get_string("PROXY_PORT"));
    if (host.empty() || port.empty()) {
        LOG_WARN("PROXY_ENABLED is set but PROXY_HOST or PROXY_PORT is missing; not using a proxy");
        return std::nullopt;
    }
    
    auto user = config.get_string("PROXY_USER");
    auto pass = config.get_string("PROXY_PASS");
    
    std::string auth;
    if (!user.empty()) {
        auth = pass.empty() ? user + "@" : user + ":" + pass + "@";
    } else if (!pass.empty()) {
        LOG_WARN("PROXY_PASS is set without PROXY_USER; connecting to the proxy without credentials");
    }
    
    return "socks5://" + auth + host + ":" + port;
}

void establish_tunnel(boost::asio::ip::tcp::socket& socket,
                      const ProxySettings& proxy,
                      const std::string& target_host,
                      std::uint16_t target_port) {
    LOG_DEBUG("Opening {} tunnel to {}:{}", proxy.scheme, target_host, target_port);
    
    switch (proxy.type) {
        case ProxyType::SOCKS5:
            socks5_connect(socket, proxy, target_host, target_port);
            break;
        case ProxyType::SOCKS4:
            socks4_connect(socket, proxy, target_host, target_port);
            break;
        case ProxyType::HTTP:
            http_connect(socket, proxy, target_host, target_port);
            break;
    }
}

std::string describe(const ProxySettings& proxy) {
    std::string text = proxy.scheme + "://";
    if (proxy.username) {
        text += *proxy.username + (proxy.password ? ":***@" : "@");
    }
    return text + proxy.host + ":" + std::to_string(proxy.port);
}

}
