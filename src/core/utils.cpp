#include "mediapush/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mediapush::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    
    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    
    return start < end ? std::string(start, end) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::is_integer(const std::string& str) {
    size_t start = (!str.empty() && str[0] == '-') ? 1 : 0;
    if (start == str.size()) {
        return false;
    }
    return std::all_of(str.begin() + start, str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string StringUtils::utf8_tail(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    size_t pos = str.size();
    
    while (pos > 0 && chars < max_chars) {
        --pos;
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(str[pos]) & 0xC0) != 0x80) {
            ++chars;
        }
    }
    
    return str.substr(pos);
}

bool FileUtils::is_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::filesystem::path FileUtils::expand_user(const std::filesystem::path& path) {
    auto str = path.string();
    if (str == "~") {
        return get_home_dir();
    }
    if (StringUtils::starts_with(str, "~/")) {
        return get_home_dir() / str.substr(2);
    }
    return path;
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

}
