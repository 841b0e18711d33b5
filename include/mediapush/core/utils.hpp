#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace mediapush::core::utils {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    
    // Optional leading '-' followed by one or more digits.
    static bool is_integer(const std::string& str);
    
    // Last max_chars characters of a UTF-8 string, never splitting a
    // multi-byte sequence.
    static std::string utf8_tail(const std::string& str, size_t max_chars);
};

class FileUtils {
public:
    static bool is_directory(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    
    // Replaces a leading "~" with the home directory.
    static std::filesystem::path expand_user(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
};

}
