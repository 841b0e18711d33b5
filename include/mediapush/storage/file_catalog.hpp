#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace mediapush::storage {

struct FileEntry {
    std::filesystem::path path;
    std::uint64_t size = 0;
    std::string filename;
    // Trailing part of the filename used as progress label.
    std::string display_name;
};

// Finds the video files of a directory in a reproducible order.
class FileCatalog {
public:
    static constexpr size_t DISPLAY_NAME_CHARS = 60;
    
    explicit FileCatalog(std::filesystem::path root, bool recursive = false);
    
    // Matching files sorted case-insensitively by full path, truncated to the
    // first `limit` entries when a non-zero limit is given. Throws
    // core::ConfigurationError if the root is not a directory.
    std::vector<FileEntry> scan(std::optional<size_t> limit = std::nullopt) const;
    
    static const std::set<std::string>& video_extensions();
    static bool has_video_extension(const std::filesystem::path& path);
    static std::string display_name_for(const std::string& filename);
    
    const std::filesystem::path& root() const { return root_; }
    bool recursive() const { return recursive_; }
    
private:
    std::filesystem::path root_;
    bool recursive_;
    
    void consider(const std::filesystem::directory_entry& entry, std::vector<FileEntry>& out) const;
};

} // namespace mediapush::storage
