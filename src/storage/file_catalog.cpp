#include "mediapush/storage/file_catalog.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/logger.hpp"
#include "mediapush/core/utils.hpp"
#include <algorithm>

namespace mediapush::storage {

using core::utils::StringUtils;

FileCatalog::FileCatalog(std::filesystem::path root, bool recursive)
    : root_(std::move(root))
    , recursive_(recursive) {
}

const std::set<std::string>& FileCatalog::video_extensions() {
    static const std::set<std::string> extensions = {
        ".mp4", ".mkv", ".mov", ".webm", ".avi", ".flv", ".m4v", ".ts"
    };
    return extensions;
}

bool FileCatalog::has_video_extension(const std::filesystem::path& path) {
    auto extension = StringUtils::to_lower(path.extension().string());
    return video_extensions().count(extension) > 0;
}

std::string FileCatalog::display_name_for(const std::string& filename) {
    return StringUtils::utf8_tail(filename, DISPLAY_NAME_CHARS);
}

std::vector<FileEntry> FileCatalog::scan(std::optional<size_t> limit) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        throw core::ConfigurationError("Download directory does not exist: " + root_.string());
    }
    
    std::vector<FileEntry> files;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    
    if (recursive_) {
        std::filesystem::recursive_directory_iterator it(root_, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            consider(*it, files);
        }
    } else {
        std::filesystem::directory_iterator it(root_, options, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            consider(*it, files);
        }
    }
    
    if (ec) {
        throw core::ConfigurationError("Failed to scan " + root_.string() + ": " + ec.message());
    }
    
    std::sort(files.begin(), files.end(), [](const FileEntry& a, const FileEntry& b) {
        auto lhs = StringUtils::to_lower(a.path.string());
        auto rhs = StringUtils::to_lower(b.path.string());
        if (lhs != rhs) {
            return lhs < rhs;
        }
        return a.path.string() < b.path.string();
    });
    
    if (limit && *limit > 0 && files.size() > *limit) {
        files.resize(*limit);
    }
    
    LOG_DEBUG("Catalog of {} ({}) found {} video files",
              root_.string(), recursive_ ? "recursive" : "flat", files.size());
    return files;
}

void FileCatalog::consider(const std::filesystem::directory_entry& entry, std::vector<FileEntry>& out) const {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || !has_video_extension(entry.path())) {
        return;
    }
    
    auto size = core::utils::FileUtils::file_size(entry.path());
    if (!size) {
        LOG_WARN("Skipping {}: size unavailable", entry.path().string());
        return;
    }
    
    FileEntry file;
    file.path = std::filesystem::absolute(entry.path());
    file.size = *size;
    file.filename = entry.path().filename().string();
    file.display_name = display_name_for(file.filename);
    out.push_back(std::move(file));
}

} // namespace mediapush::storage
