#include "FileSelector.hpp"
#include "../engine/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace {
const std::set<std::string> VIDEO_EXTENSIONS = {
    ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".webm", ".m4v", ".ts"
};
}

std::string FileSelector::extensionOf(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool FileSelector::isVideo(const std::string& path) {
    return VIDEO_EXTENSIONS.contains(extensionOf(path));
}

FileEntry FileSelector::select(const std::vector<FileEntry>& files) {
    std::vector<const FileEntry*> candidates;
    for (const auto& file : files) {
        if (isVideo(file.path)) {
            candidates.push_back(&file);
        }
    }
    if (candidates.empty()) {
        // Mislabeled or extensionless content
        for (const auto& file : files) {
            candidates.push_back(&file);
        }
    }
    if (candidates.empty()) {
        throw NoPlayableFileError();
    }

    // max_element keeps the first of equal elements
    auto it = std::max_element(candidates.begin(), candidates.end(),
        [](const FileEntry* a, const FileEntry* b) { return a->length < b->length; });
    return **it;
}
