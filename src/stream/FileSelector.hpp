#pragma once
#include "../engine/TransferEngine.hpp"
#include <string>
#include <vector>

class FileSelector {
public:
    // Largest video file, or the largest file when nothing looks like video.
    // Throws NoPlayableFileError for an empty list.
    static FileEntry select(const std::vector<FileEntry>& files);

    static bool isVideo(const std::string& path);
    static std::string extensionOf(const std::string& path);
};
