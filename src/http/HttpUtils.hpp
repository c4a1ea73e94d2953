#pragma once
#include <map>
#include <string>

class HttpUtils {
public:
    // Splits "/path?query" into its two halves
    static std::pair<std::string, std::string> splitTarget(const std::string& target);
    // application/x-www-form-urlencoded pairs; the first occurrence of a key wins
    static std::map<std::string, std::string> parseQuery(const std::string& query);
    // MIME type for a media file by extension, video/mp4 by default
    static std::string contentTypeFor(const std::string& path);
};
