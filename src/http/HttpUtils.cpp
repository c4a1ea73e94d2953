#include "HttpUtils.hpp"
#include "../stream/FileSelector.hpp"
#include "../utils/MagnetUtils.hpp"
#include <sstream>

std::pair<std::string, std::string> HttpUtils::splitTarget(const std::string& target) {
    size_t question = target.find('?');
    if (question == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, question), target.substr(question + 1)};
}

std::map<std::string, std::string> HttpUtils::parseQuery(const std::string& query) {
    std::map<std::string, std::string> values;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = MagnetUtils::urlDecode(pair.substr(0, eq), true);
        std::string value = eq == std::string::npos ? "" : MagnetUtils::urlDecode(pair.substr(eq + 1), true);
        values.emplace(key, value);
    }
    return values;
}

std::string HttpUtils::contentTypeFor(const std::string& path) {
    std::string ext = FileSelector::extensionOf(path);
    if (ext == ".mkv") {
        return "video/x-matroska";
    }
    if (ext == ".avi") {
        return "video/x-msvideo";
    }
    if (ext == ".webm") {
        return "video/webm";
    }
    return "video/mp4";
}
