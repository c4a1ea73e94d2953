#include "ServerConfig.hpp"
#include "../engine/Errors.hpp"
#include <cstdlib>
#include <filesystem>

namespace {
long long parseNumber(const std::string& flag, const std::string& value, long long min, long long max) {
    size_t used = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw BadRequestError("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size() || number < min || number > max) {
        throw BadRequestError("Invalid value for " + flag + ": " + value);
    }
    return number;
}
}

std::string ServerConfig::streamUrl() const {
    return "http://" + bind_address + ":" + std::to_string(port) + "/stream";
}

ServerConfig ServerConfig::load(const CommandOptions& options) {
    ServerConfig config;
    config.cache_dir = (std::filesystem::temp_directory_path() / "roxbox_torrent").string();

    if (const char* port = std::getenv("ROXBOX_PORT"); port != nullptr && *port != '\0') {
        config.port = static_cast<unsigned short>(parseNumber("ROXBOX_PORT", port, 0, 65535));
    }
    if (const char* cache = std::getenv("ROXBOX_CACHE"); cache != nullptr && *cache != '\0') {
        config.cache_dir = cache;
    }

    if (options.options.contains("-p")) {
        config.port = static_cast<unsigned short>(parseNumber("-p", options.options.at("-p"), 0, 65535));
    }
    if (options.options.contains("-c")) {
        config.cache_dir = options.options.at("-c");
    }
    if (options.options.contains("-r")) {
        config.readahead_bytes = parseNumber("-r", options.options.at("-r"), 1, 1024) * 1024 * 1024;
    }
    if (options.options.contains("-t")) {
        config.ready_threshold = static_cast<double>(parseNumber("-t", options.options.at("-t"), 0, 100));
    }
    if (options.options.contains("-m")) {
        config.metadata_timeout = std::chrono::seconds(parseNumber("-m", options.options.at("-m"), 0, 86400));
    }
    return config;
}
