#pragma once
#include "../commands/CommandOptions.hpp"
#include <chrono>
#include <cstdint>
#include <string>

struct ServerConfig {
    std::string bind_address = "127.0.0.1";
    unsigned short port = 8888;
    std::string cache_dir;
    int64_t readahead_bytes = 8 * 1024 * 1024;
    double ready_threshold = 3.0;                 // percent downloaded before "ready"
    std::chrono::milliseconds stats_interval{1000};
    std::chrono::seconds metadata_timeout{0};     // zero waits forever
    std::chrono::seconds shutdown_grace{5};
    int connections_per_torrent = 80;

    std::string streamUrl() const;

    // Defaults, then ROXBOX_PORT / ROXBOX_CACHE, then -p -c -r -t -m options.
    // Throws BadRequestError on malformed values.
    static ServerConfig load(const CommandOptions& options);
};
