#pragma once
#include "../engine/TransferEngine.hpp"
#include "../manager/PriorityScheduler.hpp"
#include <cstdint>
#include <memory>
#include <string>

// Everything a request needs to serve the selected file of the current session
struct ActiveStream {
    uint64_t session_id = 0;
    std::shared_ptr<Transfer> transfer;
    std::shared_ptr<PriorityScheduler> scheduler;
    FileEntry file;
    int64_t piece_length = 0;
    int num_pieces = 0;
    std::string etag;
};
