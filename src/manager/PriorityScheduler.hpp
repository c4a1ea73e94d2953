#pragma once
#include "../engine/TransferEngine.hpp"
#include <map>
#include <memory>
#include <mutex>

// Absolute byte ranges within the transfer, half-open
struct PriorityWindow {
    int64_t head_begin = 0;
    int64_t head_end = 0;
    int64_t tail_begin = 0;
    int64_t tail_end = 0;
};

class PriorityScheduler {
public:
    PriorityScheduler(std::shared_ptr<Transfer> transfer, const FileEntry& file,
                      int64_t piece_length, int num_pieces);

    // Head window at the start of the file, tail window at its end
    void prime();
    // Moves the head window to a file position; the tail window stays put
    void reprime(int64_t file_position);

    PriorityWindow getWindow() const;
    PiecePriority getPriority(int piece) const;

    static PriorityWindow computeWindow(const FileEntry& file, int64_t head_position);
    static std::map<int, PiecePriority> plan(const FileEntry& file, int64_t piece_length,
                                             int num_pieces, int64_t head_position);

    static constexpr int64_t HEAD_DIVISOR = 20;    // 5% of the file
    static constexpr int64_t TAIL_DIVISOR = 100;   // 1% of the file

private:
    void apply(int64_t head_position);

    mutable std::mutex schedule_mutex;
    std::shared_ptr<Transfer> transfer;
    const FileEntry file;
    const int64_t piece_length;
    const int num_pieces;
    int first_piece = 0;
    int last_piece = -1;
    bool primed = false;
    int head_piece = -1;
    PriorityWindow window;
    std::map<int, PiecePriority> assigned;
};
