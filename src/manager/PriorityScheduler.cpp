#include "PriorityScheduler.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

PriorityScheduler::PriorityScheduler(std::shared_ptr<Transfer> transfer, const FileEntry& file,
                                     int64_t piece_length, int num_pieces)
    : transfer(std::move(transfer)), file(file), piece_length(piece_length), num_pieces(num_pieces) {
    if (piece_length <= 0) {
        throw std::invalid_argument("Invalid piece length");
    }
    if (file.length > 0) {
        first_piece = static_cast<int>(file.offset / piece_length);
        last_piece = std::min(static_cast<int>((file.offset + file.length - 1) / piece_length),
                              num_pieces - 1);
    }
}

PriorityWindow PriorityScheduler::computeWindow(const FileEntry& file, int64_t head_position) {
    int64_t position = std::clamp<int64_t>(head_position, 0, file.length);
    int64_t file_end = file.offset + file.length;

    PriorityWindow w;
    w.head_begin = file.offset + position;
    // Rounded outward: a piece touching a fractional boundary belongs to the window
    w.head_end = std::min(w.head_begin + (file.length + HEAD_DIVISOR - 1) / HEAD_DIVISOR, file_end);
    w.tail_begin = file_end - (file.length + TAIL_DIVISOR - 1) / TAIL_DIVISOR;
    w.tail_end = file_end;
    return w;
}

std::map<int, PiecePriority> PriorityScheduler::plan(const FileEntry& file, int64_t piece_length,
                                                     int num_pieces, int64_t head_position) {
    std::map<int, PiecePriority> tiers;
    if (piece_length <= 0 || file.length <= 0) {
        return tiers;
    }

    PriorityWindow w = computeWindow(file, head_position);
    int64_t file_end = file.offset + file.length;
    auto overlaps = [](int64_t start, int64_t end, int64_t begin, int64_t stop) {
        return begin < stop && start < stop && end > begin;
    };

    for (int i = static_cast<int>(file.offset / piece_length); i < num_pieces; ++i) {
        int64_t piece_start = static_cast<int64_t>(i) * piece_length;
        int64_t piece_end = piece_start + piece_length;
        if (piece_start >= file_end) {
            break;
        }
        if (piece_end <= file.offset) {
            continue;  // belongs to an earlier file
        }
        bool immediate = overlaps(piece_start, piece_end, w.head_begin, w.head_end) ||
                         overlaps(piece_start, piece_end, w.tail_begin, w.tail_end);
        tiers[i] = immediate ? PiecePriority::Immediate : PiecePriority::Normal;
    }
    return tiers;
}

void PriorityScheduler::prime() {
    std::lock_guard<std::mutex> lock(schedule_mutex);
    apply(0);
    std::cout << "[scheduler] Primed pieces " << first_piece << "-" << last_piece
              << " of " << file.path << std::endl;
}

void PriorityScheduler::reprime(int64_t file_position) {
    std::lock_guard<std::mutex> lock(schedule_mutex);
    int64_t position = std::clamp<int64_t>(file_position, 0, file.length);
    int piece = static_cast<int>((file.offset + position) / piece_length);
    if (primed && piece == head_piece) {
        return;
    }
    apply(position);
    std::cout << "[scheduler] Re-primed head window at byte " << position << std::endl;
}

void PriorityScheduler::apply(int64_t head_position) {
    window = computeWindow(file, head_position);
    head_piece = static_cast<int>(window.head_begin / piece_length);

    for (const auto& [piece, tier] : plan(file, piece_length, num_pieces, head_position)) {
        auto it = assigned.find(piece);
        if (primed && it != assigned.end() && it->second == tier) {
            continue;
        }
        transfer->setPiecePriority(piece, tier);
        assigned[piece] = tier;
    }
    primed = true;
}

PriorityWindow PriorityScheduler::getWindow() const {
    std::lock_guard<std::mutex> lock(schedule_mutex);
    return window;
}

PiecePriority PriorityScheduler::getPriority(int piece) const {
    std::lock_guard<std::mutex> lock(schedule_mutex);
    auto it = assigned.find(piece);
    if (it == assigned.end()) {
        throw std::out_of_range("Piece " + std::to_string(piece) + " is outside the file");
    }
    return it->second;
}
