#include "StreamReader.hpp"
#include "../engine/Errors.hpp"
#include <algorithm>
#include <iostream>

StreamReader::StreamReader(const ActiveStream& stream, const ReaderOptions& options)
    : stream(stream), options(options) {
    if (!stream.transfer || stream.piece_length <= 0) {
        throw NoActiveSessionError();
    }
    stream.transfer->addListener(this);
}

StreamReader::~StreamReader() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[reader] Failed to release readahead: " << e.what() << std::endl;
    }
}

int StreamReader::pieceAt(int64_t file_offset) const {
    return static_cast<int>((stream.file.offset + file_offset) / stream.piece_length);
}

bool StreamReader::rangeComplete(int first, int last) const {
    for (int piece = first; piece <= last; ++piece) {
        if (!stream.transfer->havePiece(piece)) {
            return false;
        }
    }
    return true;
}

bool StreamReader::isAvailable(int64_t offset, int64_t size) const {
    if (offset < 0 || size <= 0 || offset + size > length()) {
        return false;
    }
    return rangeComplete(pieceAt(offset), pieceAt(offset + size - 1));
}

size_t StreamReader::read(int64_t offset, char* buffer, size_t size, const CancelCheck& cancelled) {
    if (closed) {
        throw TransferClosedError("reader closed");
    }
    if (offset < 0 || offset > length()) {
        throw RangeNotSatisfiableError(length());
    }
    if (size == 0 || offset == length()) {
        return 0;
    }

    size_t wanted = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(size), length() - offset));
    if (!started) {
        // The head window is shared by the session and may sit where another request left it
        started = true;
        if (stream.scheduler) {
            stream.scheduler->reprime(offset);
        }
        cursor = offset;
    } else if (isSeek(offset)) {
        seek(offset);
    }
    updateReadahead(offset);
    waitForRange(pieceAt(offset), pieceAt(offset + static_cast<int64_t>(wanted) - 1), cancelled);

    size_t got = stream.transfer->readFile(stream.file, offset, buffer, wanted);
    cursor = offset + static_cast<int64_t>(got);
    return got;
}

bool StreamReader::isSeek(int64_t offset) const {
    return offset + stream.piece_length < cursor || offset > cursor + options.readahead;
}

void StreamReader::seek(int64_t offset) {
    std::cout << "[reader] Seek " << cursor << " -> " << offset << " in " << stream.file.path << std::endl;
    clearDeadlines();
    if (stream.scheduler) {
        stream.scheduler->reprime(offset);
    }
    cursor = offset;
}

void StreamReader::updateReadahead(int64_t offset) {
    int first = pieceAt(offset);
    int last = pieceAt(std::min(offset + options.readahead, length()) - 1);
    if (first == readahead_first && last == readahead_last) {
        return;
    }

    for (auto it = deadlines.begin(); it != deadlines.end();) {
        if (*it < first || *it > last) {
            stream.transfer->resetPieceDeadline(*it);
            it = deadlines.erase(it);
        } else {
            ++it;
        }
    }

    // Nearer pieces get earlier deadlines so they complete first
    for (int piece = first; piece <= last; ++piece) {
        if (deadlines.contains(piece) || stream.transfer->havePiece(piece)) {
            continue;
        }
        stream.transfer->setPieceDeadline(piece, (piece - first) * options.deadline_step_ms);
        deadlines.insert(piece);
    }
    readahead_first = first;
    readahead_last = last;
}

void StreamReader::clearDeadlines() {
    if (!stream.transfer->isDetached()) {
        for (int piece : deadlines) {
            stream.transfer->resetPieceDeadline(piece);
        }
    }
    deadlines.clear();
    readahead_first = -1;
    readahead_last = -1;
}

void StreamReader::waitForRange(int first, int last, const CancelCheck& cancelled) {
    std::unique_lock<std::mutex> lock(wait_mutex);
    while (!rangeComplete(first, last)) {
        if (transfer_closed || stream.transfer->isDetached()) {
            throw TransferClosedError();
        }
        if (cancelled && cancelled()) {
            throw ReadCancelledError();
        }
        TransferStats stats = stream.transfer->stats();
        if (stats.failed) {
            throw TransferClosedError("transfer failed: " + stats.error);
        }
        piece_cv.wait_for(lock, options.wait_slice);
    }
}

void StreamReader::close() {
    if (closed) {
        return;
    }
    closed = true;
    stream.transfer->removeListener(this);
    clearDeadlines();
}

void StreamReader::onPieceFinished(int) {
    std::lock_guard<std::mutex> lock(wait_mutex);
    piece_cv.notify_all();
}

void StreamReader::onTransferClosed() {
    std::lock_guard<std::mutex> lock(wait_mutex);
    transfer_closed = true;
    piece_cv.notify_all();
}
