#pragma once
#include "ActiveStream.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>

struct ReaderOptions {
    int64_t readahead = 8 * 1024 * 1024;
    int deadline_step_ms = 50;                       // extra deadline per piece away from the cursor
    std::chrono::milliseconds wait_slice{200};       // how often a blocked read re-checks cancellation
};

// Byte-range reads over a partially downloaded file. A read blocks until the
// engine reports every piece under the range complete. One reader per request.
class StreamReader : public PieceListener {
public:
    StreamReader(const ActiveStream& stream, const ReaderOptions& options);
    ~StreamReader() override;

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    int64_t length() const { return stream.file.length; }
    const std::string& identity() const { return stream.etag; }
    int64_t position() const { return cursor; }

    bool isAvailable(int64_t offset, int64_t size) const;
    size_t read(int64_t offset, char* buffer, size_t size, const CancelCheck& cancelled);

    // Drops readahead deadlines and stops listening. Called by the destructor.
    void close();

    void onPieceFinished(int piece) override;
    void onTransferClosed() override;

private:
    bool isSeek(int64_t offset) const;
    void seek(int64_t offset);
    void updateReadahead(int64_t offset);
    void clearDeadlines();
    bool rangeComplete(int first, int last) const;
    void waitForRange(int first, int last, const CancelCheck& cancelled);
    int pieceAt(int64_t file_offset) const;

    const ActiveStream stream;
    const ReaderOptions options;
    int64_t cursor = 0;
    bool started = false;
    int readahead_first = -1;
    int readahead_last = -1;
    std::set<int> deadlines;
    bool closed = false;

    mutable std::mutex wait_mutex;
    std::condition_variable piece_cv;
    bool transfer_closed = false;
};
