#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class PiecePriority {
    Normal,     // sequential order, behind immediate pieces
    Immediate   // fetch as soon as possible
};

struct FileEntry {
    int index = 0;
    std::string path;
    int64_t length = 0;
    int64_t offset = 0;   // byte offset within the transfer's piece space
};

struct TransferMetadata {
    std::string name;
    std::string info_hash;
    int64_t piece_length = 0;
    int num_pieces = 0;
    std::vector<FileEntry> files;
};

struct TransferStats {
    int64_t bytes_downloaded = 0;   // cumulative useful payload bytes
    int active_peers = 0;
    bool failed = false;
    std::string error;
};

using CancelCheck = std::function<bool()>;

// Receives piece completion events from the engine's own threads.
class PieceListener {
public:
    virtual ~PieceListener() = default;
    virtual void onPieceFinished(int piece) = 0;
    virtual void onTransferClosed() = 0;
};

// One swarm attached to the engine. All methods are thread-safe.
class Transfer {
public:
    virtual ~Transfer() = default;

    // Blocks until metadata is known. Throws ResolutionError when the engine gives up
    // or the timeout (zero means none) expires, ReadCancelledError when cancelled.
    virtual TransferMetadata awaitMetadata(const CancelCheck& cancelled,
                                           std::chrono::seconds timeout) = 0;
    virtual std::vector<FileEntry> listFiles() const = 0;

    // Marks one file wanted and every other file skipped
    virtual void selectFile(int file_index) = 0;
    virtual void setPiecePriority(int piece, PiecePriority tier) = 0;
    virtual void setPieceDeadline(int piece, int deadline_ms) = 0;
    virtual void resetPieceDeadline(int piece) = 0;
    virtual bool havePiece(int piece) const = 0;

    // Copies downloaded bytes of a file. Only valid for completed pieces.
    virtual size_t readFile(const FileEntry& file, int64_t offset, char* buffer, size_t length) = 0;

    virtual TransferStats stats() const = 0;

    virtual void addListener(PieceListener* listener) = 0;
    virtual void removeListener(PieceListener* listener) = 0;

    // Releases everything tied to this transfer; wakes blocked waiters
    virtual void detach() = 0;
    virtual bool isDetached() const = 0;
};

class TransferEngine {
public:
    virtual ~TransferEngine() = default;
    // Throws ResolutionError for descriptors the engine cannot accept
    virtual std::shared_ptr<Transfer> add(const std::string& descriptor) = 0;
};
