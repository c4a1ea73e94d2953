#pragma once
#include "TransferEngine.hpp"
#include "../utils/ServerConfig.hpp"
#include <libtorrent/alert.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <atomic>
#include <condition_variable>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// One torrent inside the engine's lt::session. The engine must outlive it.
class LibtorrentTransfer : public Transfer {
public:
    LibtorrentTransfer(lt::session& session, lt::torrent_handle handle, std::string save_path);

    TransferMetadata awaitMetadata(const CancelCheck& cancelled, std::chrono::seconds timeout) override;
    std::vector<FileEntry> listFiles() const override;
    void selectFile(int file_index) override;
    void setPiecePriority(int piece, PiecePriority tier) override;
    void setPieceDeadline(int piece, int deadline_ms) override;
    void resetPieceDeadline(int piece) override;
    bool havePiece(int piece) const override;
    size_t readFile(const FileEntry& file, int64_t offset, char* buffer, size_t length) override;
    TransferStats stats() const override;
    void addListener(PieceListener* listener) override;
    void removeListener(PieceListener* listener) override;
    void detach() override;
    bool isDetached() const override { return detached; }

    // Alert thread entry points
    void notifyMetadata();
    void notifyPieceFinished(int piece);
    void notifyError(const std::string& message);

private:
    static TransferMetadata buildMetadata(const lt::torrent_info& info);

    lt::session& session;
    lt::torrent_handle handle;
    const std::string save_path;
    std::atomic<bool> detached{false};

    mutable std::mutex transfer_mutex;
    std::condition_variable metadata_cv;
    bool metadata_ready = false;
    std::optional<TransferMetadata> metadata;
    std::string error;

    std::mutex listeners_mutex;
    std::list<PieceListener*> listeners;
};

class LibtorrentEngine : public TransferEngine {
public:
    explicit LibtorrentEngine(const ServerConfig& config);
    ~LibtorrentEngine() override;

    LibtorrentEngine(const LibtorrentEngine&) = delete;
    LibtorrentEngine& operator=(const LibtorrentEngine&) = delete;

    std::shared_ptr<Transfer> add(const std::string& descriptor) override;

private:
    void alertLoop();
    void dispatch(lt::alert* alert);
    std::shared_ptr<LibtorrentTransfer> find(const lt::torrent_handle& handle);

    const std::string save_path;
    const int connections_per_torrent;
    std::unique_ptr<lt::session> session;

    std::mutex transfers_mutex;
    std::map<lt::torrent_handle, std::weak_ptr<LibtorrentTransfer>> transfers;

    std::atomic<bool> quit{false};
    std::thread alert_thread;
};
