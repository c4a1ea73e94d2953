#include "LibtorrentEngine.hpp"
#include "Errors.hpp"
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_status.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
const char* DHT_BOOTSTRAP_NODES =
    "router.bittorrent.com:6881,"
    "router.utorrent.com:6881,"
    "dht.transmissionbt.com:6881";
}

LibtorrentTransfer::LibtorrentTransfer(lt::session& session, lt::torrent_handle handle, std::string save_path)
    : session(session), handle(std::move(handle)), save_path(std::move(save_path)) {
}

TransferMetadata LibtorrentTransfer::buildMetadata(const lt::torrent_info& info) {
    TransferMetadata result;
    result.name = info.name();
    std::ostringstream hash;
    hash << info.info_hashes().get_best();
    result.info_hash = hash.str();
    result.piece_length = info.piece_length();
    result.num_pieces = info.num_pieces();

    const lt::file_storage& files = info.files();
    for (lt::file_index_t i : files.file_range()) {
        if (files.pad_file_at(i)) {
            continue;
        }
        FileEntry entry;
        entry.index = static_cast<int>(i);
        entry.path = files.file_path(i);
        entry.length = files.file_size(i);
        entry.offset = files.file_offset(i);
        result.files.push_back(entry);
    }
    return result;
}

TransferMetadata LibtorrentTransfer::awaitMetadata(const CancelCheck& cancelled, std::chrono::seconds timeout) {
    auto started = std::chrono::steady_clock::now();
    while (true) {
        if (detached) {
            throw TransferClosedError();
        }
        if (cancelled && cancelled()) {
            throw ReadCancelledError();
        }

        std::shared_ptr<const lt::torrent_info> info = handle.torrent_file();
        if (info) {
            TransferMetadata built = buildMetadata(*info);
            std::lock_guard<std::mutex> lock(transfer_mutex);
            metadata = built;
            return built;
        }

        std::unique_lock<std::mutex> lock(transfer_mutex);
        if (!error.empty()) {
            throw ResolutionError(error);
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - started >= timeout) {
            throw ResolutionError("timed out waiting for torrent metadata");
        }
        metadata_cv.wait_for(lock, std::chrono::milliseconds(200),
            [this] { return metadata_ready || detached || !error.empty(); });
    }
}

std::vector<FileEntry> LibtorrentTransfer::listFiles() const {
    std::lock_guard<std::mutex> lock(transfer_mutex);
    return metadata ? metadata->files : std::vector<FileEntry>{};
}

void LibtorrentTransfer::selectFile(int file_index) {
    if (detached) {
        return;
    }
    std::shared_ptr<const lt::torrent_info> info = handle.torrent_file();
    if (!info) {
        throw std::logic_error("File selection before metadata");
    }
    std::vector<lt::download_priority_t> priorities(static_cast<size_t>(info->num_files()), lt::dont_download);
    priorities.at(static_cast<size_t>(file_index)) = lt::default_priority;
    handle.prioritize_files(priorities);
}

void LibtorrentTransfer::setPiecePriority(int piece, PiecePriority tier) {
    if (detached) {
        return;
    }
    handle.piece_priority(lt::piece_index_t{piece},
        tier == PiecePriority::Immediate ? lt::top_priority : lt::default_priority);
}

void LibtorrentTransfer::setPieceDeadline(int piece, int deadline_ms) {
    if (detached) {
        return;
    }
    handle.set_piece_deadline(lt::piece_index_t{piece}, deadline_ms);
}

void LibtorrentTransfer::resetPieceDeadline(int piece) {
    if (detached) {
        return;
    }
    handle.reset_piece_deadline(lt::piece_index_t{piece});
}

bool LibtorrentTransfer::havePiece(int piece) const {
    if (detached) {
        return false;
    }
    try {
        return handle.have_piece(lt::piece_index_t{piece});
    } catch (const lt::system_error&) {
        return false;  // removed between the check and the call
    }
}

size_t LibtorrentTransfer::readFile(const FileEntry& file, int64_t offset, char* buffer, size_t length) {
    std::filesystem::path path = std::filesystem::path(save_path) / file.path;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open downloaded file: " + path.string());
    }
    in.seekg(offset);
    in.read(buffer, static_cast<std::streamsize>(length));
    return static_cast<size_t>(in.gcount());
}

TransferStats LibtorrentTransfer::stats() const {
    TransferStats result;
    if (detached) {
        return result;
    }
    lt::torrent_status status = handle.status();
    result.bytes_downloaded = status.total_payload_download;
    result.active_peers = status.num_peers;
    if (status.errc) {
        result.failed = true;
        result.error = status.errc.message();
    }

    std::lock_guard<std::mutex> lock(transfer_mutex);
    if (!result.failed && !error.empty() && metadata) {
        result.failed = true;
        result.error = error;
    }
    return result;
}

void LibtorrentTransfer::addListener(PieceListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex);
    listeners.push_back(listener);
}

void LibtorrentTransfer::removeListener(PieceListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex);
    listeners.remove(listener);
}

void LibtorrentTransfer::detach() {
    if (detached.exchange(true)) {
        return;
    }
    try {
        session.remove_torrent(handle);
    } catch (const lt::system_error& e) {
        std::cerr << "[engine] Remove torrent failed: " << e.what() << std::endl;
    }
    {
        std::lock_guard<std::mutex> lock(transfer_mutex);
        metadata_cv.notify_all();
    }
    std::lock_guard<std::mutex> lock(listeners_mutex);
    for (PieceListener* listener : listeners) {
        listener->onTransferClosed();
    }
}

void LibtorrentTransfer::notifyMetadata() {
    std::lock_guard<std::mutex> lock(transfer_mutex);
    metadata_ready = true;
    metadata_cv.notify_all();
}

void LibtorrentTransfer::notifyPieceFinished(int piece) {
    std::lock_guard<std::mutex> lock(listeners_mutex);
    for (PieceListener* listener : listeners) {
        listener->onPieceFinished(piece);
    }
}

void LibtorrentTransfer::notifyError(const std::string& message) {
    std::lock_guard<std::mutex> lock(transfer_mutex);
    error = message;
    metadata_cv.notify_all();
}

LibtorrentEngine::LibtorrentEngine(const ServerConfig& config)
    : save_path(config.cache_dir), connections_per_torrent(config.connections_per_torrent) {
    lt::settings_pack pack = lt::default_settings();
    pack.set_int(lt::settings_pack::alert_mask,
        lt::alert_category::status | lt::alert_category::error |
        lt::alert_category::storage | lt::alert_category::piece_progress);
    pack.set_bool(lt::settings_pack::enable_dht, true);
    pack.set_str(lt::settings_pack::dht_bootstrap_nodes, DHT_BOOTSTRAP_NODES);
    pack.set_bool(lt::settings_pack::enable_upnp, false);
    pack.set_bool(lt::settings_pack::enable_natpmp, false);
    pack.set_bool(lt::settings_pack::strict_end_game_mode, false);
    pack.set_bool(lt::settings_pack::announce_to_all_trackers, true);
    pack.set_bool(lt::settings_pack::announce_to_all_tiers, true);
    pack.set_int(lt::settings_pack::request_timeout, 2);
    pack.set_int(lt::settings_pack::whole_pieces_threshold, 5);

    session = std::make_unique<lt::session>(pack);
    alert_thread = std::thread(&LibtorrentEngine::alertLoop, this);
}

LibtorrentEngine::~LibtorrentEngine() {
    quit = true;
    if (alert_thread.joinable()) {
        alert_thread.join();
    }
    session.reset();
}

std::shared_ptr<Transfer> LibtorrentEngine::add(const std::string& descriptor) {
    lt::error_code ec;
    lt::add_torrent_params params = lt::parse_magnet_uri(descriptor, ec);
    if (ec) {
        throw ResolutionError("AddMagnet: " + ec.message());
    }
    params.save_path = save_path;
    params.max_connections = connections_per_torrent;
    params.flags |= lt::torrent_flags::sequential_download;
    params.flags &= ~(lt::torrent_flags::auto_managed | lt::torrent_flags::paused);

    // Held across add_torrent so early alerts find their transfer
    std::lock_guard<std::mutex> lock(transfers_mutex);
    lt::torrent_handle handle = session->add_torrent(std::move(params), ec);
    if (ec) {
        throw ResolutionError("AddMagnet: " + ec.message());
    }
    auto transfer = std::make_shared<LibtorrentTransfer>(*session, handle, save_path);
    transfers[handle] = transfer;
    std::cout << "[engine] Added torrent to session" << std::endl;
    return transfer;
}

std::shared_ptr<LibtorrentTransfer> LibtorrentEngine::find(const lt::torrent_handle& handle) {
    std::lock_guard<std::mutex> lock(transfers_mutex);
    auto it = transfers.find(handle);
    if (it == transfers.end()) {
        return nullptr;
    }
    return it->second.lock();
}

void LibtorrentEngine::alertLoop() {
    while (!quit) {
        session->wait_for_alert(std::chrono::milliseconds(500));
        if (quit) {
            break;
        }
        std::vector<lt::alert*> alerts;
        session->pop_alerts(&alerts);
        for (lt::alert* alert : alerts) {
            dispatch(alert);
        }
    }
}

void LibtorrentEngine::dispatch(lt::alert* alert) {
    if (auto* finished = lt::alert_cast<lt::piece_finished_alert>(alert)) {
        if (auto transfer = find(finished->handle)) {
            transfer->notifyPieceFinished(static_cast<int>(finished->piece_index));
        }
    } else if (auto* received = lt::alert_cast<lt::metadata_received_alert>(alert)) {
        if (auto transfer = find(received->handle)) {
            transfer->notifyMetadata();
        }
    } else if (auto* err = lt::alert_cast<lt::torrent_error_alert>(alert)) {
        std::cerr << "[engine] " << err->message() << std::endl;
        if (auto transfer = find(err->handle)) {
            transfer->notifyError(err->error.message());
        }
    } else if (auto* file_err = lt::alert_cast<lt::file_error_alert>(alert)) {
        std::cerr << "[engine] " << file_err->message() << std::endl;
        if (auto transfer = find(file_err->handle)) {
            transfer->notifyError(file_err->error.message());
        }
    } else if (auto* removed = lt::alert_cast<lt::torrent_removed_alert>(alert)) {
        std::lock_guard<std::mutex> lock(transfers_mutex);
        transfers.erase(removed->handle);
    }
}
