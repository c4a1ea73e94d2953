#include "SessionManager.hpp"
#include "../engine/Errors.hpp"
#include "../stream/FileSelector.hpp"
#include "../utils/SHA1.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

SessionManager::SessionManager(std::shared_ptr<TransferEngine> engine, const ServerConfig& config)
    : engine(std::move(engine)), config(config), stream_url(config.streamUrl()) {
    if (!this->engine) {
        throw std::invalid_argument("Transfer engine required");
    }
}

SessionManager::~SessionManager() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "[session] Shutdown failed: " << e.what() << std::endl;
    }
}

void SessionManager::start(const std::string& descriptor) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    teardown();

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    uint64_t id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex);
        id = ++next_id;
        session = Session{};
        session.id = id;
        session.descriptor = descriptor;
        session.cancelled = cancelled;
        session.status.state = SessionState::Loading;
    }

    std::cout << "[session] Starting session " << id << std::endl;
    bootstrap_thread = std::thread(&SessionManager::bootstrap, this, id, descriptor, cancelled);
}

void SessionManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    teardown();
}

void SessionManager::teardown() {
    Session old;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex);
        old = std::move(session);
        session = Session{};
    }

    // Background tasks see the identity change before anything is released
    if (old.cancelled) {
        *old.cancelled = true;
    }
    if (old.stats) {
        old.stats->stop();
    }
    if (old.transfer) {
        old.transfer->detach();
    }
    if (bootstrap_thread.joinable()) {
        bootstrap_thread.join();
    }
    if (old.id != 0) {
        std::cout << "[session] Stopped session " << old.id << std::endl;
    }
}

void SessionManager::bootstrap(uint64_t id, std::string descriptor, std::shared_ptr<std::atomic<bool>> cancelled) {
    try {
        std::shared_ptr<Transfer> transfer = engine->add(descriptor);
        {
            std::unique_lock<std::shared_mutex> lock(state_mutex);
            if (session.id != id) {
                lock.unlock();
                transfer->detach();
                return;
            }
            session.transfer = transfer;
        }

        std::cout << "[session] Waiting for torrent info..." << std::endl;
        TransferMetadata metadata = transfer->awaitMetadata(
            [cancelled] { return cancelled->load(); }, config.metadata_timeout);
        std::cout << "[session] Got info: " << metadata.name << std::endl;

        FileEntry file = FileSelector::select(transfer->listFiles());
        std::cout << "[session] Selected " << file.path << " (" << file.length << " bytes)" << std::endl;

        // Only the chosen file is fetched; piece tiers are applied on top of that
        transfer->selectFile(file.index);
        auto scheduler = std::make_shared<PriorityScheduler>(
            transfer, file, metadata.piece_length, metadata.num_pieces);
        scheduler->prime();

        auto collector = std::make_shared<StatsCollector>(
            id, transfer, file.length, metadata.name, config.stats_interval,
            [this](uint64_t session_id, const StatsSample& sample) { return applyStats(session_id, sample); });

        StatsSample initial = StatsCollector::measure(transfer->stats(), 0, file.length, config.stats_interval);
        initial.speed_kbs = 0;

        std::string etag = "\"" + SHA1::hexDigest(
            metadata.info_hash + "/" + file.path + "/" + std::to_string(file.length)) + "\"";

        std::string url;
        {
            std::unique_lock<std::shared_mutex> lock(state_mutex);
            if (session.id != id) {
                return;
            }
            session.file = file;
            session.scheduler = scheduler;
            session.stats = collector;
            session.piece_length = metadata.piece_length;
            session.num_pieces = metadata.num_pieces;
            session.etag = etag;
            session.status.stream_url = stream_url;
            session.status.state = SessionState::Ready;
            updateProgress(session.status, initial);
            collector->start();
            url = session.status.stream_url;
        }
        std::cout << "[session] Stream available at " << url << std::endl;

    } catch (const ReadCancelledError&) {
        std::cout << "[session] Session " << id << " superseded while loading" << std::endl;
    } catch (const TransferClosedError&) {
        std::cout << "[session] Session " << id << " closed while loading" << std::endl;
    } catch (const std::exception& e) {
        fail(id, e.what());
    }
}

void SessionManager::fail(uint64_t id, const std::string& message) {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex);
        if (session.id != id) {
            return;
        }
        session.status.state = SessionState::Error;
        session.status.error = message;
        session.status.stream_url.clear();
    }
    std::cerr << "[session] ERROR: " << message << std::endl;
}

void SessionManager::updateProgress(StatusSnapshot& status, const StatsSample& sample) const {
    // Byte counters only grow within a session; never let the percentage go back
    status.progress = std::max(status.progress, sample.progress);
    status.download_mb = sample.download_mb;
    status.speed_kbs = sample.speed_kbs;
    status.peers = sample.peers;

    if (status.state == SessionState::Error) {
        return;
    }
    if (sample.failed) {
        status.state = SessionState::Error;
        status.error = sample.error.empty() ? "transfer failed" : sample.error;
        status.stream_url.clear();
        return;
    }
    if (status.state == SessionState::Loading && status.progress >= config.ready_threshold) {
        status.state = SessionState::Ready;
    }
}

bool SessionManager::applyStats(uint64_t id, const StatsSample& sample) {
    std::string error;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex);
        if (session.id != id) {
            return false;
        }
        bool was_error = session.status.state == SessionState::Error;
        updateProgress(session.status, sample);
        if (!was_error && session.status.state == SessionState::Error) {
            error = session.status.error;
        }
    }
    if (!error.empty()) {
        std::cerr << "[session] ERROR: " << error << std::endl;
    }
    return true;
}

StatusSnapshot SessionManager::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex);
    return session.status;
}

ActiveStream SessionManager::activeStream() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex);
    if (!session.file || !session.transfer || session.status.state == SessionState::Error) {
        throw NoActiveSessionError();
    }
    ActiveStream stream;
    stream.session_id = session.id;
    stream.transfer = session.transfer;
    stream.scheduler = session.scheduler;
    stream.file = *session.file;
    stream.piece_length = session.piece_length;
    stream.num_pieces = session.num_pieces;
    stream.etag = session.etag;
    return stream;
}

uint64_t SessionManager::currentSessionId() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex);
    return session.id;
}

void SessionManager::setStreamUrl(const std::string& url) {
    std::unique_lock<std::shared_mutex> lock(state_mutex);
    stream_url = url;
    if (!session.status.stream_url.empty()) {
        session.status.stream_url = url;
    }
}
