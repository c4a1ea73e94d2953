#pragma once
#include "../engine/TransferEngine.hpp"
#include "../stream/ActiveStream.hpp"
#include "../utils/ServerConfig.hpp"
#include "PriorityScheduler.hpp"
#include "SessionStatus.hpp"
#include "StatsCollector.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>

// Owns the single active session: idle -> loading -> ready, any -> error,
// any -> idle on stop(). A new start() always tears the old session down first.
class SessionManager {
public:
    SessionManager(std::shared_ptr<TransferEngine> engine, const ServerConfig& config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Returns as soon as loading has begun; failures show up in snapshot()
    void start(const std::string& descriptor);
    void stop();

    StatusSnapshot snapshot() const;
    // Throws NoActiveSessionError when no file is selected
    ActiveStream activeStream() const;

    uint64_t currentSessionId() const;
    void setStreamUrl(const std::string& url);

private:
    struct Session {
        uint64_t id = 0;
        std::string descriptor;
        std::shared_ptr<Transfer> transfer;
        std::optional<FileEntry> file;
        std::shared_ptr<PriorityScheduler> scheduler;
        std::shared_ptr<StatsCollector> stats;
        std::shared_ptr<std::atomic<bool>> cancelled;
        int64_t piece_length = 0;
        int num_pieces = 0;
        std::string etag;
        StatusSnapshot status;
    };

    void teardown();
    void bootstrap(uint64_t id, std::string descriptor, std::shared_ptr<std::atomic<bool>> cancelled);
    void fail(uint64_t id, const std::string& message);
    bool applyStats(uint64_t id, const StatsSample& sample);
    void updateProgress(StatusSnapshot& status, const StatsSample& sample) const;

    std::shared_ptr<TransferEngine> engine;
    ServerConfig config;
    std::string stream_url;

    std::mutex lifecycle_mutex;           // serializes start/stop
    std::thread bootstrap_thread;         // guarded by lifecycle_mutex

    mutable std::shared_mutex state_mutex;
    Session session;                      // guarded by state_mutex
    uint64_t next_id = 0;
};
