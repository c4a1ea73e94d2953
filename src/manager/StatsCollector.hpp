#pragma once
#include "../engine/TransferEngine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct StatsSample {
    int64_t downloaded = 0;
    double progress = 0;
    double download_mb = 0;
    double speed_kbs = 0;
    int peers = 0;
    bool failed = false;
    std::string error;
};

// Periodically samples one transfer and hands the result to a sink bound to one
// session identity. The sink returns false once that session is gone, which
// ends the collector for good.
class StatsCollector {
public:
    using Sink = std::function<bool(uint64_t session_id, const StatsSample& sample)>;

    StatsCollector(uint64_t session_id, std::shared_ptr<Transfer> transfer, int64_t file_length,
                   std::string name, std::chrono::milliseconds interval, Sink sink);
    ~StatsCollector();

    StatsCollector(const StatsCollector&) = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    void start();
    // Signals the worker and joins it
    void stop();
    bool isRunning() const { return running; }

    // One sampling step, separated from the timer for reuse at bootstrap
    static StatsSample measure(const TransferStats& stats, int64_t last_bytes, int64_t file_length,
                               std::chrono::milliseconds interval);

private:
    void run();

    const uint64_t session_id;
    std::shared_ptr<Transfer> transfer;
    const int64_t file_length;
    const std::string name;
    const std::chrono::milliseconds interval;
    Sink sink;

    std::thread worker;
    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    bool stop_flag = false;
    std::atomic<bool> running{false};
};
