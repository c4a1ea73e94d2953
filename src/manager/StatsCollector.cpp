#include "StatsCollector.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

StatsCollector::StatsCollector(uint64_t session_id, std::shared_ptr<Transfer> transfer, int64_t file_length,
                               std::string name, std::chrono::milliseconds interval, Sink sink)
    : session_id(session_id), transfer(std::move(transfer)), file_length(file_length),
      name(std::move(name)), interval(interval), sink(std::move(sink)) {
}

StatsCollector::~StatsCollector() {
    stop();
}

StatsSample StatsCollector::measure(const TransferStats& stats, int64_t last_bytes, int64_t file_length,
                                    std::chrono::milliseconds interval) {
    StatsSample sample;
    sample.downloaded = stats.bytes_downloaded;
    sample.peers = stats.active_peers;
    sample.failed = stats.failed;
    sample.error = stats.error;
    sample.download_mb = static_cast<double>(stats.bytes_downloaded) / (1024 * 1024);

    double seconds = std::chrono::duration<double>(interval).count();
    if (seconds > 0) {
        sample.speed_kbs = std::max(0.0, static_cast<double>(stats.bytes_downloaded - last_bytes) / 1024 / seconds);
    }
    if (file_length > 0) {
        sample.progress = std::clamp(static_cast<double>(stats.bytes_downloaded) / file_length * 100, 0.0, 100.0);
    } else {
        sample.progress = 100;
    }
    return sample;
}

void StatsCollector::start() {
    if (running.exchange(true)) {
        return;
    }
    worker = std::thread(&StatsCollector::run, this);
}

void StatsCollector::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex);
        stop_flag = true;
        stop_cv.notify_all();
    }
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

void StatsCollector::run() {
    int64_t last_bytes = transfer->stats().bytes_downloaded;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex);
            if (stop_cv.wait_for(lock, interval, [this] { return stop_flag; })) {
                break;
            }
        }

        StatsSample sample = measure(transfer->stats(), last_bytes, file_length, interval);
        last_bytes = sample.downloaded;
        if (!sink(session_id, sample)) {
            std::cout << "[stats] session " << session_id << " superseded, sampling stopped" << std::endl;
            break;
        }
        if (sample.failed) {
            std::cerr << "[stats] " << name << " transfer failed: " << sample.error << std::endl;
        }

        std::ostringstream line;
        line << "[" << name << "] " << std::fixed << std::setprecision(1) << sample.progress << "% | "
             << sample.download_mb << " MB | " << std::setprecision(0) << sample.speed_kbs
             << " KB/s | " << sample.peers << " peers";
        std::cout << line.str() << std::endl;
    }
    running = false;
}
