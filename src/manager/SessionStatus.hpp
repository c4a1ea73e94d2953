#pragma once
#include <nlohmann/json.hpp>
#include <string>

enum class SessionState { Idle, Loading, Ready, Error };

std::string toString(SessionState state);

// Point-in-time copy of session progress handed to readers
struct StatusSnapshot {
    SessionState state = SessionState::Idle;
    double progress = 0;      // 0-100
    double download_mb = 0;
    double speed_kbs = 0;
    int peers = 0;
    std::string stream_url;   // set once the file is servable, published only when ready
    std::string error;

    nlohmann::json toJson() const;
};
