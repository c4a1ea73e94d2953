#include "SessionStatus.hpp"

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Loading: return "loading";
        case SessionState::Ready: return "ready";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

nlohmann::json StatusSnapshot::toJson() const {
    nlohmann::json json = {
        {"state", toString(state)},
        {"progress", progress},
        {"download_mb", download_mb},
        {"speed_kbs", speed_kbs},
        {"peers", peers}
    };
    if (state == SessionState::Ready && !stream_url.empty()) {
        json["stream_url"] = stream_url;
    }
    if (state == SessionState::Error) {
        json["error"] = error;
    }
    return json;
}
