#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace inventory {
namespace ingest {

enum class EventKind {
    Progress,
    Complete,
    Error,
    Pong
};

/**
 * One outbound message on an import channel
 */
struct ProgressEvent {
    EventKind kind = EventKind::Progress;
    std::string step;
    int progress = 0;                 // 0-100
    std::string message;
    nlohmann::json data;              // null when absent

    static ProgressEvent makeProgress(const std::string& step, int progress,
                                      const std::string& message,
                                      nlohmann::json data = nullptr) {
        return ProgressEvent{EventKind::Progress, step, progress, message, std::move(data)};
    }

    static ProgressEvent makeComplete(const std::string& message, nlohmann::json summary) {
        return ProgressEvent{EventKind::Complete, "complete", 100, message, std::move(summary)};
    }

    static ProgressEvent makeError(const std::string& message) {
        return ProgressEvent{EventKind::Error, "", 0, message, nullptr};
    }

    static ProgressEvent makePong() {
        return ProgressEvent{EventKind::Pong, "", 0, "", nullptr};
    }

    std::string typeName() const {
        switch (kind) {
            case EventKind::Progress: return "progress";
            case EventKind::Complete: return "complete";
            case EventKind::Error: return "error";
            case EventKind::Pong: return "pong";
        }
        return "unknown";
    }

    /**
     * Wire form
     */
    nlohmann::json toJson() const {
        nlohmann::json j;
        j["type"] = typeName();

        switch (kind) {
            case EventKind::Progress:
            case EventKind::Complete:
                j["step"] = step;
                j["progress"] = progress;
                j["message"] = message;
                if (!data.is_null()) {
                    j["data"] = data;
                }
                break;
            case EventKind::Error:
                j["message"] = message;
                break;
            case EventKind::Pong:
                break;
        }

        return j;
    }
};

} // namespace ingest
} // namespace inventory
