#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace nodes {

/**
 * Status of a node during evaluation
 */
enum class ExecutionStatus {
    Started,    // Compute step is about to run
    Completed,  // All outputs populated
    Failed      // Compute step or one of its inputs raised
};

/**
 * Event emitted for every node actually computed during a request.
 * Cache hits produce no events.
 */
struct ExecutionEvent {
    std::string nodeId;              // Which node
    std::string kind;                // Registered kind name
    ExecutionStatus status;          // Current status
    int64_t durationMs = 0;          // Compute time (only for Completed/Failed)
    std::string errorMessage;        // Error message (only for Failed)
    nlohmann::json frameMetadata;    // {rows, columns} when the designated output is a frame

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["node_id"] = nodeId;
        j["kind"] = kind;

        switch (status) {
            case ExecutionStatus::Started:
                j["status"] = "started";
                break;
            case ExecutionStatus::Completed:
                j["status"] = "completed";
                j["duration_ms"] = durationMs;
                if (!frameMetadata.empty()) {
                    j["frame"] = frameMetadata;
                }
                break;
            case ExecutionStatus::Failed:
                j["status"] = "failed";
                j["duration_ms"] = durationMs;
                j["error_message"] = errorMessage;
                break;
        }

        return j;
    }
};

/**
 * Callback type for execution events
 */
using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

} // namespace nodes
