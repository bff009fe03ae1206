#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace daemon_state {

constexpr int kMinProgress = 0;
constexpr int kMaxProgress = 100;

struct DiskProgress {
    std::string path;  // backend-reported identifier, unique within the job
    int progress = 0;  // 0-100
};

struct LastMessage {
    std::string message;
    std::string type = "error";
};

/**
 * @brief Job state as published in the state file.
 *
 * Keys appear in the file only once they carry information: "pid" once the
 * subprocess was spawned, "return_code" after it exited, and "failed" only
 * when the job was classified unsuccessful.
 */
struct ConversionState {
    bool started = false;
    std::optional<pid_t> pid;
    std::vector<DiskProgress> disks;
    std::optional<int> diskCount;
    std::optional<int> returnCode;
    bool finished = false;
    bool failed = false;
    std::optional<LastMessage> lastMessage;
    std::optional<std::string> vmId;
};

nlohmann::json toJson(const ConversionState& state);

// Clamp a backend-reported percentage into [0, 100], dropping the fraction
int clampProgress(double percent);

}  // namespace daemon_state
