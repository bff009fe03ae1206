#include "daemon/state/conversion_state.h"

#include <cmath>

namespace daemon_state {

nlohmann::json toJson(const ConversionState& state) {
    nlohmann::json j;

    nlohmann::json disks = nlohmann::json::array();
    for (const auto& disk : state.disks) {
        disks.push_back({{"path", disk.path}, {"progress", disk.progress}});
    }
    j["disks"] = std::move(disks);

    if (state.diskCount) {
        j["disk_count"] = *state.diskCount;
    }
    if (state.started) {
        j["started"] = true;
    }
    if (state.pid) {
        j["pid"] = *state.pid;
    }
    if (state.vmId) {
        j["vm_id"] = *state.vmId;
    }
    if (state.lastMessage) {
        j["last_message"] = {{"message", state.lastMessage->message},
                             {"type", state.lastMessage->type}};
    }
    if (state.returnCode) {
        j["return_code"] = *state.returnCode;
    }
    if (state.finished) {
        j["finished"] = true;
    }
    if (state.failed) {
        j["failed"] = true;
    }
    return j;
}

int clampProgress(double percent) {
    if (std::isnan(percent) || percent <= kMinProgress) {
        return kMinProgress;
    }
    if (percent >= kMaxProgress) {
        return kMaxProgress;
    }
    return static_cast<int>(std::floor(percent));
}

}  // namespace daemon_state
