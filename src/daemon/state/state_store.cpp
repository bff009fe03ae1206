#include "daemon/state/state_store.h"

#include "logging/logger.h"

#include <algorithm>

namespace daemon_state {

StateStore::StateStore(StateFile file) : file_(std::move(file)) {}

template <typename Fn>
bool StateStore::mutate(Fn&& fn) {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.finished) {
            return false;
        }
        if (!fn(state_)) {
            return false;
        }
        ++version_;
        callback = onChange_;
    }
    if (callback) {
        callback();
    }
    return true;
}

bool StateStore::initializeDisks(const std::vector<std::string>& paths) {
    return mutate([&paths](ConversionState& state) {
        state.disks.clear();
        for (const auto& path : paths) {
            auto it = std::find_if(state.disks.begin(), state.disks.end(),
                                   [&path](const DiskProgress& d) { return d.path == path; });
            if (it != state.disks.end()) {
                LOG_WARN("Ignoring duplicate source disk '{}'", path);
                continue;
            }
            state.disks.push_back(DiskProgress{path, 0});
        }
        state.diskCount = static_cast<int>(state.disks.size());
        return true;
    });
}

bool StateStore::markStarted(pid_t pid) {
    return mutate([pid](ConversionState& state) {
        state.started = true;
        state.pid = pid;
        return true;
    });
}

bool StateStore::setDiskCount(int count) {
    if (count < 0) {
        return false;
    }
    return mutate([count](ConversionState& state) {
        if (state.diskCount && *state.diskCount == count) {
            return false;
        }
        state.diskCount = count;
        if (static_cast<std::size_t>(count) != state.disks.size()) {
            LOG_WARN("Number of supplied disk paths ({}) does not match number of disks in VM ({})",
                     state.disks.size(), count);
        }
        return true;
    });
}

bool StateStore::locateDisk(const std::string& path, std::size_t index) {
    return mutate([&path, index](ConversionState& state) {
        auto& disks = state.disks;
        std::size_t target = std::min(index, disks.size());
        auto it = std::find_if(disks.begin(), disks.end(),
                               [&path](const DiskProgress& d) { return d.path == path; });
        if (it == disks.end()) {
            LOG_DEBUG("Path '{}' not in the disk list, adding it at position {}", path, target);
            disks.insert(disks.begin() + static_cast<std::ptrdiff_t>(target),
                         DiskProgress{path, 0});
            return true;
        }
        std::size_t current = static_cast<std::size_t>(it - disks.begin());
        if (current == target) {
            return false;
        }
        DiskProgress disk = *it;
        disks.erase(it);
        target = std::min(target, disks.size());
        LOG_DEBUG("Moving disk '{}' from position {} to {}", path, current, target);
        disks.insert(disks.begin() + static_cast<std::ptrdiff_t>(target), std::move(disk));
        return true;
    });
}

bool StateStore::setProgress(const std::string& path, double percent) {
    int progress = clampProgress(percent);
    return mutate([&path, progress](ConversionState& state) {
        for (auto& disk : state.disks) {
            if (disk.path == path) {
                if (disk.progress == progress) {
                    return false;
                }
                disk.progress = progress;
                return true;
            }
        }
        return false;
    });
}

bool StateStore::setVmId(const std::string& vmId) {
    return mutate([&vmId](ConversionState& state) {
        if (state.vmId && *state.vmId == vmId) {
            return false;
        }
        state.vmId = vmId;
        return true;
    });
}

bool StateStore::recordError(const std::string& message) {
    return mutate([&message](ConversionState& state) {
        if (state.lastMessage) {
            return false;
        }
        state.lastMessage = LastMessage{message, "error"};
        return true;
    });
}

bool StateStore::finalize(std::optional<int> returnCode, bool failed) {
    bool committed = mutate([returnCode, failed](ConversionState& state) {
        state.returnCode = returnCode;
        state.finished = true;
        state.failed = failed;
        return true;
    });
    if (!committed) {
        LOG_WARN("Conversion state already finalized, ignoring second finalize");
        return false;
    }
    return writeSnapshot(true);
}

ConversionState StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StateStore::isFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.finished;
}

uint64_t StateStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

void StateStore::setChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    onChange_ = std::move(callback);
}

bool StateStore::persist() {
    return writeSnapshot(false);
}

const std::string& StateStore::path() const {
    return file_.path();
}

bool StateStore::writeSnapshot(bool terminal) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    ConversionState state;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = state_;
        version = version_;
    }
    if (everWritten_ && version <= writtenVersion_) {
        return true;
    }

    const nlohmann::json payload = toJson(state);
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (file_.writeJsonAtomically(payload)) {
            writtenVersion_ = version;
            everWritten_ = true;
            return true;
        }
    }

    if (terminal) {
        LOG_CRITICAL("Unable to commit terminal state to {}", file_.path());
    } else {
        LOG_ERROR("Unable to write state file {}", file_.path());
    }
    return false;
}

}  // namespace daemon_state
