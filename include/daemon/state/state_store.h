#pragma once

#include "daemon/state/conversion_state.h"
#include "daemon/state/state_file.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace daemon_state {

/**
 * @brief Owns the job's ConversionState and its file.
 *
 * Every mutator takes the state lock, so the persister only ever serializes a
 * complete snapshot. Once finalize() ran the store is frozen: mutators return
 * false and leave the state untouched.
 */
class StateStore {
   public:
    using ChangeCallback = std::function<void()>;

    explicit StateStore(StateFile file);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Seed disks from the request; disk_count starts at the number of entries
    bool initializeDisks(const std::vector<std::string>& paths);
    bool markStarted(pid_t pid);
    bool setDiskCount(int count);

    // Put `path` at `index` in the disk list. A known path is moved there,
    // an unknown one is inserted (appended when index is past the end).
    bool locateDisk(const std::string& path, std::size_t index);
    bool setProgress(const std::string& path, double percent);
    bool setVmId(const std::string& vmId);

    // Keeps the first error only; later ones are logged by the caller
    bool recordError(const std::string& message);

    // Commit the terminal state, persist it and freeze the store.
    // Returns false when the terminal state could not be written.
    bool finalize(std::optional<int> returnCode, bool failed);

    ConversionState snapshot() const;
    bool isFinished() const;
    uint64_t version() const;

    // Invoked (outside the state lock) after every successful mutation
    void setChangeCallback(ChangeCallback callback);

    // Write the current snapshot if it is newer than the last one written.
    // A failed write is retried once before it is reported.
    bool persist();

    const std::string& path() const;

   private:
    template <typename Fn>
    bool mutate(Fn&& fn);

    bool writeSnapshot(bool terminal);

    StateFile file_;

    mutable std::mutex mutex_;
    ConversionState state_;
    uint64_t version_ = 0;
    ChangeCallback onChange_;

    std::mutex writeMutex_;
    uint64_t writtenVersion_ = 0;
    bool everWritten_ = false;
};

}  // namespace daemon_state
