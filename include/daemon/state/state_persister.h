#pragma once

#include "daemon/state/state_store.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace daemon_state {

// Housekeeping thread writing StateStore snapshots. It wakes on notify() and
// at least once per interval, and skips the write when nothing changed.
class StatePersister {
   public:
    StatePersister(StateStore& store, std::chrono::milliseconds interval);
    ~StatePersister();

    StatePersister(const StatePersister&) = delete;
    StatePersister& operator=(const StatePersister&) = delete;

    void start();
    // Joins the thread after a last write of any pending change
    void stop();
    void notify();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

   private:
    void run();

    StateStore& store_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool dirty_ = false;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace daemon_state
