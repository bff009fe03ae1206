#include "daemon/state/state_persister.h"

#include "logging/logger.h"

namespace daemon_state {

StatePersister::StatePersister(StateStore& store, std::chrono::milliseconds interval)
    : store_(store), interval_(interval) {
    if (interval_.count() <= 0) {
        interval_ = std::chrono::milliseconds(1000);
    }
}

StatePersister::~StatePersister() {
    stop();
}

void StatePersister::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&StatePersister::run, this);
    LOG_DEBUG("State persister started (interval: {} ms)", interval_.count());
}

void StatePersister::stop() {
    bool wasRunning = running_.exchange(false);
    cv_.notify_all();
    if (wasRunning && thread_.joinable()) {
        thread_.join();
    }
}

void StatePersister::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dirty_ = true;
    }
    cv_.notify_one();
}

void StatePersister::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this]() {
                return dirty_ || !running_.load(std::memory_order_acquire);
            });
            dirty_ = false;
        }
        if (!store_.persist()) {
            LOG_DEBUG("State persister retries on the next wake-up");
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

}  // namespace daemon_state
