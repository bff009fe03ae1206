#pragma once

#include <spawn.h>

namespace daemon_supervisor {

// Owns posix_spawn_file_actions_t for the duration of one spawn
class FileActions {
   public:
    FileActions() {
        ok_ = posix_spawn_file_actions_init(&actions_) == 0;
    }
    ~FileActions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    bool ok() const {
        return ok_;
    }
    posix_spawn_file_actions_t* get() {
        return &actions_;
    }

   private:
    posix_spawn_file_actions_t actions_{};
    bool ok_ = false;
};

}  // namespace daemon_supervisor
