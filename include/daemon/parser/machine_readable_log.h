#pragma once

#include "daemon/parser/line_buffer.h"
#include "daemon/state/state_store.h"

#include <cstddef>
#include <string>

namespace daemon_parser {

/**
 * @brief Follows the file virt-v2v writes with --machine-readable=file:...
 *
 * Each complete line is a JSON object. Records of type "error" are fatal
 * error markers: the first one becomes the job's last_message and all of
 * them are counted for outcome classification.
 */
class MachineReadableLog {
   public:
    MachineReadableLog(std::string path, daemon_state::StateStore& store);
    ~MachineReadableLog();

    MachineReadableLog(const MachineReadableLog&) = delete;
    MachineReadableLog& operator=(const MachineReadableLog&) = delete;

    // Consume whatever was appended since the last call. The file may not
    // exist yet; that is not an error.
    void poll();

    // Final read after the subprocess exited, including an unterminated tail
    void finish();

    // Handle one record; exposed for callers that already split lines
    void handleLine(const std::string& line);

    std::size_t fatalErrorCount() const {
        return fatalErrors_;
    }
    const std::string& path() const {
        return path_;
    }

   private:
    bool ensureOpen();
    void readAvailable();

    std::string path_;
    daemon_state::StateStore& store_;
    int fd_ = -1;
    LineBuffer buffer_;
    std::size_t fatalErrors_ = 0;
};

}  // namespace daemon_parser
