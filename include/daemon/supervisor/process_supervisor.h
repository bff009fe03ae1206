#pragma once

#include "core/command_builder.h"
#include "daemon/parser/line_buffer.h"
#include "daemon/parser/machine_readable_log.h"
#include "daemon/parser/progress_parser.h"
#include "daemon/state/state_store.h"

#include <cstddef>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace daemon_supervisor {

struct ExitStatus {
    bool exited = false;  // normal exit, code is valid
    int code = 0;
    bool signaled = false;  // killed, signal is valid
    int signal = 0;

    // Value published as return_code: the exit code, or -signal when killed
    int returnCode() const {
        return signaled ? -signal : code;
    }

    static ExitStatus fromWaitStatus(int status);
};

struct SupervisorResult {
    ExitStatus exit;
    std::size_t fatalErrors = 0;  // error markers seen in the machine readable log
    bool monitorError = false;
    std::string monitorMessage;
};

struct SupervisorOptions {
    std::string v2vLogPath;
    int pollTimeoutMs = 1000;
};

/**
 * @brief Spawns virt-v2v and owns it until it exits.
 *
 * stdout and stderr are read through separate pipes, each with its own
 * LineBuffer. Every chunk is appended verbatim to the conversion log and every
 * complete line goes to the ProgressParser. Output still buffered after the
 * process exited is drained before run() returns.
 */
class ProcessSupervisor {
   public:
    ProcessSupervisor(daemon_state::StateStore& store, daemon_parser::ProgressParser& parser,
                      daemon_parser::MachineReadableLog& machineLog, SupervisorOptions options);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Start the subprocess, publish pid and started=true and persist them.
    // Throws SpawnError when the log, the pipes or the exec fail.
    pid_t spawn(const v2v_wrapper::V2vCommand& command);

    // Block until the subprocess exited and all its output was consumed
    SupervisorResult run();

    std::optional<pid_t> pid() const {
        return pid_;
    }

   private:
    struct Stream {
        int fd = -1;
        const char* name = "";
        daemon_parser::LineBuffer buffer;
    };

    // Returns false once the stream reached EOF
    bool readStream(Stream& stream);
    void handleChunk(Stream& stream, const char* data, std::size_t size);
    void handleLines(Stream& stream, const std::vector<std::string>& lines);
    void drain();
    void closeStream(Stream& stream);
    void writeLog(const char* data, std::size_t size);
    void monitorFailed(const std::string& message, SupervisorResult& result);

    daemon_state::StateStore& store_;
    daemon_parser::ProgressParser& parser_;
    daemon_parser::MachineReadableLog& machineLog_;
    SupervisorOptions options_;

    int logFd_ = -1;
    Stream stdout_;
    Stream stderr_;
    std::optional<pid_t> pid_;
    bool reaped_ = false;
};

}  // namespace daemon_supervisor
