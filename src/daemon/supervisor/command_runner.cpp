#include "daemon/supervisor/command_runner.h"

#include "core/error_codes.h"
#include "core/wrapper_constants.h"
#include "daemon/supervisor/file_actions.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace daemon_supervisor {

using v2v_wrapper::ErrorCode;
using v2v_wrapper::SpawnError;

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        closeRead();
        closeWrite();
    }
    void closeRead() {
        if (fds[0] >= 0) {
            close(fds[0]);
            fds[0] = -1;
        }
    }
    void closeWrite() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }
};

// Returns false at EOF or on a read error
bool readInto(int fd, std::string& target) {
    char chunk[WrapperConstants::OUTPUT_READ_CHUNK];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            target.append(chunk, static_cast<std::size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

}  // namespace

CommandOutput runCommand(const std::vector<std::string>& args,
                         const v2v_wrapper::Environment& env) {
    if (args.empty()) {
        throw SpawnError("Empty command line");
    }

    Pipe out;
    Pipe err;
    if (pipe2(out.fds, O_CLOEXEC) < 0 || pipe2(err.fds, O_CLOEXEC) < 0) {
        throw SpawnError(std::string("pipe() failed: ") + strerror(errno),
                         ErrorCode::SPAWN_PIPE_FAILED);
    }

    FileActions actions;
    if (!actions.ok() ||
        posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0) !=
            0 ||
        posix_spawn_file_actions_adddup2(actions.get(), out.fds[1], STDOUT_FILENO) != 0 ||
        posix_spawn_file_actions_adddup2(actions.get(), err.fds[1], STDERR_FILENO) != 0) {
        throw SpawnError("Cannot prepare file actions for " + args[0],
                         ErrorCode::SPAWN_PIPE_FAILED);
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = v2v_wrapper::CommandBuilder::toEnvp(env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& entry : envStrings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0].c_str(), actions.get(), nullptr, argv.data(), envp.data());
    out.closeWrite();
    err.closeWrite();
    if (rc != 0) {
        throw SpawnError("Failed to start " + args[0] + ": " + strerror(rc),
                         ErrorCode::SPAWN_EXEC_FAILED);
    }

    CommandOutput result;
    pollfd fds[2] = {{out.fds[0], POLLIN, 0}, {err.fds[0], POLLIN, 0}};
    std::string* targets[2] = {&result.out, &result.err};
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("poll() on {} output failed: {}", args[0], strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd >= 0 && (fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!readInto(fds[i].fd, *targets[i])) {
                    // Negative fds are ignored by poll()
                    fds[i].fd = -1;
                }
            }
        }
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited == pid) {
        result.exit = ExitStatus::fromWaitStatus(status);
    } else {
        LOG_WARN("waitpid() for {} failed: {}", args[0], strerror(errno));
    }
    return result;
}

std::optional<v2v_wrapper::Capabilities> queryCapabilities(const std::string& virtV2vPath,
                                                           const v2v_wrapper::Environment& env) {
    CommandOutput output;
    try {
        output = runCommand({virtV2vPath, "--machine-readable"}, env);
    } catch (const SpawnError& e) {
        LOG_WARN("Could not get virt-v2v capabilities: {}", e.what());
        return std::nullopt;
    }
    if (!output.succeeded()) {
        LOG_WARN("Could not get virt-v2v capabilities: {} exited with {}: {}", virtV2vPath,
                 output.exit.returnCode(), output.err);
        return std::nullopt;
    }
    auto capabilities = v2v_wrapper::parseCapabilities(output.out);
    std::string listed;
    for (const auto& capability : capabilities) {
        listed += (listed.empty() ? "" : ", ") + capability;
    }
    LOG_DEBUG("virt-v2v capabilities: {}", listed);
    return capabilities;
}

}  // namespace daemon_supervisor
