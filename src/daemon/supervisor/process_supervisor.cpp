#include "daemon/supervisor/process_supervisor.h"

#include "core/error_codes.h"
#include "core/wrapper_constants.h"
#include "daemon/supervisor/file_actions.h"
#include "logging/logger.h"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace daemon_supervisor {

using v2v_wrapper::ErrorCode;
using v2v_wrapper::SpawnError;

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace

ExitStatus ExitStatus::fromWaitStatus(int status) {
    ExitStatus exit;
    if (WIFEXITED(status)) {
        exit.exited = true;
        exit.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signaled = true;
        exit.signal = WTERMSIG(status);
    }
    return exit;
}

ProcessSupervisor::ProcessSupervisor(daemon_state::StateStore& store,
                                     daemon_parser::ProgressParser& parser,
                                     daemon_parser::MachineReadableLog& machineLog,
                                     SupervisorOptions options)
    : store_(store), parser_(parser), machineLog_(machineLog), options_(std::move(options)) {
    stdout_.name = "stdout";
    stderr_.name = "stderr";
}

ProcessSupervisor::~ProcessSupervisor() {
    closeFd(stdout_.fd);
    closeFd(stderr_.fd);
    closeFd(logFd_);
    if (pid_ && !reaped_) {
        LOG_WARN("Supervisor destroyed while virt-v2v (pid {}) is running, killing it", *pid_);
        kill(*pid_, SIGKILL);
        int status = 0;
        waitpid(*pid_, &status, 0);
    }
}

pid_t ProcessSupervisor::spawn(const v2v_wrapper::V2vCommand& command) {
    if (pid_) {
        throw SpawnError("virt-v2v was already started (pid " + std::to_string(*pid_) + ")");
    }
    if (command.args.empty()) {
        throw SpawnError("Empty virt-v2v command line");
    }

    logFd_ = open(options_.v2vLogPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (logFd_ < 0) {
        throw SpawnError("Cannot open conversion log " + options_.v2vLogPath + ": " +
                             strerror(errno),
                         ErrorCode::SPAWN_LOG_OPEN_FAILED);
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) < 0) {
        throw SpawnError(std::string("pipe() failed: ") + strerror(errno),
                         ErrorCode::SPAWN_PIPE_FAILED);
    }
    if (pipe2(errPipe, O_CLOEXEC) < 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw SpawnError(std::string("pipe() failed: ") + strerror(err),
                         ErrorCode::SPAWN_PIPE_FAILED);
    }
    auto closePipes = [&]() {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
    };

    FileActions actions;
    if (!actions.ok() ||
        posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0) !=
            0 ||
        posix_spawn_file_actions_adddup2(actions.get(), outPipe[1], STDOUT_FILENO) != 0 ||
        posix_spawn_file_actions_adddup2(actions.get(), errPipe[1], STDERR_FILENO) != 0) {
        closePipes();
        throw SpawnError("Cannot prepare file actions for virt-v2v", ErrorCode::SPAWN_PIPE_FAILED);
    }

    std::vector<char*> argv;
    argv.reserve(command.args.size() + 1);
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = v2v_wrapper::CommandBuilder::toEnvp(command.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& entry : envStrings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, command.args[0].c_str(), actions.get(), nullptr, argv.data(),
                          envp.data());
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    if (rc != 0) {
        closePipes();
        throw SpawnError("Failed to start " + command.args[0] + ": " + std::to_string(rc) + " (" +
                             strerror(rc) + ")",
                         ErrorCode::SPAWN_EXEC_FAILED);
    }

    stdout_.fd = outPipe[0];
    stderr_.fd = errPipe[0];
    if (!setNonBlocking(stdout_.fd) || !setNonBlocking(stderr_.fd)) {
        LOG_WARN("Cannot make virt-v2v output pipes non-blocking: {}", strerror(errno));
    }

    pid_ = pid;
    LOG_INFO("virt-v2v started with pid {}", pid);
    store_.markStarted(pid);
    if (!store_.persist()) {
        LOG_WARN("Started state not persisted yet, the persister will retry");
    }
    return pid;
}

SupervisorResult ProcessSupervisor::run() {
    if (!pid_) {
        throw std::logic_error("ProcessSupervisor::run() called before spawn()");
    }

    SupervisorResult result;
    int status = 0;
    while (!reaped_) {
        try {
            pollfd fds[2];
            Stream* streams[2];
            nfds_t count = 0;
            for (Stream* stream : {&stdout_, &stderr_}) {
                if (stream->fd >= 0) {
                    fds[count].fd = stream->fd;
                    fds[count].events = POLLIN;
                    fds[count].revents = 0;
                    streams[count] = stream;
                    ++count;
                }
            }

            int rc = ::poll(count > 0 ? fds : nullptr, count, options_.pollTimeoutMs);
            if (rc < 0 && errno != EINTR) {
                throw std::runtime_error(std::string("poll() failed: ") + strerror(errno));
            }
            for (nfds_t i = 0; rc > 0 && i < count; ++i) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    if (!readStream(*streams[i])) {
                        closeStream(*streams[i]);
                    }
                }
            }
            machineLog_.poll();
        } catch (const std::exception& e) {
            monitorFailed(e.what(), result);
            break;
        }

        pid_t waited = waitpid(*pid_, &status, WNOHANG);
        if (waited == *pid_) {
            reaped_ = true;
            result.exit = ExitStatus::fromWaitStatus(status);
        } else if (waited < 0 && errno != EINTR) {
            monitorFailed(std::string("waitpid() failed: ") + strerror(errno), result);
            break;
        }
    }

    try {
        drain();
        machineLog_.finish();
    } catch (const std::exception& e) {
        LOG_ERROR("Error while draining virt-v2v output: {}", e.what());
        result.monitorError = true;
        if (result.monitorMessage.empty()) {
            result.monitorMessage = e.what();
        }
    }
    closeFd(logFd_);

    result.fatalErrors = machineLog_.fatalErrorCount();
    if (result.exit.signaled) {
        LOG_INFO("virt-v2v terminated by signal {} ({})", result.exit.signal,
                 strsignal(result.exit.signal));
    } else {
        LOG_INFO("virt-v2v terminated with return code {}", result.exit.code);
    }
    return result;
}

bool ProcessSupervisor::readStream(Stream& stream) {
    std::vector<char> chunk(WrapperConstants::OUTPUT_READ_CHUNK);
    while (true) {
        ssize_t n = read(stream.fd, chunk.data(), chunk.size());
        if (n > 0) {
            handleChunk(stream, chunk.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        LOG_WARN("Error reading virt-v2v {}: {}", stream.name, strerror(errno));
        return false;
    }
}

void ProcessSupervisor::handleChunk(Stream& stream, const char* data, std::size_t size) {
    writeLog(data, size);
    handleLines(stream, stream.buffer.append(data, size));
}

void ProcessSupervisor::handleLines(Stream& /*stream*/, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        parser_.feedLine(line);
    }
}

void ProcessSupervisor::drain() {
    // Descendants of virt-v2v may keep the pipes open after it exited, so only
    // what is readable right now is consumed.
    for (Stream* stream : {&stdout_, &stderr_}) {
        if (stream->fd < 0) {
            continue;
        }
        readStream(*stream);
        closeStream(*stream);
    }
}

void ProcessSupervisor::closeStream(Stream& stream) {
    if (stream.fd >= 0) {
        closeFd(stream.fd);
        handleLines(stream, stream.buffer.flush());
    }
}

void ProcessSupervisor::writeLog(const char* data, std::size_t size) {
    if (logFd_ < 0) {
        return;
    }
    while (size > 0) {
        ssize_t written = write(logFd_, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ONCE(WARN, "Cannot write conversion log {}: {}", options_.v2vLogPath,
                     strerror(errno));
            return;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
}

void ProcessSupervisor::monitorFailed(const std::string& message, SupervisorResult& result) {
    result.monitorError = true;
    result.monitorMessage = message;
    LOG_ERROR("Error while monitoring virt-v2v: {}", message);
    store_.recordError("Error while monitoring virt-v2v");

    if (!reaped_) {
        LOG_INFO("Killing virt-v2v process");
        kill(*pid_, SIGKILL);
        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(*pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        reaped_ = true;
        if (waited == *pid_) {
            result.exit = ExitStatus::fromWaitStatus(status);
        } else {
            result.exit.signaled = true;
            result.exit.signal = SIGKILL;
        }
    }
}

}  // namespace daemon_supervisor
