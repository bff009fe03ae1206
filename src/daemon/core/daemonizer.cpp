#include "daemon/core/daemonizer.h"

#include "core/error_codes.h"
#include "core/wrapper_constants.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace daemon_core {

using v2v_wrapper::ErrorCode;
using v2v_wrapper::SpawnError;

namespace {

std::atomic<bool> gDetached{false};

void redirectToDevNull(int target, int flags) {
    int fd = open("/dev/null", flags);
    if (fd < 0) {
        return;
    }
    if (fd != target) {
        dup2(fd, target);
        close(fd);
    }
}

std::string joinPath(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / name).string();
}

}  // namespace

std::string makeJobTag(std::time_t now, pid_t pid) {
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    if (std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &local) == 0) {
        stamp[0] = '\0';
    }
    return std::string(stamp) + "-" + std::to_string(pid);
}

std::string absoluteDir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::absolute(dir, ec);
    if (ec) {
        return dir;
    }
    return resolved.lexically_normal().string();
}

OutputPaths computeOutputPaths(const v2v_wrapper::WrapperConfig& config, const std::string& tag) {
    const std::string base = std::string(WrapperConstants::OUTPUT_PREFIX) + tag;
    const std::string logDir = absoluteDir(config.logDir);
    const std::string stateDir = absoluteDir(config.stateDir);
    OutputPaths paths;
    paths.v2vLog = joinPath(logDir, base + WrapperConstants::V2V_LOG_SUFFIX);
    paths.machineReadableLog =
        joinPath(logDir, base + WrapperConstants::MACHINE_READABLE_LOG_SUFFIX);
    paths.wrapperLog = joinPath(logDir, base + WrapperConstants::WRAPPER_LOG_SUFFIX);
    paths.stateFile = joinPath(stateDir, base + WrapperConstants::STATE_FILE_SUFFIX);
    return paths;
}

nlohmann::json bootstrapJson(const OutputPaths& paths) {
    return {{"state_file", paths.stateFile},
            {"v2v_log", paths.v2vLog},
            {"wrapper_log", paths.wrapperLog}};
}

bool writeBootstrapLine(std::ostream& out, const OutputPaths& paths) {
    out << bootstrapJson(paths).dump() << '\n';
    out.flush();
    return static_cast<bool>(out);
}

void closeInheritedDescriptors(const std::vector<int>& keepFds) {
    std::vector<int> toClose;
    DIR* dir = opendir("/proc/self/fd");
    if (dir != nullptr) {
        int dirFd = dirfd(dir);
        while (struct dirent* entry = readdir(dir)) {
            char* end = nullptr;
            long fd = std::strtol(entry->d_name, &end, 10);
            if (end == entry->d_name || *end != '\0') {
                continue;
            }
            if (fd > STDERR_FILENO && fd != dirFd) {
                toClose.push_back(static_cast<int>(fd));
            }
        }
        closedir(dir);
    } else {
        long maxFd = sysconf(_SC_OPEN_MAX);
        for (long fd = STDERR_FILENO + 1; fd < (maxFd > 0 ? maxFd : 1024); ++fd) {
            toClose.push_back(static_cast<int>(fd));
        }
    }
    for (int fd : toClose) {
        if (std::find(keepFds.begin(), keepFds.end(), fd) == keepFds.end()) {
            close(fd);
        }
    }
}

void detach(const std::vector<int>& keepFds) {
    if (gDetached.exchange(true)) {
        throw SpawnError("Wrapper is already detached", ErrorCode::SPAWN_DETACH_FAILED);
    }

    std::fflush(stdout);
    std::fflush(stderr);

    pid_t pid = fork();
    if (pid < 0) {
        gDetached.store(false);
        throw SpawnError(std::string("fork() failed: ") + strerror(errno),
                         ErrorCode::SPAWN_DETACH_FAILED);
    }
    if (pid > 0) {
        _exit(0);
    }

    // From here on the caller has gone; errors cannot be reported to it
    if (setsid() < 0) {
        throw SpawnError(std::string("setsid() failed: ") + strerror(errno),
                         ErrorCode::SPAWN_DETACH_FAILED);
    }
    pid = fork();
    if (pid < 0) {
        throw SpawnError(std::string("second fork() failed: ") + strerror(errno),
                         ErrorCode::SPAWN_DETACH_FAILED);
    }
    if (pid > 0) {
        _exit(0);
    }

    umask(0);
    if (chdir("/") < 0) {
        throw SpawnError(std::string("chdir(\"/\") failed: ") + strerror(errno),
                         ErrorCode::SPAWN_DETACH_FAILED);
    }
    redirectToDevNull(STDIN_FILENO, O_RDONLY);
    redirectToDevNull(STDOUT_FILENO, O_WRONLY);
    redirectToDevNull(STDERR_FILENO, O_WRONLY);
    closeInheritedDescriptors(keepFds);
}

}  // namespace daemon_core
