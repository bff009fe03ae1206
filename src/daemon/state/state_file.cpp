#include "daemon/state/state_file.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace daemon_state {

namespace {

bool writeAll(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

}  // namespace

StateFile::StateFile(std::string path) : path_(std::move(path)) {}

StateFile::StateFile(StateFile&& other) noexcept : path_(std::move(other.path_)) {}

StateFile& StateFile::operator=(StateFile&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    path_ = std::move(other.path_);
    return *this;
}

const std::string& StateFile::path() const {
    return path_;
}

void StateFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool StateFile::writeJsonAtomically(const nlohmann::json& payload) const {
    if (path_.empty()) {
        return false;
    }

    const std::string content = payload.dump() + '\n';

    std::string pattern = path_ + ".XXXXXX";
    std::vector<char> tmpPath(pattern.begin(), pattern.end());
    tmpPath.push_back('\0');
    int fd = mkstemp(tmpPath.data());
    if (fd < 0) {
        LOG_WARN("Cannot create temporary state file for {}: {}", path_, strerror(errno));
        return false;
    }

    // Pollers may run as a different user than the wrapper
    if (fchmod(fd, 0644) < 0) {
        LOG_WARN("Cannot make {} readable: {}", tmpPath.data(), strerror(errno));
    }

    bool ok = writeAll(fd, content) && fsync(fd) == 0;
    int err = errno;
    if (close(fd) < 0) {
        ok = false;
        err = errno;
    }
    if (!ok) {
        LOG_WARN("Cannot write temporary state file {}: {}", tmpPath.data(), strerror(err));
        unlink(tmpPath.data());
        return false;
    }
    if (std::rename(tmpPath.data(), path_.c_str()) != 0) {
        LOG_WARN("Cannot rename {} to {}: {}", tmpPath.data(), path_, strerror(errno));
        unlink(tmpPath.data());
        return false;
    }
    return true;
}

}  // namespace daemon_state
