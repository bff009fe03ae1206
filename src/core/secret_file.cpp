#include "core/secret_file.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace v2v_wrapper {

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

SecretFile SecretFile::create(const std::string& directory, const std::string& content, uid_t uid,
                              gid_t gid) {
    std::string pattern = directory + "/v2v-secret-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    // mkstemp creates the file with mode 0600
    int fd = mkstemp(buffer.data());
    if (fd < 0) {
        throw SpawnError("Cannot create secret file in " + directory + ": " + strerror(errno),
                         ErrorCode::SPAWN_SECRET_FILE_FAILED);
    }
    SecretFile file(std::string(buffer.data()));

    if (fchown(fd, uid, gid) < 0) {
        int err = errno;
        close(fd);
        throw SpawnError("Cannot change owner of secret file " + file.path() + ": " +
                             strerror(err),
                         ErrorCode::SPAWN_SECRET_FILE_FAILED);
    }
    if (!writeAll(fd, content)) {
        int err = errno;
        close(fd);
        throw SpawnError("Cannot write secret file " + file.path() + ": " + strerror(err),
                         ErrorCode::SPAWN_SECRET_FILE_FAILED);
    }
    if (close(fd) < 0) {
        throw SpawnError("Cannot close secret file " + file.path() + ": " + strerror(errno),
                         ErrorCode::SPAWN_SECRET_FILE_FAILED);
    }
    LOG_DEBUG("Wrote secret file {}", file.path());
    return file;
}

SecretFile::SecretFile(std::string path) : path_(std::move(path)) {}

SecretFile::SecretFile(SecretFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

SecretFile& SecretFile::operator=(SecretFile&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
    return *this;
}

SecretFile::~SecretFile() {
    remove();
}

const std::string& SecretFile::path() const {
    return path_;
}

void SecretFile::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
        LOG_ERROR("Error removing secret file {}: {}", path_, strerror(errno));
    }
    path_.clear();
}

}  // namespace v2v_wrapper
