#include "daemon/parser/machine_readable_log.h"

#include "core/wrapper_constants.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <vector>

namespace daemon_parser {

MachineReadableLog::MachineReadableLog(std::string path, daemon_state::StateStore& store)
    : path_(std::move(path)), store_(store) {}

MachineReadableLog::~MachineReadableLog() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

bool MachineReadableLog::ensureOpen() {
    if (fd_ >= 0) {
        return true;
    }
    fd_ = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        if (errno != ENOENT) {
            LOG_WARN("Cannot open machine readable log {}: {}", path_, strerror(errno));
        }
        return false;
    }
    LOG_DEBUG("Following machine readable log {}", path_);
    return true;
}

void MachineReadableLog::readAvailable() {
    std::vector<char> chunk(WrapperConstants::OUTPUT_READ_CHUNK);
    while (true) {
        ssize_t n = read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("Error reading machine readable log {}: {}", path_, strerror(errno));
            return;
        }
        if (n == 0) {
            return;
        }
        for (const auto& line : buffer_.append(chunk.data(), static_cast<std::size_t>(n))) {
            handleLine(line);
        }
    }
}

void MachineReadableLog::poll() {
    if (!ensureOpen()) {
        return;
    }
    readAvailable();
}

void MachineReadableLog::finish() {
    if (ensureOpen()) {
        readAvailable();
    }
    for (const auto& line : buffer_.flush()) {
        handleLine(line);
    }
}

void MachineReadableLog::handleLine(const std::string& line) {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse line from virt-v2v machine readable output: {}", e.what());
        LOG_ERROR("Offending line: {}", line);
        return;
    }
    if (!record.is_object() || !record.contains("type") || !record["type"].is_string()) {
        return;
    }
    if (record["type"].get<std::string>() != "error") {
        return;
    }

    std::string message;
    if (record.contains("message") && record["message"].is_string()) {
        message = record["message"].get<std::string>();
    } else if (record.contains("message")) {
        message = record["message"].dump();
    }
    ++fatalErrors_;
    LOG_ERROR("virt-v2v error: {}", message);
    store_.recordError("virt-v2v error: " + message);
}

}  // namespace daemon_parser
