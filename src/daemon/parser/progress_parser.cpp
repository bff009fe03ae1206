#include "daemon/parser/progress_parser.h"

#include "logging/logger.h"

#include <stdexcept>

namespace daemon_parser {

ProgressParser::ProgressParser(daemon_state::StateStore& store,
                               std::unique_ptr<ProgressGrammar> grammar)
    : store_(store), grammar_(std::move(grammar)) {
    if (!grammar_) {
        throw std::invalid_argument("ProgressParser requires a grammar");
    }
    LOG_DEBUG("Progress parser using {} grammar v{}", grammar_->name(), grammar_->version());
}

bool ProgressParser::feedLine(const std::string& line) {
    ParsedLine parsed = grammar_->classify(line);
    return std::visit([this](const auto& value) { return apply(value); }, parsed);
}

bool ProgressParser::apply(const CopyDiskLine& line) {
    currentDisk_ = static_cast<std::size_t>(line.index - 1);
    currentPath_.reset();
    LOG_INFO("Copying disk {}/{}", line.index, line.count);
    return store_.setDiskCount(line.count);
}

bool ProgressParser::apply(const DiskPathLine& line) {
    currentPath_ = line.path;
    if (!currentDisk_) {
        LOG_DEBUG("Disk path '{}' reported before any disk copy started", line.path);
        return false;
    }
    LOG_INFO("Copying path: {}", line.path);
    return store_.locateDisk(line.path, *currentDisk_);
}

bool ProgressParser::apply(const ProgressLine& line) {
    if (!currentDisk_ || !currentPath_) {
        LOG_DEBUG("Skipping progress update for unknown disk");
        return false;
    }
    LOG_DEBUG("Updated progress: {:.2f}", line.percent);
    return store_.setProgress(*currentPath_, line.percent);
}

bool ProgressParser::apply(const VmIdLine& line) {
    LOG_INFO("Created VM with id={}", line.uuid);
    return store_.setVmId(line.uuid);
}

bool ProgressParser::apply(const DisplayNameLine& line) {
    LOG_INFO("Set VM display name to: {}", line.name);
    return false;
}

bool ProgressParser::apply(const UnrecognizedLine& line) {
    LOG_DEBUG("{}", line.text);
    return false;
}

}  // namespace daemon_parser
