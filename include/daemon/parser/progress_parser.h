#pragma once

#include "daemon/parser/progress_grammar.h"
#include "daemon/state/state_store.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace daemon_parser {

/**
 * @brief Turns classified conversion output into StateStore updates.
 *
 * Tracks the disk currently being copied (from "Copying disk N/M") and the
 * path that disk was opened from. Progress lines are applied to that path
 * only; without a known path they are skipped. Nothing here fails the job.
 */
class ProgressParser {
   public:
    ProgressParser(daemon_state::StateStore& store, std::unique_ptr<ProgressGrammar> grammar);

    // Returns true when the line changed the stored state
    bool feedLine(const std::string& line);

    int grammarVersion() const {
        return grammar_->version();
    }

    std::optional<std::size_t> currentDisk() const {
        return currentDisk_;
    }
    const std::optional<std::string>& currentPath() const {
        return currentPath_;
    }

   private:
    bool apply(const CopyDiskLine& line);
    bool apply(const DiskPathLine& line);
    bool apply(const ProgressLine& line);
    bool apply(const VmIdLine& line);
    bool apply(const DisplayNameLine& line);
    bool apply(const UnrecognizedLine& line);

    daemon_state::StateStore& store_;
    std::unique_ptr<ProgressGrammar> grammar_;

    std::optional<std::size_t> currentDisk_;  // 0-based
    std::optional<std::string> currentPath_;
};

}  // namespace daemon_parser
