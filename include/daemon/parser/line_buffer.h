#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace daemon_parser {

// Reassembles lines from arbitrary chunks. virt-v2v redraws its progress bar
// with '\r', so both '\r' and '\n' end a line; empty lines are dropped.
class LineBuffer {
   public:
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    std::vector<std::string> append(const char* data, std::size_t size) {
        std::vector<std::string> lines;
        for (std::size_t i = 0; i < size; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                if (!pending_.empty()) {
                    lines.push_back(std::move(pending_));
                    pending_.clear();
                }
                continue;
            }
            pending_.push_back(c);
            if (pending_.size() >= kMaxLineLength) {
                lines.push_back(std::move(pending_));
                pending_.clear();
            }
        }
        return lines;
    }

    std::vector<std::string> append(const std::string& chunk) {
        return append(chunk.data(), chunk.size());
    }

    // Returns the unterminated remainder (if any) and resets the buffer
    std::vector<std::string> flush() {
        std::vector<std::string> lines;
        if (!pending_.empty()) {
            lines.push_back(std::move(pending_));
            pending_.clear();
        }
        return lines;
    }

    bool hasPending() const {
        return !pending_.empty();
    }

   private:
    std::string pending_;
};

}  // namespace daemon_parser
