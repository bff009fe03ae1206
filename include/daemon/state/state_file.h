#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace daemon_state {

// Canonical state file location. Every write replaces the whole file through a
// rename so pollers see either the previous or the new document.
class StateFile {
   public:
    explicit StateFile(std::string path);

    StateFile(const StateFile&) = delete;
    StateFile& operator=(const StateFile&) = delete;

    StateFile(StateFile&& other) noexcept;
    StateFile& operator=(StateFile&& other) noexcept;

    const std::string& path() const;

    void removeIfExists() const;

    // Serialize to a temporary file in the same directory, fsync it, then rename
    // it over path(). Returns false (and leaves the old content) on any failure.
    bool writeJsonAtomically(const nlohmann::json& payload) const;

   private:
    std::string path_;
};

}  // namespace daemon_state
