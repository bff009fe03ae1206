#pragma once

#include "core/config_loader.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace daemon_app {

/**
 * @brief Host readiness check run through `--check-<name>`.
 *
 * A check prints what it found to `out` and returns true when the host is
 * usable for conversions in that respect.
 */
struct HostCheck {
    std::string name;
    std::function<bool(const v2v_wrapper::WrapperConfig&, std::ostream&)> run;
};

// All checks, in the order `--checks` lists them
const std::vector<HostCheck>& hostChecks();

// nullptr for an unknown name
const HostCheck* findHostCheck(const std::string& name);

// Compare dotted numeric versions: <0, 0 or >0. Missing components count as 0.
int compareVersions(const std::string& a, const std::string& b);

// Best guest tools image among file names: RHV tools first, then oVirt tools,
// then virtio-win; newer versions win within the same kind.
std::optional<std::string> pickToolsIso(const std::vector<std::string>& names);

// Image directory of the ISO storage domain mounted below mountsDir
std::optional<std::filesystem::path> findIsoDomain(const std::filesystem::path& mountsDir);

}  // namespace daemon_app
