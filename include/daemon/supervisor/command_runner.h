#pragma once

#include "core/command_builder.h"
#include "daemon/supervisor/process_supervisor.h"

#include <optional>
#include <string>
#include <vector>

namespace daemon_supervisor {

struct CommandOutput {
    ExitStatus exit;
    std::string out;
    std::string err;

    bool succeeded() const {
        return exit.exited && exit.code == 0;
    }
};

/**
 * @brief Run a short helper command to completion.
 *
 * stdin is /dev/null; stdout and stderr are collected separately. Blocks
 * until the command exited and both pipes reached EOF.
 *
 * @throws SpawnError when the pipes cannot be created or the exec fails
 */
CommandOutput runCommand(const std::vector<std::string>& args, const v2v_wrapper::Environment& env);

// Feature list of `virt-v2v --machine-readable`. nullopt when virt-v2v cannot
// be started or exits with an error; the reason is logged.
std::optional<v2v_wrapper::Capabilities> queryCapabilities(const std::string& virtV2vPath,
                                                           const v2v_wrapper::Environment& env);

}  // namespace daemon_supervisor
