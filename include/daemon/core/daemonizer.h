#pragma once

#include "core/config_loader.h"

#include <ctime>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <sys/types.h>
#include <vector>

namespace daemon_core {

struct OutputPaths {
    std::string v2vLog;
    std::string machineReadableLog;
    std::string wrapperLog;
    std::string stateFile;
};

// "YYYYMMDDTHHMMSS-<pid>" in local time
std::string makeJobTag(std::time_t now, pid_t pid);

// `dir` resolved against the current working directory. detach() moves to "/",
// so every path handed out before it must be absolute.
std::string absoluteDir(const std::string& dir);

// Always absolute, whatever the configured directories are
OutputPaths computeOutputPaths(const v2v_wrapper::WrapperConfig& config, const std::string& tag);

// {"state_file": ..., "v2v_log": ..., "wrapper_log": ...}
nlohmann::json bootstrapJson(const OutputPaths& paths);

// Write the bootstrap object as a single line and flush it.
// Returns false when the stream reported an error.
bool writeBootstrapLine(std::ostream& out, const OutputPaths& paths);

/**
 * @brief Detach the wrapper from its caller.
 *
 * Double fork with setsid() in between; only the grandchild returns. The
 * original process and the intermediate child leave with _exit(0), so no
 * destructors run there. The daemon gets umask 0, "/" as working directory,
 * /dev/null on stdin, stdout and stderr, and every other descriptor not in
 * keepFds closed. Callers must flush or close their log sinks beforehand.
 *
 * Works once per process; a second call throws SpawnError(SPAWN_DETACH_FAILED),
 * as does a failed fork or setsid.
 */
void detach(const std::vector<int>& keepFds = {});

// Close every descriptor above stderr that is not listed in keepFds
void closeInheritedDescriptors(const std::vector<int>& keepFds);

}  // namespace daemon_core
