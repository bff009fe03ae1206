#pragma once

#include "core/config_loader.h"
#include "core/job_request.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace v2v_wrapper {

using Environment = std::map<std::string, std::string>;

// Feature names printed one per line by `virt-v2v --machine-readable`
using Capabilities = std::set<std::string>;

Capabilities parseCapabilities(const std::string& output);

struct V2vCommand {
    std::vector<std::string> args;  // args[0] is the virt-v2v binary
    Environment env;
};

// Per-job values that are only known once the wrapper prepared its files
struct CommandInputs {
    std::string machineReadableLog;
    std::optional<std::string> vmwarePasswordFile;
    std::optional<std::string> rhvPasswordFile;
    bool runsAsRoot = true;
    // Without "mac-option" every network mapping is passed with --bridge
    Capabilities capabilities;
};

class CommandBuilder {
   public:
    static V2vCommand build(const JobRequest& request, const WrapperConfig& config,
                            const CommandInputs& inputs, const Environment& baseEnv);

    // Command line and environment with password arguments and variables masked
    static std::string describeSafe(const V2vCommand& command);

    static std::vector<std::string> toEnvp(const Environment& env);
};

// Snapshot of the wrapper's own environment
Environment currentEnvironment();

}  // namespace v2v_wrapper
