#ifndef V2V_WRAPPER_CONFIG_LOADER_H
#define V2V_WRAPPER_CONFIG_LOADER_H

#include "core/wrapper_constants.h"
#include "logging/logger.h"

#include <filesystem>
#include <string>

namespace v2v_wrapper {

// Host-level settings. Anything that varies per job lives in JobRequest instead.
struct WrapperConfig {
    std::string virtV2vPath = WrapperConstants::DEFAULT_VIRT_V2V_PATH;
    // virt-v2v log, machine-readable log, wrapper log
    std::string logDir = WrapperConstants::DEFAULT_LOG_DIR;
    std::string stateDir = WrapperConstants::DEFAULT_STATE_DIR;  // state file and secret files
    // -o local target when no RHV target is given
    std::string localOutputDir = WrapperConstants::DEFAULT_LOCAL_OUTPUT_DIR;
    std::string vddkLibDir = WrapperConstants::DEFAULT_VDDK_LIBDIR;
    // identity virt-v2v runs as when root is not needed
    std::string serviceAccount = WrapperConstants::DEFAULT_SERVICE_ACCOUNT;
    std::string rhvCaFile = WrapperConstants::DEFAULT_RHV_CAFILE;
    // storage domains mounted by VDSM, searched by the guest tools check
    std::string vdsmMountsDir = WrapperConstants::DEFAULT_VDSM_MOUNTS_DIR;
    // housekeeping interval for state snapshots
    int persistIntervalMs = WrapperConstants::DEFAULT_PERSIST_INTERVAL_MS;

    struct LoggingConfig {
        logging::LogLevel level = logging::LogLevel::Debug;
        size_t maxFileSize = static_cast<size_t>(50 * 1024 * 1024);
        size_t maxBackups = 3;
        std::string pattern = "%Y-%m-%d %H:%M:%S,%e:%^%L%$: %v (%s:%#)";
    } logging;
};

// Load the JSON config file into outConfig. A missing file leaves the defaults
// in place and returns false; a file that does not parse also returns false.
bool loadWrapperConfig(const std::filesystem::path& configPath, WrapperConfig& outConfig,
                       bool verbose = true);

// Override config values from V2V_WRAPPER_* environment variables.
// Returns false and fills error when a value cannot be interpreted.
bool applyEnvOverrides(WrapperConfig& config, std::string& error);

}  // namespace v2v_wrapper

#endif  // V2V_WRAPPER_CONFIG_LOADER_H
