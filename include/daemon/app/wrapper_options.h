#pragma once

#include "logging/logger.h"

#include <optional>
#include <ostream>
#include <string>

namespace daemon_app {

struct WrapperOptions {
    std::string configPath;
    std::optional<v2v_wrapper::logging::LogLevel> logLevel;
    bool showHelp = false;
    bool showVersion = false;
    bool listChecks = false;          // --checks
    std::optional<std::string> check;  // --check-<name>
};

// Defaults, with the config path taken from V2V_WRAPPER_CONFIG when set
WrapperOptions makeDefaultOptions();

// Parse command line flags into options. Returns false and fills error on an
// unknown flag or a missing value.
bool parseArgs(int argc, char** argv, WrapperOptions& options, std::string& error);

void printHelp(std::ostream& out, const char* exeName);

void printVersion(std::ostream& out);

}  // namespace daemon_app
