#include "daemon/app/wrapper_options.h"

#include "core/wrapper_constants.h"

#include <cstdlib>
#include <string>

namespace daemon_app {

namespace {

bool isKnownLevel(const std::string& value) {
    return value == "trace" || value == "debug" || value == "info" || value == "warn" ||
           value == "warning" || value == "error" || value == "critical" || value == "off";
}

}  // namespace

WrapperOptions makeDefaultOptions() {
    WrapperOptions options;
    options.configPath = WrapperConstants::DEFAULT_CONFIG_PATH;
    if (const char* env = std::getenv("V2V_WRAPPER_CONFIG")) {
        options.configPath = env;
    }
    return options;
}

void printHelp(std::ostream& out, const char* exeName) {
    out << "v2v-wrapper " << WrapperConstants::WRAPPER_VERSION << "\n";
    out << "Usage: " << exeName << " [options] < job.json\n\n";
    out << "Reads one conversion job as JSON from standard input, prints the\n";
    out << "locations of the state file and logs as one JSON line, then runs\n";
    out << "virt-v2v in the background.\n\n";
    out << "Options:\n";
    out << "  -c, --config <file>     Wrapper config (default: " << WrapperConstants::DEFAULT_CONFIG_PATH
        << ")\n";
    out << "  -l, --log-level <lvl>   trace/debug/info/warn/error (default: debug)\n";
    out << "  --checks                List host checks\n";
    out << "  --check-<name>          Run one host check, exit 0 when it passes\n";
    out << "  -V, --version           Show version\n";
    out << "  -h, --help              Show this help\n";
    out << std::endl;
}

void printVersion(std::ostream& out) {
    out << "v2v-wrapper " << WrapperConstants::WRAPPER_VERSION << std::endl;
}

bool parseArgs(int argc, char** argv, WrapperOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto requireValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-V" || arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--checks") {
            options.listChecks = true;
        } else if (arg.rfind("--check-", 0) == 0 && arg.size() > 8) {
            options.check = arg.substr(8);
        } else if (arg == "-c" || arg == "--config") {
            if (!requireValue(options.configPath)) {
                return false;
            }
        } else if (arg == "-l" || arg == "--log-level") {
            std::string value;
            if (!requireValue(value)) {
                return false;
            }
            if (!isKnownLevel(value)) {
                error = "Unknown log level: " + value;
                return false;
            }
            options.logLevel = v2v_wrapper::logging::stringToLevel(value);
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

}  // namespace daemon_app
