#include "daemon/app/host_checks.h"

#include "core/command_builder.h"
#include "core/error_codes.h"
#include "core/wrapper_constants.h"
#include "daemon/supervisor/command_runner.h"
#include "logging/logger.h"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace daemon_app {

namespace fs = std::filesystem;

namespace {

struct ToolsPattern {
    int priority;
    std::regex pattern;  // group 1, when present, is the version
};

const std::vector<ToolsPattern>& toolsPatterns() {
    static const auto icase = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<ToolsPattern> patterns = {
        {7, std::regex(R"(^RHV-toolsSetup_([0-9._]+)\.iso)", icase)},
        {6, std::regex(R"(^rhv-tools-setup\.iso)", icase)},
        {5, std::regex(R"(^RHEV-toolsSetup_([0-9._]+)\.iso)", icase)},
        {4, std::regex(R"(^rhev-tools-setup\.iso)", icase)},
        {3, std::regex(R"(^oVirt-toolsSetup_([a-z0-9._-]+)\.iso)", icase)},
        {2, std::regex(R"(^ovirt-tools-setup\.iso)", icase)},
        {1, std::regex(R"(^virtio-win-([0-9.]+)\.iso)", icase)},
        {0, std::regex(R"(^virtio-win\.iso)", icase)},
    };
    return patterns;
}

bool isIsoDomainMetadata(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (line == "CLASS=Iso") {
            return true;
        }
    }
    return false;
}

bool checkVirtV2v(const v2v_wrapper::WrapperConfig& config, std::ostream& out) {
    v2v_wrapper::Environment env = v2v_wrapper::currentEnvironment();
    env["LANG"] = "C";
    auto capabilities = daemon_supervisor::queryCapabilities(config.virtV2vPath, env);
    if (!capabilities) {
        out << "Cannot run " << config.virtV2vPath << " --machine-readable\n";
        return false;
    }
    out << config.virtV2vPath << " reports " << capabilities->size() << " capabilities\n";
    return true;
}

bool checkRhvGuestTools(const v2v_wrapper::WrapperConfig& config, std::ostream& out) {
    auto isoDomain = findIsoDomain(config.vdsmMountsDir);
    if (!isoDomain) {
        out << "No ISO domain found below " << config.vdsmMountsDir << "\n";
        return false;
    }

    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(*isoDomain, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        out << "Cannot list ISO domain " << isoDomain->string() << ": " << ec.message() << "\n";
        return false;
    }

    auto best = pickToolsIso(names);
    if (!best) {
        out << "No ISO with guest tools or drivers in " << isoDomain->string() << "\n";
        return false;
    }
    out << "Guest tools: " << (*isoDomain / *best).string() << "\n";
    return true;
}

bool checkRhvVersion(const v2v_wrapper::WrapperConfig& /*config*/, std::ostream& out) {
    daemon_supervisor::CommandOutput rpm;
    try {
        rpm = daemon_supervisor::runCommand({"rpm", "-q", "--queryformat", "%{VERSION}", "vdsm"},
                                            v2v_wrapper::currentEnvironment());
    } catch (const v2v_wrapper::SpawnError& e) {
        LOG_WARN("Cannot query VDSM version: {}", e.what());
        out << "Cannot query the VDSM version: " << e.what() << "\n";
        out << "Minimal required oVirt/RHV version is " << WrapperConstants::MIN_RHV_VERSION
            << "\n";
        return false;
    }

    if (rpm.succeeded() && !rpm.out.empty()) {
        if (compareVersions(rpm.out, WrapperConstants::MIN_VDSM_VERSION) >= 0) {
            return true;
        }
        out << "Version of VDSM on the host: " << rpm.out << "\n";
    }
    out << "Minimal required oVirt/RHV version is " << WrapperConstants::MIN_RHV_VERSION << "\n";
    return false;
}

}  // namespace

const std::vector<HostCheck>& hostChecks() {
    static const std::vector<HostCheck> checks = {
        {"rhv-guest-tools", checkRhvGuestTools},
        {"rhv-version", checkRhvVersion},
        {"virt-v2v", checkVirtV2v},
    };
    return checks;
}

const HostCheck* findHostCheck(const std::string& name) {
    for (const auto& check : hostChecks()) {
        if (check.name == name) {
            return &check;
        }
    }
    return nullptr;
}

int compareVersions(const std::string& a, const std::string& b) {
    std::istringstream left(a);
    std::istringstream right(b);
    while (left.good() || right.good()) {
        std::string leftPart;
        std::string rightPart;
        if (left.good()) {
            std::getline(left, leftPart, '.');
        }
        if (right.good()) {
            std::getline(right, rightPart, '.');
        }
        long l = std::strtol(leftPart.c_str(), nullptr, 10);
        long r = std::strtol(rightPart.c_str(), nullptr, 10);
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

std::optional<std::string> pickToolsIso(const std::vector<std::string>& names) {
    std::optional<std::string> bestName;
    std::string bestVersion;
    int bestPriority = -1;

    for (const auto& name : names) {
        for (const auto& candidate : toolsPatterns()) {
            std::smatch m;
            if (!std::regex_search(name, m, candidate.pattern)) {
                continue;
            }
            const std::string version = m.size() > 1 ? m[1].str() : std::string();
            LOG_DEBUG("Matched ISO {} (priority {})", name, candidate.priority);
            if (!bestName || bestPriority < candidate.priority ||
                (bestPriority == candidate.priority && compareVersions(bestVersion, version) < 0)) {
                bestName = name;
                bestVersion = version;
                bestPriority = candidate.priority;
            }
        }
    }
    return bestName;
}

std::optional<fs::path> findIsoDomain(const fs::path& mountsDir) {
    std::error_code ec;
    if (!fs::is_directory(mountsDir, ec)) {
        LOG_WARN("Cannot find RHV domains in {}", mountsDir.string());
        return std::nullopt;
    }

    fs::recursive_directory_iterator it(mountsDir, fs::directory_options::skip_permission_denied,
                                        ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        const std::string name = path.filename().string();
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            // Disk images and block domains never hold domain metadata
            if (name == "images" || name == "master" || name == "blockSD") {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (name == "metadata" && path.parent_path().filename() == "dom_md" &&
            isIsoDomainMetadata(path)) {
            return path.parent_path().parent_path() / "images" /
                   WrapperConstants::ISO_DOMAIN_IMAGE_ID;
        }
    }
    if (ec) {
        LOG_WARN("Error while searching {} for an ISO domain: {}", mountsDir.string(),
                 ec.message());
    }
    return std::nullopt;
}

}  // namespace daemon_app
