#include "core/command_builder.h"

#include "core/wrapper_constants.h"

#include <regex>
#include <sstream>

extern char** environ;

namespace v2v_wrapper {

namespace {

constexpr const char* kMasked = "*****";

void appendSource(const JobRequest& request, const WrapperConfig& config,
                  const CommandInputs& inputs, std::vector<std::string>& args) {
    if (request.transportMethod == TransportMethod::Vddk) {
        args.insert(args.end(), {"-i", "libvirt", "-ic", request.vmwareUri, "-it", "vddk", "-io",
                                 "vddk-libdir=" + config.vddkLibDir});
        if (request.vmwareFingerprint) {
            args.insert(args.end(), {"-io", "vddk-thumbprint=" + *request.vmwareFingerprint});
        }
        if (inputs.vmwarePasswordFile) {
            args.insert(args.end(), {"--password-file", *inputs.vmwarePasswordFile});
        }
    } else {
        args.insert(args.end(), {"-i", "vmx", "-it", "ssh"});
    }
}

void appendNetworks(const JobRequest& request, const CommandInputs& inputs,
                    std::vector<std::string>& args) {
    const bool macOption = inputs.capabilities.count(WrapperConstants::CAPABILITY_MAC_OPTION) > 0;
    for (const auto& mapping : request.networkMappings) {
        if (mapping.macAddress && macOption) {
            args.insert(args.end(),
                        {"--mac", *mapping.macAddress + ":bridge:" + mapping.destination});
        } else {
            args.insert(args.end(), {"--bridge", mapping.source + ":" + mapping.destination});
        }
    }
}

void appendOutput(const JobRequest& request, const WrapperConfig& config,
                  const CommandInputs& inputs, std::vector<std::string>& args) {
    if (request.rhvUpload) {
        const auto& upload = *request.rhvUpload;
        args.insert(args.end(), {"-o", "rhv-upload", "-oc", upload.url, "-os", upload.storage});
        if (inputs.rhvPasswordFile) {
            args.insert(args.end(), {"-op", *inputs.rhvPasswordFile});
        }
        args.insert(args.end(), {"-oo", "rhv-cluster=" + upload.cluster, "-oo", "rhv-direct",
                                 "-oo",
                                 std::string("rhv-verifypeer=") +
                                     (upload.insecureConnection ? "false" : "true")});
        if (!upload.insecureConnection) {
            const std::string caFile = upload.caFile.empty() ? config.rhvCaFile : upload.caFile;
            args.insert(args.end(), {"-oo", "rhv-cafile=" + caFile});
        }
    } else if (request.exportDomain) {
        args.insert(args.end(), {"-o", "rhv", "-os", *request.exportDomain});
    } else {
        args.insert(args.end(), {"-o", "local", "-os", config.localOutputDir});
    }

    args.insert(args.end(), {"-of", outputFormatToString(request.outputFormat)});
    if (request.allocation) {
        args.insert(args.end(), {"-oa", allocationToString(*request.allocation)});
    }
}

}  // namespace

Capabilities parseCapabilities(const std::string& output) {
    Capabilities capabilities;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        const auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = line.find_last_not_of(" \t\r");
        capabilities.insert(line.substr(begin, end - begin + 1));
    }
    return capabilities;
}

V2vCommand CommandBuilder::build(const JobRequest& request, const WrapperConfig& config,
                                 const CommandInputs& inputs, const Environment& baseEnv) {
    V2vCommand command;
    auto& args = command.args;
    args = {config.virtV2vPath,
            "-v",
            "-x",
            request.vmName,
            "--root",
            "first",
            "--machine-readable=file:" + inputs.machineReadableLog};

    appendSource(request, config, inputs, args);
    appendNetworks(request, inputs, args);
    appendOutput(request, config, inputs, args);

    command.env = baseEnv;
    command.env["LANG"] = "C";
    // Export domains are mounted as root, where the libvirt backend cannot run
    if (request.exportDomain) {
        command.env["LIBGUESTFS_BACKEND"] = "direct";
    } else if (request.backend) {
        command.env["LIBGUESTFS_BACKEND"] = *request.backend;
    }
    if (request.virtioWin) {
        command.env["VIRTIO_WIN"] = *request.virtioWin;
    }
    // XDG_RUNTIME_DIR of the invoking user is not accessible to the service account
    if (!inputs.runsAsRoot) {
        command.env.erase("XDG_RUNTIME_DIR");
    }
    return command;
}

std::string CommandBuilder::describeSafe(const V2vCommand& command) {
    static const std::regex argRegex("([^=]*password[^=]*)=(.*)", std::regex::icase);
    static const std::regex envRegex("password", std::regex::icase);

    std::ostringstream oss;
    oss << "Executing command: [";
    for (size_t i = 0; i < command.args.size(); ++i) {
        std::string arg = command.args[i];
        std::smatch match;
        if (i > 0 && std::regex_match(arg, match, argRegex)) {
            arg = match[1].str() + "=" + kMasked;
        }
        oss << (i > 0 ? ", " : "") << "'" << arg << "'";
    }
    oss << "], environment: {";
    bool first = true;
    for (const auto& [key, value] : command.env) {
        oss << (first ? "" : ", ") << "'" << key << "': '"
            << (std::regex_search(key, envRegex) ? kMasked : value) << "'";
        first = false;
    }
    oss << "}";
    return oss.str();
}

std::vector<std::string> CommandBuilder::toEnvp(const Environment& env) {
    std::vector<std::string> envp;
    envp.reserve(env.size());
    for (const auto& [key, value] : env) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

Environment currentEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto pos = item.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        env[item.substr(0, pos)] = item.substr(pos + 1);
    }
    return env;
}

}  // namespace v2v_wrapper
