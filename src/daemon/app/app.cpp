#include "daemon/app/app.h"

#include "core/command_builder.h"
#include "core/error_codes.h"
#include "core/wrapper_constants.h"
#include "daemon/app/host_checks.h"
#include "daemon/parser/machine_readable_log.h"
#include "daemon/parser/progress_parser.h"
#include "daemon/state/state_persister.h"
#include "daemon/supervisor/command_runner.h"
#include "daemon/supervisor/process_supervisor.h"
#include "logging/logger.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

namespace daemon_app {
namespace {

using v2v_wrapper::ErrorCode;
using v2v_wrapper::WrapperError;

namespace logging = v2v_wrapper::logging;

void ensureDirectory(const std::string& dir, ErrorCode code) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw WrapperError(code, "Cannot create directory " + dir + ": " + ec.message());
    }
}

void loadConfig(JobContext& ctx) {
    const auto& path = ctx.options.configPath;
    if (!loadWrapperConfig(path, ctx.config)) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            throw v2v_wrapper::ValidationError("Invalid wrapper config: " + path,
                                               ErrorCode::VALIDATION_INVALID_CONFIG);
        }
        LOG_DEBUG("No wrapper config at {}, using defaults", path);
    }
    std::string error;
    if (!applyEnvOverrides(ctx.config, error)) {
        throw v2v_wrapper::ValidationError(error, ErrorCode::VALIDATION_INVALID_CONFIG);
    }
    if (ctx.options.logLevel) {
        ctx.config.logging.level = *ctx.options.logLevel;
    }
    // Secret files and -os are used after detach() left the working directory
    ctx.config.logDir = daemon_core::absoluteDir(ctx.config.logDir);
    ctx.config.stateDir = daemon_core::absoluteDir(ctx.config.stateDir);
    ctx.config.localOutputDir = daemon_core::absoluteDir(ctx.config.localOutputDir);
}

logging::LogConfig fileLogConfig(const JobContext& ctx, bool console) {
    logging::LogConfig logConfig;
    logConfig.level = ctx.config.logging.level;
    logConfig.filePath = ctx.paths.wrapperLog;
    logConfig.maxFileSize = ctx.config.logging.maxFileSize;
    logConfig.maxBackups = ctx.config.logging.maxBackups;
    logConfig.pattern = ctx.config.logging.pattern;
    logConfig.consoleOutput = console;
    logConfig.stderrOutput = true;
    return logConfig;
}

void writeSecretFiles(JobContext& ctx) {
    const auto& request = ctx.request;
    if (request.vmwarePassword && request.transportMethod == v2v_wrapper::TransportMethod::Vddk) {
        ctx.vmwarePasswordFile.emplace(v2v_wrapper::SecretFile::create(
            ctx.config.stateDir, *request.vmwarePassword, ctx.account.uid, ctx.account.gid));
    }
    if (request.rhvUpload) {
        ctx.rhvPasswordFile.emplace(v2v_wrapper::SecretFile::create(
            ctx.config.stateDir, request.rhvUpload->password, ctx.account.uid, ctx.account.gid));
    }
}

// Detaches the store from a persister that is about to go away
class ChangeCallbackGuard {
   public:
    explicit ChangeCallbackGuard(daemon_state::StateStore& store) : store_(store) {}
    ~ChangeCallbackGuard() {
        store_.setChangeCallback(nullptr);
    }
    ChangeCallbackGuard(const ChangeCallbackGuard&) = delete;
    ChangeCallbackGuard& operator=(const ChangeCallbackGuard&) = delete;

   private:
    daemon_state::StateStore& store_;
};

int runHostCheck(JobContext& ctx, std::ostream& out, std::ostream& err) {
    const HostCheck* check = findHostCheck(*ctx.options.check);
    if (check == nullptr) {
        err << "Error: Unknown check: " << *ctx.options.check << "\n";
        return 1;
    }
    try {
        loadConfig(ctx);
    } catch (const WrapperError& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
    logging::setLevel(ctx.config.logging.level);
    return check->run(ctx.config, out) ? 0 : 1;
}

}  // namespace

void prepareJob(JobContext& ctx, std::istream& in) {
    loadConfig(ctx);
    logging::setLevel(ctx.config.logging.level);

    ctx.request = v2v_wrapper::loadJobRequest(in);
    LOG_DEBUG("Job request: {}", ctx.request.redactedJson().dump());

    ctx.privilege = daemon_core::decidePrivilege(ctx.request, geteuid(), ctx.config.serviceAccount);
    LOG_DEBUG("Privileges: {}", ctx.privilege.reason);
    if (ctx.privilege.action == daemon_core::PrivilegeAction::DropToServiceAccount) {
        ctx.account = daemon_core::resolveAccount(ctx.privilege.account);
    } else {
        ctx.account = daemon_core::currentAccount();
    }

    ctx.tag = daemon_core::makeJobTag(std::time(nullptr), getpid());
    ctx.paths = daemon_core::computeOutputPaths(ctx.config, ctx.tag);
    ensureDirectory(ctx.config.logDir, ErrorCode::SPAWN_LOG_OPEN_FAILED);
    ensureDirectory(ctx.config.stateDir, ErrorCode::PERSISTENCE_WRITE_FAILED);

    // Written while still privileged so they can be handed to the target account
    writeSecretFiles(ctx);

    if (ctx.privilege.action == daemon_core::PrivilegeAction::DropToServiceAccount) {
        daemon_core::dropPrivileges(ctx.account);
    }

    if (!logging::initialize(fileLogConfig(ctx, !ctx.request.daemonize))) {
        throw WrapperError(ErrorCode::SPAWN_LOG_OPEN_FAILED,
                           "Cannot open wrapper log " + ctx.paths.wrapperLog);
    }
    LOG_INFO("v2v-wrapper {} preparing conversion of '{}'", WrapperConstants::WRAPPER_VERSION,
             ctx.request.vmName);
    LOG_INFO("Will store virt-v2v log in: {}", ctx.paths.v2vLog);
    LOG_INFO("Will store state file in: {}", ctx.paths.stateFile);

    ctx.store = std::make_unique<daemon_state::StateStore>(
        daemon_state::StateFile(ctx.paths.stateFile));
    ctx.lifecycle = std::make_unique<daemon_lifecycle::Lifecycle>(*ctx.store);
    ctx.store->initializeDisks(ctx.request.sourceDisks);
    if (!ctx.store->persist()) {
        throw WrapperError(ErrorCode::PERSISTENCE_WRITE_FAILED,
                           "Cannot write state file " + ctx.paths.stateFile);
    }
}

daemon_lifecycle::Outcome superviseJob(JobContext& ctx) {
    v2v_wrapper::CommandInputs inputs;
    inputs.machineReadableLog = ctx.paths.machineReadableLog;
    if (ctx.vmwarePasswordFile) {
        inputs.vmwarePasswordFile = ctx.vmwarePasswordFile->path();
    }
    if (ctx.rhvPasswordFile) {
        inputs.rhvPasswordFile = ctx.rhvPasswordFile->path();
    }
    inputs.runsAsRoot = ctx.account.uid == 0;

    v2v_wrapper::Environment queryEnv = v2v_wrapper::currentEnvironment();
    queryEnv["LANG"] = "C";
    if (auto capabilities =
            daemon_supervisor::queryCapabilities(ctx.config.virtV2vPath, queryEnv)) {
        inputs.capabilities = std::move(*capabilities);
    }

    const v2v_wrapper::V2vCommand command = v2v_wrapper::CommandBuilder::build(
        ctx.request, ctx.config, inputs, v2v_wrapper::currentEnvironment());
    LOG_INFO("Starting virt-v2v:");
    LOG_INFO("{}", v2v_wrapper::CommandBuilder::describeSafe(command));

    auto& store = *ctx.store;
    auto& lifecycle = *ctx.lifecycle;

    daemon_state::StatePersister persister(
        store, std::chrono::milliseconds(ctx.config.persistIntervalMs));
    ChangeCallbackGuard callbackGuard(store);
    store.setChangeCallback([&persister]() { persister.notify(); });
    persister.start();

    daemon_parser::ProgressParser parser(store, daemon_parser::makeGrammar());
    daemon_parser::MachineReadableLog machineLog(ctx.paths.machineReadableLog, store);

    daemon_supervisor::SupervisorOptions supervisorOptions;
    supervisorOptions.v2vLogPath = ctx.paths.v2vLog;
    supervisorOptions.pollTimeoutMs = WrapperConstants::OUTPUT_POLL_TIMEOUT_MS;

    daemon_lifecycle::Outcome outcome;
    {
        daemon_supervisor::ProcessSupervisor supervisor(store, parser, machineLog,
                                                        supervisorOptions);
        try {
            supervisor.spawn(command);
        } catch (const v2v_wrapper::SpawnError& e) {
            LOG_ERROR("Failed to start virt-v2v: {} [{}]", e.what(),
                      v2v_wrapper::errorCodeToString(e.code()));
            store.setChangeCallback(nullptr);
            persister.stop();
            outcome =
                lifecycle.fail(std::string("Failed to start virt-v2v: ") + e.what(), e.code());
            return outcome;
        }
        lifecycle.advance(daemon_lifecycle::LifecyclePhase::Started);
        lifecycle.advance(daemon_lifecycle::LifecyclePhase::Running);

        daemon_supervisor::SupervisorResult result = supervisor.run();
        store.setChangeCallback(nullptr);
        persister.stop();
        outcome = lifecycle.finish(result);
    }

    // Secrets are no longer needed once virt-v2v is gone
    ctx.vmwarePasswordFile.reset();
    ctx.rhvPasswordFile.reset();
    return outcome;
}

daemon_lifecycle::Outcome runGuarded(JobContext& ctx, const SupervisedPhase& phase) {
    try {
        return phase(ctx);
    } catch (const std::exception& e) {
        // The child, if any, was killed and reaped while unwinding
        LOG_CRITICAL("Unexpected error while supervising the conversion: {}", e.what());
        return ctx.lifecycle->fail(std::string("Internal error: ") + e.what(),
                                   ErrorCode::INTERNAL_UNKNOWN);
    }
}

int runWrapper(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err) {
    logging::initializeEarly();

    JobContext ctx;
    ctx.options = makeDefaultOptions();
    std::string error;
    if (!parseArgs(argc, argv, ctx.options, error)) {
        err << "Error: " << error << "\n";
        printHelp(err, argv[0]);
        return 1;
    }
    if (ctx.options.showHelp) {
        printHelp(out, argv[0]);
        return 0;
    }
    if (ctx.options.showVersion) {
        printVersion(out);
        return 0;
    }
    if (ctx.options.listChecks) {
        for (const auto& check : hostChecks()) {
            out << check.name << "\n";
        }
        out.flush();
        return 0;
    }
    if (ctx.options.check) {
        return runHostCheck(ctx, out, err);
    }

    try {
        prepareJob(ctx, in);
    } catch (const WrapperError& e) {
        LOG_ERROR("{} [{}]", e.what(), v2v_wrapper::errorCodeToString(e.code()));
        err << "Error: " << e.what() << std::endl;
        if (ctx.store) {
            daemon_state::StateFile(ctx.paths.stateFile).removeIfExists();
        }
        return v2v_wrapper::toExitStatus(e.code());
    }

    if (!daemon_core::writeBootstrapLine(out, ctx.paths)) {
        LOG_ERROR("Cannot write bootstrap information to standard output");
        daemon_state::StateFile(ctx.paths.stateFile).removeIfExists();
        return 1;
    }

    if (ctx.request.daemonize) {
        logging::shutdown();
        try {
            daemon_core::detach();
        } catch (const v2v_wrapper::SpawnError& e) {
            if (logging::initialize(fileLogConfig(ctx, false))) {
                LOG_ERROR("Failed to detach: {}", e.what());
            }
            ctx.lifecycle->fail(std::string("Failed to detach: ") + e.what(), e.code());
            return 1;
        }
        if (!logging::initialize(fileLogConfig(ctx, false))) {
            // Nowhere left to report this but the state file
            ctx.store->recordError("Cannot reopen wrapper log " + ctx.paths.wrapperLog);
        }
        LOG_INFO("Detached from caller, daemon pid {}", getpid());
    }
    ctx.lifecycle->advance(daemon_lifecycle::LifecyclePhase::Detached);

    daemon_lifecycle::Outcome outcome = runGuarded(ctx, superviseJob);
    logging::flush();
    return outcome.failed ? v2v_wrapper::toExitStatus(outcome.code) : 0;
}

}  // namespace daemon_app
