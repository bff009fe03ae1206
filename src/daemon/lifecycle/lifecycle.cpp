#include "daemon/lifecycle/lifecycle.h"

#include "logging/logger.h"

#include <cstring>

namespace daemon_lifecycle {

using v2v_wrapper::ErrorCode;

const char* phaseToString(LifecyclePhase phase) {
    switch (phase) {
    case LifecyclePhase::Initializing:
        return "initializing";
    case LifecyclePhase::Detached:
        return "detached";
    case LifecyclePhase::Started:
        return "started";
    case LifecyclePhase::Running:
        return "running";
    case LifecyclePhase::FinishedSuccess:
        return "finished-success";
    case LifecyclePhase::FinishedFailure:
        return "finished-failure";
    }
    return "unknown";
}

Outcome classifyOutcome(const daemon_supervisor::ExitStatus& exit, std::size_t fatalErrorMarkers,
                        bool monitorError) {
    Outcome outcome;
    if (exit.signaled) {
        outcome.failed = true;
        outcome.code = ErrorCode::BACKEND_KILLED;
        outcome.reason = std::string("virt-v2v killed by signal ") + std::to_string(exit.signal) +
                         " (" + strsignal(exit.signal) + ")";
    } else if (fatalErrorMarkers > 0) {
        outcome.failed = true;
        outcome.code = ErrorCode::BACKEND_ERROR_REPORTED;
        outcome.reason = "virt-v2v reported " + std::to_string(fatalErrorMarkers) + " error(s)";
    } else if (monitorError) {
        outcome.failed = true;
        outcome.code = ErrorCode::BACKEND_MONITOR_FAILED;
        outcome.reason = "error while monitoring virt-v2v";
    } else if (!exit.exited || exit.code != 0) {
        outcome.failed = true;
        outcome.code = ErrorCode::BACKEND_NONZERO_EXIT;
        outcome.reason = "virt-v2v exited with code " + std::to_string(exit.code);
    } else {
        outcome.reason = "virt-v2v finished successfully";
    }
    return outcome;
}

Lifecycle::Lifecycle(daemon_state::StateStore& store) : store_(store) {}

bool Lifecycle::advance(LifecyclePhase next) {
    if (isTerminal(phase_) || static_cast<int>(next) <= static_cast<int>(phase_)) {
        LOG_ERROR("Rejected lifecycle transition {} -> {}", phaseToString(phase_),
                  phaseToString(next));
        return false;
    }
    LOG_DEBUG("Lifecycle {} -> {}", phaseToString(phase_), phaseToString(next));
    phase_ = next;
    return true;
}

Outcome Lifecycle::finish(const daemon_supervisor::SupervisorResult& result) {
    Outcome outcome = classifyOutcome(result.exit, result.fatalErrors, result.monitorError);
    return commit(outcome, result.exit.returnCode());
}

Outcome Lifecycle::fail(const std::string& message, v2v_wrapper::ErrorCode code) {
    store_.recordError(message);
    Outcome outcome;
    outcome.failed = true;
    outcome.code = code;
    outcome.reason = message;
    return commit(outcome, std::nullopt);
}

Outcome Lifecycle::commit(const Outcome& outcome, std::optional<int> returnCode) {
    LifecyclePhase terminal =
        outcome.failed ? LifecyclePhase::FinishedFailure : LifecyclePhase::FinishedSuccess;
    if (!advance(terminal)) {
        return outcome;
    }
    if (outcome.failed) {
        LOG_ERROR("Conversion failed: {} [{}]", outcome.reason,
                  v2v_wrapper::errorCodeToString(outcome.code));
    } else {
        LOG_INFO("Conversion finished: {}", outcome.reason);
    }
    if (!store_.finalize(returnCode, outcome.failed)) {
        LOG_CRITICAL("Terminal state of the conversion could not be committed [{}]",
                     v2v_wrapper::errorCodeToString(
                         v2v_wrapper::ErrorCode::PERSISTENCE_TERMINAL_WRITE_FAILED));
    }
    return outcome;
}

}  // namespace daemon_lifecycle
