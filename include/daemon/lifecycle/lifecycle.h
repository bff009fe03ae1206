#pragma once

#include "core/error_codes.h"
#include "daemon/state/state_store.h"
#include "daemon/supervisor/process_supervisor.h"

#include <cstddef>
#include <optional>
#include <string>

namespace daemon_lifecycle {

// Forward-only job phases. The two Finished phases are terminal.
enum class LifecyclePhase {
    Initializing,
    Detached,
    Started,
    Running,
    FinishedSuccess,
    FinishedFailure,
};

const char* phaseToString(LifecyclePhase phase);

inline bool isTerminal(LifecyclePhase phase) {
    return phase == LifecyclePhase::FinishedSuccess || phase == LifecyclePhase::FinishedFailure;
}

struct Outcome {
    bool failed = false;
    v2v_wrapper::ErrorCode code = v2v_wrapper::ErrorCode::OK;
    std::string reason;
};

/**
 * @brief Decide whether the conversion succeeded.
 *
 * A zero exit code alone is not success: a fatal error marker reported by
 * virt-v2v or a monitoring error fails the job as well.
 */
Outcome classifyOutcome(const daemon_supervisor::ExitStatus& exit, std::size_t fatalErrorMarkers,
                        bool monitorError);

class Lifecycle {
   public:
    explicit Lifecycle(daemon_state::StateStore& store);

    LifecyclePhase phase() const {
        return phase_;
    }

    // Move to `next`. Backward moves, repeats and moves out of a terminal phase
    // are rejected and logged.
    bool advance(LifecyclePhase next);

    // Classify the supervisor result, commit return_code/finished/failed and
    // enter the matching terminal phase. Returns the outcome.
    Outcome finish(const daemon_supervisor::SupervisorResult& result);

    // Terminal failure without an exit status (the subprocess never started)
    Outcome fail(const std::string& message,
                 v2v_wrapper::ErrorCode code = v2v_wrapper::ErrorCode::SPAWN_EXEC_FAILED);

   private:
    Outcome commit(const Outcome& outcome, std::optional<int> returnCode);

    daemon_state::StateStore& store_;
    LifecyclePhase phase_ = LifecyclePhase::Initializing;
};

}  // namespace daemon_lifecycle
