#pragma once

#include "daemon/app/job_context.h"

#include <functional>
#include <istream>
#include <ostream>

namespace daemon_app {

/**
 * @brief Whole wrapper run: startup phase, hand-off, supervising phase.
 *
 * Startup (synchronous, caller still attached): config, job request,
 * privilege decision, output paths, secret files, privilege drop, initial
 * state file, bootstrap line on `out`. Errors here go to `err` and return 1
 * without a bootstrap line.
 *
 * With daemonize=true the process then detaches and only the daemon returns
 * from this function. Conversion failures return FOREGROUND_FAILURE_EXIT,
 * a virt-v2v that could not be started returns 1.
 */
int runWrapper(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err);

// Startup phase. Throws WrapperError; on return the bootstrap line is not yet written.
void prepareJob(JobContext& ctx, std::istream& in);

// Supervising phase: spawn virt-v2v, follow it and commit the terminal state
daemon_lifecycle::Outcome superviseJob(JobContext& ctx);

using SupervisedPhase = std::function<daemon_lifecycle::Outcome(JobContext&)>;

// Run the phase after the bootstrap line. An exception escaping it is
// committed to the state file as a failure with INTERNAL_UNKNOWN.
daemon_lifecycle::Outcome runGuarded(JobContext& ctx, const SupervisedPhase& phase);

}  // namespace daemon_app
