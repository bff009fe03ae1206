#pragma once

#include "core/config_loader.h"
#include "core/job_request.h"
#include "core/secret_file.h"
#include "daemon/app/wrapper_options.h"
#include "daemon/core/daemonizer.h"
#include "daemon/core/privilege.h"
#include "daemon/lifecycle/lifecycle.h"
#include "daemon/state/state_store.h"

#include <memory>
#include <optional>
#include <string>

namespace daemon_app {

// Everything one wrapper run knows about its job. Passed explicitly between
// the startup phase and the supervising phase.
struct JobContext {
    WrapperOptions options;
    v2v_wrapper::WrapperConfig config;
    v2v_wrapper::JobRequest request;

    std::string tag;
    daemon_core::OutputPaths paths;

    daemon_core::PrivilegeDecision privilege;
    daemon_core::ServiceAccount account;  // identity virt-v2v runs as

    std::optional<v2v_wrapper::SecretFile> vmwarePasswordFile;
    std::optional<v2v_wrapper::SecretFile> rhvPasswordFile;

    std::unique_ptr<daemon_state::StateStore> store;
    std::unique_ptr<daemon_lifecycle::Lifecycle> lifecycle;
};

}  // namespace daemon_app
