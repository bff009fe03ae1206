#pragma once

#include "core/job_request.h"

#include <string>
#include <sys/types.h>

namespace daemon_core {

enum class PrivilegeAction { KeepCurrent, DropToServiceAccount };

struct PrivilegeDecision {
    PrivilegeAction action = PrivilegeAction::KeepCurrent;
    std::string account;  // set when dropping
    std::string reason;
};

struct ServiceAccount {
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
};

/**
 * @brief Decide which identity the conversion subprocess runs under.
 *
 * Pure function of its inputs:
 * - not running as root: nothing to drop, keep the current identity
 * - explicit run_as_root override: keep root
 * - export domain output: keep root (the NFS export has to be mounted)
 * - otherwise drop to the service account
 */
PrivilegeDecision decidePrivilege(v2v_wrapper::TransportMethod transport, bool runAsRootOverride,
                                  bool needsRootForOutput, uid_t currentEuid,
                                  const std::string& serviceAccount);

// Convenience overload taking the loaded job
PrivilegeDecision decidePrivilege(const v2v_wrapper::JobRequest& request, uid_t currentEuid,
                                  const std::string& serviceAccount);

// Look the account up in the user database.
// Throws PrivilegeError(PRIVILEGE_ACCOUNT_NOT_FOUND) if it does not exist.
ServiceAccount resolveAccount(const std::string& name);

// The account the subprocess will run as when nothing is dropped
ServiceAccount currentAccount();

/**
 * @brief Permanently switch the process to the given account.
 *
 * Clears supplementary groups (initializing them from the account), sets the
 * real, effective and saved gid then uid, and verifies that root cannot be
 * regained. Any failure throws PrivilegeError; the caller must not continue.
 */
void dropPrivileges(const ServiceAccount& account);

}  // namespace daemon_core
