#include "daemon/core/privilege.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace daemon_core {

using v2v_wrapper::ErrorCode;
using v2v_wrapper::PrivilegeError;

PrivilegeDecision decidePrivilege(v2v_wrapper::TransportMethod transport, bool runAsRootOverride,
                                  bool needsRootForOutput, uid_t currentEuid,
                                  const std::string& serviceAccount) {
    PrivilegeDecision decision;
    if (currentEuid != 0) {
        decision.reason = "not running as root";
        return decision;
    }
    if (runAsRootOverride) {
        decision.reason = "run_as_root requested";
        return decision;
    }
    if (needsRootForOutput) {
        decision.reason = "export domain must be mounted as root";
        return decision;
    }
    decision.action = PrivilegeAction::DropToServiceAccount;
    decision.account = serviceAccount;
    decision.reason = std::string("running ") + v2v_wrapper::transportMethodToString(transport) +
                      " conversion as service account";
    return decision;
}

PrivilegeDecision decidePrivilege(const v2v_wrapper::JobRequest& request, uid_t currentEuid,
                                  const std::string& serviceAccount) {
    return decidePrivilege(request.transportMethod, request.runAsRoot,
                           request.exportDomain.has_value(), currentEuid, serviceAccount);
}

ServiceAccount resolveAccount(const std::string& name) {
    std::vector<char> buffer(16384);
    struct passwd pwd {};
    struct passwd* result = nullptr;
    int rc = getpwnam_r(name.c_str(), &pwd, buffer.data(), buffer.size(), &result);
    if (rc != 0 || result == nullptr) {
        throw PrivilegeError("Service account '" + name + "' does not exist" +
                                 (rc != 0 ? std::string(": ") + strerror(rc) : std::string()),
                             ErrorCode::PRIVILEGE_ACCOUNT_NOT_FOUND);
    }
    ServiceAccount account;
    account.name = name;
    account.uid = result->pw_uid;
    account.gid = result->pw_gid;
    return account;
}

ServiceAccount currentAccount() {
    ServiceAccount account;
    account.uid = geteuid();
    account.gid = getegid();
    std::vector<char> buffer(16384);
    struct passwd pwd {};
    struct passwd* result = nullptr;
    if (getpwuid_r(account.uid, &pwd, buffer.data(), buffer.size(), &result) == 0 && result) {
        account.name = result->pw_name;
    } else {
        account.name = std::to_string(account.uid);
    }
    return account;
}

void dropPrivileges(const ServiceAccount& account) {
    if (initgroups(account.name.c_str(), account.gid) < 0) {
        throw PrivilegeError("initgroups(" + account.name + ") failed: " + strerror(errno));
    }
    if (setresgid(account.gid, account.gid, account.gid) < 0) {
        throw PrivilegeError("setresgid(" + std::to_string(account.gid) +
                             ") failed: " + strerror(errno));
    }
    if (setresuid(account.uid, account.uid, account.uid) < 0) {
        throw PrivilegeError("setresuid(" + std::to_string(account.uid) +
                             ") failed: " + strerror(errno));
    }

    if (getuid() != account.uid || geteuid() != account.uid || getgid() != account.gid ||
        getegid() != account.gid) {
        throw PrivilegeError("Identity after privilege drop does not match " + account.name);
    }
    if (account.uid != 0 && setuid(0) == 0) {
        throw PrivilegeError("Root privileges could be regained after dropping to " + account.name,
                             ErrorCode::PRIVILEGE_REGAIN_POSSIBLE);
    }
    LOG_INFO("Dropped privileges to {} (uid={}, gid={})", account.name, account.uid, account.gid);
}

}  // namespace daemon_core
