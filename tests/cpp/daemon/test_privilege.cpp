#include "core/error_codes.h"
#include "daemon/core/privilege.h"

#include <gtest/gtest.h>
#include <unistd.h>

using daemon_core::PrivilegeAction;
using v2v_wrapper::TransportMethod;

TEST(Privilege, NonRootKeepsCurrentIdentity) {
    auto decision = daemon_core::decidePrivilege(TransportMethod::Vddk, false, false, 1000, "vdsm");
    EXPECT_EQ(decision.action, PrivilegeAction::KeepCurrent);
    EXPECT_TRUE(decision.account.empty());
    EXPECT_FALSE(decision.reason.empty());
}

TEST(Privilege, RootDropsToServiceAccountByDefault) {
    auto decision = daemon_core::decidePrivilege(TransportMethod::Vddk, false, false, 0, "vdsm");
    EXPECT_EQ(decision.action, PrivilegeAction::DropToServiceAccount);
    EXPECT_EQ(decision.account, "vdsm");

    decision = daemon_core::decidePrivilege(TransportMethod::Ssh, false, false, 0, "qemu");
    EXPECT_EQ(decision.action, PrivilegeAction::DropToServiceAccount);
    EXPECT_EQ(decision.account, "qemu");
}

TEST(Privilege, RunAsRootOverrideKeepsRoot) {
    auto decision = daemon_core::decidePrivilege(TransportMethod::Vddk, true, false, 0, "vdsm");
    EXPECT_EQ(decision.action, PrivilegeAction::KeepCurrent);
}

TEST(Privilege, ExportDomainKeepsRoot) {
    v2v_wrapper::JobRequest request;
    request.transportMethod = TransportMethod::Vddk;
    request.exportDomain = "nfs:/exports/domain";

    auto decision = daemon_core::decidePrivilege(request, 0, "vdsm");
    EXPECT_EQ(decision.action, PrivilegeAction::KeepCurrent);

    request.exportDomain.reset();
    decision = daemon_core::decidePrivilege(request, 0, "vdsm");
    EXPECT_EQ(decision.action, PrivilegeAction::DropToServiceAccount);
}

TEST(Privilege, DecisionIsPureFunctionOfInputs) {
    auto first = daemon_core::decidePrivilege(TransportMethod::Ssh, false, false, 0, "vdsm");
    auto second = daemon_core::decidePrivilege(TransportMethod::Ssh, false, false, 0, "vdsm");
    EXPECT_EQ(first.action, second.action);
    EXPECT_EQ(first.account, second.account);
    EXPECT_EQ(first.reason, second.reason);
}

TEST(Privilege, ResolveRootAccount) {
    auto account = daemon_core::resolveAccount("root");
    EXPECT_EQ(account.name, "root");
    EXPECT_EQ(account.uid, 0u);
    EXPECT_EQ(account.gid, 0u);
}

TEST(Privilege, ResolveUnknownAccountThrows) {
    try {
        daemon_core::resolveAccount("v2v-wrapper-no-such-user");
        FAIL() << "Expected PrivilegeError";
    } catch (const v2v_wrapper::PrivilegeError& e) {
        EXPECT_EQ(e.code(), v2v_wrapper::ErrorCode::PRIVILEGE_ACCOUNT_NOT_FOUND);
    }
}

TEST(Privilege, CurrentAccountMatchesProcess) {
    auto account = daemon_core::currentAccount();
    EXPECT_EQ(account.uid, geteuid());
    EXPECT_EQ(account.gid, getegid());
    EXPECT_FALSE(account.name.empty());
}
