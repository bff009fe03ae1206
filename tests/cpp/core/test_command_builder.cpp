/**
 * @file test_command_builder.cpp
 * @brief Unit tests for the virt-v2v command line and environment
 */

#include "core/command_builder.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace v2v_wrapper;

namespace {

bool containsSequence(const std::vector<std::string>& args,
                      const std::vector<std::string>& sequence) {
    return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

bool containsArg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

}  // namespace

class CommandBuilderTest : public ::testing::Test {
   protected:
    WrapperConfig config;
    CommandInputs inputs;
    JobRequest request;

    void SetUp() override {
        config.virtV2vPath = "/usr/bin/virt-v2v";
        config.vddkLibDir = "/opt/vddk";
        config.localOutputDir = "/var/tmp/out";
        config.rhvCaFile = "/etc/pki/ca.pem";
        inputs.machineReadableLog = "/var/log/import/v2v-import-x-mr.log";

        request.vmName = "web01";
        request.transportMethod = TransportMethod::Vddk;
        request.vmwareUri = "vpx://vc/dc/host";
    }
};

TEST_F(CommandBuilderTest, VddkToLocalDirectory) {
    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    const auto& args = command.args;

    ASSERT_GE(args.size(), 7u);
    EXPECT_EQ(args[0], "/usr/bin/virt-v2v");
    EXPECT_TRUE(containsSequence(args, {"-v", "-x", "web01"}));
    EXPECT_TRUE(containsSequence(args, {"--root", "first"}));
    EXPECT_TRUE(containsArg(args, "--machine-readable=file:/var/log/import/v2v-import-x-mr.log"));
    EXPECT_TRUE(containsSequence(
        args, {"-i", "libvirt", "-ic", "vpx://vc/dc/host", "-it", "vddk", "-io",
               "vddk-libdir=/opt/vddk"}));
    EXPECT_TRUE(containsSequence(args, {"-o", "local", "-os", "/var/tmp/out"}));
    EXPECT_TRUE(containsSequence(args, {"-of", "raw"}));
    EXPECT_FALSE(containsArg(args, "--password-file"));
    EXPECT_FALSE(containsArg(args, "-oa"));
}

TEST_F(CommandBuilderTest, VddkWithThumbprintAndPassword) {
    request.vmwareFingerprint = "AA:BB:CC";
    inputs.vmwarePasswordFile = "/tmp/v2v-secret-abc";

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"-io", "vddk-thumbprint=AA:BB:CC"}));
    EXPECT_TRUE(containsSequence(command.args, {"--password-file", "/tmp/v2v-secret-abc"}));
}

TEST_F(CommandBuilderTest, SshSource) {
    request.transportMethod = TransportMethod::Ssh;
    request.vmName = "ssh://root@esx/vmfs/volumes/ds1/vm/vm.vmx";

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"-i", "vmx", "-it", "ssh"}));
    EXPECT_FALSE(containsArg(command.args, "libvirt"));
}

TEST_F(CommandBuilderTest, RhvUploadOutput) {
    RhvUploadTarget upload;
    upload.url = "https://engine/ovirt-engine/api";
    upload.cluster = "Default";
    upload.storage = "data";
    upload.password = "secret";
    request.rhvUpload = upload;
    request.allocation = Allocation::Sparse;
    inputs.rhvPasswordFile = "/tmp/v2v-secret-rhv";

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    const auto& args = command.args;
    EXPECT_TRUE(containsSequence(
        args, {"-o", "rhv-upload", "-oc", "https://engine/ovirt-engine/api", "-os", "data"}));
    EXPECT_TRUE(containsSequence(args, {"-op", "/tmp/v2v-secret-rhv"}));
    EXPECT_TRUE(containsSequence(args, {"-oo", "rhv-cluster=Default"}));
    EXPECT_TRUE(containsSequence(args, {"-oo", "rhv-verifypeer=true"}));
    EXPECT_TRUE(containsSequence(args, {"-oo", "rhv-cafile=/etc/pki/ca.pem"}));
    EXPECT_TRUE(containsSequence(args, {"-oa", "sparse"}));
    EXPECT_FALSE(containsArg(args, "secret"));
}

TEST_F(CommandBuilderTest, InsecureRhvUploadSkipsCaFile) {
    RhvUploadTarget upload;
    upload.url = "https://engine";
    upload.cluster = "c";
    upload.storage = "s";
    upload.insecureConnection = true;
    request.rhvUpload = upload;

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"-oo", "rhv-verifypeer=false"}));
    EXPECT_FALSE(containsArg(command.args, "rhv-cafile=/etc/pki/ca.pem"));
}

TEST_F(CommandBuilderTest, ExportDomainOutput) {
    request.exportDomain = "nfs:/exports/domain";
    request.outputFormat = OutputFormat::Qcow2;

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"-o", "rhv", "-os", "nfs:/exports/domain"}));
    EXPECT_TRUE(containsSequence(command.args, {"-of", "qcow2"}));
}

TEST_F(CommandBuilderTest, ExportDomainForcesDirectBackend) {
    request.vmName = "vm1";
    request.vmwareUri = "esx://h";
    request.exportDomain = "nfs:/exp";

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    ASSERT_EQ(command.env.count("LIBGUESTFS_BACKEND"), 1u);
    EXPECT_EQ(command.env["LIBGUESTFS_BACKEND"], "direct");

    request.backend = "libvirt";
    command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_EQ(command.env["LIBGUESTFS_BACKEND"], "direct");
}

TEST_F(CommandBuilderTest, BackendIsLeftAloneWithoutExportDomain) {
    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_EQ(command.env.count("LIBGUESTFS_BACKEND"), 0u);
}

TEST_F(CommandBuilderTest, NetworkMappings) {
    request.networkMappings.push_back({"VM Network", "ovirtmgmt", std::nullopt});
    request.networkMappings.push_back({"Backup", "backup", std::string("00:50:56:aa:bb:cc")});

    inputs.capabilities = {"virt-v2v", "mac-option"};

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"--bridge", "VM Network:ovirtmgmt"}));
    EXPECT_TRUE(containsSequence(command.args, {"--mac", "00:50:56:aa:bb:cc:bridge:backup"}));
}

TEST_F(CommandBuilderTest, MacMappingFallsBackToBridgeWithoutCapability) {
    request.networkMappings.push_back({"Backup", "backup", std::string("00:50:56:aa:bb:cc")});
    inputs.capabilities = {"virt-v2v", "input:libvirt"};

    V2vCommand command = CommandBuilder::build(request, config, inputs, {});
    EXPECT_TRUE(containsSequence(command.args, {"--bridge", "Backup:backup"}));
    EXPECT_FALSE(containsArg(command.args, "--mac"));
}

TEST(Capabilities, ParsedOnePerLine) {
    Capabilities caps = parseCapabilities("virt-v2v\nmac-option\r\n  vddk \n\ninput:libvirt\n");
    EXPECT_EQ(caps.size(), 4u);
    EXPECT_EQ(caps.count("mac-option"), 1u);
    EXPECT_EQ(caps.count("vddk"), 1u);
    EXPECT_TRUE(parseCapabilities("").empty());
}

TEST_F(CommandBuilderTest, EnvironmentAdjustments) {
    Environment base = {{"PATH", "/usr/bin"}, {"LANG", "de_DE.UTF-8"}, {"XDG_RUNTIME_DIR", "/run/user/0"}};
    request.backend = "direct";
    request.virtioWin = "/iso/virtio-win.iso";

    inputs.runsAsRoot = false;
    V2vCommand dropped = CommandBuilder::build(request, config, inputs, base);
    EXPECT_EQ(dropped.env["LANG"], "C");
    EXPECT_EQ(dropped.env["PATH"], "/usr/bin");
    EXPECT_EQ(dropped.env["LIBGUESTFS_BACKEND"], "direct");
    EXPECT_EQ(dropped.env["VIRTIO_WIN"], "/iso/virtio-win.iso");
    EXPECT_EQ(dropped.env.count("XDG_RUNTIME_DIR"), 0u);

    inputs.runsAsRoot = true;
    V2vCommand root = CommandBuilder::build(request, config, inputs, base);
    EXPECT_EQ(root.env["XDG_RUNTIME_DIR"], "/run/user/0");
}

TEST_F(CommandBuilderTest, DescribeSafeMasksPasswords) {
    V2vCommand command;
    command.args = {"/usr/bin/virt-v2v", "-oo", "rhv-password=hunter2", "-x", "web01"};
    command.env = {{"LANG", "C"}, {"VDDK_PASSWORD", "hunter2"}};

    const std::string described = CommandBuilder::describeSafe(command);
    EXPECT_EQ(described.find("hunter2"), std::string::npos);
    EXPECT_NE(described.find("'rhv-password=*****'"), std::string::npos);
    EXPECT_NE(described.find("'VDDK_PASSWORD': '*****'"), std::string::npos);
    EXPECT_NE(described.find("'LANG': 'C'"), std::string::npos);
    EXPECT_EQ(described.rfind("Executing command: ['/usr/bin/virt-v2v'", 0), 0u);
}

TEST_F(CommandBuilderTest, EnvpIsKeyEqualsValue) {
    std::vector<std::string> envp = CommandBuilder::toEnvp({{"A", "1"}, {"B", "x=y"}});
    ASSERT_EQ(envp.size(), 2u);
    EXPECT_EQ(envp[0], "A=1");
    EXPECT_EQ(envp[1], "B=x=y");
}
