#include "daemon/app/host_checks.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using daemon_app::compareVersions;
using daemon_app::pickToolsIso;

TEST(HostChecks, VersionsCompareNumerically) {
    EXPECT_EQ(compareVersions("4.20.31", "4.20.31"), 0);
    EXPECT_GT(compareVersions("4.30.2", "4.20.31"), 0);
    EXPECT_LT(compareVersions("4.19.45", "4.20.31"), 0);
    EXPECT_GT(compareVersions("4.3", "4.2.10"), 0);
    EXPECT_EQ(compareVersions("4.2", "4.2.0"), 0);
    EXPECT_LT(compareVersions("", "1"), 0);
}

TEST(HostChecks, ToolsIsoPreference) {
    EXPECT_EQ(pickToolsIso({"virtio-win.iso", "RHV-toolsSetup_4.2_5.iso", "other.iso"}),
              std::optional<std::string>("RHV-toolsSetup_4.2_5.iso"));
    EXPECT_EQ(pickToolsIso({"virtio-win.iso", "virtio-win-0.1.141.iso"}),
              std::optional<std::string>("virtio-win-0.1.141.iso"));
    EXPECT_EQ(pickToolsIso({"oVirt-toolsSetup_4.1-3.fc24.iso", "rhev-tools-setup.iso"}),
              std::optional<std::string>("rhev-tools-setup.iso"));
    EXPECT_FALSE(pickToolsIso({"Fedora-Server.iso", "notes.txt"}).has_value());
}

TEST(HostChecks, NewerVersionWinsWithinKind) {
    EXPECT_EQ(pickToolsIso({"virtio-win-0.1.9.iso", "virtio-win-0.1.141.iso",
                            "virtio-win-0.1.100.iso"}),
              std::optional<std::string>("virtio-win-0.1.141.iso"));
    EXPECT_EQ(pickToolsIso({"rhv-toolssetup_4.3_1.iso", "RHV-toolsSetup_4.2_9.iso"}),
              std::optional<std::string>("rhv-toolssetup_4.3_1.iso"));
}

TEST(HostChecks, RegistryListsKnownChecks) {
    ASSERT_FALSE(daemon_app::hostChecks().empty());
    EXPECT_NE(daemon_app::findHostCheck("rhv-guest-tools"), nullptr);
    EXPECT_NE(daemon_app::findHostCheck("rhv-version"), nullptr);
    EXPECT_NE(daemon_app::findHostCheck("virt-v2v"), nullptr);
    EXPECT_EQ(daemon_app::findHostCheck("no-such-check"), nullptr);
}

class IsoDomainTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("v2v_wrapper_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    // <mounts>/<server>/<uuid>/dom_md/metadata with the given storage class
    fs::path makeDomain(const std::string& server, const std::string& uuid,
                        const std::string& domainClass) {
        const fs::path domain = tempDir / server / uuid;
        fs::create_directories(domain / "dom_md");
        fs::create_directories(domain / "images");
        std::ofstream metadata(domain / "dom_md" / "metadata");
        metadata << "VERSION=4\nCLASS=" << domainClass << "\nROLE=Regular\n";
        return domain;
    }

    static void touch(const fs::path& path) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << "iso";
    }
};

TEST_F(IsoDomainTest, FindsIsoDomainAmongDataDomains) {
    makeDomain("nfs.example.com:_data", "aaaaaaaa-0000", "Data");
    const fs::path iso = makeDomain("nfs.example.com:_iso", "bbbbbbbb-0000", "Iso");

    auto found = daemon_app::findIsoDomain(tempDir);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, iso / "images" / "11111111-1111-1111-1111-111111111111");
}

TEST_F(IsoDomainTest, NoIsoDomain) {
    makeDomain("nfs.example.com:_data", "aaaaaaaa-0000", "Data");
    EXPECT_FALSE(daemon_app::findIsoDomain(tempDir).has_value());
    EXPECT_FALSE(daemon_app::findIsoDomain(tempDir / "missing").has_value());
}

TEST_F(IsoDomainTest, GuestToolsCheckReportsBestImage) {
    const fs::path iso = makeDomain("nfs.example.com:_iso", "bbbbbbbb-0000", "Iso");
    const fs::path images = iso / "images" / "11111111-1111-1111-1111-111111111111";
    touch(images / "virtio-win.iso");
    touch(images / "RHEV-toolsSetup_3.6_9.iso");

    v2v_wrapper::WrapperConfig config;
    config.vdsmMountsDir = tempDir.string();
    std::ostringstream out;
    EXPECT_TRUE(daemon_app::findHostCheck("rhv-guest-tools")->run(config, out));
    EXPECT_NE(out.str().find("RHEV-toolsSetup_3.6_9.iso"), std::string::npos);
}

TEST_F(IsoDomainTest, GuestToolsCheckFailsWithoutImages) {
    makeDomain("nfs.example.com:_iso", "bbbbbbbb-0000", "Iso");
    fs::create_directories(tempDir / "nfs.example.com:_iso" / "bbbbbbbb-0000" / "images" /
                           "11111111-1111-1111-1111-111111111111");

    v2v_wrapper::WrapperConfig config;
    config.vdsmMountsDir = tempDir.string();
    std::ostringstream out;
    EXPECT_FALSE(daemon_app::findHostCheck("rhv-guest-tools")->run(config, out));
    EXPECT_NE(out.str().find("No ISO"), std::string::npos);
}
