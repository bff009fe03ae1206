#include "daemon/parser/progress_parser.h"

#include <gtest/gtest.h>
#include <stdexcept>

using daemon_parser::ProgressParser;

namespace {

// Never written to: these tests only inspect snapshots
daemon_state::StateFile unusedFile() {
    return daemon_state::StateFile("/nonexistent/v2v-wrapper-test.state");
}

}  // namespace

class ProgressParserTest : public ::testing::Test {
   protected:
    daemon_state::StateStore store{unusedFile()};
    ProgressParser parser{store, daemon_parser::makeGrammar()};
};

TEST_F(ProgressParserTest, NullGrammarIsRejected) {
    EXPECT_THROW({ ProgressParser rejected(store, nullptr); }, std::invalid_argument);
}

TEST_F(ProgressParserTest, TracksProgressOfCurrentDisk) {
    store.initializeDisks({"[ds1] vm/vm.vmdk"});

    EXPECT_FALSE(parser.feedLine("Copying disk 1/1 to /var/tmp/vm-sda (raw)"));
    EXPECT_EQ(parser.currentDisk(), std::optional<std::size_t>(0));
    EXPECT_FALSE(parser.currentPath().has_value());

    EXPECT_FALSE(parser.feedLine("nbdkit: debug: Opening file [ds1] vm/vm.vmdk (x)"));
    EXPECT_EQ(parser.currentPath(), std::optional<std::string>("[ds1] vm/vm.vmdk"));

    EXPECT_TRUE(parser.feedLine("    (50.00/100%)"));
    EXPECT_TRUE(parser.feedLine("    (100.00/100%)"));

    auto state = store.snapshot();
    ASSERT_EQ(state.disks.size(), 1u);
    EXPECT_EQ(state.disks[0].progress, 100);
}

TEST_F(ProgressParserTest, ProgressWithoutPathIsSkipped) {
    store.initializeDisks({"a"});

    EXPECT_FALSE(parser.feedLine("    (10.00/100%)"));
    parser.feedLine("Copying disk 1/1 to /tmp/out");
    EXPECT_FALSE(parser.feedLine("    (10.00/100%)"));

    EXPECT_EQ(store.snapshot().disks[0].progress, 0);
}

TEST_F(ProgressParserTest, PathBeforeCopyDoesNotTouchDisks) {
    store.initializeDisks({"a"});
    EXPECT_FALSE(parser.feedLine("nbdkit: debug: Opening file b (x)"));
    EXPECT_EQ(store.snapshot().disks.size(), 1u);
}

TEST_F(ProgressParserTest, DiskOrderFollowsBackend) {
    store.initializeDisks({"[ds1] vm/vm.vmdk", "[ds1] vm/vm_1.vmdk"});

    parser.feedLine("Copying disk 1/2 to /tmp/sda");
    EXPECT_TRUE(parser.feedLine("nbdkit: debug: Opening file [ds1] vm/vm_1.vmdk (x)"));
    parser.feedLine("    (100.00/100%)");
    parser.feedLine("Copying disk 2/2 to /tmp/sdb");
    EXPECT_FALSE(parser.currentPath().has_value());
    parser.feedLine("nbdkit: debug: Opening file [ds1] vm/vm.vmdk (x)");
    parser.feedLine("    (25.50/100%)");

    auto disks = store.snapshot().disks;
    ASSERT_EQ(disks.size(), 2u);
    EXPECT_EQ(disks[0].path, "[ds1] vm/vm_1.vmdk");
    EXPECT_EQ(disks[0].progress, 100);
    EXPECT_EQ(disks[1].path, "[ds1] vm/vm.vmdk");
    EXPECT_EQ(disks[1].progress, 25);
}

TEST_F(ProgressParserTest, UnknownDiskIsAddedAtCurrentIndex) {
    parser.feedLine("Copying disk 1/1 to /tmp/sda");
    EXPECT_TRUE(parser.feedLine("nbdkit: debug: Opening file [ds9] other/other.vmdk (x)"));
    parser.feedLine("    (12.00/100%)");

    auto state = store.snapshot();
    ASSERT_EQ(state.disks.size(), 1u);
    EXPECT_EQ(state.disks[0].path, "[ds9] other/other.vmdk");
    EXPECT_EQ(state.disks[0].progress, 12);
    EXPECT_EQ(state.diskCount, 1);
}

TEST_F(ProgressParserTest, CopyDiskUpdatesDiskCount) {
    store.initializeDisks({"a"});
    EXPECT_TRUE(parser.feedLine("Copying disk 1/3 to /tmp/sda"));
    EXPECT_EQ(store.snapshot().diskCount, 3);
}

TEST_F(ProgressParserTest, VmIdAndDisplayName) {
    EXPECT_TRUE(parser.feedLine("<VirtualSystem ovf:id='abcdef01-2345'>"));
    EXPECT_EQ(store.snapshot().vmId, std::optional<std::string>("abcdef01-2345"));

    const auto version = store.version();
    EXPECT_FALSE(parser.feedLine("displayName = \"web\""));
    EXPECT_EQ(store.version(), version);
}

TEST_F(ProgressParserTest, UnrecognizedLinesChangeNothing) {
    store.initializeDisks({"a"});
    const auto version = store.version();
    EXPECT_FALSE(parser.feedLine("libguestfs: trace: launch"));
    EXPECT_EQ(store.version(), version);
}

TEST_F(ProgressParserTest, ReportsGrammarVersion) {
    EXPECT_EQ(parser.grammarVersion(), daemon_parser::VirtV2vGrammar::kVersion);
}
