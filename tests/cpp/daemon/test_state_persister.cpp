#include "daemon/state/state_persister.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class StatePersisterTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path statePath;

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
        statePath = tempDir / "job.state";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    nlohmann::json readState() const {
        std::ifstream in(statePath);
        return nlohmann::json::parse(in);
    }
};

TEST_F(StatePersisterTest, StartStop) {
    daemon_state::StateStore store(daemon_state::StateFile(statePath.string()));
    daemon_state::StatePersister persister(store, std::chrono::milliseconds(50));

    EXPECT_FALSE(persister.isRunning());
    persister.start();
    EXPECT_TRUE(persister.isRunning());
    persister.start();
    EXPECT_TRUE(persister.isRunning());
    persister.stop();
    EXPECT_FALSE(persister.isRunning());
    persister.stop();
}

TEST_F(StatePersisterTest, NotifyWritesChanges) {
    daemon_state::StateStore store(daemon_state::StateFile(statePath.string()));
    daemon_state::StatePersister persister(store, std::chrono::seconds(60));
    store.setChangeCallback([&persister]() { persister.notify(); });
    persister.start();

    store.initializeDisks({"a"});
    store.setProgress("a", 25.0);

    bool written = false;
    for (int i = 0; i < 200 && !written; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (fs::exists(statePath)) {
            auto j = readState();
            written = j["disks"][0]["progress"] == 25;
        }
    }
    store.setChangeCallback(nullptr);
    persister.stop();
    EXPECT_TRUE(written);
}

TEST_F(StatePersisterTest, StopFlushesPendingChange) {
    daemon_state::StateStore store(daemon_state::StateFile(statePath.string()));
    daemon_state::StatePersister persister(store, std::chrono::seconds(60));
    persister.start();

    store.markStarted(77);
    persister.stop();

    ASSERT_TRUE(fs::exists(statePath));
    EXPECT_EQ(readState()["pid"], 77);
}

TEST_F(StatePersisterTest, DestructorStopsThread) {
    daemon_state::StateStore store(daemon_state::StateFile(statePath.string()));
    {
        daemon_state::StatePersister persister(store, std::chrono::milliseconds(10));
        persister.start();
        store.markStarted(5);
    }
    ASSERT_TRUE(fs::exists(statePath));
    EXPECT_EQ(readState()["pid"], 5);
}

TEST_F(StatePersisterTest, ConcurrentReaderAlwaysSeesCompleteDocument) {
    daemon_state::StateStore store(daemon_state::StateFile(statePath.string()));
    std::vector<std::string> disks;
    for (int i = 0; i < 8; ++i) {
        disks.push_back("[ds1] vm/disk_" + std::to_string(i) + ".vmdk");
    }
    store.initializeDisks(disks);
    ASSERT_TRUE(store.persist());

    daemon_state::StatePersister persister(store, std::chrono::milliseconds(5));
    store.setChangeCallback([&persister]() { persister.notify(); });
    persister.start();

    std::atomic<bool> done{false};
    std::atomic<int> reads{0};
    std::atomic<int> torn{0};
    std::thread reader([&]() {
        while (!done.load()) {
            std::ifstream in(statePath);
            if (!in.is_open()) {
                ++torn;
                continue;
            }
            auto j = nlohmann::json::parse(in, nullptr, false);
            if (j.is_discarded() || !j.contains("disks") || j["disks"].size() != 8u) {
                ++torn;
            }
            ++reads;
        }
    });

    for (int round = 0; round < 100; ++round) {
        for (const auto& disk : disks) {
            store.setProgress(disk, round);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    store.finalize(0, false);

    done.store(true);
    reader.join();
    store.setChangeCallback(nullptr);
    persister.stop();

    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(readState()["finished"], true);
}
