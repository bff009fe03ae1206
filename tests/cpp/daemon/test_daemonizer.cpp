#include "daemon/core/daemonizer.h"

#include "core/error_codes.h"

#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <regex>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(Daemonizer, JobTagFormat) {
    const std::string tag = daemon_core::makeJobTag(std::time(nullptr), 4242);
    EXPECT_TRUE(std::regex_match(tag, std::regex(R"(\d{8}T\d{6}-4242)"))) << tag;
}

TEST(Daemonizer, OutputPathsFollowNamingScheme) {
    v2v_wrapper::WrapperConfig config;
    config.logDir = "/var/log/import";
    config.stateDir = "/run/v2v";

    auto paths = daemon_core::computeOutputPaths(config, "20240102T030405-77");
    EXPECT_EQ(paths.v2vLog, "/var/log/import/v2v-import-20240102T030405-77.log");
    EXPECT_EQ(paths.machineReadableLog, "/var/log/import/v2v-import-20240102T030405-77-mr.log");
    EXPECT_EQ(paths.wrapperLog, "/var/log/import/v2v-import-20240102T030405-77-wrapper.log");
    EXPECT_EQ(paths.stateFile, "/run/v2v/v2v-import-20240102T030405-77.state");
}

TEST(Daemonizer, RelativeDirectoriesBecomeAbsolute) {
    v2v_wrapper::WrapperConfig config;
    config.logDir = "relative-logs";
    config.stateDir = "./relative-state/";

    auto paths = daemon_core::computeOutputPaths(config, "20240102T030405-77");
    const fs::path cwd = fs::current_path();
    EXPECT_EQ(fs::path(paths.v2vLog), cwd / "relative-logs" / "v2v-import-20240102T030405-77.log");
    EXPECT_EQ(fs::path(paths.stateFile),
              cwd / "relative-state" / "v2v-import-20240102T030405-77.state");
    EXPECT_TRUE(fs::path(paths.wrapperLog).is_absolute());
    EXPECT_TRUE(fs::path(paths.machineReadableLog).is_absolute());

    EXPECT_EQ(daemon_core::absoluteDir("/already/absolute"), "/already/absolute");
}

TEST(Daemonizer, BootstrapLineIsSingleJsonObject) {
    daemon_core::OutputPaths paths;
    paths.v2vLog = "/l/a.log";
    paths.wrapperLog = "/l/a-wrapper.log";
    paths.stateFile = "/s/a.state";
    paths.machineReadableLog = "/l/a-mr.log";

    std::ostringstream out;
    ASSERT_TRUE(daemon_core::writeBootstrapLine(out, paths));

    const std::string text = out.str();
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(text.find('\n'), text.size() - 1);

    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j.size(), 3u);
    EXPECT_EQ(j["state_file"], "/s/a.state");
    EXPECT_EQ(j["v2v_log"], "/l/a.log");
    EXPECT_EQ(j["wrapper_log"], "/l/a-wrapper.log");
}

TEST(Daemonizer, BootstrapLineReportsStreamFailure) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_FALSE(daemon_core::writeBootstrapLine(out, daemon_core::OutputPaths{}));
}

TEST(Daemonizer, DetachedProcessOutlivesCaller) {
    const fs::path marker =
        fs::temp_directory_path() / ("v2v_wrapper_test_detach_" + std::to_string(getpid()));
    fs::remove(marker);

    // Run detach() in a throwaway child so the test process itself stays attached
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        try {
            daemon_core::detach();
        } catch (const v2v_wrapper::SpawnError&) {
            _exit(3);
        }
        std::ofstream out(marker);
        out << getpid() << " " << getsid(0) << " " << (fs::current_path() == "/" ? 1 : 0) << " "
            << fcntl(STDIN_FILENO, F_GETFD);
        out.close();
        _exit(0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    for (int i = 0; i < 100 && !fs::exists(marker); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(fs::exists(marker));

    std::ifstream in(marker);
    pid_t daemonPid = 0;
    pid_t sid = 0;
    int inRoot = 0;
    int stdinFlags = -1;
    in >> daemonPid >> sid >> inRoot >> stdinFlags;

    EXPECT_NE(daemonPid, child);
    EXPECT_NE(daemonPid, getpid());
    // Second fork: the daemon is not the session leader
    EXPECT_NE(sid, daemonPid);
    EXPECT_EQ(inRoot, 1);
    EXPECT_GE(stdinFlags, 0);

    fs::remove(marker);
}

TEST(Daemonizer, CloseInheritedDescriptorsKeepsListedOnes) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        int keep = open("/dev/null", O_RDONLY);
        int drop = open("/dev/null", O_RDONLY);
        daemon_core::closeInheritedDescriptors({keep});
        bool keptOpen = fcntl(keep, F_GETFD) >= 0;
        bool droppedClosed = fcntl(drop, F_GETFD) < 0;
        _exit(keptOpen && droppedClosed ? 0 : 1);
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
