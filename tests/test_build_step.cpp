#include <lgctl/core/build_step.hpp>
#include <lgctl/core/shutdown.hpp>
#include <lgctl/core/ui_build.hpp>
#include <lgctl/core/utils.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <thread>
#include <unistd.h>

using namespace lgctl;
using lgctl::test::LogCapture;
using lgctl::test::StubBuild;
using lgctl::test::TempDir;

TEST(RunBuildTest, SuccessfulBuildReturnsTrue) {
    StubBuild build(StubBuild::SUCCEED, 3);
    EXPECT_TRUE(run_build(build, 5));
    EXPECT_EQ(1, build.starts);
    EXPECT_EQ(3, build.polls);
    EXPECT_EQ(0, build.terminations);
}

TEST(RunBuildTest, FailedBuildReturnsFalse) {
    StubBuild build(StubBuild::FAIL);
    EXPECT_FALSE(run_build(build, 5));
    EXPECT_EQ(0, build.terminations);
}

TEST(RunBuildTest, TimeoutReturnsFalseAndTerminates) {
    LogCapture logs;
    StubBuild build(StubBuild::HANG);

    int64_t begin = monotonic_ms();
    EXPECT_FALSE(run_build(build, 1));
    int64_t elapsed = monotonic_ms() - begin;

    EXPECT_GE(elapsed, 1000);
    EXPECT_LT(elapsed, 5000);
    EXPECT_EQ(1, build.terminations);
    EXPECT_EQ(1u, logs.count(LogLevel::ERROR, "did not complete within 1 seconds"));
}

TEST(RunBuildTest, ThrowingBuildIsContained) {
    LogCapture logs;
    StubBuild build(StubBuild::THROW);
    bool result = true;
    EXPECT_NO_THROW(result = run_build(build, 5));
    EXPECT_FALSE(result);
    EXPECT_EQ(1u, logs.count(LogLevel::ERROR, "build tool crashed"));
}

TEST(RunBuildTest, RefusedStartReturnsFalse) {
    StubBuild build(StubBuild::REFUSE_START);
    EXPECT_FALSE(run_build(build, 5));
    EXPECT_EQ(0, build.polls);
}

TEST(RunBuildTest, NonPositiveTimeoutNeverStarts) {
    StubBuild build(StubBuild::SUCCEED);
    EXPECT_FALSE(run_build(build, 0));
    EXPECT_FALSE(run_build(build, -3));
    EXPECT_EQ(0, build.starts);
}

class UiBuildTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp.path().empty());
        options.directory = tmp.file("ui");
        options.output_dir = tmp.file("static");
        ASSERT_TRUE(create_directories(options.directory));
    }

    TempDir tmp;
    UiBuildOptions options;
};

TEST_F(UiBuildTest, SuccessfulCommandWritesFingerprint) {
    options.command = "echo built > marker";
    UiBuildOperation build(options);

    ASSERT_TRUE(run_build(build, 10));
    EXPECT_FALSE(build.skipped());
    EXPECT_TRUE(file_exists(join_path(options.directory, "marker")));
    EXPECT_TRUE(build.is_current());
}

TEST_F(UiBuildTest, FailingCommandLeavesNoFingerprint) {
    options.command = "exit 3";
    UiBuildOperation build(options);

    EXPECT_FALSE(run_build(build, 10));
    EXPECT_FALSE(file_exists(build.fingerprint_path()));
}

TEST_F(UiBuildTest, UnchangedInputsSkipTheBuild) {
    options.command = "true";
    UiBuildOperation first(options);
    ASSERT_TRUE(run_build(first, 10));

    options.command = "true";
    UiBuildOperation second(options);
    EXPECT_TRUE(run_build(second, 10));
    EXPECT_TRUE(second.skipped());
}

TEST_F(UiBuildTest, ForceRebuildsEvenWhenCurrent) {
    options.command = "true";
    UiBuildOperation first(options);
    ASSERT_TRUE(run_build(first, 10));

    options.force = true;
    UiBuildOperation forced(options);
    EXPECT_TRUE(run_build(forced, 10));
    EXPECT_FALSE(forced.skipped());
}

TEST_F(UiBuildTest, ChangedInputsChangeFingerprint) {
    UiBuildOperation a(options);
    options.dev_mode = !options.dev_mode;
    UiBuildOperation b(options);
    EXPECT_NE(a.fingerprint(), b.fingerprint());
    EXPECT_EQ(64u, a.fingerprint().size());
}

TEST_F(UiBuildTest, MissingDirectoryFails) {
    options.directory = tmp.file("missing");
    UiBuildOperation build(options);
    EXPECT_FALSE(run_build(build, 10));
}

TEST_F(UiBuildTest, SlowCommandTimesOut) {
    options.command = "sleep 2 && touch marker";
    UiBuildOperation build(options);

    int64_t begin = monotonic_ms();
    EXPECT_FALSE(run_build(build, 1));
    EXPECT_LT(monotonic_ms() - begin, 10000);
    EXPECT_FALSE(file_exists(build.fingerprint_path()));

    // Nothing the build started may finish its work after the timeout
    sleep_ms(2500);
    EXPECT_FALSE(file_exists(join_path(options.directory, "marker")));
}

TEST_F(UiBuildTest, InterruptIsForwardedToTheBuild) {
    options.command = "sleep 30";
    UiBuildOperation build(options);
    ShutdownSignal shutdown;
    install_signal_handlers(shutdown);

    std::thread interrupter([]() {
        sleep_ms(300);
        ::kill(::getpid(), SIGINT);
    });

    int64_t begin = monotonic_ms();
    bool built = run_build(build, 20);
    interrupter.join();
    uninstall_signal_handlers();

    EXPECT_FALSE(built);
    EXPECT_LT(monotonic_ms() - begin, 10000);
    EXPECT_TRUE(shutdown.triggered());
    EXPECT_EQ(SIGINT, shutdown.signal_number());
}
