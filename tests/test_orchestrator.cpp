#include <lgctl/core/orchestrator.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <csignal>

using namespace lgctl;
using lgctl::test::FakeService;
using lgctl::test::LogCapture;
using lgctl::test::StubBuild;

namespace {

const char* const INTERRUPT_NOTICE = "Stopping looking glass due to keyboard interrupt.";

StartupSession with_build(int timeout = 5) {
    StartupSession session;
    session.build = true;
    session.build_timeout = timeout;
    return session;
}

} // namespace

TEST(OrchestratorTest, WithoutBuildServiceRunsOnce) {
    StubBuild build(StubBuild::SUCCEED);
    FakeService service;
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(StartupSession()));
    EXPECT_EQ(0, build.starts);
    EXPECT_EQ(1, service.calls);
    EXPECT_EQ(StartupState::TERMINATED, orchestrator.state());
}

TEST(OrchestratorTest, SuccessfulBuildStartsServiceExactlyOnce) {
    StubBuild build(StubBuild::SUCCEED, 2);
    FakeService service;
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(with_build()));
    EXPECT_EQ(1, build.starts);
    EXPECT_EQ(1, service.calls);
}

TEST(OrchestratorTest, FailedBuildNeverStartsService) {
    StubBuild build(StubBuild::FAIL);
    FakeService service;
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(EXIT_BUILD_FAILED, orchestrator.start(with_build()));
    EXPECT_EQ(0, service.calls);
    EXPECT_EQ(StartupState::TERMINATED, orchestrator.state());
}

TEST(OrchestratorTest, TimedOutBuildNeverStartsService) {
    StubBuild build(StubBuild::HANG);
    FakeService service;
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_NE(0, orchestrator.start(with_build(1)));
    EXPECT_EQ(0, service.calls);
    EXPECT_EQ(1, build.terminations);
}

TEST(OrchestratorTest, ServiceExitCodePassesThrough) {
    StubBuild build(StubBuild::SUCCEED);
    FakeService service(42);
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(42, orchestrator.start(StartupSession()));
}

TEST(OrchestratorTest, WorkerCountReachesService) {
    StubBuild build(StubBuild::SUCCEED);
    FakeService service;
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    StartupSession session;
    session.workers = 4;
    orchestrator.start(session);
    EXPECT_EQ(4, service.last_session.workers);
}

TEST(OrchestratorTest, InterruptWhileServingExitsZeroWithOneNotice) {
    LogCapture logs;
    StubBuild build(StubBuild::SUCCEED);
    FakeService service(130);
    service.during_run = [](ShutdownSignal& s) { s.request(""); };
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(StartupSession()));
    EXPECT_EQ(1u, logs.count_all(INTERRUPT_NOTICE));
    EXPECT_EQ(0u, logs.count(LogLevel::WARN));
}

TEST(OrchestratorTest, InterruptMessageIsWarnedBeforeNotice) {
    LogCapture logs;
    StubBuild build(StubBuild::SUCCEED);
    FakeService service;
    service.during_run = [](ShutdownSignal& s) { s.request("operator pressed Ctrl+C"); };
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(StartupSession()));
    EXPECT_EQ(1u, logs.count(LogLevel::WARN, "operator pressed Ctrl+C"));
    EXPECT_EQ(1u, logs.count_all(INTERRUPT_NOTICE));
}

TEST(OrchestratorTest, SingleCharacterMessageIsNotWarned) {
    LogCapture logs;
    StubBuild build(StubBuild::SUCCEED);
    FakeService service;
    service.during_run = [](ShutdownSignal& s) { s.request("x"); };
    ShutdownSignal shutdown;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(StartupSession()));
    EXPECT_EQ(0u, logs.count(LogLevel::WARN));
    EXPECT_EQ(1u, logs.count_all(INTERRUPT_NOTICE));
}

TEST(OrchestratorTest, InterruptDuringBuildStopsCleanly) {
    LogCapture logs;
    ShutdownSignal shutdown;
    StubBuild build(StubBuild::FAIL, 2);
    build.on_poll = [&shutdown]() { shutdown.request(""); };
    FakeService service;
    StartupOrchestrator orchestrator(build, service, shutdown);

    EXPECT_EQ(0, orchestrator.start(with_build()));
    EXPECT_EQ(0, service.calls);
    EXPECT_EQ(1u, logs.count_all(INTERRUPT_NOTICE));
}

TEST(OrchestratorTest, SigintWhileServingIsRoutedToOrchestrator) {
    LogCapture logs;
    StubBuild build(StubBuild::SUCCEED);
    FakeService service;
    service.during_run = [](ShutdownSignal&) { raise(SIGINT); };
    ShutdownSignal shutdown;
    install_signal_handlers(shutdown);
    StartupOrchestrator orchestrator(build, service, shutdown);

    int code = orchestrator.start(StartupSession());
    uninstall_signal_handlers();

    EXPECT_EQ(0, code);
    EXPECT_EQ(SIGINT, shutdown.signal_number());
    EXPECT_EQ(1u, logs.count_all(INTERRUPT_NOTICE));
}

TEST(ShutdownSignalTest, ResetClearsState) {
    ShutdownSignal shutdown;
    shutdown.request("bye");
    EXPECT_TRUE(shutdown.triggered());
    EXPECT_EQ("bye", shutdown.message());

    shutdown.reset();
    EXPECT_FALSE(shutdown.triggered());
    EXPECT_EQ("", shutdown.message());
}
