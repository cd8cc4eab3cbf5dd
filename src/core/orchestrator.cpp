#include <lgctl/core/orchestrator.hpp>
#include <lgctl/core/logger.hpp>

#include <string>

namespace lgctl {

const char* startup_state_name(StartupState state) {
    switch (state) {
        case StartupState::IDLE: return "idle";
        case StartupState::BUILDING: return "building";
        case StartupState::SERVING: return "serving";
        case StartupState::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

StartupOrchestrator::StartupOrchestrator(BuildOperation& build, ServiceLauncher& service,
                                         ShutdownSignal& shutdown)
    : build_(build)
    , service_(service)
    , shutdown_(shutdown)
    , state_(StartupState::IDLE) {}

void StartupOrchestrator::transition(StartupState next) {
    LOG_DEBUG("Startup state %s -> %s", startup_state_name(state_), startup_state_name(next));
    state_ = next;
}

int report_interrupted(const ShutdownSignal& shutdown) {
    std::string message = shutdown.message();
    if (message.size() > 1) {
        LOG_WARN("%s", message.c_str());
    }
    LOG_ERROR("Stopping looking glass due to keyboard interrupt.");
    return 0;
}

int StartupOrchestrator::stop_interrupted() {
    int exit_code = report_interrupted(shutdown_);
    transition(StartupState::TERMINATED);
    return exit_code;
}

int StartupOrchestrator::start(const StartupSession& session) {
    state_ = StartupState::IDLE;

    if (session.build) {
        transition(StartupState::BUILDING);
        bool built = run_build(build_, session.build_timeout);

        if (shutdown_.triggered()) {
            return stop_interrupted();
        }
        if (!built) {
            LOG_ERROR("UI build did not complete, not starting the service");
            transition(StartupState::TERMINATED);
            return EXIT_BUILD_FAILED;
        }
    }

    if (shutdown_.triggered()) {
        return stop_interrupted();
    }

    transition(StartupState::SERVING);
    if (session.has_workers()) {
        LOG_INFO("Starting looking glass with %d workers", session.workers);
    } else {
        LOG_INFO("Starting looking glass");
    }

    int exit_code = service_.run(session, shutdown_);

    if (shutdown_.triggered()) {
        return stop_interrupted();
    }

    transition(StartupState::TERMINATED);
    return exit_code;
}

} // namespace lgctl
