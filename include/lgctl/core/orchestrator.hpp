/*
 * lgctl - Startup Orchestrator
 *
 *   IDLE --(build requested)--> BUILDING --ok--> SERVING --> TERMINATED
 *     \                            \--failed/timeout-----------^
 *      \--(no build)-------------> SERVING
 *
 * A failed build never reaches SERVING. An interrupt seen while BUILDING
 * or SERVING is a clean stop with exit code 0.
 */
#ifndef lgctl_CORE_ORCHESTRATOR_HPP
#define lgctl_CORE_ORCHESTRATOR_HPP

#include "build_step.hpp"
#include "service.hpp"
#include "shutdown.hpp"

namespace lgctl {

enum class StartupState {
    IDLE,
    BUILDING,
    SERVING,
    TERMINATED
};

const char* startup_state_name(StartupState state);

// Exit code when the build gate fails
const int EXIT_BUILD_FAILED = 1;

// Logs the stop notice for a triggered shutdown, preceded by its message
// when it carries one. Returns the exit code of a clean stop.
int report_interrupted(const ShutdownSignal& shutdown);

class StartupOrchestrator {
public:
    StartupOrchestrator(BuildOperation& build, ServiceLauncher& service, ShutdownSignal& shutdown);

    // Runs one session to completion and returns the process exit code.
    int start(const StartupSession& session);

    StartupState state() const { return state_; }

private:
    int stop_interrupted();
    void transition(StartupState next);

    BuildOperation& build_;
    ServiceLauncher& service_;
    ShutdownSignal& shutdown_;
    StartupState state_;
};

} // namespace lgctl

#endif // lgctl_CORE_ORCHESTRATOR_HPP
