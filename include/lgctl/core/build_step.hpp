/*
 * lgctl - Deadline-bounded build step
 *
 * run_build() drives an opaque build operation until it finishes or the
 * deadline passes. Failure and timeout both come back as `false`; the
 * operation is asked to terminate when the deadline passes.
 */
#ifndef lgctl_CORE_BUILD_STEP_HPP
#define lgctl_CORE_BUILD_STEP_HPP

#include <string>

namespace lgctl {

enum class BuildStatus {
    RUNNING,
    SUCCEEDED,
    FAILED
};

class BuildOperation {
public:
    virtual ~BuildOperation() {}

    // Begin the build. false = could not be started.
    virtual bool start() = 0;

    // Non-blocking progress check.
    virtual BuildStatus poll() = 0;

    // Best-effort forced stop after the deadline. May leave work running
    // when the operation cannot be interrupted.
    virtual void terminate() = 0;

    virtual std::string description() const = 0;
};

// Interval between poll() calls
const int BUILD_POLL_INTERVAL_MS = 100;

// Default deadline used by `start --build` and `build-ui`
const int DEFAULT_BUILD_TIMEOUT_SECONDS = 180;

// true iff the operation succeeded within `timeout_seconds`.
bool run_build(BuildOperation& operation, int timeout_seconds);

} // namespace lgctl

#endif // lgctl_CORE_BUILD_STEP_HPP
