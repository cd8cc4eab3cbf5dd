#include <lgctl/core/build_step.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

#include <stdexcept>

namespace lgctl {

bool run_build(BuildOperation& operation, int timeout_seconds) {
    if (timeout_seconds <= 0) {
        LOG_ERROR("Build timeout must be a positive number of seconds (got %d)", timeout_seconds);
        return false;
    }

    std::string name = operation.description();

    try {
        if (!operation.start()) {
            LOG_ERROR("%s could not be started", name.c_str());
            return false;
        }

        int64_t deadline = monotonic_ms() + static_cast<int64_t>(timeout_seconds) * 1000;
        for (;;) {
            BuildStatus status = operation.poll();
            if (status == BuildStatus::SUCCEEDED) {
                LOG_DEBUG("%s completed", name.c_str());
                return true;
            }
            if (status == BuildStatus::FAILED) {
                LOG_ERROR("%s failed", name.c_str());
                return false;
            }
            if (monotonic_ms() >= deadline) {
                break;
            }
            sleep_ms(BUILD_POLL_INTERVAL_MS);
        }

        LOG_ERROR("%s did not complete within %d seconds", name.c_str(), timeout_seconds);
        operation.terminate();
    } catch (const std::exception& e) {
        LOG_ERROR("%s raised an error: %s", name.c_str(), e.what());
    }
    return false;
}

} // namespace lgctl
