/*
 * lgctl - Service entry point
 *
 * ServiceLauncher is the hand-off point of `start`: it runs the looking
 * glass service until it exits or a shutdown is requested.
 */
#ifndef lgctl_CORE_SERVICE_HPP
#define lgctl_CORE_SERVICE_HPP

#include "config.hpp"
#include "shutdown.hpp"
#include <string>
#include <vector>

namespace lgctl {

// One `start` invocation
struct StartupSession {
    bool build;             // Rebuild the UI before serving
    int workers;            // 0 = let the service decide
    int build_timeout;      // Seconds

    StartupSession() : build(false), workers(0), build_timeout(180) {}

    bool has_workers() const { return workers > 0; }
};

class ServiceLauncher {
public:
    virtual ~ServiceLauncher() {}

    // Blocks until the service exits or `shutdown` triggers.
    // Returns the service's exit code.
    virtual int run(const StartupSession& session, ShutdownSignal& shutdown) = 0;
};

struct ServiceOptions {
    std::vector<std::string> command;   // service.command + service.args
    std::string workdir;                // service.workdir
    int grace_seconds;                  // SIGTERM -> SIGKILL delay

    ServiceOptions() : grace_seconds(10) {
        command.push_back("lgctl-server");
    }

    static ServiceOptions from_config(const Config& config, const Settings& settings);
};

// Runs the service as a child process
class ProcessService : public ServiceLauncher {
public:
    explicit ProcessService(const ServiceOptions& options);

    int run(const StartupSession& session, ShutdownSignal& shutdown) override;

    // Full argv for `session`, with --workers appended when requested
    std::vector<std::string> build_argv(const StartupSession& session) const;

private:
    ServiceOptions options_;
};

} // namespace lgctl

#endif // lgctl_CORE_SERVICE_HPP
