#include <lgctl/core/service.hpp>
#include <lgctl/core/process.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

namespace lgctl {

ServiceOptions ServiceOptions::from_config(const Config& config, const Settings& settings) {
    ServiceOptions options;

    std::string command = config.get_string("service.command", "");
    if (!command.empty()) {
        options.command.clear();
        options.command.push_back(command);
    }

    std::vector<std::string> args = config.get_string_array("service.args");
    options.command.insert(options.command.end(), args.begin(), args.end());

    options.workdir = config.get_string("service.workdir", settings.app_path);
    options.grace_seconds = static_cast<int>(config.get_int("service.grace_seconds", options.grace_seconds));
    if (options.grace_seconds < 0) {
        options.grace_seconds = 0;
    }
    return options;
}

ProcessService::ProcessService(const ServiceOptions& options) : options_(options) {}

std::vector<std::string> ProcessService::build_argv(const StartupSession& session) const {
    std::vector<std::string> argv = options_.command;
    if (session.has_workers()) {
        argv.push_back("--workers");
        argv.push_back(std::to_string(session.workers));
    }
    return argv;
}

int ProcessService::run(const StartupSession& session, ShutdownSignal& shutdown) {
    std::vector<std::string> argv = build_argv(session);

    std::string workdir = options_.workdir;
    if (!workdir.empty() && !file_exists(workdir)) {
        LOG_WARN("Service working directory %s does not exist, using current directory", workdir.c_str());
        workdir.clear();
    }

    ChildProcess child;
    if (!child.spawn(argv, workdir)) {
        LOG_ERROR("Failed to start service: %s", child.last_error().c_str());
        return 1;
    }
    LOG_INFO("Service started (pid %d): %s", static_cast<int>(child.pid()), join(argv, " ").c_str());

    while (child.running()) {
        if (shutdown.triggered()) {
            LOG_INFO("Stopping service (pid %d)", static_cast<int>(child.pid()));
            child.terminate(options_.grace_seconds * 1000);
            break;
        }
        sleep_ms(100);
    }

    LOG_DEBUG("Service exited with code %d", child.exit_code());
    return child.exit_code();
}

} // namespace lgctl
