/*
 * lgctl - Application
 *
 * Process-wide singleton: parses the global options, loads settings and
 * the config file, then dispatches to one subcommand.
 */
#ifndef lgctl_CORE_APPLICATION_HPP
#define lgctl_CORE_APPLICATION_HPP

#include "commands.hpp"
#include "config.hpp"
#include "shutdown.hpp"
#include <lgctl/state/store.hpp>

#include <string>
#include <vector>

namespace lgctl {

struct AppInfo {
    static constexpr const char* NAME = "lgctl";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

// What the options in front of the subcommand name ask for
struct GlobalOptions {
    enum Action { RUN, SHOW_HELP, SHOW_VERSION, USAGE_ERROR };

    Action action;
    std::string config_file;
    bool debug;
    size_t command_index;       // Position of the subcommand name when RUN
    std::string error;

    GlobalOptions() : action(SHOW_HELP), debug(false), command_index(0) {}
};

// `args` excludes the program name. --help and --version are eager: they
// win over any malformed option next to them.
GlobalOptions parse_global_options(const std::vector<std::string>& args);

class Application {
public:
    static Application& instance();

    // Returns false when there is nothing to run (help, version, errors);
    // exit_code() then holds the process exit status.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    const Settings& settings() const { return settings_; }
    const Config& config() const { return config_; }
    ShutdownSignal& shutdown_signal() { return shutdown_signal_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool open_store();
    CommandContext make_context();

    Settings settings_;
    Config config_;
    SqliteStateStore store_;
    ShutdownSignal shutdown_signal_;

    std::string prog_;
    std::string config_file_;
    bool debug_;
    int exit_code_;

    const CommandDef* command_;
    std::vector<std::string> command_args_;
};

} // namespace lgctl

#endif // lgctl_CORE_APPLICATION_HPP
