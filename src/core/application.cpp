/*
 * lgctl - Application Implementation
 *
 * Global options come before the subcommand name; everything after it
 * belongs to the subcommand.
 */
#include <lgctl/core/application.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/service.hpp>
#include <lgctl/core/ui_build.hpp>
#include <lgctl/core/utils.hpp>

#include <iostream>
#include <cstdlib>
#include <unistd.h>

namespace lgctl {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Looking glass command line control\n\n"
              << "Usage: " << prog << " [options] <command> [command options]\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  --config <file>      Config file (default $LGCTL_APP_PATH/lgctl.json)\n\n"
              << "Commands:\n";

    const std::vector<CommandDef>& table = command_table();
    for (size_t i = 0; i < table.size(); ++i) {
        std::string name = table[i].name;
        name.resize(14, ' ');
        std::cout << "  " << name << " " << table[i].description << "\n";
    }
    std::cout << "\nRun '" << prog << " <command> --help' for command options.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " version " << AppInfo::VERSION << "\n";
}

GlobalOptions parse_global_options(const std::vector<std::string>& args) {
    GlobalOptions result;

    // Global options end at the first word that is not an option
    size_t end = args.size();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            ++i;
            continue;
        }
        if (args[i].empty() || args[i][0] != '-') {
            end = i;
            break;
        }
    }

    for (size_t i = 0; i < end; ++i) {
        if (args[i] == "--config") {
            ++i;
            continue;
        }
        if (args[i] == "-h" || args[i] == "--help") {
            result.action = GlobalOptions::SHOW_HELP;
            return result;
        }
        if (args[i] == "-v" || args[i] == "--version") {
            result.action = GlobalOptions::SHOW_VERSION;
            return result;
        }
    }

    for (size_t i = 0; i < end; ++i) {
        if (args[i] == "-d" || args[i] == "--debug") {
            result.debug = true;
            continue;
        }
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                result.action = GlobalOptions::USAGE_ERROR;
                result.error = "--config requires a file argument";
                return result;
            }
            result.config_file = args[++i];
            continue;
        }
        result.action = GlobalOptions::USAGE_ERROR;
        result.error = "no such option: " + args[i];
        return result;
    }

    if (end == args.size()) {
        // Only global options were given
        result.action = GlobalOptions::SHOW_HELP;
        return result;
    }

    result.action = GlobalOptions::RUN;
    result.command_index = end;
    return result;
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : prog_(AppInfo::NAME)
    , debug_(false)
    , exit_code_(0)
    , command_(nullptr)
{}

bool Application::parse_args(int argc, char* argv[]) {
    if (argc > 0 && argv[0]) {
        prog_ = argv[0];
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    GlobalOptions options = parse_global_options(args);
    switch (options.action) {
        case GlobalOptions::SHOW_HELP:
            print_usage(prog_.c_str());
            exit_code_ = 0;
            return false;
        case GlobalOptions::SHOW_VERSION:
            print_version();
            exit_code_ = 0;
            return false;
        case GlobalOptions::USAGE_ERROR:
            std::cerr << "Error: " << options.error << "\n";
            exit_code_ = EXIT_USAGE;
            return false;
        case GlobalOptions::RUN:
            break;
    }

    debug_ = options.debug;
    config_file_ = options.config_file;

    const std::string& name = args[options.command_index];
    command_ = find_command(name);
    if (!command_) {
        std::cerr << "Error: no such command '" << name << "'\n"
                  << "Run '" << prog_ << " --help' for a list of commands.\n";
        exit_code_ = EXIT_USAGE;
        return false;
    }
    command_args_.assign(args.begin() + options.command_index + 1, args.end());
    return true;
}

bool Application::load_config() {
    bool explicit_file = !config_file_.empty();
    std::string path = explicit_file ? config_file_ : settings_.config_path();

    if (!explicit_file && !file_exists(path)) {
        LOG_DEBUG("No config file at %s, using defaults", path.c_str());
        return true;
    }

    if (!config_.load_file(path)) {
        LOG_ERROR("Failed to load config from %s: %s", path.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_DEBUG("Loaded config from %s", path.c_str());
    return true;
}

void Application::setup_logging() {
    LogLevel level = parse_log_level(config_.get_string("log_level", "info"), LogLevel::INFO);

    // Environment overrides the config file
    if (getenv("LGCTL_LOG_LEVEL")) {
        level = parse_log_level(settings_.log_level, level);
    }
    if (debug_ || settings_.debug) {
        level = LogLevel::DEBUG;
    }
    Logger::instance().set_level(level);
}

bool Application::open_store() {
    if (store_.is_open()) {
        return true;
    }
    std::string path = settings_.state_db_path();
    if (!store_.open(path)) {
        LOG_ERROR("Could not open state database %s: %s", path.c_str(), store_.last_error().c_str());
        return false;
    }
    return true;
}

CommandContext Application::make_context() {
    CommandContext ctx;
    ctx.settings = &settings_;
    ctx.config = &config_;
    ctx.store = store_.is_open() ? &store_ : nullptr;
    ctx.shutdown = &shutdown_signal_;
    ctx.out = &std::cout;
    ctx.in = &std::cin;
    ctx.out_is_tty = isatty(STDOUT_FILENO) != 0;

    const Config& config = config_;
    const Settings& settings = settings_;
    ctx.make_build = [&config, &settings](bool force) {
        UiBuildOptions options = UiBuildOptions::from_config(config, settings);
        options.force = force;
        return std::unique_ptr<BuildOperation>(new UiBuildOperation(options));
    };
    ctx.make_service = [&config, &settings]() {
        return std::unique_ptr<ServiceLauncher>(
            new ProcessService(ServiceOptions::from_config(config, settings)));
    };
    return ctx;
}

bool Application::init(int argc, char* argv[]) {
    settings_ = Settings::from_environment();

    if (!parse_args(argc, argv)) {
        return false;
    }

    // Early level so config loading can log at debug
    if (debug_ || settings_.debug) {
        Logger::instance().set_level(LogLevel::DEBUG);
    }

    if (!load_config()) {
        exit_code_ = 1;
        return false;
    }
    setup_logging();

    LOG_DEBUG("%s v%s, app path %s", AppInfo::NAME, AppInfo::VERSION, settings_.app_path.c_str());
    return true;
}

int Application::run() {
    CommandArgs args;
    std::string error;
    if (!parse_command_args(*command_, command_args_, args, error)) {
        std::cerr << "Error: " << error << "\n";
        print_command_usage(std::cerr, *command_);
        exit_code_ = EXIT_USAGE;
        return exit_code_;
    }
    if (args.help) {
        print_command_usage(std::cout, *command_);
        exit_code_ = 0;
        return exit_code_;
    }

    if (command_->needs_store && !open_store()) {
        exit_code_ = 1;
        return exit_code_;
    }

    bool long_running = command_->name == "start" || command_->name == "build-ui";
    if (long_running) {
        install_signal_handlers(shutdown_signal_);
    }

    CommandContext ctx = make_context();
    try {
        exit_code_ = command_->handler(ctx, args);
    } catch (const std::exception& e) {
        LOG_ERROR("%s failed: %s", command_->name.c_str(), e.what());
        exit_code_ = 1;
    }

    if (long_running) {
        uninstall_signal_handlers();
    }
    return exit_code_;
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");
    store_.close();
}

} // namespace lgctl
