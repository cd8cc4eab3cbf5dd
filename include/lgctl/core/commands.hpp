/*
 * lgctl - Subcommands
 *
 * Every subcommand is a CommandDef in the command table: its options,
 * whether it needs the state store, and a handler returning the process
 * exit code. Handlers get their collaborators through CommandContext.
 */
#ifndef lgctl_CORE_COMMANDS_HPP
#define lgctl_CORE_COMMANDS_HPP

#include <lgctl/core/build_step.hpp>
#include <lgctl/core/config.hpp>
#include <lgctl/core/service.hpp>
#include <lgctl/core/shutdown.hpp>
#include <lgctl/state/store.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lgctl {

// Exit code for malformed command lines
const int EXIT_USAGE = 2;

typedef std::function<std::unique_ptr<BuildOperation>(bool force)> BuildFactory;
typedef std::function<std::unique_ptr<ServiceLauncher>()> ServiceFactory;

struct CommandContext {
    const Settings* settings;
    const Config* config;
    StateStore* store;              // Set for commands that need it
    ShutdownSignal* shutdown;
    std::ostream* out;
    std::istream* in;
    bool out_is_tty;
    BuildFactory make_build;
    ServiceFactory make_service;

    CommandContext()
        : settings(nullptr), config(nullptr), store(nullptr), shutdown(nullptr)
        , out(&std::cout), in(&std::cin), out_is_tty(false) {}
};

struct OptionDef {
    std::string long_name;      // Without leading dashes
    char short_name;            // 0 = none
    bool takes_value;
    std::string help;

    OptionDef(const std::string& l, char s, bool v, const std::string& h)
        : long_name(l), short_name(s), takes_value(v), help(h) {}
};

struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;
    std::set<std::string> flags;
    bool help;

    CommandArgs() : help(false) {}

    bool has_flag(const std::string& name) const { return flags.count(name) > 0; }
    bool has_value(const std::string& name) const { return values.count(name) > 0; }
    std::string value(const std::string& name, const std::string& default_value = "") const;
};

typedef std::function<int(CommandContext& ctx, const CommandArgs& args)> CommandHandler;

struct CommandDef {
    std::string name;
    std::string description;
    std::string positional_help;    // e.g. "[PATTERN]"; empty = no positional arguments
    std::vector<OptionDef> options;
    bool needs_store;
    CommandHandler handler;

    CommandDef() : needs_store(false) {}
    CommandDef(const std::string& n, const std::string& d, CommandHandler h)
        : name(n), description(d), needs_store(false), handler(h) {}
};

const std::vector<CommandDef>& command_table();
const CommandDef* find_command(const std::string& name);

bool parse_command_args(const CommandDef& def, const std::vector<std::string>& argv,
                        CommandArgs& out, std::string& error);

void print_command_usage(std::ostream& out, const CommandDef& def);

namespace commands {
    int cmd_start(CommandContext& ctx, const CommandArgs& args);
    int cmd_build_ui(CommandContext& ctx, const CommandArgs& args);
    int cmd_system_info(CommandContext& ctx, const CommandArgs& args);
    int cmd_clear_cache(CommandContext& ctx, const CommandArgs& args);
    int cmd_devices(CommandContext& ctx, const CommandArgs& args);
    int cmd_directives(CommandContext& ctx, const CommandArgs& args);
    int cmd_plugins(CommandContext& ctx, const CommandArgs& args);
    int cmd_params(CommandContext& ctx, const CommandArgs& args);
    int cmd_setup(CommandContext& ctx, const CommandArgs& args);
    int cmd_settings(CommandContext& ctx, const CommandArgs& args);
}

} // namespace lgctl

#endif // lgctl_CORE_COMMANDS_HPP
