/*
 * lgctl - Subcommand implementations
 */
#include <lgctl/core/commands.hpp>
#include <lgctl/core/installer.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/orchestrator.hpp>
#include <lgctl/core/path_resolver.hpp>
#include <lgctl/core/pattern_search.hpp>
#include <lgctl/core/system_info.hpp>
#include <lgctl/core/utils.hpp>

#include <sstream>

namespace lgctl {

// ============================================================================
// Argument parsing
// ============================================================================

std::string CommandArgs::value(const std::string& name, const std::string& default_value) const {
    std::map<std::string, std::string>::const_iterator it = values.find(name);
    return it == values.end() ? default_value : it->second;
}

namespace {

const OptionDef* find_long_option(const CommandDef& def, const std::string& name) {
    for (size_t i = 0; i < def.options.size(); ++i) {
        if (def.options[i].long_name == name) return &def.options[i];
    }
    return nullptr;
}

const OptionDef* find_short_option(const CommandDef& def, char name) {
    for (size_t i = 0; i < def.options.size(); ++i) {
        if (def.options[i].short_name != 0 && def.options[i].short_name == name) return &def.options[i];
    }
    return nullptr;
}

} // namespace

bool parse_command_args(const CommandDef& def, const std::vector<std::string>& argv,
                        CommandArgs& out, std::string& error) {
    out = CommandArgs();
    bool only_positional = false;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (only_positional || arg.size() < 2 || arg[0] != '-') {
            out.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            out.help = true;
            continue;
        }

        const OptionDef* opt = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (starts_with(arg, "--")) {
            std::string name = arg.substr(2);
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
                has_inline = true;
            }
            opt = find_long_option(def, name);
        } else if (arg.size() == 2) {
            opt = find_short_option(def, arg[1]);
        }

        if (!opt) {
            error = "no such option: " + arg;
            return false;
        }

        if (!opt->takes_value) {
            if (has_inline) {
                error = "option --" + opt->long_name + " does not take a value";
                return false;
            }
            out.flags.insert(opt->long_name);
            continue;
        }

        if (has_inline) {
            out.values[opt->long_name] = inline_value;
        } else if (i + 1 < argv.size()) {
            out.values[opt->long_name] = argv[++i];
        } else {
            error = "option " + arg + " requires a value";
            return false;
        }
    }

    size_t max_positional = def.positional_help.empty() ? 0 : 1;
    if (out.positional.size() > max_positional) {
        error = "unexpected argument: " + out.positional[max_positional];
        return false;
    }
    return true;
}

void print_command_usage(std::ostream& out, const CommandDef& def) {
    out << "Usage: lgctl " << def.name;
    if (!def.options.empty()) out << " [OPTIONS]";
    if (!def.positional_help.empty()) out << " " << def.positional_help;
    out << "\n\n  " << def.description << "\n";

    out << "\nOptions:\n";
    for (size_t i = 0; i < def.options.size(); ++i) {
        const OptionDef& opt = def.options[i];
        std::ostringstream flag;
        flag << "--" << opt.long_name;
        if (opt.short_name) flag << ", -" << opt.short_name;
        if (opt.takes_value) flag << " <value>";
        out << "  " << flag.str();
        for (size_t pad = flag.str().size(); pad < 24; ++pad) out << ' ';
        out << opt.help << "\n";
    }
    out << "  --help, -h              Show this message and exit\n";
}

// ============================================================================
// Command table
// ============================================================================

const std::vector<CommandDef>& command_table() {
    static std::vector<CommandDef> table;
    if (!table.empty()) {
        return table;
    }

    CommandDef start("start", "Start the looking glass service", commands::cmd_start);
    start.options.push_back(OptionDef("build", 'b', false, "Build UI before starting"));
    start.options.push_back(OptionDef("workers", 'w', true, "Number of workers"));
    table.push_back(start);

    CommandDef build_ui("build-ui", "Create a new UI build", commands::cmd_build_ui);
    build_ui.options.push_back(OptionDef("timeout", 't', true, "Timeout in seconds (default ui.timeout or 180)"));
    build_ui.options.push_back(OptionDef("force", 'f', false, "Rebuild even if inputs are unchanged"));
    table.push_back(build_ui);

    table.push_back(CommandDef("system-info", "Get system information for a bug report",
                               commands::cmd_system_info));

    CommandDef clear_cache("clear-cache", "Clear the response cache", commands::cmd_clear_cache);
    clear_cache.needs_store = true;
    table.push_back(clear_cache);

    CommandDef devices("devices", "Show all configured devices", commands::cmd_devices);
    devices.positional_help = "[PATTERN]";
    devices.needs_store = true;
    table.push_back(devices);

    CommandDef directives("directives", "Show all configured directives", commands::cmd_directives);
    directives.positional_help = "[PATTERN]";
    directives.needs_store = true;
    table.push_back(directives);

    CommandDef plugins("plugins", "Show all configured plugins", commands::cmd_plugins);
    plugins.positional_help = "[PATTERN]";
    plugins.options.push_back(OptionDef("input", 'i', false, "Show input plugins only"));
    plugins.options.push_back(OptionDef("output", 'o', false, "Show output plugins only"));
    plugins.needs_store = true;
    table.push_back(plugins);

    CommandDef params("params", "Show configuration parameters", commands::cmd_params);
    params.positional_help = "[PATH]";
    params.needs_store = true;
    table.push_back(params);

    table.push_back(CommandDef("setup", "Initialize lgctl setup", commands::cmd_setup));
    table.push_back(CommandDef("settings", "Show lgctl system settings (environment variables)",
                               commands::cmd_settings));
    return table;
}

const CommandDef* find_command(const std::string& name) {
    const std::vector<CommandDef>& table = command_table();
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].name == name) return &table[i];
    }
    return nullptr;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

std::string render_scalar(const Json& value) {
    if (value.is_object() || value.is_array()) {
        return value.dump(2);
    }
    return value.dump();
}

void render_entity(std::ostream& out, const NamedEntity& entity) {
    out << "== " << entity.name << " ==\n";
    if (entity.fields.is_object()) {
        for (Json::const_iterator it = entity.fields.begin(); it != entity.fields.end(); ++it) {
            out << "  " << it.key() << " = " << render_scalar(it.value()) << "\n";
        }
    }
    out << "\n";
}

void render_entities(std::ostream& out, const EntityCollection& entities) {
    for (size_t i = 0; i < entities.size(); ++i) {
        render_entity(out, entities[i]);
    }
}

void render_value(std::ostream& out, const std::string& title, const Json& value) {
    out << "== " << title << " ==\n";
    if (value.is_object()) {
        for (Json::const_iterator it = value.begin(); it != value.end(); ++it) {
            out << "  " << it.key() << " = " << render_scalar(it.value()) << "\n";
        }
    } else {
        out << "  " << render_scalar(value) << "\n";
    }
    out << "\n";
}

// devices/directives: the first match, or everything when there is none
int show_collection(CommandContext& ctx, const CommandArgs& args,
                    const EntityCollection& collection, const char* kind) {
    if (!args.positional.empty()) {
        const std::string& pattern = args.positional[0];
        SearchResult result = search_entities(collection, pattern, SearchMode::FIRST_MATCH);
        if (result.success) {
            render_entity(*ctx.out, result.matches.front());
            return 0;
        }
        if (result.error == SearchError::INVALID_PATTERN) {
            LOG_ERROR("%s", result.message.c_str());
            return 1;
        }
        LOG_DEBUG("No %s matching '%s', showing all", kind, pattern.c_str());
    }

    if (collection.empty()) {
        LOG_INFO("No %s configured", kind);
        return 0;
    }
    render_entities(*ctx.out, collection);
    return 0;
}

bool parse_int_option(const CommandArgs& args, const std::string& name, int& out) {
    if (!args.has_value(name)) {
        return true;
    }
    std::string raw = args.value(name);
    if (!parse_positive_int(raw, out)) {
        LOG_ERROR("Invalid value for --%s: '%s' is not a positive integer", name.c_str(), raw.c_str());
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

int cmd_start(CommandContext& ctx, const CommandArgs& args) {
    StartupSession session;
    session.build = args.has_flag("build");
    session.build_timeout = static_cast<int>(
        ctx.config->get_int("ui.timeout", DEFAULT_BUILD_TIMEOUT_SECONDS));

    if (!parse_int_option(args, "workers", session.workers)) {
        return EXIT_USAGE;
    }

    std::unique_ptr<BuildOperation> build = ctx.make_build(false);
    std::unique_ptr<ServiceLauncher> service = ctx.make_service();

    StartupOrchestrator orchestrator(*build, *service, *ctx.shutdown);
    return orchestrator.start(session);
}

int cmd_build_ui(CommandContext& ctx, const CommandArgs& args) {
    int timeout = static_cast<int>(
        ctx.config->get_int("ui.timeout", DEFAULT_BUILD_TIMEOUT_SECONDS));
    if (!parse_int_option(args, "timeout", timeout)) {
        return EXIT_USAGE;
    }

    LOG_INFO("Starting new UI build with a %d second timeout...", timeout);
    std::unique_ptr<BuildOperation> build = ctx.make_build(args.has_flag("force"));

    bool built = run_build(*build, timeout);
    if (ctx.shutdown && ctx.shutdown->triggered()) {
        return report_interrupted(*ctx.shutdown);
    }
    if (!built) {
        LOG_ERROR("UI build failed");
        return 1;
    }
    LOG_SUCCESS("UI build completed");
    return 0;
}

int cmd_system_info(CommandContext& ctx, const CommandArgs& /*args*/) {
    std::vector<SystemInfoEntry> entries = get_system_info(*ctx.settings);
    *ctx.out << "Please copy & paste this table in your bug report\n\n"
             << render_system_info(entries);
    return 0;
}

int cmd_clear_cache(CommandContext& ctx, const CommandArgs& /*args*/) {
    if (ctx.store->clear()) {
        LOG_SUCCESS("Cleared cache");
        return 0;
    }

    std::string error = ctx.store->last_error();
    if (!ctx.out_is_tty) {
        // Captured output gets the whole story
        *ctx.out << "clear-cache failed\n"
                 << "  time:     " << format_timestamp(current_timestamp()) << "\n"
                 << "  store:    " << ctx.settings->state_db_path() << "\n"
                 << "  error:    " << error << "\n";
        return 1;
    }

    LOG_ERROR("Error clearing cache: %s", error.c_str());
    return 1;
}

int cmd_devices(CommandContext& ctx, const CommandArgs& args) {
    return show_collection(ctx, args, ctx.store->devices(), "devices");
}

int cmd_directives(CommandContext& ctx, const CommandArgs& args) {
    return show_collection(ctx, args, ctx.store->directives(), "directives");
}

int cmd_plugins(CommandContext& ctx, const CommandArgs& args) {
    std::vector<PluginType> to_fetch;
    if (args.has_flag("input")) {
        to_fetch.push_back(PluginType::INPUT);
    } else if (args.has_flag("output")) {
        to_fetch.push_back(PluginType::OUTPUT);
    } else {
        to_fetch.push_back(PluginType::INPUT);
        to_fetch.push_back(PluginType::OUTPUT);
    }

    EntityCollection all_plugins;
    for (size_t i = 0; i < to_fetch.size(); ++i) {
        EntityCollection typed = ctx.store->plugins(to_fetch[i]);
        all_plugins.insert(all_plugins.end(), typed.begin(), typed.end());
    }

    if (!args.positional.empty()) {
        const std::string& pattern = args.positional[0];
        SearchResult result = search_entities(all_plugins, pattern, SearchMode::ALL_MATCHES);
        if (!result.success) {
            if (result.error == SearchError::INVALID_PATTERN) {
                LOG_ERROR("%s", result.message.c_str());
            } else {
                LOG_ERROR("No plugins matching '%s'", pattern.c_str());
            }
            return 1;
        }
        render_entities(*ctx.out, result.matches);
        return 0;
    }

    render_entities(*ctx.out, all_plugins);
    return 0;
}

int cmd_params(CommandContext& ctx, const CommandArgs& args) {
    Json params = ctx.store->params();

    if (!args.positional.empty()) {
        const std::string& path = args.positional[0];
        ResolveResult result = resolve_path(params, path);
        if (!result.success) {
            LOG_ERROR("'params.%s' does not exist", result.path.c_str());
            return 1;
        }
        render_value(*ctx.out, "params." + path, result.value);
        return 0;
    }

    render_value(*ctx.out, "lgctl Configuration Parameters", params);
    return 0;
}

int cmd_setup(CommandContext& ctx, const CommandArgs& /*args*/) {
    Installer installer(*ctx.settings, *ctx.in, *ctx.out);
    return installer();
}

int cmd_settings(CommandContext& ctx, const CommandArgs& /*args*/) {
    std::vector<std::pair<std::string, std::string> > entries = ctx.settings->entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        *ctx.out << entries[i].first << "=" << entries[i].second << "\n";
    }
    return 0;
}

} // namespace commands

} // namespace lgctl
