#include <lgctl/core/ui_build.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/shutdown.hpp>
#include <lgctl/core/utils.hpp>

#include <vector>

namespace lgctl {

UiBuildOptions UiBuildOptions::from_config(const Config& config, const Settings& settings) {
    UiBuildOptions options;
    options.command = config.get_string("ui.build_command", options.command);
    options.directory = config.get_string("ui.directory", join_path(settings.app_path, "ui"));
    options.output_dir = config.get_string("ui.output_dir", join_path(settings.app_path, "static/ui"));
    options.dev_mode = settings.dev_mode;

    Json section = config.get_section("ui");
    if (section.is_object()) {
        options.inputs = section;
    }
    return options;
}

UiBuildOperation::UiBuildOperation(const UiBuildOptions& options)
    : options_(options)
    , skipped_(false) {
    // npm and friends fork their own workers; keep them in one group
    child_.set_own_process_group(true);
}

UiBuildOperation::~UiBuildOperation() {
    if (child_.pid() > 0) {
        stop_forwarding_signals(child_.pid());
    }
}

std::string UiBuildOperation::fingerprint() const {
    Json doc;
    doc["command"] = options_.command;
    doc["directory"] = options_.directory;
    doc["output_dir"] = options_.output_dir;
    doc["dev_mode"] = options_.dev_mode;
    doc["inputs"] = options_.inputs;
    return sha256_hex(doc.dump());
}

std::string UiBuildOperation::fingerprint_path() const {
    return join_path(options_.output_dir, ".lgctl-build-id");
}

bool UiBuildOperation::is_current() const {
    std::string stored;
    if (!read_file(fingerprint_path(), stored)) {
        return false;
    }
    return trim(stored) == fingerprint();
}

bool UiBuildOperation::write_fingerprint() {
    if (!write_file(fingerprint_path(), fingerprint() + "\n")) {
        LOG_WARN("Could not write build fingerprint to %s", fingerprint_path().c_str());
        return false;
    }
    return true;
}

bool UiBuildOperation::start() {
    skipped_ = false;

    if (!options_.force && is_current()) {
        LOG_INFO("UI build inputs unchanged, skipping build");
        skipped_ = true;
        return true;
    }

    if (!file_exists(options_.directory)) {
        LOG_ERROR("UI directory %s does not exist", options_.directory.c_str());
        return false;
    }

    std::vector<std::string> argv;
    argv.push_back("/bin/sh");
    argv.push_back("-c");
    argv.push_back(options_.command);

    LOG_INFO("Running '%s' in %s", options_.command.c_str(), options_.directory.c_str());
    if (!child_.spawn(argv, options_.directory)) {
        LOG_ERROR("Failed to launch UI build: %s", child_.last_error().c_str());
        return false;
    }
    forward_signals_to_group(child_.pid());
    return true;
}

BuildStatus UiBuildOperation::poll() {
    if (skipped_) {
        return BuildStatus::SUCCEEDED;
    }
    if (child_.running()) {
        return BuildStatus::RUNNING;
    }
    stop_forwarding_signals(child_.pid());

    if (child_.exit_code() != 0) {
        LOG_ERROR("UI build exited with code %d", child_.exit_code());
        return BuildStatus::FAILED;
    }

    write_fingerprint();
    return BuildStatus::SUCCEEDED;
}

void UiBuildOperation::terminate() {
    stop_forwarding_signals(child_.pid());
    child_.terminate(5000);
}

} // namespace lgctl
