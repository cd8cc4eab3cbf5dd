/*
 * lgctl - UI asset build
 *
 * Runs the configured front-end build command through /bin/sh in the UI
 * directory. A SHA-256 fingerprint of the build inputs is stored next to
 * the output; an unforced build whose fingerprint matches is skipped.
 * The build runs in its own process group, which receives forwarded
 * interrupts and is torn down as a whole on timeout.
 */
#ifndef lgctl_CORE_UI_BUILD_HPP
#define lgctl_CORE_UI_BUILD_HPP

#include "build_step.hpp"
#include "config.hpp"
#include "json.hpp"
#include "process.hpp"
#include <string>

namespace lgctl {

struct UiBuildOptions {
    std::string command;        // ui.build_command
    std::string directory;      // ui.directory
    std::string output_dir;     // ui.output_dir
    bool dev_mode;
    bool force;                 // Ignore a matching fingerprint
    Json inputs;                // Extra data folded into the fingerprint (the "ui" section)

    UiBuildOptions()
        : command("npm run build")
        , dev_mode(false)
        , force(false)
        , inputs(Json::object()) {}

    static UiBuildOptions from_config(const Config& config, const Settings& settings);
};

class UiBuildOperation : public BuildOperation {
public:
    explicit UiBuildOperation(const UiBuildOptions& options);
    ~UiBuildOperation();

    bool start() override;
    BuildStatus poll() override;
    void terminate() override;
    std::string description() const override { return "UI build"; }

    std::string fingerprint() const;
    std::string fingerprint_path() const;

    // Stored fingerprint matches the current inputs
    bool is_current() const;

    bool skipped() const { return skipped_; }

private:
    bool write_fingerprint();

    UiBuildOptions options_;
    ChildProcess child_;
    bool skipped_;
};

} // namespace lgctl

#endif // lgctl_CORE_UI_BUILD_HPP
