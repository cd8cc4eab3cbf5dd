/*
 * lgctl - Configuration
 *
 * Settings: process environment (LGCTL_*), read once at startup.
 * Config:   the CLI's JSON config file (<app_path>/lgctl.json), read with
 *           dotted keys such as "service.command" or "ui.timeout".
 */
#ifndef lgctl_CORE_CONFIG_HPP
#define lgctl_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace lgctl {

struct Settings {
    std::string app_path;       // LGCTL_APP_PATH
    std::string host;           // LGCTL_HOST
    int port;                   // LGCTL_PORT
    bool debug;                 // LGCTL_DEBUG
    bool dev_mode;              // LGCTL_DEV_MODE
    bool disable_ui;            // LGCTL_DISABLE_UI
    bool container;             // LGCTL_CONTAINER
    std::string state_db;       // LGCTL_STATE_DB (empty = <app_path>/state.db)
    std::string log_level;      // LGCTL_LOG_LEVEL

    Settings()
        : app_path("/etc/lgctl")
        , host("0.0.0.0")
        , port(8001)
        , debug(false)
        , dev_mode(false)
        , disable_ui(false)
        , container(false)
        , log_level("info") {}

    static Settings from_environment();

    std::string config_path() const;
    std::string state_db_path() const;

    // Name/value pairs in environment-variable form, for display
    std::vector<std::pair<std::string, std::string> > entries() const;
};

class Config {
public:
    Config();

    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool loaded() const { return loaded_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    bool has(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    // Subtree at `key`, or null Json when missing
    Json get_section(const std::string& key) const;

private:
    Json data_;
    bool loaded_;
    std::string path_;
    std::string last_error_;
};

} // namespace lgctl

#endif // lgctl_CORE_CONFIG_HPP
