#include <lgctl/core/config.hpp>
#include <lgctl/core/path_resolver.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

#include <cstdlib>

namespace lgctl {

// ============================================================================
// Settings
// ============================================================================

Settings Settings::from_environment() {
    Settings s;
    s.app_path = env_or("LGCTL_APP_PATH", s.app_path);
    s.host = env_or("LGCTL_HOST", s.host);

    int port = 0;
    std::string port_str = env_or("LGCTL_PORT", "");
    if (!port_str.empty()) {
        if (parse_positive_int(port_str, port) && port <= 65535) {
            s.port = port;
        } else {
            LOG_WARN("Ignoring invalid LGCTL_PORT '%s'", port_str.c_str());
        }
    }

    s.debug = is_truthy(env_or("LGCTL_DEBUG", "false"));
    s.dev_mode = is_truthy(env_or("LGCTL_DEV_MODE", "false"));
    s.disable_ui = is_truthy(env_or("LGCTL_DISABLE_UI", "false"));
    s.container = is_truthy(env_or("LGCTL_CONTAINER", "false"));
    s.state_db = env_or("LGCTL_STATE_DB", "");
    s.log_level = env_or("LGCTL_LOG_LEVEL", s.debug ? "debug" : s.log_level);
    return s;
}

std::string Settings::config_path() const {
    return join_path(app_path, "lgctl.json");
}

std::string Settings::state_db_path() const {
    if (!state_db.empty()) return state_db;
    return join_path(app_path, "state.db");
}

std::vector<std::pair<std::string, std::string> > Settings::entries() const {
    std::vector<std::pair<std::string, std::string> > out;
    out.push_back(std::make_pair("LGCTL_APP_PATH", app_path));
    out.push_back(std::make_pair("LGCTL_HOST", host));
    out.push_back(std::make_pair("LGCTL_PORT", std::to_string(port)));
    out.push_back(std::make_pair("LGCTL_DEBUG", debug ? "true" : "false"));
    out.push_back(std::make_pair("LGCTL_DEV_MODE", dev_mode ? "true" : "false"));
    out.push_back(std::make_pair("LGCTL_DISABLE_UI", disable_ui ? "true" : "false"));
    out.push_back(std::make_pair("LGCTL_CONTAINER", container ? "true" : "false"));
    out.push_back(std::make_pair("LGCTL_STATE_DB", state_db_path()));
    out.push_back(std::make_pair("LGCTL_LOG_LEVEL", log_level));
    return out;
}

// ============================================================================
// Config
// ============================================================================

Config::Config() : data_(Json::object()), loaded_(false) {}

bool Config::load_file(const std::string& path) {
    path_ = path;

    std::string text;
    if (!read_file(path, text)) {
        last_error_ = "cannot read " + path;
        return false;
    }
    return load_string(text);
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "top-level value must be an object";
            return false;
        }
        data_ = parsed;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }

    loaded_ = true;
    last_error_.clear();
    return true;
}

bool Config::has(const std::string& key) const {
    return find_path(data_, key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* node = find_path(data_, key);
    if (!node || !node->is_string()) return default_value;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* node = find_path(data_, key);
    if (!node || !node->is_number_integer()) return default_value;
    return node->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* node = find_path(data_, key);
    if (!node || !node->is_boolean()) return default_value;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_array(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find_path(data_, key);
    if (!node || !node->is_array()) return out;

    for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
        if (it->is_string()) {
            out.push_back(it->get<std::string>());
        }
    }
    return out;
}

Json Config::get_section(const std::string& key) const {
    const Json* node = find_path(data_, key);
    if (!node) return Json();
    return *node;
}

} // namespace lgctl
