#include <lgctl/core/installer.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>
#include <lgctl/state/store.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace lgctl {

Installer::Installer(const Settings& settings, std::istream& in, std::ostream& out,
                     const std::string& lock_path)
    : settings_(settings)
    , in_(in)
    , out_(out)
    , lock_path_(lock_path)
    , lock_fd_(-1) {
    int fd = ::open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        last_error_ = "cannot open lock file " + lock_path_ + ": " + strerror(errno);
        return;
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        last_error_ = "another setup is already running (" + lock_path_ + ")";
        ::close(fd);
        return;
    }
    lock_fd_ = fd;
    LOG_DEBUG("Setup lock acquired: %s", lock_path_.c_str());
}

Installer::~Installer() {
    if (lock_fd_ >= 0) {
        // Left on disk so every setup locks the same inode
        ::flock(lock_fd_, LOCK_UN);
        ::close(lock_fd_);
        LOG_DEBUG("Setup lock released: %s", lock_path_.c_str());
    }
}

std::string Installer::default_lock_path() {
    return join_path(env_or("TMPDIR", "/tmp"), "lgctl-setup.lock");
}

Json Installer::default_config(const std::string& app_path) {
    Json config;
    config["log_level"] = "info";

    config["service"]["command"] = "lgctl-server";
    config["service"]["args"] = Json::array();
    config["service"]["grace_seconds"] = 10;

    config["ui"]["build_command"] = "npm run build";
    config["ui"]["directory"] = join_path(app_path, "ui");
    config["ui"]["output_dir"] = join_path(app_path, "static/ui");
    config["ui"]["timeout"] = 180;

    config["state"]["devices"] = Json::array();
    config["state"]["directives"] = Json::array();
    config["state"]["plugins"] = Json::array();
    config["state"]["params"] = Json::object();
    return config;
}

std::string Installer::prompt(const std::string& question, const std::string& default_value) {
    out_ << question << " [" << default_value << "]: ";
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << "\n";
        return default_value;
    }
    answer = trim(answer);
    return answer.empty() ? default_value : answer;
}

int Installer::run() {
    if (!acquired()) {
        LOG_ERROR("%s", last_error_.c_str());
        return 1;
    }

    out_ << "lgctl setup\n\n";
    std::string app_path = prompt("Application directory", settings_.app_path);

    if (!create_directories(app_path)) {
        LOG_ERROR("Could not create %s: %s", app_path.c_str(), strerror(errno));
        return 1;
    }
    settings_.app_path = app_path;

    std::string config_path = settings_.config_path();
    if (file_exists(config_path)) {
        LOG_INFO("Keeping existing configuration %s", config_path.c_str());
    } else {
        if (!write_file(config_path, default_config(app_path).dump(2) + "\n")) {
            LOG_ERROR("Could not write %s", config_path.c_str());
            return 1;
        }
        LOG_SUCCESS("Wrote default configuration to %s", config_path.c_str());
    }

    Config config;
    if (!config.load_file(config_path)) {
        LOG_ERROR("Invalid configuration %s: %s", config_path.c_str(), config.last_error().c_str());
        return 1;
    }

    SqliteStateStore store;
    if (!store.open(settings_.state_db_path())) {
        LOG_ERROR("Could not open state database: %s", store.last_error().c_str());
        return 1;
    }

    int imported = store.import_state(config.get_section("state"));
    if (imported < 0) {
        return 1;
    }
    LOG_INFO("Seeded %d state documents into %s", imported, store.path().c_str());

    LOG_SUCCESS("Setup complete. Start the service with 'lgctl start --build'.");
    return 0;
}

} // namespace lgctl
