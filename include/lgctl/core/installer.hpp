/*
 * lgctl - First-time setup
 *
 * The installer holds an exclusive lock for its whole lifetime; the
 * destructor releases it however run() exits.
 */
#ifndef lgctl_CORE_INSTALLER_HPP
#define lgctl_CORE_INSTALLER_HPP

#include "config.hpp"
#include "json.hpp"
#include <iostream>
#include <string>

namespace lgctl {

class Installer {
public:
    Installer(const Settings& settings, std::istream& in, std::ostream& out,
              const std::string& lock_path = default_lock_path());
    ~Installer();

    // Lock taken in the constructor
    bool acquired() const { return lock_fd_ >= 0; }
    const std::string& last_error() const { return last_error_; }

    // Interactive setup. Returns a process exit code.
    int run();
    int operator()() { return run(); }

    static std::string default_lock_path();
    static Json default_config(const std::string& app_path);

private:
    Installer(const Installer&);
    Installer& operator=(const Installer&);

    std::string prompt(const std::string& question, const std::string& default_value);

    Settings settings_;
    std::istream& in_;
    std::ostream& out_;
    std::string lock_path_;
    int lock_fd_;
    std::string last_error_;
};

} // namespace lgctl

#endif // lgctl_CORE_INSTALLER_HPP
