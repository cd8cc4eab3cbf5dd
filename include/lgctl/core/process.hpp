/*
 * lgctl - Child process handle
 *
 * fork/exec wrapper used by the UI build and the service launcher.
 * A running child is terminated and reaped when the handle is destroyed.
 */
#ifndef lgctl_CORE_PROCESS_HPP
#define lgctl_CORE_PROCESS_HPP

#include <string>
#include <vector>
#include <sys/types.h>

namespace lgctl {

class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    // Start the next child as the leader of a new process group. Signals
    // then go to the whole group, so whatever it spawned goes down with it.
    void set_own_process_group(bool enable) { own_group_ = enable; }
    bool own_process_group() const { return own_group_; }

    // argv[0] is looked up in PATH. `workdir` empty = inherit.
    bool spawn(const std::vector<std::string>& argv, const std::string& workdir = "");

    // Reaps the child if it has exited. Never blocks.
    bool running();

    // Blocks until the child exits.
    void wait();

    // SIGTERM, then SIGKILL once `grace_ms` has passed. Reaps the child.
    // With an own process group, members outliving the leader are killed.
    void terminate(int grace_ms);

    bool send_signal(int sig);

    // Exit status, or 128 + signal number when killed. -1 while running.
    int exit_code() const { return exit_code_; }
    pid_t pid() const { return pid_; }
    const std::string& last_error() const { return last_error_; }

private:
    ChildProcess(const ChildProcess&);
    ChildProcess& operator=(const ChildProcess&);

    void record_status(int status);
    void kill_group_leftovers();

    pid_t pid_;
    int exit_code_;
    bool own_group_;
    std::string last_error_;
};

} // namespace lgctl

#endif // lgctl_CORE_PROCESS_HPP
