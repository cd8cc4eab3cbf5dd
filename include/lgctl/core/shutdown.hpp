/*
 * lgctl - Shutdown signal
 *
 * The channel the startup orchestrator listens on. Signal handlers call
 * notify() (async-signal-safe); in-process callers use request() and may
 * attach an explanatory message. Both end in the same triggered state.
 */
#ifndef lgctl_CORE_SHUTDOWN_HPP
#define lgctl_CORE_SHUTDOWN_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace lgctl {

class ShutdownSignal {
public:
    ShutdownSignal();

    void request(const std::string& message);
    void notify(int signo);

    bool triggered() const;
    int signal_number() const;
    std::string message() const;

    void reset();

private:
    ShutdownSignal(const ShutdownSignal&);
    ShutdownSignal& operator=(const ShutdownSignal&);

    std::atomic<bool> triggered_;
    std::atomic<int> signo_;
    mutable std::mutex mutex_;
    std::string message_;
};

// Route SIGINT, SIGTERM and SIGQUIT to `signal`. Only one signal is
// installed at a time.
void install_signal_handlers(ShutdownSignal& signal);
void uninstall_signal_handlers();

// While set, a caught signal is also passed on to process group `group`.
// A child in its own group no longer sees the terminal's SIGINT, so the
// handler relays it. Clearing only succeeds for the group that was set.
void forward_signals_to_group(pid_t group);
void stop_forwarding_signals(pid_t group);

} // namespace lgctl

#endif // lgctl_CORE_SHUTDOWN_HPP
