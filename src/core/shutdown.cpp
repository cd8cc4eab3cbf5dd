#include <lgctl/core/shutdown.hpp>

#include <cerrno>
#include <csignal>
#include <signal.h>

namespace lgctl {

ShutdownSignal::ShutdownSignal() : triggered_(false), signo_(0) {}

void ShutdownSignal::request(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_ = message;
    }
    triggered_.store(true, std::memory_order_release);
}

void ShutdownSignal::notify(int signo) {
    signo_.store(signo, std::memory_order_relaxed);
    triggered_.store(true, std::memory_order_release);
}

bool ShutdownSignal::triggered() const {
    return triggered_.load(std::memory_order_acquire);
}

int ShutdownSignal::signal_number() const {
    return signo_.load(std::memory_order_relaxed);
}

std::string ShutdownSignal::message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

void ShutdownSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    message_.clear();
    signo_.store(0, std::memory_order_relaxed);
    triggered_.store(false, std::memory_order_release);
}

// ============================================================================
// Signal Handlers
// ============================================================================

namespace {

std::atomic<ShutdownSignal*> g_shutdown_signal(nullptr);
std::atomic<pid_t> g_forward_group(0);

void shutdown_signal_handler(int sig) {
    ShutdownSignal* target = g_shutdown_signal.load();
    if (target) {
        target->notify(sig);
    }
    pid_t group = g_forward_group.load();
    if (group > 0) {
        int saved_errno = errno;
        ::kill(-group, sig);
        errno = saved_errno;
    }
}

} // namespace

void install_signal_handlers(ShutdownSignal& signal) {
    g_shutdown_signal.store(&signal);

    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = shutdown_signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
    install(SIGQUIT);
}

void uninstall_signal_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGQUIT, SIG_DFL);
    g_shutdown_signal.store(nullptr);
}

void forward_signals_to_group(pid_t group) {
    g_forward_group.store(group);
}

void stop_forwarding_signals(pid_t group) {
    g_forward_group.compare_exchange_strong(group, 0);
}

} // namespace lgctl
