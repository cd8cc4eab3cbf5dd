#include <lgctl/core/process.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>

namespace lgctl {

ChildProcess::ChildProcess() : pid_(-1), exit_code_(-1), own_group_(false) {}

ChildProcess::~ChildProcess() {
    if (running()) {
        LOG_DEBUG("Reaping child %d on destruction", static_cast<int>(pid_));
        terminate(2000);
    }
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const std::string& workdir) {
    if (argv.empty()) {
        last_error_ = "empty command";
        return false;
    }
    if (pid_ > 0 && exit_code_ < 0) {
        last_error_ = "process already running";
        return false;
    }

    // Build argv before fork; the child only calls async-signal-safe functions.
    std::vector<char*> exec_args;
    exec_args.reserve(argv.size() + 1);
    for (size_t i = 0; i < argv.size(); ++i) {
        exec_args.push_back(const_cast<char*>(argv[i].c_str()));
    }
    exec_args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        last_error_ = std::string("fork failed: ") + strerror(errno);
        return false;
    }

    if (pid == 0) {
        if (own_group_ && ::setpgid(0, 0) != 0) {
            _exit(127);
        }
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            _exit(127);
        }
        ::execvp(exec_args[0], exec_args.data());
        _exit(127);
    }

    // Also set from the parent so the group exists before anyone signals
    // it. EACCES means the child already exec'd after doing it itself.
    if (own_group_ && ::setpgid(pid, pid) != 0 && errno != EACCES) {
        LOG_DEBUG("setpgid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
    }

    pid_ = pid;
    exit_code_ = -1;
    last_error_.clear();
    LOG_DEBUG("Spawned '%s' as pid %d", join(argv, " ").c_str(), static_cast<int>(pid_));
    return true;
}

bool ChildProcess::running() {
    if (pid_ <= 0 || exit_code_ >= 0) {
        return false;
    }

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0) {
        return true;
    }
    if (rc < 0) {
        last_error_ = std::string("waitpid failed: ") + strerror(errno);
        exit_code_ = 1;
        return false;
    }

    record_status(status);
    return false;
}

void ChildProcess::wait() {
    if (pid_ <= 0 || exit_code_ >= 0) {
        return;
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            last_error_ = std::string("waitpid failed: ") + strerror(errno);
            exit_code_ = 1;
            return;
        }
    }
    record_status(status);
}

void ChildProcess::terminate(int grace_ms) {
    if (!running()) {
        return;
    }

    send_signal(SIGTERM);

    int64_t deadline = monotonic_ms() + grace_ms;
    while (monotonic_ms() < deadline) {
        if (!running()) {
            kill_group_leftovers();
            return;
        }
        sleep_ms(50);
    }

    LOG_WARN("Process %d did not exit after SIGTERM, sending SIGKILL", static_cast<int>(pid_));
    send_signal(SIGKILL);
    wait();
    kill_group_leftovers();
}

void ChildProcess::kill_group_leftovers() {
    // The group id stays reserved while any member is alive, so this can
    // only reach processes the child started.
    if (own_group_ && pid_ > 0 && ::kill(-pid_, SIGKILL) == 0) {
        LOG_DEBUG("Killed leftover members of process group %d", static_cast<int>(pid_));
    }
}

bool ChildProcess::send_signal(int sig) {
    if (pid_ <= 0 || exit_code_ >= 0) {
        return false;
    }
    pid_t target = own_group_ ? -pid_ : pid_;
    if (::kill(target, sig) != 0) {
        last_error_ = std::string("kill failed: ") + strerror(errno);
        return false;
    }
    return true;
}

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = 1;
    }
}

} // namespace lgctl
