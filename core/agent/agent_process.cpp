#include "agent_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"

namespace agentgate {
namespace agent {

namespace {

// A write to a closed stdin must surface as EPIPE, not kill the gateway
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Only async-signal-safe calls are allowed between fork and exec
void report_child_errno(int fd) {
    int err = errno;
    ssize_t ignored = write(fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

}  // namespace

AgentProcess::AgentProcess(const std::string &name, const std::string &executable,
                           const std::vector<std::string> &args, const std::string &working_directory)
    : name_(name),
      executable_(executable),
      args_(args),
      working_directory_(working_directory),
      pid_(-1),
      reaped_(false),
      terminate_count_(0) {}

AgentProcess::~AgentProcess() {
    if (is_running()) {
        LOG_WARN("[Agent] " << name_ << " still running at teardown, terminating (PID=" << pid() << ")");
        reap(500);
    }
    pipes_.close_all();
}

bool AgentProcess::spawn() {
    LOG_INFO("[Agent] Spawning: " << executable_);

    if (executable_.empty()) {
        error_ = "Executable path is empty";
        LOG_ERROR("[Agent] " << error_);
        return false;
    }

    ignore_sigpipe_once();
    return spawn_linux();
}

bool AgentProcess::spawn_linux() {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    // O_CLOEXEC keeps our ends out of the child; dup2 clears it on the redirected copies
    if (pipe2(stdin_pipe, O_CLOEXEC) < 0 || pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create pipes: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return false;
    }

    // Build argv before fork
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(executable_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child = fork();
    if (child < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (child == 0) {
        // Child process
        setpgid(0, 0);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        // Restore default SIGPIPE for the agent
        signal(SIGPIPE, SIG_DFL);

        if (!working_directory_.empty() && chdir(working_directory_.c_str()) != 0) {
            report_child_errno(exec_pipe[1]);
        }

        execvp(argv[0], argv.data());

        // If we get here, exec failed
        report_child_errno(exec_pipe[1]);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // Blocks until exec succeeds (pipe closed by CLOEXEC) or the child reports errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        error_ = strerror(child_errno);
        LOG_ERROR("[Agent] Failed to start " << executable_ << ": " << error_);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = child;
        reaped_ = false;
    }
    pipes_.set_handles(stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);

    LOG_INFO("[Agent] " << name_ << " spawned successfully (PID=" << child << ")");
    return true;
}

bool AgentProcess::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_ > 0 && !reaped_;
}

pid_t AgentProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

bool AgentProcess::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_ || terminate_count_ > 0) {
        return false;
    }
    terminate_count_++;
    LOG_INFO("[Agent] Sending SIGTERM to " << name_ << " (PID=" << pid_ << ")");
    if (kill(-pid_, SIGTERM) != 0) {
        kill(pid_, SIGTERM);
    }
    return true;
}

void AgentProcess::force_kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_) {
        return;
    }
    LOG_WARN("[Agent] Forcing termination of " << name_ << " (PID=" << pid_ << ")");
    if (kill(-pid_, SIGKILL) != 0) {
        kill(pid_, SIGKILL);
    }
}

void AgentProcess::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        term_signal_ = WTERMSIG(status);
    }
}

bool AgentProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pid_ <= 0 || reaped_) {
                return true;
            }

            int status = 0;
            pid_t result = waitpid(pid_, &status, WNOHANG);
            if (result == pid_) {
                record_status(status);
                return true;
            }
            if (result == -1) {
                if (errno == ECHILD) {
                    // Reaped elsewhere; treat as exited with unknown status
                    reaped_ = true;
                    return true;
                }
                if (errno != EINTR) {
                    return false;
                }
            }
        }

        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
                return false;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void AgentProcess::reap(int grace_ms) {
    if (!is_running()) {
        return;
    }

    terminate();
    if (wait_for_exit(grace_ms)) {
        return;
    }

    force_kill();
    wait_for_exit(-1);
}

std::optional<int> AgentProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

std::optional<int> AgentProcess::term_signal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return term_signal_;
}

std::string AgentProcess::exit_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_) {
        return "exited with code " + std::to_string(*exit_code_);
    }
    if (term_signal_) {
        return "terminated by signal " + std::to_string(*term_signal_);
    }
    return "exited with unknown status";
}

int AgentProcess::terminate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminate_count_;
}

}  // namespace agent
}  // namespace agentgate
