#pragma once

#include <sys/types.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stdio_pipes.hpp"

namespace agentgate {
namespace agent {

// AgentProcess manages the lifecycle of one agent child process
// Responsibilities:
// - Spawn with redirected stdin/stdout/stderr in the requested working directory
// - Report exec/chdir failures as spawn errors (not as exit codes)
// - Terminate (SIGTERM once), force kill, and always reap
//
// The child runs in its own process group so terminate() also reaches any
// helpers the agent started.
class AgentProcess {
public:
    AgentProcess(const std::string &name, const std::string &executable, const std::vector<std::string> &args,
                 const std::string &working_directory);
    ~AgentProcess();

    AgentProcess(const AgentProcess &) = delete;
    AgentProcess &operator=(const AgentProcess &) = delete;

    // Spawn the agent process
    // Returns true on success, false on failure (sets last_error())
    bool spawn();

    // True while spawned and not yet reaped
    bool is_running() const;

    // Send SIGTERM. Only the first call signals; later calls are no-ops.
    // Returns true if the signal was sent by this call.
    bool terminate();

    // Send SIGKILL to a process that has not been reaped
    void force_kill();

    // Wait for exit and reap. timeout_ms < 0 waits indefinitely.
    // Returns true once the process has been reaped.
    bool wait_for_exit(int timeout_ms);

    // terminate -> wait grace_ms -> SIGKILL -> wait. Leaves no zombie.
    void reap(int grace_ms);

    StdioPipes &pipes() { return pipes_; }

    pid_t pid() const;
    const std::string &name() const { return name_; }
    const std::string &last_error() const { return error_; }

    // Exit details, set once the process has been reaped
    std::optional<int> exit_code() const;
    std::optional<int> term_signal() const;

    // "exited with code N" / "terminated by signal N"
    std::string exit_description() const;

    int terminate_count() const;

private:
    bool spawn_linux();
    void record_status(int status);

    std::string name_;
    std::string executable_;
    std::vector<std::string> args_;
    std::string working_directory_;
    std::string error_;

    StdioPipes pipes_;

    mutable std::mutex mutex_;
    pid_t pid_;
    bool reaped_;
    int terminate_count_;
    std::optional<int> exit_code_;
    std::optional<int> term_signal_;
};

}  // namespace agent
}  // namespace agentgate
