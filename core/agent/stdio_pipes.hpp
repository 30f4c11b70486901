#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace agentgate {
namespace agent {

// Read buffer size for a single drain step
constexpr size_t kReadChunkSize = 4096;

// Poll interval of drain loops; bounds how long a stop request goes unnoticed
constexpr int kDrainPollMs = 100;

// StdioPipes owns the parent's ends of the three pipes connected to an agent
// process: stdin (write), stdout (read) and stderr (read).
//
// Thread model: write_all()/close_stdin() are called from the spawning thread;
// read_some(STDOUT) and read_some(STDERR) may run concurrently on two drain
// threads. close_all() must only run once those threads have been joined.
class StdioPipes {
public:
    using PipeHandle = int;  // file descriptor

    enum class Channel { STDOUT, STDERR };

    enum class ReadStatus {
        DATA,           // Bytes appended to the output buffer
        TIMEOUT,        // Nothing arrived within timeout_ms
        END_OF_STREAM,  // Writer side closed (process exited or closed the pipe)
        FAILED          // poll/read error
    };

    StdioPipes();
    ~StdioPipes();

    // Delete copy/move (manages OS handles)
    StdioPipes(const StdioPipes &) = delete;
    StdioPipes &operator=(const StdioPipes &) = delete;

    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read);

    // Write the full buffer to the child's stdin, waiting at most timeout_ms in total
    // (-1 = no limit). Returns false on error or timeout (sets last_error()).
    bool write_all(const std::string &data, int timeout_ms = -1);

    // Wait up to timeout_ms for data on one output pipe and append what is available
    ReadStatus read_some(Channel channel, std::string &out, int timeout_ms);

    // Close stdin (signals EOF to the agent)
    void close_stdin();

    // Close every remaining handle
    void close_all();

    bool stdin_open() const { return stdin_write_ >= 0; }

    const std::string &last_error() const { return error_; }

private:
    PipeHandle stdin_write_;
    PipeHandle stdout_read_;
    PipeHandle stderr_read_;
    std::string error_;
};

// Read one output pipe until EOF, error or stop, handing every chunk to on_chunk
// in arrival order. Runs on a dedicated drain thread.
void drain_pipe(StdioPipes &pipes, StdioPipes::Channel channel, const std::atomic<bool> &stop,
                const std::function<void(const std::string &)> &on_chunk);

}  // namespace agent
}  // namespace agentgate
