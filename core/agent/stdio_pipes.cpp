#include "stdio_pipes.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "logging/logger.hpp"

namespace agentgate {
namespace agent {

namespace {
constexpr StdioPipes::PipeHandle kInvalidHandle = -1;

void close_handle(StdioPipes::PipeHandle &fd) {
    if (fd >= 0) {
        close(fd);
        fd = kInvalidHandle;
    }
}
}  // namespace

StdioPipes::StdioPipes() : stdin_write_(kInvalidHandle), stdout_read_(kInvalidHandle), stderr_read_(kInvalidHandle) {}

StdioPipes::~StdioPipes() { close_all(); }

void StdioPipes::set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read) {
    stdin_write_ = stdin_write;
    stdout_read_ = stdout_read;
    stderr_read_ = stderr_read;
}

bool StdioPipes::write_all(const std::string &data, int timeout_ms) {
    if (stdin_write_ < 0) {
        error_ = "stdin already closed";
        return false;
    }

    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < data.size()) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            if (elapsed_ms >= timeout_ms) {
                error_ = "Timeout writing prompt";
                return false;
            }
            wait_ms = static_cast<int>(timeout_ms - elapsed_ms);
        }

        // Wait until the pipe can take more data so a stalled agent cannot block us past the deadline
        struct pollfd pfd;
        pfd.fd = stdin_write_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "poll failed: " + std::string(strerror(errno));
            return false;
        }
        if (ready == 0) {
            continue;  // Re-check deadline
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            error_ = "Broken pipe (agent closed stdin)";
            return false;
        }

        ssize_t w = write(stdin_write_, data.data() + total, data.size() - total);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (agent closed stdin)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

StdioPipes::ReadStatus StdioPipes::read_some(Channel channel, std::string &out, int timeout_ms) {
    const PipeHandle fd = channel == Channel::STDOUT ? stdout_read_ : stderr_read_;
    if (fd < 0) {
        return ReadStatus::END_OF_STREAM;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return ReadStatus::TIMEOUT;
        }
        LOG_ERROR("[Agent] poll failed on " << (channel == Channel::STDOUT ? "stdout" : "stderr") << ": "
                                            << strerror(errno));
        return ReadStatus::FAILED;
    }
    if (result == 0) {
        return ReadStatus::TIMEOUT;
    }

    // POLLHUP with data still buffered: read() drains it first, then returns 0
    char buf[kReadChunkSize];
    while (true) {
        ssize_t r = read(fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Agent] read failed: " << strerror(errno));
            return ReadStatus::FAILED;
        }
        if (r == 0) {
            return ReadStatus::END_OF_STREAM;
        }
        out.append(buf, static_cast<size_t>(r));
        return ReadStatus::DATA;
    }
}

void StdioPipes::close_stdin() { close_handle(stdin_write_); }

void StdioPipes::close_all() {
    close_handle(stdin_write_);
    close_handle(stdout_read_);
    close_handle(stderr_read_);
}

void drain_pipe(StdioPipes &pipes, StdioPipes::Channel channel, const std::atomic<bool> &stop,
                const std::function<void(const std::string &)> &on_chunk) {
    std::string chunk;
    while (!stop.load()) {
        chunk.clear();
        auto status = pipes.read_some(channel, chunk, kDrainPollMs);
        if (status == StdioPipes::ReadStatus::DATA) {
            on_chunk(chunk);
        } else if (status == StdioPipes::ReadStatus::TIMEOUT) {
            continue;
        } else {
            break;
        }
    }
}

}  // namespace agent
}  // namespace agentgate
