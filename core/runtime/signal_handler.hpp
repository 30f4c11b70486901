#pragma once

#include <atomic>

namespace agentgate {
namespace runtime {

/**
 * @brief Process signal setup for the gateway
 *
 * SIGINT and SIGTERM request a shutdown that the runtime loop polls.
 * SIGPIPE is ignored so a client or agent closing its end of a socket or
 * pipe shows up as a write error instead of killing the gateway.
 */
class SignalHandler {
public:
    static bool install();
    static bool is_shutdown_requested();

    // Signal that requested the shutdown (0 if none)
    static int received_signal();

private:
    static void handle_signal(int signal);
    static std::atomic<int> received_signal_;
};

}  // namespace runtime
}  // namespace agentgate
