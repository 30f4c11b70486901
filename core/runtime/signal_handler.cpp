#include "signal_handler.hpp"

#include <signal.h>

namespace agentgate {
namespace runtime {

std::atomic<int> SignalHandler::received_signal_{0};

bool SignalHandler::install() {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        return false;
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    return sigaction(SIGPIPE, &ignore, nullptr) == 0;
}

bool SignalHandler::is_shutdown_requested() { return received_signal_.load() != 0; }

int SignalHandler::received_signal() { return received_signal_.load(); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations allowed
    received_signal_.store(signal);
}

}  // namespace runtime
}  // namespace agentgate
