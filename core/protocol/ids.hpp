#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace agentgate {
namespace protocol {

inline int64_t unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// prefix + epoch millis + per-process sequence ("chatcmpl-1718000000000-7")
inline std::string generate_id(const std::string &prefix) {
    static std::atomic<uint64_t> sequence{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return prefix + std::to_string(ms) + "-" + std::to_string(sequence.fetch_add(1));
}

}  // namespace protocol
}  // namespace agentgate
