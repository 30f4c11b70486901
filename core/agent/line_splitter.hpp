#pragma once

#include <string>
#include <vector>

namespace agentgate {
namespace agent {

// Trim ASCII whitespace (space, tab, CR, LF) from both ends
inline std::string trim_copy(const std::string &s) {
    const char *ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Splits a byte stream into lines. A line broken across two pipe reads is held
// until its newline arrives (or until flush() at end of stream). Only trimmed,
// non-empty lines are returned.
class LineSplitter {
public:
    std::vector<std::string> feed(const std::string &chunk) {
        std::vector<std::string> lines;
        pending_ += chunk;

        size_t start = 0;
        size_t pos;
        while ((pos = pending_.find('\n', start)) != std::string::npos) {
            std::string line = trim_copy(pending_.substr(start, pos - start));
            if (!line.empty()) {
                lines.push_back(std::move(line));
            }
            start = pos + 1;
        }
        pending_.erase(0, start);
        return lines;
    }

    // Emit the unterminated tail, if any
    std::vector<std::string> flush() {
        std::vector<std::string> lines;
        std::string line = trim_copy(pending_);
        pending_.clear();
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        return lines;
    }

    size_t pending_size() const { return pending_.size(); }

private:
    std::string pending_;
};

}  // namespace agent
}  // namespace agentgate
