#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent/i_agent_runner.hpp"

namespace agentgate {
namespace tests {

using namespace testing;

class MockAgentRunner : public agent::IAgentRunner {
public:
    MOCK_METHOD(agent::AgentExecutionResult, execute, (const agent::AgentExecutionRequest &), (override));
    MOCK_METHOD(std::unique_ptr<agent::ILineStream>, execute_streaming, (const agent::AgentExecutionRequest &),
                (override));
    MOCK_METHOD(const agent::AgentSettings &, settings, (), (const, override));

    // Helper to store/return settings reference
    agent::AgentSettings _settings;
};

/**
 * @brief Line stream replaying canned agent output
 *
 * Yields the given lines, then ends with END, or FAILED when an error is set.
 * With hold_open the stream stays PENDING after the lines until released.
 */
class FakeLineStream : public agent::ILineStream {
public:
    struct Shared {
        std::mutex mutex;
        bool cancelled = false;
        bool released = false;  // Ends a hold_open stream
    };

    FakeLineStream(std::vector<std::string> lines, std::string error = "", bool hold_open = false)
        : lines_(lines.begin(), lines.end()),
          error_(std::move(error)),
          hold_open_(hold_open),
          shared_(std::make_shared<Shared>()) {}

    Status next(std::string &line, int timeout_ms) override {
        bool released = false;
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            if (shared_->cancelled) {
                return Status::FAILED;
            }
            released = shared_->released;
        }
        if (!lines_.empty()) {
            line = lines_.front();
            lines_.pop_front();
            return Status::LINE;
        }
        if (hold_open_ && !released) {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 20)));
            return Status::PENDING;
        }
        return error_.empty() ? Status::END : Status::FAILED;
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->cancelled = true;
    }

    std::string error() const override { return error_; }

    // Outlives the stream; lets a test observe cancellation after the server released it
    std::shared_ptr<Shared> shared() const { return shared_; }

private:
    std::deque<std::string> lines_;
    std::string error_;
    bool hold_open_;
    std::shared_ptr<Shared> shared_;
};

}  // namespace tests
}  // namespace agentgate
