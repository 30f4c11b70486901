/**
 * agent_supervisor_test.cpp - AgentSupervisor buffered execution tests
 *
 * Every test runs a small shell script in place of the agent binary.
 */

#include "agent/agent_supervisor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "helpers/script_agent.hpp"

using namespace agentgate::agent;
using agentgate::tests::ScriptAgentDir;

class AgentSupervisorTest : public ::testing::Test {
protected:
    AgentExecutionRequest request(const std::string &prompt, std::optional<std::chrono::milliseconds> timeout =
                                                                 std::chrono::milliseconds(10000)) {
        AgentExecutionRequest req;
        req.prompt = prompt;
        req.working_directory = dir_.path();
        req.timeout = timeout;
        return req;
    }

    ScriptAgentDir dir_;
};

TEST_F(AgentSupervisorTest, SuccessWithNoOutput) {
    AgentSupervisor supervisor(dir_.settings_for(dir_.write_script("silent.sh", "cat > /dev/null\nexit 0\n")));

    AgentExecutionResult result = supervisor.execute(request("hello"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.raw_output, "");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.error_kind, ErrorKind::NONE);
}

TEST_F(AgentSupervisorTest, CapturesPromptEchoedOnStdout) {
    AgentSupervisor supervisor(dir_.settings_for(dir_.write_script("echo.sh", "cat\n")));

    AgentExecutionResult result = supervisor.execute(request("say hi"));

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.raw_output, "say hi");
}

TEST_F(AgentSupervisorTest, StderrIsIncludedInRawOutput) {
    AgentSupervisor supervisor(
        dir_.settings_for(dir_.write_script("stderr.sh", "cat > /dev/null\necho 'warning: slow' >&2\nexit 0\n")));

    AgentExecutionResult result = supervisor.execute(request("x"));

    ASSERT_TRUE(result.success);
    EXPECT_NE(result.raw_output.find("warning: slow"), std::string::npos);
}

TEST_F(AgentSupervisorTest, NonZeroExitIsFailureWithCode) {
    AgentSupervisor supervisor(
        dir_.settings_for(dir_.write_script("fail.sh", "cat > /dev/null\necho 'partial'\nexit 2\n")));

    AgentExecutionResult result = supervisor.execute(request("x"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NONZERO_EXIT);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "test-agent exited with code 2");
    EXPECT_NE(result.raw_output.find("partial"), std::string::npos);
}

TEST_F(AgentSupervisorTest, TimeoutTerminatesWithSingleSigterm) {
    std::string marker = dir_.file("term.log");
    std::string script = dir_.write_script(
        "slow.sh", "trap 'echo TERM >> \"" + marker + "\"; exit 143' TERM\nsleep 5 &\nwait $!\n");
    AgentSupervisor supervisor(dir_.settings_for(script));

    auto start = std::chrono::steady_clock::now();
    AgentExecutionResult result = supervisor.execute(request("x", std::chrono::milliseconds(500)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::TIMED_OUT);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("timed out"), std::string::npos);
    EXPECT_NE(result.error->find("500ms"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(4));

    EXPECT_EQ(dir_.count_lines("term.log"), 1);
}

TEST_F(AgentSupervisorTest, TimeoutReturnsWithinGraceWhenSigtermIgnored) {
    std::string script = dir_.write_script("stubborn.sh", "trap '' TERM\nsleep 6\n");
    AgentSettings settings = dir_.settings_for(script);
    settings.terminate_grace_ms = 200;
    AgentSupervisor supervisor(settings);

    auto start = std::chrono::steady_clock::now();
    AgentExecutionResult result = supervisor.execute(request("x", std::chrono::milliseconds(300)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.error_kind, ErrorKind::TIMED_OUT);
    // timeout + grace, plus slack for the drain poll and SIGKILL delivery
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::milliseconds(300 + 200 + 1000));
}

TEST_F(AgentSupervisorTest, MissingExecutableIsSpawnFailure) {
    AgentSupervisor supervisor(dir_.settings_for(dir_.file("missing-agent")));

    AgentExecutionResult result = supervisor.execute(request("x"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::SPAWN_FAILED);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->rfind("Failed to spawn test-agent: ", 0), 0u);
}

TEST_F(AgentSupervisorTest, EmptyPromptIsRejectedWithoutSpawning) {
    std::string marker = dir_.file("spawned");
    AgentSupervisor supervisor(dir_.settings_for(dir_.write_script("mark.sh", "touch '" + marker + "'\n")));

    AgentExecutionResult result = supervisor.execute(request(""));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::INVALID_REQUEST);
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(AgentSupervisorTest, NoTimeoutWaitsForCompletion) {
    AgentSupervisor supervisor(dir_.settings_for(dir_.write_script("nap.sh", "cat > /dev/null\nsleep 0.3\necho done\n")));

    AgentExecutionResult result = supervisor.execute(request("x", std::nullopt));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.raw_output, "done\n");
}

TEST_F(AgentSupervisorTest, ReceivesAgentArguments) {
    std::string script = dir_.write_script("args.sh", "cat > /dev/null\necho \"$@\"\n");
    AgentSettings settings = dir_.settings_for(script);
    settings.api_key = "secret-key";
    AgentSupervisor supervisor(settings);

    AgentExecutionResult result = supervisor.execute(request("x"));

    ASSERT_TRUE(result.success);
    EXPECT_NE(result.raw_output.find("--print --output-format stream-json"), std::string::npos);
    EXPECT_NE(result.raw_output.find("--model grok-code-fast-1"), std::string::npos);
    EXPECT_NE(result.raw_output.find("--workspace " + dir_.path()), std::string::npos);
    EXPECT_NE(result.raw_output.find("--api-key secret-key"), std::string::npos);
}

TEST_F(AgentSupervisorTest, StreamingEmptyPromptFailsImmediately) {
    AgentSupervisor supervisor(dir_.settings_for(dir_.write_script("ok.sh", "exit 0\n")));

    auto stream = supervisor.execute_streaming(request(""));
    std::string line;

    EXPECT_EQ(stream->next(line, 100), ILineStream::Status::FAILED);
    EXPECT_EQ(stream->error(), "Prompt must not be empty");
}
