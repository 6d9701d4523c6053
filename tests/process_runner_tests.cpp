#include <gtest/gtest.h>
#include "include/command_runner.hpp"

#include <chrono>

using namespace netcheck;
using namespace std::chrono_literals;

TEST(ProcessRunnerTests, Smoke_Success)
{
    ProcessRunner runner;
    auto result = runner.run("echo", {"-n", "ok"}, 5s);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->stdout_text, "ok");
    EXPECT_EQ(result->exit_code, 0);
}

TEST(ProcessRunnerTests, NonZeroExitIsNotAnError)
{
    ProcessRunner runner;
    auto result = runner.run("sh", {"-c", "exit 2"}, 5s);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exit_code, 2);
}

TEST(ProcessRunnerTests, MissingCommandIsNotFound)
{
    ProcessRunner runner;
    auto result = runner.run("netcheck-definitely-not-a-command", {}, 5s);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ProbeErrorKind::NotFound);
    EXPECT_NE(result.error().message.find("not found"), std::string::npos);
}

TEST(ProcessRunnerTests, SlowCommandTimesOut)
{
    ProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run("sleep", {"10"}, 1s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ProbeErrorKind::Timeout);
    EXPECT_EQ(result.error().message, "'sleep' timed out after 1 seconds");
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunnerTests, CancelledRunIsUnknown)
{
    ProcessRunner runner;
    std::stop_source source;
    source.request_stop();

    auto result = runner.run("sleep", {"10"}, 5s, source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ProbeErrorKind::Unknown);
}

TEST(ProbeOutcomeTests, KindNames)
{
    EXPECT_EQ(kind_name(ProbeErrorKind::Timeout), "timeout");
    EXPECT_EQ(kind_name(ProbeErrorKind::NotFound), "not found");
    EXPECT_EQ(kind_name(ProbeErrorKind::ResolutionError), "resolution error");
    EXPECT_EQ(kind_name(ProbeErrorKind::Unknown), "unknown");
}
