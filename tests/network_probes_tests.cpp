#include <gtest/gtest.h>
#include "include/network_probes.hpp"
#include "include/logging.hpp"
#include "test_fakes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

using namespace netcheck;
using namespace netcheck::testing;
using namespace std::chrono_literals;

namespace {

// Stands in for a ping that never answers.
class HangingPingPlatform : public PosixPlatform {
public:
    std::string ping_command() const override { return "sleep"; }
    std::vector<std::string> ping_arguments(const std::string&, int) const override
    {
        return {"10"};
    }
};

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}

TEST(GatewayLocatorTests, Smoke_PosixRouteOutput)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign("ip", exited(0, "default via 10.0.0.1 dev eth0\n"));
    PosixPlatform platform;
    CapturedLog log;
    GatewayLocator locator(runner, platform, log.logger);

    EXPECT_EQ(locator.discover(5s), "10.0.0.1");
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"route"}));
    EXPECT_EQ(runner.calls[0].timeout, 5s);
    EXPECT_NE(log.text().find("Found default gateway: 10.0.0.1"), std::string::npos);
}

TEST(GatewayLocatorTests, WindowsIpconfigOutput)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign(
        "ipconfig", exited(0, "   Default Gateway . . . . . . . . . : 192.168.1.1\r\n"));
    WindowsPlatform platform;
    GatewayLocator locator(runner, platform, core::null_logger());

    EXPECT_EQ(locator.discover(5s), "192.168.1.1");
    EXPECT_EQ(runner.count_calls("ipconfig"), 1u);
}

TEST(GatewayLocatorTests, CommandFailureGivesNothing)
{
    FakeCommandRunner runner;
    PosixPlatform platform;
    CapturedLog log;
    GatewayLocator locator(runner, platform, log.logger);

    EXPECT_FALSE(locator.discover(5s).has_value());
    EXPECT_NE(log.text().find("error"), std::string::npos);
}

TEST(GatewayLocatorTests, NonZeroExitStillParsed)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign("ip", exited(1, "default via 10.9.9.9 dev eth0\n"));
    PosixPlatform platform;
    GatewayLocator locator(runner, platform, core::null_logger());

    EXPECT_EQ(locator.discover(5s), "10.9.9.9");
}

TEST(GatewayLocatorTests, UnparseableOutput)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign("ip", exited(0, "garbage\nmore garbage\n"));
    PosixPlatform platform;
    GatewayLocator locator(runner, platform, core::null_logger());

    EXPECT_FALSE(locator.discover(5s).has_value());
}

TEST(PingProbeTests, Smoke_SuccessReturnsOutput)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign("ping", exited(0, "1 packets transmitted, 1 received\n"));
    PosixPlatform platform;
    PingProbe probe(runner, platform, core::null_logger());

    bool reachable = false;
    auto text = probe.ping("10.0.0.1", 2, 5s, {}, &reachable);
    EXPECT_TRUE(reachable);
    EXPECT_EQ(text, "1 packets transmitted, 1 received\n");
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"-c", "2", "10.0.0.1"}));
}

TEST(PingProbeTests, NonZeroExit)
{
    FakeCommandRunner runner;
    runner.responses.insert_or_assign("ping", exited(1));
    PosixPlatform platform;
    PingProbe probe(runner, platform, core::null_logger());

    bool reachable = true;
    EXPECT_EQ(probe.ping("10.0.0.1", 1, 5s, {}, &reachable), "Ping failed (return code: 1)");
    EXPECT_FALSE(reachable);
}

TEST(PingProbeTests, ErrorKindsMapToMessages)
{
    FakeCommandRunner runner;
    PosixPlatform platform;
    PingProbe probe(runner, platform, core::null_logger());

    runner.responses.insert_or_assign(
        "ping", probe_failure(ProbeErrorKind::Timeout, "'ping' timed out after 3 seconds"));
    EXPECT_EQ(probe.ping("10.0.0.1", 1, 3s), "Ping timeout after 3 seconds");

    runner.responses.insert_or_assign(
        "ping", probe_failure(ProbeErrorKind::NotFound, "'ping' command not found"));
    EXPECT_EQ(probe.ping("10.0.0.1", 1, 3s), "Ping command not found");

    runner.responses.insert_or_assign("ping",
                                      probe_failure(ProbeErrorKind::Unknown, "fork failed"));
    EXPECT_EQ(probe.ping("10.0.0.1", 1, 3s), "Ping error: fork failed");
}

TEST(PingProbeTests, OptionLikeHostRejected)
{
    FakeCommandRunner runner;
    PosixPlatform platform;
    PingProbe probe(runner, platform, core::null_logger());

    EXPECT_EQ(probe.ping("-f", 1, 5s), "Ping error: invalid host '-f'");
    EXPECT_EQ(probe.ping("", 1, 5s), "Ping error: invalid host ''");
    EXPECT_TRUE(runner.calls.empty());
}

TEST(PingProbeTests, HangingPingTimesOutAndIsKilled)
{
    ProcessRunner runner;
    HangingPingPlatform platform;
    PingProbe probe(runner, platform, core::null_logger());

    auto start = std::chrono::steady_clock::now();
    auto text = probe.ping("10.0.0.1", 1, 1s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_NE(lowercase(text).find("timeout"), std::string::npos) << text;
    EXPECT_LT(elapsed, 5s);
}
