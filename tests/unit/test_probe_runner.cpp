/**
 * @file test_probe_runner.cpp
 * @brief Unit tests for ProbeRunner's cycle and error policy
 */

#include <gtest/gtest.h>
#include <freeprobe/core/credential_store.hpp>
#include <freeprobe/core/errors.hpp>
#include <freeprobe/core/probe_runner.hpp>

#include "common/fake_freebox.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>

using namespace freeprobe;
using namespace freeprobe::core;
using freeprobe::testing::FakeFreebox;
using freeprobe::testing::MockHttpClient;
using ::testing::NiceMock;

namespace {

/// Discovery that answers with a fixed device, or fails.
class StaticDiscovery : public DeviceDiscovery {
public:
    std::string uid = "0123456789abcdef";
    bool present = true;
    int calls = 0;

    DeviceDescriptor discover(const std::string& serviceType,
                              std::chrono::milliseconds timeout) override {
        ++calls;
        lastServiceType = serviceType;
        lastTimeout = timeout;
        if (!present) {
            throw NotFoundError("No " + serviceType + " device answered within " +
                                std::to_string(timeout.count()) + " ms");
        }
        return freeprobe::testing::fakeDevice(uid);
    }

    std::string lastServiceType;
    std::chrono::milliseconds lastTimeout{0};
};

size_t lineCount(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if (c == '\n') {
            ++n;
        }
    }
    return n;
}

}  // namespace

class ProbeRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/freeprobe_runner_XXXXXX";
        ASSERT_NE(::mkdtemp(tmpl), nullptr);
        root_ = tmpl;
        store_.reset(new CredentialStore(root_ + "/ssl"));

        fake_.attach(http_);
        config_.session.poll_interval_ms = 1;
        config_.session.poll_limit = 5;
        config_.endpoints = {{"/connection/", "wan"}, {"/system/", "system"}};
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    int run(bool registerApp, bool dryRun) {
        ProbeRunner runner(config_, discovery_, http_, *store_, out_, err_,
                           [](std::chrono::milliseconds) {});
        RunOptions options;
        options.register_app = registerApp;
        options.dry_run = dryRun;
        options.discovery_timeout = std::chrono::milliseconds(500);
        return runner.run(options);
    }

    void storeToken(const std::string& deviceUid = "0123456789abcdef") {
        Credential credential;
        credential.appId = "fr.freebox.freeprobe";
        credential.appToken = fake_.appToken;
        credential.trackId = fake_.trackId;
        credential.deviceUid = deviceUid;
        store_->save(credential);
    }

    std::string root_;
    std::unique_ptr<CredentialStore> store_;
    NiceMock<MockHttpClient> http_;
    FakeFreebox fake_;
    StaticDiscovery discovery_;
    RunnerConfig config_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(ProbeRunnerTest, RegisterStoresToken) {
    fake_.grantAfterPolls = 2;

    EXPECT_EQ(run(true, false), 0);

    EXPECT_TRUE(store_->exists("fr.freebox.freeprobe"));
    Credential stored = store_->load("fr.freebox.freeprobe");
    EXPECT_EQ(stored.appToken, fake_.appToken);
    EXPECT_EQ(stored.deviceUid, "0123456789abcdef");
    EXPECT_NE(out_.str().find("confirm"), std::string::npos);
    EXPECT_NE(out_.str().find(store_->pathFor("fr.freebox.freeprobe")), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
    EXPECT_EQ(fake_.sessionCalls, 0);
}

TEST_F(ProbeRunnerTest, DeniedRegistrationStoresNothing) {
    fake_.terminalStatus = "denied";

    EXPECT_EQ(run(true, false), 1);
    EXPECT_FALSE(store_->exists("fr.freebox.freeprobe"));
    EXPECT_EQ(lineCount(err_.str()), 1u);
    EXPECT_NE(err_.str().find("denied"), std::string::npos);
}

TEST_F(ProbeRunnerTest, DryRunPrintsCounters) {
    storeToken();

    EXPECT_EQ(run(false, true), 0);

    EXPECT_NE(out_.str().find("freebox_wan_rate_down 12345\n"), std::string::npos);
    EXPECT_NE(out_.str().find("freebox_wan_rate_up 678\n"), std::string::npos);
    EXPECT_TRUE(fake_.gatewayPushes.empty());
    EXPECT_EQ(fake_.logoutCalls, 1);
    EXPECT_EQ(discovery_.lastServiceType, FBX_API_SERVICE_TYPE);
    EXPECT_EQ(discovery_.lastTimeout, std::chrono::milliseconds(500));
}

TEST_F(ProbeRunnerTest, LiveRunPushesToGateway) {
    storeToken();

    EXPECT_EQ(run(false, false), 0);

    ASSERT_EQ(fake_.gatewayPushes.size(), 1u);
    const net::HttpRequest& push = fake_.gatewayPushes[0];
    EXPECT_EQ(push.method, "PUT");
    EXPECT_EQ(push.url, "http://prometheus.catsnet.home:9091/metrics/job/freeprobe");
    EXPECT_NE(push.body.find("freebox_wan_rate_down 12345"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ProbeRunnerTest, MissingTokenFailsWithOneLine) {
    EXPECT_EQ(run(false, false), 1);

    EXPECT_EQ(lineCount(err_.str()), 1u);
    EXPECT_EQ(err_.str().rfind("freeprobe: ", 0), 0u);
    EXPECT_NE(err_.str().find("--register"), std::string::npos);
    EXPECT_EQ(fake_.challengeCalls, 0);
}

TEST_F(ProbeRunnerTest, NoDeviceFailsWithOneLine) {
    discovery_.present = false;

    EXPECT_EQ(run(false, true), 1);
    EXPECT_EQ(lineCount(err_.str()), 1u);
    EXPECT_TRUE(fake_.requests.empty());
}

TEST_F(ProbeRunnerTest, TokenOfAnotherDeviceIsRefused) {
    storeToken("ffffffffffffffff");

    EXPECT_EQ(run(false, true), 1);
    EXPECT_NE(err_.str().find("ffffffffffffffff"), std::string::npos);
    EXPECT_EQ(fake_.sessionCalls, 0);
}

TEST_F(ProbeRunnerTest, RevokedTokenFails) {
    storeToken();
    fake_.rejectSession = true;

    EXPECT_EQ(run(false, true), 1);
    EXPECT_EQ(lineCount(err_.str()), 1u);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ProbeRunnerTest, PartialFailureStillPublishes) {
    storeToken();

    // /system/ is unknown to the fake device
    EXPECT_EQ(run(false, true), 0);
    EXPECT_NE(out_.str().find("freebox_wan_rate_down"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ProbeRunnerTest, AllEndpointsFailing) {
    storeToken();
    fake_.counters.clear();

    EXPECT_EQ(run(false, true), 1);
    EXPECT_NE(err_.str().find("All 2 counter endpoints failed"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(fake_.logoutCalls, 1);
}

TEST_F(ProbeRunnerTest, GatewayRejectionFails) {
    storeToken();
    fake_.gatewayStatus = 400;

    EXPECT_EQ(run(false, false), 1);
    EXPECT_NE(err_.str().find("HTTP 400"), std::string::npos);
    EXPECT_EQ(fake_.logoutCalls, 1);
}
