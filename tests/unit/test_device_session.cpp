/**
 * @file test_device_session.cpp
 * @brief Unit tests for DeviceSession against a scripted device
 */

#include <gtest/gtest.h>
#include <freeprobe/core/device_session.hpp>
#include <freeprobe/core/errors.hpp>
#include <freeprobe/utils/hmac.hpp>

#include "common/fake_freebox.hpp"

#include <algorithm>

using namespace freeprobe;
using namespace freeprobe::core;
using freeprobe::testing::FakeFreebox;
using freeprobe::testing::MockHttpClient;
using ::testing::NiceMock;

class DeviceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake_.attach(http_);
        config_.poll_interval_ms = 2000;
        config_.poll_limit = 5;
    }

    DeviceSession makeSession(const CancelToken* cancel = nullptr) {
        return DeviceSession(freeprobe::testing::fakeDevice(), http_, config_,
                             [this](std::chrono::milliseconds d) { sleeps_.push_back(d); },
                             cancel);
    }

    static std::string headerValue(const net::HttpRequest& request, const std::string& name) {
        for (const auto& header : request.headers) {
            if (header.first == name) {
                return header.second;
            }
        }
        return std::string();
    }

    NiceMock<MockHttpClient> http_;
    FakeFreebox fake_;
    SessionConfig config_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(DeviceSessionTest, AppIdIsDerivedFromName) {
    EXPECT_EQ(DeviceSession::makeAppId("FreeProbe"), "fr.freebox.freeprobe");
}

TEST_F(DeviceSessionTest, BaseUrlFollowsDescriptor) {
    DeviceSession session = makeSession();
    EXPECT_EQ(session.baseUrl(), freeprobe::testing::FAKE_BASE_URL);
    EXPECT_EQ(session.config().device_name, "freeprobe");
}

TEST_F(DeviceSessionTest, RegistrationGrantedAfterThreePolls) {
    fake_.grantAfterPolls = 3;
    DeviceSession session = makeSession();

    Registration registration = session.registerApp();

    EXPECT_EQ(registration.appToken, fake_.appToken);
    EXPECT_EQ(registration.trackId, 42);
    EXPECT_EQ(session.registrationState(), RegistrationState::GRANTED);
    EXPECT_EQ(fake_.authorizeCalls, 1);
    EXPECT_EQ(fake_.pollCalls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));
}

TEST_F(DeviceSessionTest, RegistrationRequestCarriesIdentity) {
    DeviceSession session = makeSession();
    session.registerApp();

    ASSERT_FALSE(fake_.requests.empty());
    const net::HttpRequest& request = fake_.requests.front();
    EXPECT_EQ(request.method, "POST");
    EXPECT_NE(request.body.find("\"app_id\":\"fr.freebox.freeprobe\""), std::string::npos);
    EXPECT_NE(request.body.find("\"device_name\":\"freeprobe\""), std::string::npos);
    EXPECT_EQ(headerValue(request, "Content-Type"), "application/json");
}

TEST_F(DeviceSessionTest, PendingUntilLimitTimesOut) {
    fake_.grantAfterPolls = 1000;
    DeviceSession session = makeSession();

    try {
        session.registerApp();
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_STREQ(e.what(), "approval timed out");
        EXPECT_EQ(e.status(), "pending");
    }
    EXPECT_EQ(fake_.pollCalls, 5);
    EXPECT_EQ(sleeps_.size(), 4u);
    EXPECT_EQ(session.registrationState(), RegistrationState::TIMED_OUT);
}

TEST_F(DeviceSessionTest, DeniedStopsPolling) {
    fake_.grantAfterPolls = 2;
    fake_.terminalStatus = "denied";
    DeviceSession session = makeSession();

    try {
        session.registerApp();
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.status(), "denied");
    }
    EXPECT_EQ(fake_.pollCalls, 2);
    EXPECT_EQ(session.registrationState(), RegistrationState::DENIED);
}

TEST_F(DeviceSessionTest, DeviceSideTimeoutIsTerminal) {
    fake_.terminalStatus = "timeout";
    DeviceSession session = makeSession();

    try {
        session.registerApp();
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.status(), "timeout");
    }
    EXPECT_EQ(fake_.pollCalls, 1);
}

TEST_F(DeviceSessionTest, CancelStopsBeforeNextPoll) {
    fake_.grantAfterPolls = 1000;
    CancelToken cancel;
    DeviceSession session(freeprobe::testing::fakeDevice(), http_, config_,
                          [&cancel](std::chrono::milliseconds) { cancel.cancel(); }, &cancel);

    try {
        session.registerApp();
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_STREQ(e.what(), "registration cancelled");
    }
    EXPECT_EQ(fake_.pollCalls, 1);
}

TEST_F(DeviceSessionTest, OpenSessionSendsHmacPassword) {
    DeviceSession session = makeSession();
    std::string token = session.openSession(fake_.appToken);

    EXPECT_EQ(token, "session-token-1");
    EXPECT_TRUE(session.hasSession());
    EXPECT_EQ(fake_.challengeCalls, 1);
    EXPECT_EQ(fake_.sessionCalls, 1);

    const net::HttpRequest& post = fake_.requests.back();
    EXPECT_EQ(post.method, "POST");
    std::string expected = utils::hmacSha1Hex(fake_.appToken, fake_.challenge);
    EXPECT_NE(post.body.find("\"password\":\"" + expected + "\""), std::string::npos);

    auto permissions = session.permissions();
    EXPECT_TRUE(permissions["explorer"]);
    EXPECT_FALSE(permissions["settings"]);
}

TEST_F(DeviceSessionTest, RequestsArePinnedToDiscoveredAddress) {
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    for (const auto& request : fake_.requests) {
        ASSERT_EQ(request.resolve.size(), 1u);
        EXPECT_EQ(request.resolve[0], "abcd1234.fbxos.fr:443:192.168.1.254");
    }
}

TEST_F(DeviceSessionTest, RevokedTokenIsRejected) {
    fake_.rejectSession = true;
    DeviceSession session = makeSession();

    try {
        session.openSession(fake_.appToken);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.status(), "invalid_token");
    }
    EXPECT_FALSE(session.hasSession());
}

TEST_F(DeviceSessionTest, WrongTokenIsRejected) {
    DeviceSession session = makeSession();
    EXPECT_THROW(session.openSession("not-the-token"), AuthError);
    EXPECT_THROW(session.openSession(""), AuthError);
}

TEST_F(DeviceSessionTest, AuthenticatedGetSendsSessionHeader) {
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    std::string body = session.authenticatedGet("/connection/");
    EXPECT_NE(body.find("rate_down"), std::string::npos);
    EXPECT_EQ(headerValue(fake_.requests.back(), SESSION_HEADER), "session-token-1");
}

TEST_F(DeviceSessionTest, ExpiredSessionIsRefreshedOnce) {
    fake_.expireSessionAfterCalls = 0;
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    std::string body = session.authenticatedGet("/connection/");

    EXPECT_NE(body.find("rate_down"), std::string::npos);
    EXPECT_EQ(fake_.sessionCalls, 2);
    EXPECT_EQ(fake_.counterCalls, 2);
    EXPECT_EQ(session.sessionToken(), "session-token-2");
}

TEST_F(DeviceSessionTest, FailedRefreshRaisesAuthError) {
    fake_.expireSessionAfterCalls = 0;
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);
    fake_.rejectSession = true;

    EXPECT_THROW(session.authenticatedGet("/connection/"), AuthError);
    EXPECT_FALSE(session.hasSession());
}

TEST_F(DeviceSessionTest, SecondRejectionAfterRefreshRaisesAuthError) {
    fake_.sessionAlwaysInvalid = true;
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    try {
        session.authenticatedGet("/connection/");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.status(), "invalid_session");
    }
    EXPECT_EQ(fake_.counterCalls, 2);
    EXPECT_EQ(fake_.sessionCalls, 2);
    EXPECT_FALSE(session.hasSession());
}

TEST_F(DeviceSessionTest, WithoutSessionRaisesAuthError) {
    DeviceSession session = makeSession();
    EXPECT_THROW(session.authenticatedGet("/connection/"), AuthError);
    EXPECT_TRUE(fake_.requests.empty());
}

TEST_F(DeviceSessionTest, UnknownEndpointIsCollectError) {
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);
    EXPECT_THROW(session.authenticatedGet("/connection/ftth/"), CollectError);
    EXPECT_TRUE(session.hasSession());
}

TEST_F(DeviceSessionTest, TransportFailureIsCollectError) {
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    ON_CALL(http_, perform(::testing::_))
        .WillByDefault(::testing::Return(freeprobe::testing::transportFailure()));
    EXPECT_THROW(session.authenticatedGet("/connection/"), CollectError);
}

TEST_F(DeviceSessionTest, CloseSessionLogsOut) {
    DeviceSession session = makeSession();
    session.openSession(fake_.appToken);

    EXPECT_TRUE(session.closeSession());
    EXPECT_EQ(fake_.logoutCalls, 1);
    EXPECT_FALSE(session.hasSession());

    // Nothing left to close
    EXPECT_TRUE(session.closeSession());
    EXPECT_EQ(fake_.logoutCalls, 1);
}
