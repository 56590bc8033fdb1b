#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "session/session_token_manager.hpp"
#include "test_utils.hpp"

using namespace dbridge::session;
using dbridge::http::HttpRequest;
using dbridge::http::HttpResponse;
using dbridge::http::Method;
using dbridge::http::TransportError;
using dbridge::test::FakeClock;
using dbridge::test::MockHttpTransport;
using dbridge::test::json_response;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class SessionTokenManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockHttpTransport>> transport = std::make_shared<NiceMock<MockHttpTransport>>();
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    SessionTokenManager manager{transport, clock};

    void expect_login(const std::string& body, unsigned status = 200) {
        EXPECT_CALL(*transport, send(_)).WillOnce(Return(json_response(status, body)));
    }

    void login_with_default_token() {
        expect_login(R"({"access_token": "abc123", "expires_in": 3600})");
        manager.authenticate("user@example.com", "myPassword123");
    }
};

//==============================================
// AUTHENTICATION
//==============================================

TEST_F(SessionTokenManagerTest, AuthenticateCachesTokenAndExpiry) {
    auto start = clock->now();
    expect_login(R"({"access_token": "abc123", "expires_in": 3600})");

    AuthResult result = manager.authenticate("user@example.com", "myPassword123");
    EXPECT_EQ(result.access_token, "abc123");
    EXPECT_EQ(result.expires_in, 3600);
    EXPECT_EQ(result.expires_at, start + std::chrono::seconds(3600));

    auto token = manager.snapshot();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->token, "abc123");
    EXPECT_EQ(token->expires_at, start + std::chrono::seconds(3600));
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::OK);
    EXPECT_FALSE(manager.needs_refresh());
    EXPECT_EQ(manager.state(), SessionState::State::AUTHENTICATED);
}

TEST_F(SessionTokenManagerTest, LoginRequestShape) {
    HttpRequest sent;
    EXPECT_CALL(*transport, send(_))
        .WillOnce(DoAll(SaveArg<0>(&sent), Return(json_response(200, R"({"access_token": "t"})"))));

    manager.authenticate("user@example.com", "myPassword123");

    EXPECT_EQ(sent.method, Method::POST);
    EXPECT_EQ(sent.target, SessionTokenManager::DEFAULT_LOGIN_TARGET);
    EXPECT_EQ(sent.headers["Content-Type"], "application/json");
    EXPECT_EQ(sent.headers["User-Agent"], dbridge::http::USER_AGENT);

    auto body = nlohmann::json::parse(sent.body);
    EXPECT_EQ(body["username"], "user@example.com");
    EXPECT_EQ(body["password"], "myPassword123");
    EXPECT_EQ(body["remember_me"], true);
}

TEST_F(SessionTokenManagerTest, MissingExpiresInDefaultsToOneHour) {
    auto start = clock->now();
    expect_login(R"({"access_token": "abc123"})");

    AuthResult result = manager.authenticate("user", "pass");
    EXPECT_EQ(result.expires_in, SessionTokenManager::DEFAULT_EXPIRES_IN);
    EXPECT_EQ(result.expires_at, start + std::chrono::seconds(3600));
}

TEST_F(SessionTokenManagerTest, BlankCredentialsAreRejectedWithoutRequest) {
    EXPECT_CALL(*transport, send(_)).Times(0);

    EXPECT_THROW(manager.authenticate("", "pass"), std::invalid_argument);
    EXPECT_THROW(manager.authenticate("user", "   "), std::invalid_argument);
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
}

TEST_F(SessionTokenManagerTest, RejectedCredentialsRaiseAuthError) {
    expect_login(R"({"error": "invalid credentials"})", 401);

    EXPECT_THROW(manager.authenticate("user", "wrong"), AuthError);
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
}

TEST_F(SessionTokenManagerTest, TransportFailureRaisesAuthError) {
    EXPECT_CALL(*transport, send(_)).WillOnce(Throw(TransportError("connection refused")));

    EXPECT_THROW(manager.authenticate("user", "pass"), AuthError);
}

TEST_F(SessionTokenManagerTest, MalformedResponsesRaiseAuthError) {
    const std::vector<std::string> bodies = {
        "not json",
        R"(["abc123"])",
        R"({})",
        R"({"access_token": ""})",
        R"({"access_token": 42})",
        R"({"access_token": "abc123", "expires_in": "soon"})",
        R"({"access_token": "abc123", "expires_in": 1.5})"
    };

    for (const auto& body : bodies) {
        expect_login(body);
        EXPECT_THROW(manager.authenticate("user", "pass"), AuthError) << "body: " << body;
    }
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
}

TEST_F(SessionTokenManagerTest, OutOfRangeExpiresInRaisesAuthError) {
    const std::vector<std::string> bodies = {
        R"({"access_token": "abc123", "expires_in": -5})",
        R"({"access_token": "abc123", "expires_in": 0})",
        R"({"access_token": "abc123", "expires_in": 10000000000})",
        R"({"access_token": "abc123", "expires_in": 18446744073709551615})"
    };

    for (const auto& body : bodies) {
        expect_login(body);
        EXPECT_THROW(manager.authenticate("user", "pass"), AuthError) << "body: " << body;
    }
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
}

TEST_F(SessionTokenManagerTest, LongestAcceptedLifetime) {
    auto start = clock->now();
    expect_login(R"({"access_token": "abc123", "expires_in": 31536000})");

    AuthResult result = manager.authenticate("user", "pass");
    EXPECT_EQ(result.expires_at, start + std::chrono::seconds(SessionTokenManager::MAX_EXPIRES_IN));
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::OK);
}

TEST_F(SessionTokenManagerTest, FailedReauthenticationKeepsPreviousToken) {
    login_with_default_token();
    expect_login("", 500);

    EXPECT_THROW(manager.authenticate("user", "pass"), AuthError);
    ASSERT_TRUE(manager.snapshot().has_value());
    EXPECT_EQ(manager.snapshot()->token, "abc123");
}

TEST_F(SessionTokenManagerTest, ReportsAuthenticatingWhileRequestInFlight) {
    SessionState::State observed = SessionState::State::UNAUTHENTICATED;
    EXPECT_CALL(*transport, send(_)).WillOnce(Invoke([&](const HttpRequest&) {
        observed = manager.state();
        return json_response(200, R"({"access_token": "abc123"})");
    }));

    manager.authenticate("user", "pass");
    EXPECT_EQ(observed, SessionState::State::AUTHENTICATING);
    EXPECT_EQ(manager.state(), SessionState::State::AUTHENTICATED);
}

//==============================================
// EXPIRY AND REFRESH
//==============================================

TEST_F(SessionTokenManagerTest, NeedsRefreshWithoutToken) {
    EXPECT_TRUE(manager.needs_refresh());
}

TEST_F(SessionTokenManagerTest, NeedsRefreshInsideThreshold) {
    login_with_default_token();

    clock->advance(std::chrono::seconds(3299));   // 301 s left
    EXPECT_FALSE(manager.needs_refresh());

    clock->advance(std::chrono::seconds(1));      // 300 s left
    EXPECT_TRUE(manager.needs_refresh());

    clock->advance(std::chrono::seconds(50));     // 250 s left
    EXPECT_TRUE(manager.needs_refresh());
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::OK);
}

TEST_F(SessionTokenManagerTest, TokenExpiresAtDeadline) {
    login_with_default_token();

    clock->advance(std::chrono::seconds(3599));
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::OK);

    clock->advance(std::chrono::seconds(1));
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::TOKEN_EXPIRED);
}

TEST_F(SessionTokenManagerTest, ExpiredTokenFailsValidation) {
    login_with_default_token();
    clock->advance(std::chrono::seconds(3601));

    EXPECT_EQ(manager.check_authenticated(), AuthStatus::TOKEN_EXPIRED);
    EXPECT_EQ(manager.state(), SessionState::State::EXPIRED);
    EXPECT_THROW(manager.validate_authenticated(), TokenExpiredError);
    EXPECT_THROW(manager.require_token(), TokenExpiredError);
}

TEST_F(SessionTokenManagerTest, ValidationWithoutLoginFails) {
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
    EXPECT_EQ(manager.state(), SessionState::State::UNAUTHENTICATED);
    EXPECT_THROW(manager.validate_authenticated(), NotAuthenticatedError);
}

TEST_F(SessionTokenManagerTest, RequireTokenReturnsCachedPair) {
    login_with_default_token();

    SessionToken token = manager.require_token();
    EXPECT_EQ(token.token, "abc123");
    EXPECT_EQ(token.expires_at, manager.snapshot()->expires_at);
}

TEST_F(SessionTokenManagerTest, RefreshSkippedWhileTokenFresh) {
    login_with_default_token();
    EXPECT_CALL(*transport, send(_)).Times(0);

    EXPECT_FALSE(manager.refresh_if_needed("user", "pass"));
}

TEST_F(SessionTokenManagerTest, RefreshReauthenticatesNearExpiry) {
    login_with_default_token();
    clock->advance(std::chrono::seconds(3400));
    expect_login(R"({"access_token": "def456", "expires_in": 3600})");

    EXPECT_TRUE(manager.refresh_if_needed("user", "pass"));
    EXPECT_EQ(manager.require_token().token, "def456");
    EXPECT_FALSE(manager.needs_refresh());
}

TEST_F(SessionTokenManagerTest, ClearDropsToken) {
    login_with_default_token();
    manager.clear();

    EXPECT_FALSE(manager.snapshot().has_value());
    EXPECT_EQ(manager.check_authenticated(), AuthStatus::NOT_AUTHENTICATED);
    EXPECT_EQ(manager.state(), SessionState::State::UNAUTHENTICATED);
}

TEST(SessionTokenManagerConstructionTest, RequiresTransportAndClock) {
    auto transport = std::make_shared<NiceMock<MockHttpTransport>>();
    EXPECT_THROW(SessionTokenManager(nullptr), std::invalid_argument);
    EXPECT_THROW(SessionTokenManager(transport, nullptr), std::invalid_argument);
}

//==============================================
// CONCURRENCY
//==============================================

// Each login for "user-N" answers with token "tok-N" valid for 1000 + N
// seconds, so a reader can tell whether a snapshot mixes two logins
TEST_F(SessionTokenManagerTest, ConcurrentLoginsNeverExposeMixedPair) {
    ON_CALL(*transport, send(_)).WillByDefault(Invoke([](const HttpRequest& request) {
        auto body = nlohmann::json::parse(request.body);
        std::string user = body["username"].get<std::string>();
        std::string n = user.substr(user.find('-') + 1);
        nlohmann::json response = {{"access_token", "tok-" + n}, {"expires_in", 1000 + std::stoi(n)}};
        return json_response(200, response.dump());
    }));

    const auto start = clock->now();
    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                auto token = manager.snapshot();
                if (!token) {
                    continue;
                }
                int n = std::stoi(token->token.substr(4));
                if (token->expires_at != start + std::chrono::seconds(1000 + n)) {
                    ++mismatches;
                }
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 8; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < 25; ++i) {
                manager.authenticate("user-" + std::to_string(w * 100 + i), "pass");
            }
        });
    }

    for (auto& writer : writers) {
        writer.join();
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    auto token = manager.require_token();
    EXPECT_EQ(token.token.rfind("tok-", 0), 0u);
}
