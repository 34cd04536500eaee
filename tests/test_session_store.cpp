// Tests for pairing tokens, session expiry and session persistence.
#include "sync/session_store.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>

using namespace std::chrono_literals;

namespace {

std::chrono::milliseconds const pairingTimeout = 5min;
std::chrono::milliseconds const sessionLifetime = 30 * 24h;

class SessionFileTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        path = ::testing::TempDir() + "playsyncd_sessions_"
             + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
        std::remove(path.c_str());
    }
    void TearDown() override {
        std::remove(path.c_str());
        std::remove((path + ".tmp").c_str());
    }
};

}  // namespace

TEST(SessionStoreTest, TokensAreUniqueHex) {
    std::set<std::string> tokens;
    for (int i = 0; i < 100; ++i) {
        std::string token = SessionStore::generateToken();
        EXPECT_EQ(token.size(), 32u);
        EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
        tokens.insert(token);
    }
    EXPECT_EQ(tokens.size(), 100u);
}

TEST(SessionStoreTest, PairingTokenConfirmsOnce) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    SessionStore store("", pairingTimeout, sessionLifetime, t0);

    std::string token = store.issuePairingToken(t0);
    EXPECT_FALSE(store.isAuthorized(token, t0));

    EXPECT_TRUE(store.confirm(token, t0 + 10s));
    EXPECT_TRUE(store.isAuthorized(token, t0 + 10s));
    EXPECT_FALSE(store.confirm(token, t0 + 20s));
    EXPECT_EQ(store.sessionCount(), 1u);
}

TEST(SessionStoreTest, PairingTokenExpiresAfterFiveMinutes) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    SessionStore store("", pairingTimeout, sessionLifetime, t0);

    std::string late = store.issuePairingToken(t0);
    std::string onTime = store.issuePairingToken(t0);

    EXPECT_TRUE(store.confirm(onTime, t0 + 4min + 59s));
    EXPECT_FALSE(store.confirm(late, t0 + 5min + 1ms));
    EXPECT_FALSE(store.isAuthorized(late, t0 + 5min + 1ms));
}

TEST(SessionStoreTest, UnknownTokensAreRejected) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    SessionStore store("", pairingTimeout, sessionLifetime, t0);

    EXPECT_FALSE(store.confirm("deadbeef", t0));
    EXPECT_FALSE(store.isAuthorized("deadbeef", t0));
    EXPECT_FALSE(store.isAuthorized("", t0));
}

TEST(SessionStoreTest, SessionExpiresAfterLifetime) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    SessionStore store("", pairingTimeout, sessionLifetime, t0);
    std::string token = store.issuePairingToken(t0);
    ASSERT_TRUE(store.confirm(token, t0));

    EXPECT_TRUE(store.isAuthorized(token, t0 + 30 * 24h));
    EXPECT_FALSE(store.isAuthorized(token, t0 + 30 * 24h + 1ms));
    EXPECT_EQ(store.sessionCount(), 0u);
}

TEST_F(SessionFileTest, SessionsSurviveRestart) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    std::string token;
    {
        SessionStore store(path, pairingTimeout, sessionLifetime, t0);
        token = store.issuePairingToken(t0);
        ASSERT_TRUE(store.confirm(token, t0));
    }

    std::ifstream file(path);
    ASSERT_TRUE(file.good());
    nlohmann::json document = nlohmann::json::parse(file);
    ASSERT_EQ(document["sessions"].size(), 1u);
    EXPECT_EQ(document["sessions"][0]["token"], token);
    EXPECT_EQ(document["sessions"][0]["issuedAtMs"], 1'000'000);

    SessionStore restarted(path, pairingTimeout, sessionLifetime, t0 + 1h);
    EXPECT_TRUE(restarted.isAuthorized(token, t0 + 1h));
}

TEST_F(SessionFileTest, LazyPurgeRewritesSessionFile) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    SessionStore store(path, pairingTimeout, sessionLifetime, t0);
    std::string token = store.issuePairingToken(t0);
    ASSERT_TRUE(store.confirm(token, t0));

    EXPECT_FALSE(store.isAuthorized(token, t0 + 30 * 24h + 1ms));

    std::ifstream file(path);
    ASSERT_TRUE(file.good());
    nlohmann::json document = nlohmann::json::parse(file);
    ASSERT_TRUE(document["sessions"].is_array());
    EXPECT_TRUE(document["sessions"].empty());
}

TEST_F(SessionFileTest, ExpiredSessionsAreDroppedOnLoad) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    {
        std::ofstream file(path);
        file << nlohmann::json{{"sessions", {
            {{"token", "old"}, {"issuedAtMs", 1'000'000}},
            {{"token", "new"}, {"issuedAtMs", toMillis(t0 + 29 * 24h)}}
        }}}.dump();
    }

    SessionStore store(path, pairingTimeout, sessionLifetime, t0 + 31 * 24h);

    EXPECT_EQ(store.sessionCount(), 1u);
    EXPECT_FALSE(store.isAuthorized("old", t0 + 31 * 24h));
    EXPECT_TRUE(store.isAuthorized("new", t0 + 31 * 24h));
}

TEST_F(SessionFileTest, MalformedFileStartsEmpty) {
    {
        std::ofstream file(path);
        file << "{\"sessions\": [ {\"token\": 3";
    }

    SessionStore store(path, pairingTimeout, sessionLifetime, fromMillis(0));
    EXPECT_EQ(store.sessionCount(), 0u);
}

TEST_F(SessionFileTest, MissingFileStartsEmpty) {
    SessionStore store(path, pairingTimeout, sessionLifetime, fromMillis(0));
    EXPECT_EQ(store.sessionCount(), 0u);
}
