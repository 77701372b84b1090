#include <chrono>

#include <gtest/gtest.h>

#include "data/data.hpp"
#include "session/auth.hpp"
#include "test_events.hpp"

using namespace nrelay::data;
using namespace nrelay::session;
using namespace nrelay_test;
using namespace std;
using namespace ::testing;

static const string RELAY_URL = "wss://relay.example.com";

class AuthTest : public testing::Test
{
protected:
    chrono::system_clock::time_point now = chrono::system_clock::from_time_t(1700000000);
    chrono::seconds timeout{ 600 };
    Connection connection;

    void SetUp() override
    {
        this->connection.id = "connection";
        this->connection.url = RELAY_URL;
    };

    Event authEvent(const string& challenge, const string& relay)
    {
        return makeEvent(ALICE_PUBKEY, CLIENT_AUTH_KIND, 1700000000, { { "relay", relay }, { "challenge", challenge } });
    };
};

TEST_F(AuthTest, Issue_RecordsChallengeOnConnection)
{
    string challenge = Challenge::issue(this->connection, this->now);

    ASSERT_TRUE(this->connection.auth.has_value());
    EXPECT_EQ(this->connection.auth->challenge, challenge);
    EXPECT_EQ(this->connection.auth->challengedAt, this->now);
    EXPECT_EQ(challenge.length(), 64u);
}

TEST_F(AuthTest, Issue_ReplacesPreviousChallenge)
{
    string first = Challenge::issue(this->connection, this->now);
    string second = Challenge::issue(this->connection, this->now + chrono::seconds(1));

    EXPECT_NE(first, second);
    EXPECT_EQ(this->connection.auth->challenge, second);
}

TEST_F(AuthTest, Validate_AcceptsMatchingEvent)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = this->authEvent(challenge, RELAY_URL);

    ASSERT_TRUE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST_F(AuthTest, Validate_RejectsWrongKind)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = makeEvent(ALICE_PUBKEY, 1, 1700000000, { { "relay", RELAY_URL }, { "challenge", challenge } });

    ASSERT_FALSE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST_F(AuthTest, Validate_RejectsWrongChallenge)
{
    Challenge::issue(this->connection, this->now);
    auto event = this->authEvent("something-else", RELAY_URL);

    ASSERT_FALSE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST_F(AuthTest, Validate_RejectsOtherRelay)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = this->authEvent(challenge, "wss://other.example.com");

    ASSERT_FALSE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST_F(AuthTest, Validate_RejectsMissingRelayTag)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = makeEvent(ALICE_PUBKEY, CLIENT_AUTH_KIND, 1700000000, { { "challenge", challenge } });

    ASSERT_FALSE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST_F(AuthTest, Validate_ExpiresAfterTimeout)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = this->authEvent(challenge, RELAY_URL);

    EXPECT_TRUE(Challenge::validate(
        event, *this->connection.auth, this->connection.url, this->timeout, this->now + this->timeout));
    EXPECT_FALSE(Challenge::validate(
        event, *this->connection.auth, this->connection.url, this->timeout, this->now + this->timeout + chrono::seconds(1)));
}

TEST_F(AuthTest, Validate_ComparesNormalizedUrls)
{
    string challenge = Challenge::issue(this->connection, this->now);
    auto event = this->authEvent(challenge, "WSS://Relay.Example.com:443/");

    ASSERT_TRUE(Challenge::validate(event, *this->connection.auth, this->connection.url, this->timeout, this->now));
}

TEST(NormalizeUrlTest, AppliesDefaultScheme)
{
    EXPECT_EQ(normalizeUrl("relay.example.com"), "wss://relay.example.com");
}

TEST(NormalizeUrlTest, MapsHttpSchemes)
{
    EXPECT_EQ(normalizeUrl("http://relay.example.com"), "ws://relay.example.com");
    EXPECT_EQ(normalizeUrl("https://relay.example.com"), "wss://relay.example.com");
}

TEST(NormalizeUrlTest, StripsDefaultPorts)
{
    EXPECT_EQ(normalizeUrl("ws://relay.example.com:80"), "ws://relay.example.com");
    EXPECT_EQ(normalizeUrl("wss://relay.example.com:443"), "wss://relay.example.com");
    EXPECT_EQ(normalizeUrl("wss://relay.example.com:7447"), "wss://relay.example.com:7447");
}

TEST(NormalizeUrlTest, CleansUpPath)
{
    EXPECT_EQ(normalizeUrl("wss://relay.example.com//nostr//"), "wss://relay.example.com/nostr");
    EXPECT_EQ(normalizeUrl("wss://relay.example.com/#fragment"), "wss://relay.example.com");
}

TEST(NormalizeUrlTest, LowercasesSchemeAndHostOnly)
{
    EXPECT_EQ(normalizeUrl("WSS://RELAY.Example.COM/Path"), "wss://relay.example.com/Path");
}
