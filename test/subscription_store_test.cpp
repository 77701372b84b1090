#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "service/subscription_store.hpp"

using namespace nrelay::data;
using namespace nrelay::service;
using namespace std;
using namespace ::testing;

using nlohmann::json;

class SubscriptionStoreTest : public testing::Test
{
protected:
    SubscriptionStore store;

    static vector<Filters> kindFilters(int kind)
    {
        return { Filters::fromJson({ { "kinds", { kind } } }) };
    };
};

TEST_F(SubscriptionStoreTest, Put_RegistersSubscription)
{
    ASSERT_TRUE(this->store.put("connection", "sub", kindFilters(1), 20));

    auto subscriptions = this->store.get("connection");
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions.at("sub").size(), 1u);
}

TEST_F(SubscriptionStoreTest, Put_ReplacesSubscriptionWithSameId)
{
    this->store.put("connection", "sub", kindFilters(1), 1);
    ASSERT_TRUE(this->store.put("connection", "sub", kindFilters(7), 1));

    auto subscriptions = this->store.get("connection");
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(*subscriptions.at("sub").front().kinds, vector<int>{ 7 });
}

TEST_F(SubscriptionStoreTest, Put_RefusesSubscriptionBeyondMaximum)
{
    ASSERT_TRUE(this->store.put("connection", "first", kindFilters(1), 2));
    ASSERT_TRUE(this->store.put("connection", "second", kindFilters(1), 2));
    ASSERT_FALSE(this->store.put("connection", "third", kindFilters(1), 2));

    auto subscriptions = this->store.get("connection");
    EXPECT_EQ(subscriptions.size(), 2u);
    EXPECT_EQ(subscriptions.count("third"), 0u);
}

TEST_F(SubscriptionStoreTest, Put_LimitsAreCountedPerConnection)
{
    ASSERT_TRUE(this->store.put("first", "sub", kindFilters(1), 1));
    ASSERT_TRUE(this->store.put("second", "sub", kindFilters(1), 1));
}

TEST_F(SubscriptionStoreTest, Remove_DeletesOnlyNamedSubscription)
{
    this->store.put("connection", "keep", kindFilters(1), 20);
    this->store.put("connection", "drop", kindFilters(1), 20);

    EXPECT_TRUE(this->store.remove("connection", "drop"));
    EXPECT_FALSE(this->store.remove("connection", "drop"));
    EXPECT_FALSE(this->store.remove("unknown", "keep"));

    auto subscriptions = this->store.get("connection");
    EXPECT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions.count("keep"), 1u);
}

TEST_F(SubscriptionStoreTest, RemoveConnection_DeletesEverySubscription)
{
    this->store.put("connection", "a", kindFilters(1), 20);
    this->store.put("connection", "b", kindFilters(1), 20);

    this->store.removeConnection("connection");

    ASSERT_TRUE(this->store.get("connection").empty());
}

TEST_F(SubscriptionStoreTest, Suspend_ReturnsRemovedSubscriptions)
{
    this->store.put("first", "a", kindFilters(1), 20);
    this->store.put("second", "b", kindFilters(1), 20);

    auto removed = this->store.suspend();

    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed.at("first").count("a"), 1u);
    EXPECT_TRUE(this->store.snapshot().empty());
}

TEST_F(SubscriptionStoreTest, Suspend_RefusesNewSubscriptionsUntilResumed)
{
    this->store.suspend();

    ASSERT_TRUE(this->store.isSuspended());
    ASSERT_FALSE(this->store.put("connection", "late", kindFilters(1), 20));
    ASSERT_TRUE(this->store.snapshot().empty());

    this->store.resume();

    ASSERT_FALSE(this->store.isSuspended());
    ASSERT_TRUE(this->store.put("connection", "late", kindFilters(1), 20));
}

TEST_F(SubscriptionStoreTest, Prune_RemovesClosedConnectionsOnly)
{
    this->store.put("live", "a", kindFilters(1), 20);
    this->store.put("stale1", "a", kindFilters(1), 20);
    this->store.put("stale2", "a", kindFilters(1), 20);

    size_t deleted = this->store.prune({ "live" }, 2000);

    EXPECT_EQ(deleted, 2u);
    auto remaining = this->store.snapshot();
    EXPECT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.count("live"), 1u);
}

TEST_F(SubscriptionStoreTest, Prune_ExaminesAtMostLimitEntries)
{
    for (int i = 0; i < 5; i++)
    {
        this->store.put("stale" + to_string(i), "a", kindFilters(1), 20);
    }

    EXPECT_EQ(this->store.prune({}, 3), 3u);
    EXPECT_EQ(this->store.prune({}, 3), 2u);
    EXPECT_TRUE(this->store.snapshot().empty());
}
