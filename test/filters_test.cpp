#include <cctype>
#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "data/data.hpp"
#include "test_events.hpp"

using namespace nrelay::data;
using namespace nrelay_test;
using namespace std;
using namespace ::testing;

using nlohmann::json;

static const string TARGET_ID = "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36";

class FiltersTest : public testing::Test
{
protected:
    Event event = makeEvent(
        ALICE_PUBKEY,
        1,
        1700000000,
        { { "e", TARGET_ID }, { "p", BOB_PUBKEY }, { "t", "nostr" } },
        "Hello, World!");
};

TEST_F(FiltersTest, EmptyFilter_MatchesEverything)
{
    auto filters = Filters::fromJson(json::object());

    ASSERT_TRUE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_RequiresEveryPresentField)
{
    auto filters = Filters::fromJson({
        { "authors", { ALICE_PUBKEY } },
        { "kinds", { 1 } },
        { "#t", { "nostr" } }
    });
    ASSERT_TRUE(filters.matches(this->event));

    filters.kinds = vector<int>{ 7 };
    ASSERT_FALSE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_SinceAndUntilAreInclusive)
{
    auto filters = Filters::fromJson({ { "since", 1700000000 }, { "until", 1700000000 } });
    ASSERT_TRUE(filters.matches(this->event));

    filters.since = 1700000001;
    ASSERT_FALSE(filters.matches(this->event));

    filters.since = nullopt;
    filters.until = 1699999999;
    ASSERT_FALSE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_EmptyListMatchesNothing)
{
    auto filters = Filters::fromJson({ { "authors", json::array() } });

    ASSERT_FALSE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_HexTagsCompareCaseInsensitively)
{
    string upperTarget = TARGET_ID;
    for (char& c : upperTarget)
    {
        c = static_cast<char>(toupper(c));
    }

    auto filters = Filters::fromJson({ { "#e", { upperTarget } } });
    ASSERT_TRUE(filters.matches(this->event));

    this->event.tags = { { "e", upperTarget } };
    filters = Filters::fromJson({ { "#e", { TARGET_ID } } });
    ASSERT_TRUE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_IgnoresLimit)
{
    auto filters = Filters::fromJson({ { "limit", 0 } });

    ASSERT_TRUE(filters.matches(this->event));
}

TEST_F(FiltersTest, Matches_TagKeyNeedsTagWithValue)
{
    this->event.tags = { { "t" } };
    auto filters = Filters::fromJson({ { "#t", { "nostr" } } });

    ASSERT_FALSE(filters.matches(this->event));
}

TEST_F(FiltersTest, FromJson_NormalizesHexToLowercase)
{
    auto filters = Filters::fromJson({ { "ids", { "ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789" } } });

    ASSERT_EQ(filters.ids->front(), "abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123456789");
}

TEST_F(FiltersTest, FromJson_RejectsUnsupportedElements)
{
    EXPECT_THROW(Filters::fromJson({ { "search", "nostr" } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "#x", { "value" } } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "#tt", { "value" } } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "ids", { "abc" } } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "#p", { "not-a-pubkey" } } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "kinds", { -1 } } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "since", "yesterday" } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson({ { "limit", -5 } }), invalid_argument);
    EXPECT_THROW(Filters::fromJson(json::array()), invalid_argument);
}

TEST_F(FiltersTest, FromJson_AcceptsNonHexValuesForOtherTags)
{
    auto filters = Filters::fromJson({ { "#d", { "" } }, { "#a", { "30023:abc:slug" } } });

    EXPECT_EQ(filters.tags.at("d"), vector<string>{ "" });
    EXPECT_EQ(filters.tags.at("a"), vector<string>{ "30023:abc:slug" });
}

TEST_F(FiltersTest, IsIdLookup_OnlyWhenIdsAreTheOnlyConstraint)
{
    EXPECT_TRUE(Filters::fromJson({ { "ids", { TARGET_ID } } }).isIdLookup());
    EXPECT_TRUE(Filters::fromJson({ { "ids", { TARGET_ID } }, { "limit", 1 } }).isIdLookup());
    EXPECT_FALSE(Filters::fromJson({ { "ids", { TARGET_ID } }, { "kinds", { 1 } } }).isIdLookup());
    EXPECT_FALSE(Filters::fromJson({ { "kinds", { 1 } } }).isIdLookup());
}

TEST_F(FiltersTest, ToJson_RestoresParsedFilter)
{
    json j = {
        { "authors", { ALICE_PUBKEY } },
        { "kinds", { 1, 7 } },
        { "#t", { "nostr" } },
        { "since", 10 },
        { "limit", 20 }
    };

    ASSERT_EQ(Filters::fromJson(j).toJson(), j);
}
