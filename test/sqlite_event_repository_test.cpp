#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "repository/sqlite_database.hpp"
#include "repository/sqlite_event_repository.hpp"
#include "test_events.hpp"

using namespace nrelay::data;
using namespace nrelay::repository;
using namespace nrelay_test;
using namespace std;
using namespace ::testing;

using nlohmann::json;

class SqliteEventRepositoryTest : public testing::Test
{
public:
    static const int DEFAULT_LIMIT = 3;
    static const int MAX_LIMIT = 5;

protected:
    // The logger keeps the first appender it receives for the whole test run.
    inline static shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender =
        make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    shared_ptr<SqliteDatabase> database;
    shared_ptr<SqliteEventRepository> repository;
    EventMetadata metadata{ string("127.0.0.1"), 1700000000 };

    void SetUp() override
    {
        this->database = make_shared<SqliteDatabase>(":memory:");
        this->repository = make_shared<SqliteEventRepository>(
            this->testAppender,
            this->database,
            DEFAULT_LIMIT,
            MAX_LIMIT);
    };

    vector<Event> findAll(json filter)
    {
        return this->repository->find(Filters::fromJson(filter));
    };

    vector<string> findIds(json filter)
    {
        vector<string> ids;
        for (const auto& event : this->findAll(filter))
        {
            ids.push_back(event.id);
        }
        return ids;
    };
};

TEST_F(SqliteEventRepositoryTest, Save_StoresRegularEvent)
{
    auto event = makeEvent(ALICE_PUBKEY, 1, 100, { { "t", "nostr" } }, "hello");

    ASSERT_EQ(this->repository->save(event, this->metadata), SaveResult::Stored);

    auto found = this->findAll({ { "ids", { event.id } } });
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], event);
    EXPECT_EQ(found[0].content, "hello");
    EXPECT_EQ(found[0].tags, event.tags);
}

TEST_F(SqliteEventRepositoryTest, Save_ReportsDuplicate)
{
    auto event = makeEvent(ALICE_PUBKEY, 1, 100);

    ASSERT_EQ(this->repository->save(event, this->metadata), SaveResult::Stored);
    ASSERT_EQ(this->repository->save(event, this->metadata), SaveResult::Duplicate);
    ASSERT_EQ(this->findAll({ { "authors", { ALICE_PUBKEY } } }).size(), 1u);
}

TEST_F(SqliteEventRepositoryTest, SaveReplaceable_NewerVersionReplacesOlder)
{
    auto older = makeEvent(ALICE_PUBKEY, 0, 100, {}, "old");
    auto newer = makeEvent(ALICE_PUBKEY, 0, 200, {}, "new");

    ASSERT_EQ(this->repository->saveReplaceable(older, this->metadata), SaveResult::Stored);
    ASSERT_EQ(this->repository->saveReplaceable(newer, this->metadata), SaveResult::Stored);

    auto found = this->findAll({ { "authors", { ALICE_PUBKEY } }, { "kinds", { 0 } } });
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, newer.id);
}

TEST_F(SqliteEventRepositoryTest, SaveReplaceable_OlderVersionLoses)
{
    auto older = makeEvent(ALICE_PUBKEY, 0, 100, {}, "old");
    auto newer = makeEvent(ALICE_PUBKEY, 0, 200, {}, "new");

    ASSERT_EQ(this->repository->saveReplaceable(newer, this->metadata), SaveResult::Stored);
    ASSERT_EQ(this->repository->saveReplaceable(older, this->metadata), SaveResult::Superseded);

    auto found = this->findAll({ { "authors", { ALICE_PUBKEY } }, { "kinds", { 0 } } });
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, newer.id);
}

TEST_F(SqliteEventRepositoryTest, SaveReplaceable_EqualTimestampsKeepSmallerId)
{
    auto first = makeEvent(ALICE_PUBKEY, 10002, 100, {}, "a");
    auto second = makeEvent(ALICE_PUBKEY, 10002, 100, {}, "b");
    string smallerId = min(first.id, second.id);

    // The same version survives regardless of arrival order.
    this->repository->saveReplaceable(first, this->metadata);
    this->repository->saveReplaceable(second, this->metadata);
    EXPECT_EQ(this->findIds({ { "kinds", { 10002 } } }), vector<string>{ smallerId });

    auto database = make_shared<SqliteDatabase>(":memory:");
    SqliteEventRepository reversed(this->testAppender, database, DEFAULT_LIMIT, MAX_LIMIT);
    reversed.saveReplaceable(second, this->metadata);
    reversed.saveReplaceable(first, this->metadata);

    auto found = reversed.find(Filters::fromJson({ { "kinds", { 10002 } } }));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, smallerId);
}

TEST_F(SqliteEventRepositoryTest, SaveReplaceable_SameEventIsDuplicate)
{
    auto event = makeEvent(ALICE_PUBKEY, 3, 100);

    ASSERT_EQ(this->repository->saveReplaceable(event, this->metadata), SaveResult::Stored);
    ASSERT_EQ(this->repository->saveReplaceable(event, this->metadata), SaveResult::Duplicate);
    ASSERT_EQ(this->findAll({ { "kinds", { 3 } } }).size(), 1u);
}

TEST_F(SqliteEventRepositoryTest, SaveReplaceable_KeysByAuthorAndKind)
{
    auto aliceMetadata = makeEvent(ALICE_PUBKEY, 0, 100);
    auto bobMetadata = makeEvent(BOB_PUBKEY, 0, 200);
    auto aliceContacts = makeEvent(ALICE_PUBKEY, 3, 300);

    this->repository->saveReplaceable(aliceMetadata, this->metadata);
    this->repository->saveReplaceable(bobMetadata, this->metadata);
    this->repository->saveReplaceable(aliceContacts, this->metadata);

    ASSERT_EQ(this->findAll({ { "kinds", { 0, 3 } } }).size(), 3u);
}

TEST_F(SqliteEventRepositoryTest, SaveAddressable_ReplacesWithinSameIdentifier)
{
    auto first = makeEvent(ALICE_PUBKEY, 30023, 100, { { "d", "post" } }, "draft");
    auto second = makeEvent(ALICE_PUBKEY, 30023, 200, { { "d", "post" } }, "final");
    auto other = makeEvent(ALICE_PUBKEY, 30023, 150, { { "d", "other" } });

    EXPECT_EQ(this->repository->saveAddressable(first, this->metadata), SaveResult::Stored);
    EXPECT_EQ(this->repository->saveAddressable(other, this->metadata), SaveResult::Stored);
    EXPECT_EQ(this->repository->saveAddressable(second, this->metadata), SaveResult::Stored);

    EXPECT_EQ(this->findIds({ { "kinds", { 30023 } } }), (vector<string>{ second.id, other.id }));
}

TEST_F(SqliteEventRepositoryTest, SaveAddressable_EmptyIdentifierIsDistinct)
{
    auto empty = makeEvent(ALICE_PUBKEY, 30000, 100, { { "d", "" } });
    auto named = makeEvent(ALICE_PUBKEY, 30000, 200, { { "d", "name" } });

    this->repository->saveAddressable(empty, this->metadata);
    this->repository->saveAddressable(named, this->metadata);

    EXPECT_EQ(this->findIds({ { "#d", { "" } } }), vector<string>{ empty.id });
    EXPECT_EQ(this->findAll({ { "kinds", { 30000 } } }).size(), 2u);
}

TEST_F(SqliteEventRepositoryTest, SaveAddressable_ThrowsWithoutIdentifier)
{
    auto event = makeEvent(ALICE_PUBKEY, 30023, 100, { { "t", "nostr" } });

    ASSERT_THROW(this->repository->saveAddressable(event, this->metadata), invalid_argument);
}

TEST_F(SqliteEventRepositoryTest, DeleteByReference_DeletesOwnEvents)
{
    auto note = makeEvent(ALICE_PUBKEY, 1, 100, {}, "oops");
    this->repository->save(note, this->metadata);

    auto deletion = makeEvent(ALICE_PUBKEY, DELETION_KIND, 200, { { "e", note.id } });
    this->repository->save(deletion, this->metadata);

    auto deleted = this->repository->deleteByReference(deletion);

    EXPECT_EQ(deleted, vector<string>{ note.id });
    EXPECT_TRUE(this->findAll({ { "ids", { note.id } } }).empty());
    EXPECT_EQ(this->findIds({ { "ids", { deletion.id } } }), vector<string>{ deletion.id });
}

TEST_F(SqliteEventRepositoryTest, DeleteByReference_IgnoresOtherAuthors)
{
    auto note = makeEvent(BOB_PUBKEY, 1, 100);
    this->repository->save(note, this->metadata);

    auto deletion = makeEvent(ALICE_PUBKEY, DELETION_KIND, 200, { { "e", note.id } });

    EXPECT_TRUE(this->repository->deleteByReference(deletion).empty());
    EXPECT_EQ(this->findAll({ { "ids", { note.id } } }).size(), 1u);
}

TEST_F(SqliteEventRepositoryTest, DeleteByReference_NeverDeletesDeletionRequests)
{
    auto firstDeletion = makeEvent(ALICE_PUBKEY, DELETION_KIND, 100);
    this->repository->save(firstDeletion, this->metadata);

    auto secondDeletion = makeEvent(ALICE_PUBKEY, DELETION_KIND, 200, { { "e", firstDeletion.id } });

    EXPECT_TRUE(this->repository->deleteByReference(secondDeletion).empty());
    EXPECT_EQ(this->findAll({ { "ids", { firstDeletion.id } } }).size(), 1u);
}

TEST_F(SqliteEventRepositoryTest, DeleteByReference_IgnoresMalformedReferences)
{
    auto deletion = makeEvent(ALICE_PUBKEY, DELETION_KIND, 200, { { "e", "not-an-id" }, { "e" } });

    ASSERT_TRUE(this->repository->deleteByReference(deletion).empty());
}

TEST_F(SqliteEventRepositoryTest, Find_IdsAreSortedNewestFirst)
{
    auto a = makeEvent(ALICE_PUBKEY, 1, 100);
    auto b = makeEvent(ALICE_PUBKEY, 1, 300);
    auto c = makeEvent(ALICE_PUBKEY, 1, 200);
    for (const auto& event : { a, b, c })
    {
        this->repository->save(event, this->metadata);
    }

    auto missing = string(64, 'f');
    EXPECT_EQ(this->findIds({ { "ids", { a.id, b.id, c.id, missing } } }), (vector<string>{ b.id, c.id, a.id }));
}

TEST_F(SqliteEventRepositoryTest, Find_IdLookupHonorsLimit)
{
    auto a = makeEvent(ALICE_PUBKEY, 1, 100);
    auto b = makeEvent(ALICE_PUBKEY, 1, 200);
    this->repository->save(a, this->metadata);
    this->repository->save(b, this->metadata);

    EXPECT_EQ(this->findIds({ { "ids", { a.id, b.id } }, { "limit", 1 } }), vector<string>{ b.id });
}

TEST_F(SqliteEventRepositoryTest, Find_AppliesDefaultAndMaximumLimit)
{
    for (int i = 0; i < 8; i++)
    {
        this->repository->save(makeEvent(ALICE_PUBKEY, 1, 100 + i), this->metadata);
    }

    auto defaulted = this->findAll({ { "kinds", { 1 } } });
    ASSERT_EQ(defaulted.size(), static_cast<size_t>(DEFAULT_LIMIT));
    EXPECT_EQ(defaulted.front().createdAt, 107);

    EXPECT_EQ(this->findAll({ { "kinds", { 1 } }, { "limit", 100 } }).size(), static_cast<size_t>(MAX_LIMIT));
    EXPECT_TRUE(this->findAll({ { "kinds", { 1 } }, { "limit", 0 } }).empty());
}

TEST_F(SqliteEventRepositoryTest, Find_FiltersByTimeRange)
{
    for (int i = 0; i < 5; i++)
    {
        this->repository->save(makeEvent(ALICE_PUBKEY, 1, 100 + i), this->metadata);
    }

    auto found = this->findAll({ { "since", 101 }, { "until", 103 } });

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found.front().createdAt, 103);
    EXPECT_EQ(found.back().createdAt, 101);
}

TEST_F(SqliteEventRepositoryTest, Find_MatchesHexTagsCaseInsensitively)
{
    string target = "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36";
    string upperTarget = "5C83DA77AF1DEC6D7289834998AD7AAFBD9E2191396D75EC3CC27F5A77226F36";
    auto reply = makeEvent(BOB_PUBKEY, 1, 100, { { "e", upperTarget } });
    auto unrelated = makeEvent(BOB_PUBKEY, 1, 100, { { "t", "nostr" } });
    this->repository->save(reply, this->metadata);
    this->repository->save(unrelated, this->metadata);

    EXPECT_EQ(this->findIds({ { "#e", { target } } }), vector<string>{ reply.id });
}

TEST_F(SqliteEventRepositoryTest, Find_RequiresEveryTagKey)
{
    auto both = makeEvent(ALICE_PUBKEY, 1, 100, { { "t", "nostr" }, { "p", BOB_PUBKEY } });
    auto onlyTopic = makeEvent(ALICE_PUBKEY, 1, 101, { { "t", "nostr" } });
    this->repository->save(both, this->metadata);
    this->repository->save(onlyTopic, this->metadata);

    EXPECT_EQ(this->findIds({ { "#t", { "nostr", "bitcoin" } }, { "#p", { BOB_PUBKEY } } }), vector<string>{ both.id });
    EXPECT_EQ(this->findAll({ { "#t", { "nostr" } } }).size(), 2u);
}

TEST_F(SqliteEventRepositoryTest, Find_EmptyListsMatchNothing)
{
    this->repository->save(makeEvent(ALICE_PUBKEY, 1, 100), this->metadata);

    EXPECT_TRUE(this->findAll({ { "authors", json::array() } }).empty());
    EXPECT_TRUE(this->findAll({ { "kinds", json::array() } }).empty());
    EXPECT_TRUE(this->findAll({ { "#t", json::array() } }).empty());
}

TEST_F(SqliteEventRepositoryTest, Find_ManyIdsUseQueryLimit)
{
    vector<string> ids;
    for (int i = 0; i < MAX_LIMIT + 1; i++)
    {
        auto event = makeEvent(ALICE_PUBKEY, 1, 100 + i);
        this->repository->save(event, this->metadata);
        ids.push_back(event.id);
    }

    ASSERT_EQ(this->findAll({ { "ids", ids } }).size(), static_cast<size_t>(DEFAULT_LIMIT));
}

TEST(SqliteAccountRegistryTest, RegisterAccount_MakesPubkeyRegistered)
{
    auto database = make_shared<SqliteDatabase>(":memory:");
    SqliteAccountRegistry accounts(database);

    EXPECT_FALSE(accounts.isRegistered(ALICE_PUBKEY));
    accounts.registerAccount(ALICE_PUBKEY);
    accounts.registerAccount(ALICE_PUBKEY);
    EXPECT_TRUE(accounts.isRegistered(ALICE_PUBKEY));
    EXPECT_FALSE(accounts.isRegistered(BOB_PUBKEY));
}

TEST(SqliteAccountRegistryTest, RegisterAccount_RejectsMalformedPubkey)
{
    auto database = make_shared<SqliteDatabase>(":memory:");
    SqliteAccountRegistry accounts(database);

    ASSERT_THROW(accounts.registerAccount("npub1xyz"), invalid_argument);
}
