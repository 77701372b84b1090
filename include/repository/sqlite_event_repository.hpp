#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "repository/event_repository.hpp"
#include "repository/sqlite_database.hpp"

namespace nrelay
{
namespace repository
{
/**
 * @brief An implementation of the `IEventRepository` interface backed by SQLite.
 * @remark Each event is stored whole in the `events` table, keyed by its binary ID, with its
 * pubkey, kind, and timestamp in indexed columns.  Tags with an indexed letter are copied into
 * the `tags` table.  Values of hex tags that hold 32-byte identifiers are stored as blobs, so
 * they compare case-insensitively.
 */
class SqliteEventRepository : public IEventRepository
{
public:
    /**
     * @param defaultLimit The query limit used for filters without one.
     * @param maxLimit The upper bound on the query limit of any filter, and on the number of IDs
     * answered by point lookups.
     */
    SqliteEventRepository(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<SqliteDatabase> database,
        int defaultLimit,
        int maxLimit);

    SaveResult save(const data::Event& event, const EventMetadata& metadata) override;

    SaveResult saveReplaceable(const data::Event& event, const EventMetadata& metadata) override;

    SaveResult saveAddressable(const data::Event& event, const EventMetadata& metadata) override;

    std::vector<std::string> deleteByReference(const data::Event& deletion) override;

    std::vector<data::Event> find(const data::Filters& filters) override;

private:
    std::shared_ptr<SqliteDatabase> _database;
    int _defaultLimit;
    int _maxLimit;

    void _createSchema();

    /**
     * @brief Inserts the event and its indexed tags.
     * @remark The caller must hold the statement mutex.
     */
    SaveResult _insert(const data::Event& event, const EventMetadata& metadata);

    /**
     * @brief Deletes the events with the given IDs.
     * @remark The caller must hold the statement mutex.
     */
    void _delete(const std::vector<std::string>& ids);

    /**
     * @brief Reads the stored versions of a replaceable or addressable object, latest first.
     * @param identifier The `d` tag value for addressable events, or `std::nullopt` for
     * replaceable events.
     */
    std::vector<data::EventVersion> _findVersions(
        int kind,
        const std::string& pubkey,
        const std::optional<std::string>& identifier);

    /**
     * @brief Stores the event and deletes the given versions if the event supersedes all of them.
     * @param versions Versions read by `_findVersions`, latest first.
     */
    SaveResult _saveLatestEvent(
        const data::Event& event,
        const EventMetadata& metadata,
        const std::vector<data::EventVersion>& versions);

    std::vector<data::Event> _findByIds(const std::vector<std::string>& ids, std::optional<int> limit);

    std::vector<data::Event> _findByQuery(const data::Filters& filters);

    data::Event _parseStoredEvent(const std::string& raw);
};

/**
 * @brief An implementation of the `IAccountRegistry` interface backed by the `accounts` table.
 */
class SqliteAccountRegistry : public IAccountRegistry
{
public:
    SqliteAccountRegistry(std::shared_ptr<SqliteDatabase> database);

    bool isRegistered(const std::string& pubkey) override;

    /**
     * @throws `std::invalid_argument` if the pubkey is not 64 hex characters.
     */
    void registerAccount(const std::string& pubkey) override;

private:
    std::shared_ptr<SqliteDatabase> _database;
};
} // namespace repository
} // namespace nrelay
