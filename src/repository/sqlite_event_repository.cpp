#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "repository/sqlite_event_repository.hpp"
#include "hex.hpp"
#include "internal/logging.hpp"

using namespace nrelay::data;
using namespace nrelay::repository;
using namespace std;

#pragma region Local Statics

using Parameter = variant<int64_t, string, vector<uint8_t>>;

static string _placeholders(size_t count)
{
    stringstream ss;
    for (size_t i = 0; i < count; i++)
    {
        ss << (i == 0 ? "?" : ", ?");
    }

    return ss.str();
};

static string _join(const vector<string>& clauses, const string& separator)
{
    stringstream ss;
    for (size_t i = 0; i < clauses.size(); i++)
    {
        ss << (i == 0 ? "" : separator) << clauses[i];
    }

    return ss.str();
};

static vector<string> _unique(const vector<string>& values)
{
    vector<string> unique;
    for (const auto& value : values)
    {
        if (find(unique.begin(), unique.end(), value) == unique.end())
        {
            unique.push_back(value);
        }
    }

    return unique;
};

/**
 * @brief Converts an indexed tag value to the form it is stored in.
 */
static Parameter _tagParameter(const string& name, const string& value)
{
    if (isHexTag(name) && nrelay::encoding::isHex(value, 64))
    {
        return nrelay::encoding::fromHex(value);
    }

    return value;
};

static void _bindAll(Statement& statement, const vector<Parameter>& params)
{
    for (size_t i = 0; i < params.size(); i++)
    {
        int index = static_cast<int>(i) + 1;
        visit([&statement, index](const auto& value) { statement.bind(index, value); }, params[i]);
    }
};

/**
 * @brief Orders events newest first, breaking ties by ascending ID.
 */
static void _sortEvents(vector<Event>& events)
{
    sort(events.begin(), events.end(), [](const Event& a, const Event& b)
    {
        if (a.createdAt != b.createdAt)
        {
            return a.createdAt > b.createdAt;
        }
        return a.id < b.id;
    });
};

#pragma endregion

#pragma region SqliteEventRepository

SqliteEventRepository::SqliteEventRepository(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<SqliteDatabase> database,
    int defaultLimit,
    int maxLimit)
: _database(database), _defaultLimit(defaultLimit), _maxLimit(maxLimit)
{
    nrelay::internal::initLogging(appender.get());

    this->_createSchema();
};

SaveResult SqliteEventRepository::save(const Event& event, const EventMetadata& metadata)
{
    PLOG_DEBUG << "Saving event " << event.id;

    lock_guard<mutex> lock(this->_database->statementMutex());
    Transaction transaction(*this->_database);

    SaveResult result = this->_insert(event, metadata);
    if (result == SaveResult::Stored)
    {
        transaction.commit();
    }

    return result;
};

SaveResult SqliteEventRepository::saveReplaceable(const Event& event, const EventMetadata& metadata)
{
    auto versions = this->_findVersions(event.kind, event.pubkey, nullopt);
    PLOG_DEBUG << "Found " << versions.size() << " stored versions of replaceable event " << event.id;

    return this->_saveLatestEvent(event, metadata, versions);
};

SaveResult SqliteEventRepository::saveAddressable(const Event& event, const EventMetadata& metadata)
{
    auto identifier = event.identifier();
    if (!identifier)
    {
        throw invalid_argument("SqliteEventRepository::saveAddressable: An addressable event requires a d tag.");
    }

    auto versions = this->_findVersions(event.kind, event.pubkey, identifier);
    PLOG_DEBUG << "Found " << versions.size() << " stored versions of addressable event " << event.id;

    return this->_saveLatestEvent(event, metadata, versions);
};

vector<string> SqliteEventRepository::deleteByReference(const Event& deletion)
{
    vector<string> referencedIds;
    for (const auto& value : deletion.tagValues("e"))
    {
        if (encoding::isHex(value, 64))
        {
            referencedIds.push_back(encoding::toLower(value));
        }
    }
    referencedIds = _unique(referencedIds);

    if (referencedIds.empty())
    {
        return {};
    }

    vector<Parameter> params;
    for (const auto& id : referencedIds)
    {
        params.push_back(encoding::fromHex(id));
    }

    lock_guard<mutex> lock(this->_database->statementMutex());

    vector<string> deleteIds;
    {
        auto statement = this->_database->prepare(
            "SELECT lower(hex(id)), lower(hex(pubkey)), kind FROM events WHERE id IN ("
            + _placeholders(params.size()) + ")");
        _bindAll(statement, params);

        while (statement.step())
        {
            string pubkey = statement.columnText(1);
            int kind = static_cast<int>(statement.columnInt(2));
            if (pubkey == deletion.pubkey && kind != DELETION_KIND)
            {
                deleteIds.push_back(statement.columnText(0));
            }
        }
    }

    if (!deleteIds.empty())
    {
        Transaction transaction(*this->_database);
        this->_delete(deleteIds);
        transaction.commit();
    }

    PLOG_DEBUG << "Deletion request " << deletion.id << " removed " << deleteIds.size()
        << " of " << referencedIds.size() << " referenced events.";

    return deleteIds;
};

vector<Event> SqliteEventRepository::find(const Filters& filters)
{
    if (filters.isIdLookup() && filters.ids->size() <= static_cast<size_t>(this->_maxLimit))
    {
        return this->_findByIds(*filters.ids, filters.limit);
    }

    return this->_findByQuery(filters);
};

void SqliteEventRepository::_createSchema()
{
    lock_guard<mutex> lock(this->_database->statementMutex());

    this->_database->exec(
        "CREATE TABLE IF NOT EXISTS events ("
        "  id BLOB PRIMARY KEY,"
        "  pubkey BLOB NOT NULL,"
        "  kind INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  raw TEXT NOT NULL,"
        "  ip_address TEXT,"
        "  received_at INTEGER NOT NULL"
        ")");
    this->_database->exec("CREATE INDEX IF NOT EXISTS events_created_at ON events (created_at DESC)");
    this->_database->exec("CREATE INDEX IF NOT EXISTS events_pubkey_kind ON events (pubkey, kind, created_at DESC)");
    this->_database->exec("CREATE INDEX IF NOT EXISTS events_kind ON events (kind, created_at DESC)");
    this->_database->exec(
        "CREATE TABLE IF NOT EXISTS tags ("
        "  event_id BLOB NOT NULL REFERENCES events (id) ON DELETE CASCADE,"
        "  name TEXT NOT NULL,"
        "  value NOT NULL,"
        "  PRIMARY KEY (event_id, name, value)"
        ")");
    this->_database->exec("CREATE INDEX IF NOT EXISTS tags_name_value ON tags (name, value)");
};

SaveResult SqliteEventRepository::_insert(const Event& event, const EventMetadata& metadata)
{
    auto insertEvent = this->_database->prepare(
        "INSERT OR IGNORE INTO events (id, pubkey, kind, created_at, raw, ip_address, received_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    insertEvent.bind(1, encoding::fromHex(event.id));
    insertEvent.bind(2, encoding::fromHex(event.pubkey));
    insertEvent.bind(3, static_cast<int64_t>(event.kind));
    insertEvent.bind(4, static_cast<int64_t>(event.createdAt));
    insertEvent.bind(5, event.serialize());
    if (metadata.ipAddress)
    {
        insertEvent.bind(6, *metadata.ipAddress);
    }
    insertEvent.bind(7, static_cast<int64_t>(metadata.receivedAt));
    insertEvent.step();

    if (this->_database->changes() == 0)
    {
        return SaveResult::Duplicate;
    }

    auto insertTag = this->_database->prepare(
        "INSERT OR IGNORE INTO tags (event_id, name, value) VALUES (?, ?, ?)");
    set<pair<string, string>> indexedTags;
    for (const auto& tag : event.tags)
    {
        if (tag.size() < 2 || !isIndexedTag(tag[0]))
        {
            continue;
        }

        string value = isHexTag(tag[0]) ? encoding::toLower(tag[1]) : tag[1];
        if (!indexedTags.insert({ tag[0], value }).second)
        {
            continue;
        }

        insertTag.reset();
        _bindAll(insertTag, { encoding::fromHex(event.id), tag[0], _tagParameter(tag[0], value) });
        insertTag.step();
    }

    return SaveResult::Stored;
};

void SqliteEventRepository::_delete(const vector<string>& ids)
{
    if (ids.empty())
    {
        return;
    }

    vector<Parameter> params;
    for (const auto& id : ids)
    {
        params.push_back(encoding::fromHex(id));
    }

    auto statement = this->_database->prepare(
        "DELETE FROM events WHERE id IN (" + _placeholders(params.size()) + ")");
    _bindAll(statement, params);
    statement.step();

    PLOG_DEBUG << "Deleted " << this->_database->changes() << " events.";
};

vector<EventVersion> SqliteEventRepository::_findVersions(
    int kind,
    const string& pubkey,
    const optional<string>& identifier)
{
    string sql = "SELECT lower(hex(id)), created_at FROM events WHERE kind = ? AND pubkey = ?";
    vector<Parameter> params = { static_cast<int64_t>(kind), encoding::fromHex(pubkey) };
    if (identifier)
    {
        sql += " AND EXISTS (SELECT 1 FROM tags WHERE tags.event_id = events.id AND tags.name = 'd' AND tags.value = ?)";
        params.push_back(*identifier);
    }
    sql += " ORDER BY created_at DESC, id ASC";

    lock_guard<mutex> lock(this->_database->statementMutex());

    auto statement = this->_database->prepare(sql);
    _bindAll(statement, params);

    vector<EventVersion> versions;
    while (statement.step())
    {
        versions.push_back(EventVersion{ statement.columnText(0), static_cast<time_t>(statement.columnInt(1)) });
    }

    return versions;
};

SaveResult SqliteEventRepository::_saveLatestEvent(
    const Event& event,
    const EventMetadata& metadata,
    const vector<EventVersion>& versions)
{
    for (const auto& version : versions)
    {
        if (version.id == event.id)
        {
            return SaveResult::Duplicate;
        }
    }

    if (!versions.empty() && !supersedes(event.version(), versions.front()))
    {
        PLOG_DEBUG << "Event " << event.id << " is superseded by stored event " << versions.front().id;
        return SaveResult::Superseded;
    }

    // A version stored by a concurrent writer after `versions` was read is not deleted here.
    vector<string> supersededIds;
    for (const auto& version : versions)
    {
        supersededIds.push_back(version.id);
    }

    lock_guard<mutex> lock(this->_database->statementMutex());
    Transaction transaction(*this->_database);

    this->_delete(supersededIds);
    SaveResult result = this->_insert(event, metadata);
    transaction.commit();

    return result;
};

vector<Event> SqliteEventRepository::_findByIds(const vector<string>& ids, optional<int> limit)
{
    vector<Event> events;
    {
        lock_guard<mutex> lock(this->_database->statementMutex());

        auto statement = this->_database->prepare("SELECT raw FROM events WHERE id = ?");
        for (const auto& id : _unique(ids))
        {
            statement.reset();
            statement.bind(1, encoding::fromHex(id));
            if (statement.step())
            {
                try
                {
                    events.push_back(this->_parseStoredEvent(statement.columnText(0)));
                }
                catch (const invalid_argument& e)
                {
                    PLOG_ERROR << "Skipping unreadable stored event " << id << ": " << e.what();
                }
            }
        }
    }

    _sortEvents(events);

    if (limit)
    {
        size_t cap = static_cast<size_t>(min(*limit, this->_maxLimit));
        if (events.size() > cap)
        {
            events.resize(cap);
        }
    }

    return events;
};

vector<Event> SqliteEventRepository::_findByQuery(const Filters& filters)
{
    vector<string> wheres;
    vector<Parameter> params;

    auto addHexMembership = [&wheres, &params](const string& column, const vector<string>& values)
    {
        auto unique = _unique(values);
        if (unique.empty())
        {
            wheres.push_back("0");
            return;
        }

        wheres.push_back(column + " IN (" + _placeholders(unique.size()) + ")");
        for (const auto& value : unique)
        {
            params.push_back(nrelay::encoding::fromHex(value));
        }
    };

    if (filters.ids)
    {
        addHexMembership("id", *filters.ids);
    }

    if (filters.authors)
    {
        addHexMembership("pubkey", *filters.authors);
    }

    if (filters.kinds)
    {
        if (filters.kinds->empty())
        {
            wheres.push_back("0");
        }
        else
        {
            wheres.push_back("kind IN (" + _placeholders(filters.kinds->size()) + ")");
            for (int kind : *filters.kinds)
            {
                params.push_back(static_cast<int64_t>(kind));
            }
        }
    }

    if (filters.since)
    {
        wheres.push_back("created_at >= ?");
        params.push_back(static_cast<int64_t>(*filters.since));
    }

    if (filters.until)
    {
        wheres.push_back("created_at <= ?");
        params.push_back(static_cast<int64_t>(*filters.until));
    }

    for (const auto& [name, values] : filters.tags)
    {
        auto unique = _unique(values);
        if (unique.empty())
        {
            wheres.push_back("0");
            continue;
        }

        wheres.push_back(
            "EXISTS (SELECT 1 FROM tags WHERE tags.event_id = events.id AND tags.name = ? AND tags.value IN ("
            + _placeholders(unique.size()) + "))");
        params.push_back(name);
        for (const auto& value : unique)
        {
            params.push_back(_tagParameter(name, value));
        }
    }

    int limit = min(filters.limit.value_or(this->_defaultLimit), this->_maxLimit);
    params.push_back(static_cast<int64_t>(limit));

    string sql = "SELECT raw FROM events";
    if (!wheres.empty())
    {
        sql += " WHERE " + _join(wheres, " AND ");
    }
    sql += " ORDER BY created_at DESC LIMIT ?";

    lock_guard<mutex> lock(this->_database->statementMutex());

    auto statement = this->_database->prepare(sql);
    _bindAll(statement, params);

    vector<Event> events;
    while (statement.step())
    {
        try
        {
            events.push_back(this->_parseStoredEvent(statement.columnText(0)));
        }
        catch (const invalid_argument& e)
        {
            PLOG_ERROR << "Skipping unreadable stored event: " << e.what();
        }
    }

    return events;
};

Event SqliteEventRepository::_parseStoredEvent(const string& raw)
{
    return Event::fromString(raw);
};

#pragma endregion

#pragma region SqliteAccountRegistry

SqliteAccountRegistry::SqliteAccountRegistry(shared_ptr<SqliteDatabase> database)
: _database(database)
{
    lock_guard<mutex> lock(this->_database->statementMutex());
    this->_database->exec(
        "CREATE TABLE IF NOT EXISTS accounts ("
        "  pubkey BLOB PRIMARY KEY,"
        "  registered_at INTEGER NOT NULL"
        ")");
};

bool SqliteAccountRegistry::isRegistered(const string& pubkey)
{
    if (!encoding::isHex(pubkey, 64))
    {
        return false;
    }

    lock_guard<mutex> lock(this->_database->statementMutex());

    auto statement = this->_database->prepare("SELECT 1 FROM accounts WHERE pubkey = ?");
    statement.bind(1, encoding::fromHex(pubkey));

    return statement.step();
};

void SqliteAccountRegistry::registerAccount(const string& pubkey)
{
    if (!encoding::isHex(pubkey, 64))
    {
        throw invalid_argument("SqliteAccountRegistry::registerAccount: The pubkey must be 64 hex characters.");
    }

    lock_guard<mutex> lock(this->_database->statementMutex());

    auto statement = this->_database->prepare(
        "INSERT OR IGNORE INTO accounts (pubkey, registered_at) VALUES (?, strftime('%s', 'now'))");
    statement.bind(1, encoding::fromHex(pubkey));
    statement.step();
};

#pragma endregion
