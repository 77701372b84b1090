#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace nrelay
{
namespace repository
{
/**
 * @brief A prepared SQLite statement that is finalized when it goes out of scope.
 */
class Statement
{
public:
    Statement(sqlite3* db, const std::string& sql);

    void bind(int index, int64_t value);

    void bind(int index, const std::string& value);

    void bind(int index, const std::vector<uint8_t>& value);

    /**
     * @brief Advances the statement.
     * @returns True if a row is available, false once the statement is done.
     * @throws `RepositoryError` if SQLite reports an error.
     */
    bool step();

    /**
     * @brief Resets the statement and clears its bindings so it can run again.
     */
    void reset();

    int64_t columnInt(int column);

    std::string columnText(int column);

private:
    sqlite3* _db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> _statement;
};

/**
 * @brief A SQLite connection shared by the repositories of one relay.
 * @remark Callers hold `statementMutex()` for the duration of each statement or transaction.
 */
class SqliteDatabase
{
public:
    /**
     * @brief Opens or creates the database at the given path.
     * @param path A file path, or `:memory:` for a private in-memory database.
     * @throws `RepositoryError` if the database cannot be opened.
     */
    SqliteDatabase(const std::string& path);

    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    int changes();

    std::mutex& statementMutex();

private:
    std::shared_ptr<sqlite3> _db;
    std::mutex _mutex;
};

/**
 * @brief Rolls back the enclosed statements unless `commit()` is called.
 */
class Transaction
{
public:
    Transaction(SqliteDatabase& database);

    ~Transaction();

    void commit();

private:
    SqliteDatabase& _database;
    bool _committed = false;
};
} // namespace repository
} // namespace nrelay
