#include <plog/Log.h>

#include "repository/event_repository.hpp"
#include "repository/sqlite_database.hpp"

using namespace nrelay::repository;
using namespace std;

#pragma region Statement

Statement::Statement(sqlite3* db, const string& sql)
: _db(db), _statement(nullptr, sqlite3_finalize)
{
    sqlite3_stmt* statement = nullptr;
    int result = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.length()), &statement, nullptr);
    this->_statement.reset(statement);

    if (result != SQLITE_OK)
    {
        throw RepositoryError(string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
};

void Statement::bind(int index, int64_t value)
{
    if (sqlite3_bind_int64(this->_statement.get(), index, value) != SQLITE_OK)
    {
        throw RepositoryError(string("Failed to bind parameter: ") + sqlite3_errmsg(this->_db));
    }
};

void Statement::bind(int index, const string& value)
{
    int result = sqlite3_bind_text(
        this->_statement.get(),
        index,
        value.c_str(),
        static_cast<int>(value.length()),
        SQLITE_TRANSIENT);

    if (result != SQLITE_OK)
    {
        throw RepositoryError(string("Failed to bind parameter: ") + sqlite3_errmsg(this->_db));
    }
};

void Statement::bind(int index, const vector<uint8_t>& value)
{
    int result = sqlite3_bind_blob(
        this->_statement.get(),
        index,
        value.data(),
        static_cast<int>(value.size()),
        SQLITE_TRANSIENT);

    if (result != SQLITE_OK)
    {
        throw RepositoryError(string("Failed to bind parameter: ") + sqlite3_errmsg(this->_db));
    }
};

bool Statement::step()
{
    int result = sqlite3_step(this->_statement.get());
    if (result == SQLITE_ROW)
    {
        return true;
    }
    if (result == SQLITE_DONE)
    {
        return false;
    }

    throw RepositoryError(string("Failed to execute statement: ") + sqlite3_errmsg(this->_db));
};

void Statement::reset()
{
    sqlite3_reset(this->_statement.get());
    sqlite3_clear_bindings(this->_statement.get());
};

int64_t Statement::columnInt(int column)
{
    return sqlite3_column_int64(this->_statement.get(), column);
};

string Statement::columnText(int column)
{
    const unsigned char* text = sqlite3_column_text(this->_statement.get(), column);
    if (text == nullptr)
    {
        return string();
    }

    return string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(this->_statement.get(), column));
};

#pragma endregion

#pragma region SqliteDatabase

SqliteDatabase::SqliteDatabase(const string& path)
{
    sqlite3* db = nullptr;
    int result = sqlite3_open_v2(
        path.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    this->_db = shared_ptr<sqlite3>(db, sqlite3_close_v2);

    if (result != SQLITE_OK)
    {
        string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
        throw RepositoryError("Failed to open database " + path + ": " + message);
    }

    sqlite3_busy_timeout(this->_db.get(), 5000);
    this->exec("PRAGMA foreign_keys = ON");
    this->exec("PRAGMA journal_mode = WAL");

    PLOG_INFO << "Opened database " << path;
};

void SqliteDatabase::exec(const string& sql)
{
    char* error = nullptr;
    int result = sqlite3_exec(this->_db.get(), sql.c_str(), nullptr, nullptr, &error);
    if (result != SQLITE_OK)
    {
        string message = error == nullptr ? sqlite3_errstr(result) : error;
        sqlite3_free(error);
        throw RepositoryError("Failed to execute " + sql + ": " + message);
    }
};

Statement SqliteDatabase::prepare(const string& sql)
{
    return Statement(this->_db.get(), sql);
};

int SqliteDatabase::changes()
{
    return sqlite3_changes(this->_db.get());
};

mutex& SqliteDatabase::statementMutex()
{
    return this->_mutex;
};

#pragma endregion

#pragma region Transaction

Transaction::Transaction(SqliteDatabase& database)
: _database(database)
{
    this->_database.exec("BEGIN IMMEDIATE");
};

Transaction::~Transaction()
{
    if (this->_committed)
    {
        return;
    }

    try
    {
        this->_database.exec("ROLLBACK");
    }
    catch (const RepositoryError& e)
    {
        PLOG_ERROR << "Failed to roll back transaction: " << e.what();
    }
};

void Transaction::commit()
{
    this->_database.exec("COMMIT");
    this->_committed = true;
};

#pragma endregion
