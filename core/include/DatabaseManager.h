#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ParaCopy {

/**
 * @brief Raised by the SQLite wrappers on any failed call
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief RAII Transaction class for automatic rollback on exception
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    void commit();
    void rollback();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool finished_;
    std::string savepoint_;
};

/**
 * @brief Prepared statement wrapper for type-safe parameter binding
 */
class PreparedStatement {
public:
    PreparedStatement(sqlite3* db, const std::string& sql);
    ~PreparedStatement();

    PreparedStatement& bind(int index, int value);
    PreparedStatement& bind(int index, int64_t value);
    PreparedStatement& bind(int index, const std::string& value);

    /**
     * @brief Advance the statement
     * @return true when a result row is available, false when done
     * @throws DatabaseError on any other result code
     */
    bool step();
    void reset();

    int getColumnInt(int index) const;
    int64_t getColumnInt64(int index) const;
    std::string getColumnString(int index) const;

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief Owns one SQLite connection
 *
 * Features:
 * - WAL journal with synchronous=FULL so every committed statement survives a crash
 * - user_version based migrations
 * - RAII transactions
 *
 * Not internally synchronized; callers serialize access.
 */
class DatabaseManager {
public:
    struct Migration {
        int version;
        std::string description;
        std::string upSql;
    };

    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Open the file (creating it if absent), configure durability and run migrations
     * @throws DatabaseError when the file cannot be opened or migrated
     */
    void initialize(const std::vector<Migration>& migrations);

    std::unique_ptr<PreparedStatement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (DDL, pragmas)
     * @throws DatabaseError on failure
     */
    void execute(const std::string& sql);

    std::unique_ptr<Transaction> beginTransaction();

    int changes() const;
    const std::string& path() const { return dbPath_; }

private:
    sqlite3* db_;
    std::string dbPath_;

    void runMigrations(const std::vector<Migration>& migrations);
    int getCurrentVersion();
};

} // namespace ParaCopy
