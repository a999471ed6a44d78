#include "DatabaseManager.h"
#include "Logger.h"

namespace ParaCopy {

namespace {

void execOrThrow(sqlite3* db, const std::string& sql, const std::string& context) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errmsg(db);
        if (errMsg) sqlite3_free(errMsg);
        throw DatabaseError(context + ": " + message);
    }
}

} // namespace

// Transaction Implementation
Transaction::Transaction(sqlite3* db) : db_(db), finished_(false) {
    savepoint_ = "txn_" + std::to_string(reinterpret_cast<uintptr_t>(this));
    execOrThrow(db_, "SAVEPOINT " + savepoint_, "Failed to create transaction");
}

Transaction::~Transaction() {
    if (!finished_) {
        rollback();
    }
}

void Transaction::commit() {
    if (!finished_) {
        execOrThrow(db_, "RELEASE " + savepoint_, "Failed to commit transaction");
        finished_ = true;
    }
}

void Transaction::rollback() {
    if (finished_) {
        return;
    }
    finished_ = true;
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("ROLLBACK TO " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK ||
        sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "Failed to roll back transaction: " +
                               std::string(errMsg ? errMsg : sqlite3_errmsg(db_)), "DatabaseManager");
    }
    if (errMsg) sqlite3_free(errMsg);
}

// PreparedStatement Implementation
PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw DatabaseError("Failed to prepare statement: " + sql + " - " + sqlite3_errmsg(db_));
    }
}

PreparedStatement::~PreparedStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

PreparedStatement& PreparedStatement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

bool PreparedStatement::step() {
    int result = sqlite3_step(stmt_);
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
}

void PreparedStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int PreparedStatement::getColumnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t PreparedStatement::getColumnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string PreparedStatement::getColumnString(int index) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
}

// DatabaseManager Implementation
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : db_(nullptr), dbPath_(dbPath) {}

DatabaseManager::~DatabaseManager() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void DatabaseManager::initialize(const std::vector<Migration>& migrations) {
    auto& logger = Logger::instance();
    logger.log(LogLevel::DEBUG, "Opening database: " + dbPath_, "DatabaseManager");

    if (sqlite3_open_v2(dbPath_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw DatabaseError("Failed to open database " + dbPath_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);
    execOrThrow(db_, "PRAGMA journal_mode=WAL;", "Failed to enable WAL mode");
    execOrThrow(db_, "PRAGMA synchronous=FULL;", "Failed to set synchronous mode");

    runMigrations(migrations);

    logger.log(LogLevel::DEBUG, "Database initialized: " + dbPath_, "DatabaseManager");
}

std::unique_ptr<PreparedStatement> DatabaseManager::prepare(const std::string& sql) {
    return std::make_unique<PreparedStatement>(db_, sql);
}

void DatabaseManager::execute(const std::string& sql) {
    execOrThrow(db_, sql, "Failed to execute SQL");
}

std::unique_ptr<Transaction> DatabaseManager::beginTransaction() {
    return std::make_unique<Transaction>(db_);
}

int DatabaseManager::changes() const {
    return sqlite3_changes(db_);
}

void DatabaseManager::runMigrations(const std::vector<Migration>& migrations) {
    int current = getCurrentVersion();
    for (const auto& migration : migrations) {
        if (migration.version <= current) {
            continue;
        }
        Logger::instance().log(LogLevel::INFO, "Applying migration " + std::to_string(migration.version) +
                               ": " + migration.description, "DatabaseManager");
        Transaction txn(db_);
        execOrThrow(db_, migration.upSql, "Migration " + std::to_string(migration.version) + " failed");
        execOrThrow(db_, "PRAGMA user_version = " + std::to_string(migration.version) + ";",
                    "Failed to record schema version");
        txn.commit();
        current = migration.version;
    }
}

int DatabaseManager::getCurrentVersion() {
    PreparedStatement stmt(db_, "PRAGMA user_version;");
    return stmt.step() ? stmt.getColumnInt(0) : 0;
}

} // namespace ParaCopy
