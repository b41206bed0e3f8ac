#include "storage/database.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jitstreamerStorageLog, "jitstreamer.storage")

namespace jitstreamer::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Error Statement::error(const char* what, int rc) const {
    std::string message = what;
    if (sqlite3* db = stmt_ ? sqlite3_db_handle(stmt_.get()) : nullptr) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    return Error{std::move(message), ErrorCode::Storage, rc};
}

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int(int index, int value) {
    int rc = sqlite3_bind_int(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(error("Failed to bind int", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(error("Step failed", rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error{error, ErrorCode::Storage, rc});
    }

    Database db(handle);
    sqlite3_busy_timeout(handle, 5000);

    for (const char* pragma : {"PRAGMA foreign_keys = ON;",
                               "PRAGMA journal_mode = WAL;",
                               "PRAGMA synchronous = FULL;"}) {
        auto pragma_result = db.execute(pragma);
        if (pragma_result.is_err()) {
            return Result<Database, Error>::err(pragma_result.unwrap_err());
        }
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), ErrorCode::Storage, rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, ErrorCode::Storage, rc});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    if (!active_) {
        begin_error_ = result.unwrap_err();
    }
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback().inspect_err([](const Error& e) {
            qCWarning(jitstreamerStorageLog) << "Rollback on scope exit failed:" << e.message.c_str();
        });
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(
            begin_error_.value_or(Error{"No active transaction", ErrorCode::Storage}));
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

Result<void, Error> TransactionGuard::rollback() {
    if (!active_) {
        return Result<void, Error>::ok();
    }
    active_ = false;
    return db_.rollback();
}

} // namespace jitstreamer::storage
