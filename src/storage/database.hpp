#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jitstreamer::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    /**
     * Bind every argument in order starting at parameter 1.
     * Stops at the first failing bind.
     */
    template<typename... Args>
    [[nodiscard]] Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        Result<void, Error> status = Result<void, Error>::ok();
        ((status = status.is_ok() ? bind_value(++index, args) : status), ...);
        return status;
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Returns true if a row is available.
     */
    [[nodiscard]] Result<bool, Error> step();
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;

    Result<void, Error> bind_value(int index, std::string_view v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const std::string& v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const char* v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, int v) { return bind_int(index, v); }
    Result<void, Error> bind_value(int index, int64_t v) { return bind_int64(index, v); }
    Result<void, Error> bind_value(int index, std::nullopt_t) { return bind_null(index); }

    [[nodiscard]] Error error(const char* what, int rc) const;
};

/**
 * Database - SQLite connection.
 *
 * Opened with foreign keys on, WAL journaling and synchronous=FULL so a
 * committed write survives a crash immediately after it returns.
 * Not internally synchronized; callers that share a connection across
 * threads serialize access themselves.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run a query and hand each row to `callback`.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }
        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` inside a transaction. Commits when `f` returns Ok, rolls back
     * otherwise. A failed rollback is appended to the returned error.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * Transaction RAII guard.
 * Rolls back on destruction unless commit() succeeded.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * Error from BEGIN, if it failed.
     */
    [[nodiscard]] const std::optional<Error>& begin_error() const { return begin_error_; }

    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
    std::optional<Error> begin_error_;
};

} // namespace jitstreamer::storage
