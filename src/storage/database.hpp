#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace braid::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int(int index, int value);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_null(int index);

    // Binds NULL when the value is absent.
    [[nodiscard]] Result<void, Error> bind_optional_text(
        int index, const std::optional<std::string>& text);
    [[nodiscard]] Result<void, Error> bind_optional_int64(
        int index, const std::optional<int64_t>& value);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int index) const;

    /**
     * Advance one row. ok(true) while a row is available, ok(false) when done.
     */
    [[nodiscard]] Result<bool, Error> step();
    [[nodiscard]] Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - owning handle to one SQLite connection.
 *
 * Every call reports failure through Result with the SQLite return code in
 * Error::code. The sync state lives in a single file per profile, or in
 * memory when no path is configured.
 *
 * The connection is shared between threads. Writers hold lock_writes() for
 * the whole of their statements, and transactions hold it from BEGIN to
 * COMMIT, so a write from another thread never lands inside someone else's
 * transaction.
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
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock_writes();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` inside a transaction. Commits when `f` returns ok, rolls back
     * and returns its error otherwise.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto lock = lock_writes();
        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            rollback_after_failure();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            rollback_after_failure();
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    // The original failure is what the caller sees; a failed rollback is logged.
    void rollback_after_failure();

    sqlite3* db_ = nullptr;
    std::unique_ptr<std::recursive_mutex> write_mutex_ = std::make_unique<std::recursive_mutex>();
};

/**
 * Transaction RAII guard. Rolls back unless commit() succeeded.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> begin_result() const { return begin_result_; }
    [[nodiscard]] Result<void, Error> commit();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    Result<void, Error> begin_result_;
    bool active_ = false;
};

} // namespace braid::storage
