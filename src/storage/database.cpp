#include "storage/database.hpp"
#include "core/logging.hpp"

namespace braid::storage {

namespace {

Result<void, Error> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{std::string("Failed to bind ") + what, rc});
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

Result<void, Error> Statement::bind_optional_text(
    int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

Result<void, Error> Statement::bind_optional_int64(
    int index, const std::optional<int64_t>& value) {
    return value ? bind_int64(index, *value) : bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
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

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_int64(index);
}

Result<bool, Error> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(Error{db ? sqlite3_errmsg(db) : "Step failed", rc});
}

Result<void, Error> Statement::reset() {
    const int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{"Reset failed", rc});
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_)
    , write_mutex_(std::move(other.write_mutex_))
{
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
        write_mutex_ = std::move(other.write_mutex_);
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        qCWarning(braidStorageLog) << "Failed to open" << path.c_str() << ":" << error.c_str();
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(raw);
    // WAL is not available for in-memory databases; SQLite keeps "memory".
    for (const char* pragma : {"PRAGMA foreign_keys = ON;", "PRAGMA journal_mode = WAL;"}) {
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
    if (!db_) {
        return Result<Statement, Error>::err(Error{"Database not open", SQLITE_MISUSE});
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                      static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error{"Database not open", SQLITE_MISUSE});
    }
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
    }
    return Result<void, Error>::ok();
}

std::unique_lock<std::recursive_mutex> Database::lock_writes() {
    if (!write_mutex_) {
        return {};
    }
    return std::unique_lock<std::recursive_mutex>(*write_mutex_);
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

void Database::rollback_after_failure() {
    auto result = rollback();
    if (result.is_err()) {
        qCWarning(braidStorageLog) << "Rollback failed:" << result.unwrap_err().message.c_str();
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db)
    , lock_(db.lock_writes())
    , begin_result_(db.begin_transaction())
{
    active_ = begin_result_.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        auto result = db_.rollback();
        if (result.is_err()) {
            qCWarning(braidStorageLog) << "Rollback failed:" << result.unwrap_err().message.c_str();
        }
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return begin_result_.is_err() ? begin_result_
                                      : Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

} // namespace braid::storage
