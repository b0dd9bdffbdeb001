#include "storage/database.hpp"
#include "core/log.hpp"

namespace kioku::storage {

// ============================================================================
// Statement implementation
// ============================================================================

void Statement::record_bind(int rc, const char* what) {
    if (rc != SQLITE_OK && !bind_error_) {
        bind_error_ = Error{std::string("Failed to bind ") + what, rc};
    }
}

Statement& Statement::bind_text(int index, std::string_view text) {
    record_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                  static_cast<int>(text.size()), SQLITE_TRANSIENT),
                "text");
    return *this;
}

Statement& Statement::bind_int(int index, int value) {
    record_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
    return *this;
}

Statement& Statement::bind_int64(int index, int64_t value) {
    record_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
    return *this;
}

Statement& Statement::bind_blob(int index, const std::vector<uint8_t>& data) {
    // A zero-length blob still needs a non-null pointer or SQLite binds NULL.
    static const char empty = 0;
    const void* safe_data = data.empty() ? static_cast<const void*>(&empty) : data.data();
    record_bind(sqlite3_bind_blob(stmt_.get(), index, safe_data,
                                  static_cast<int>(data.size()), SQLITE_TRANSIENT),
                "blob");
    return *this;
}

Statement& Statement::bind_null(int index) {
    record_bind(sqlite3_bind_null(stmt_.get(), index), "null");
    return *this;
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

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
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
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{"Reset failed", rc});
    }
    bind_error_.reset();
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
    int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(handle);
    if (path != ":memory:") {
        auto wal_result = db.execute("PRAGMA journal_mode = WAL;");
        if (wal_result.is_err()) {
            qCWarning(kiokuStoreLog) << "Database: WAL unavailable:"
                                     << wal_result.unwrap_err().message.c_str();
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

Result<Statement, Error> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
    }
    return Result<void, Error>::ok();
}

Result<int64_t, Error> Database::query_int(std::string_view sql) {
    auto stmt_result = prepare(sql);
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<int64_t, Error>::ok(0);
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
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
        qCWarning(kiokuStoreLog) << "Database: rollback failed:"
                                 << result.unwrap_err().message.c_str();
    }
}

Result<int, Error> Database::user_version() {
    return query_int("PRAGMA user_version;").map([](int64_t v) {
        return static_cast<int>(v);
    });
}

Result<void, Error> Database::set_user_version(int version) {
    // PRAGMA does not accept bound parameters.
    return execute("PRAGMA user_version = " + std::to_string(version) + ";");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace kioku::storage
