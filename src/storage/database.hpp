#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <vector>

namespace kioku::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * Bind failures are remembered and reported by the next step(), so call
 * sites can bind a full parameter list and check once.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Statement& bind_text(int index, std::string_view text);
    Statement& bind_int(int index, int value);
    Statement& bind_int64(int index, int64_t value);
    Statement& bind_blob(int index, const std::vector<uint8_t>& data);
    Statement& bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Returns true if there's a row
    [[nodiscard]] Result<bool, Error> step();
    [[nodiscard]] Result<void, Error> reset();

private:
    void record_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    std::optional<Error> bind_error_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Not thread-safe on its own; Store serializes every unit of work that
 * touches it.
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

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Prepare, bind and run a statement that returns no rows.
     */
    template<typename Bind>
    [[nodiscard]] Result<void, Error> update(std::string_view sql, Bind&& bind) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        bind(stmt);
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        return Result<void, Error>::ok();
    }

    /**
     * Run a query and pass every row to a callback.
     */
    template<typename Bind, typename F>
    [[nodiscard]] Result<void, Error> query(std::string_view sql, Bind&& bind, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        bind(stmt);
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            auto row_result = callback(stmt);
            if (row_result.is_err()) {
                return row_result;
            }
        }

        return Result<void, Error>::ok();
    }

    /**
     * Single integer from the first column of the first row (0 when empty).
     */
    [[nodiscard]] Result<int64_t, Error> query_int(std::string_view sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
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

    /**
     * Schema version stored in the file header (PRAGMA user_version).
     */
    [[nodiscard]] Result<int, Error> user_version();
    [[nodiscard]] Result<void, Error> set_user_version(int version);

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    void rollback_after_failure();

    sqlite3* db_ = nullptr;
};

} // namespace kioku::storage
