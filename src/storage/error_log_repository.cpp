#include "storage/error_log_repository.hpp"

#include <algorithm>

namespace kioku::storage {

namespace {

void bind_optional_text(Statement& stmt, int index, const std::string& value) {
    if (value.empty()) {
        stmt.bind_null(index);
    } else {
        stmt.bind_text(index, value);
    }
}

} // namespace

Result<void, Error> ErrorLogRepository::append(const ErrorLogEntry& entry, int capacity) {
    const int keep = std::max(capacity, 1) - 1;
    auto prune = db_.update(R"SQL(
        DELETE FROM error_log WHERE ROWID IN (
            SELECT ROWID FROM error_log ORDER BY ROWID DESC LIMIT -1 OFFSET ?
        );
    )SQL", [&](Statement& stmt) { stmt.bind_int(1, keep); });
    if (prune.is_err()) {
        return prune;
    }

    return db_.update(R"SQL(
        INSERT INTO error_log (
            code, description, request_url, response_url,
            request_data, request_headers, response_headers, response_data)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL", [&](Statement& stmt) {
        if (entry.code) {
            stmt.bind_int(1, *entry.code);
        } else {
            stmt.bind_null(1);
        }
        bind_optional_text(stmt, 2, entry.description);
        bind_optional_text(stmt, 3, entry.request_url);
        bind_optional_text(stmt, 4, entry.response_url);
        bind_optional_text(stmt, 5, entry.request_data);
        bind_optional_text(stmt, 6, entry.request_headers);
        bind_optional_text(stmt, 7, entry.response_headers);
        bind_optional_text(stmt, 8, entry.response_data);
    });
}

Result<std::vector<ErrorLogEntry>, Error> ErrorLogRepository::get_all() {
    std::vector<ErrorLogEntry> entries;

    auto result = db_.query(R"SQL(
        SELECT date, code, description, request_url, response_url,
               request_data, request_headers, response_headers, response_data
        FROM error_log ORDER BY ROWID DESC;
    )SQL", [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            ErrorLogEntry entry;
            entry.date = stmt.column_text(0);
            if (!stmt.column_is_null(1)) {
                entry.code = stmt.column_int(1);
            }
            entry.description = stmt.column_text(2);
            entry.request_url = stmt.column_text(3);
            entry.response_url = stmt.column_text(4);
            entry.request_data = stmt.column_text(5);
            entry.request_headers = stmt.column_text(6);
            entry.response_headers = stmt.column_text(7);
            entry.response_data = stmt.column_text(8);
            entries.push_back(std::move(entry));
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<ErrorLogEntry>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<ErrorLogEntry>, Error>::ok(std::move(entries));
}

Result<int64_t, Error> ErrorLogRepository::count() {
    return db_.query_int("SELECT COUNT(*) FROM error_log;");
}

} // namespace kioku::storage
