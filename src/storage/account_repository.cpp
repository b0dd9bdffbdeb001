#include "storage/account_repository.hpp"
#include "storage/record_codec.hpp"

namespace kioku::storage {

Result<std::optional<User>, Error> AccountRepository::get_user() {
    std::optional<User> found;

    auto result = db_.query("SELECT pb FROM user WHERE id = 0;",
        [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_user(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            found = std::move(decoded).unwrap();
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::optional<User>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<User>, Error>::ok(std::move(found));
}

Result<void, Error> AccountRepository::save_user(const User& user) {
    return db_.update("REPLACE INTO user (id, pb) VALUES (0, ?);",
        [&](Statement& stmt) { stmt.bind_blob(1, encode_user(user)); });
}

Result<std::vector<Level>, Error> AccountRepository::get_levels() {
    std::vector<Level> levels;

    auto result = db_.query("SELECT pb FROM level_progressions ORDER BY level, id;",
        [](Statement&) {},
        [&](Statement& stmt) -> Result<void, Error> {
            auto decoded = decode_level(stmt.column_blob(0));
            if (decoded.is_err()) {
                return Result<void, Error>::err(decoded.unwrap_err());
            }
            levels.push_back(std::move(decoded).unwrap());
            return Result<void, Error>::ok();
        });

    if (result.is_err()) {
        return Result<std::vector<Level>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Level>, Error>::ok(std::move(levels));
}

Result<void, Error> AccountRepository::save_level(const Level& level) {
    return db_.update("REPLACE INTO level_progressions (id, level, pb) VALUES (?, ?, ?);",
        [&](Statement& stmt) {
            stmt.bind_int64(1, level.id)
                .bind_int(2, level.level)
                .bind_blob(3, encode_level(level));
        });
}

} // namespace kioku::storage
