#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace kioku::storage {

/**
 * AccountRepository - the singleton user record and the level history.
 */
class AccountRepository {
public:
    explicit AccountRepository(Database& db) : db_(db) {}

    // User operations

    [[nodiscard]] Result<std::optional<User>, Error> get_user();

    [[nodiscard]] Result<void, Error> save_user(const User& user);

    // Level progression operations

    [[nodiscard]] Result<std::vector<Level>, Error> get_levels();

    [[nodiscard]] Result<void, Error> save_level(const Level& level);

private:
    Database& db_;
};

} // namespace kioku::storage
