#pragma once

#include "storage/database.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <memory>
#include <mutex>
#include <utility>
#include <string>
#include <vector>

namespace kioku::storage {

/**
 * Store - the single access path to the local cache database.
 *
 * Every read or write is submitted as a unit of work and runs under one
 * mutex, so callers on different threads never interleave. Write units run
 * inside a transaction: either every statement in the unit commits or none
 * does.
 *
 *   auto count = store.read([](Database& db) {
 *       return PendingProgressRepository(db).count();
 *   });
 */
class Store {
public:
    /**
     * Open (or create) the store file and migrate it to the latest schema.
     */
    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open(const std::string& path);

    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open_memory();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    template<typename F>
    [[nodiscard]] auto read(F&& f) -> decltype(f(std::declval<Database&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return f(db_);
    }

    template<typename F>
    [[nodiscard]] auto write(F&& f) -> decltype(f(std::declval<Database&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_.transaction([&]() { return f(db_); });
    }

    /**
     * Drop assignments and derived progress for subjects that no longer
     * exist in the catalogue.
     */
    [[nodiscard]] Result<void, Error> purge_subjects(const std::vector<SubjectId>& subject_ids);

    /**
     * Empty every table and reset the fetch cursors. Remote state is untouched.
     */
    [[nodiscard]] Result<void, Error> clear_all();

private:
    explicit Store(Database db) : db_(std::move(db)) {}

    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> prepare(Database db);

    std::mutex mutex_;
    Database db_;
};

} // namespace kioku::storage
