#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace kioku::storage {

/**
 * Migration - one forward step of the store schema.
 *
 * Versions are recorded in the file header (PRAGMA user_version), so a
 * store at version N has had steps 1..N applied.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    // Rebuild subject_progress from assignments and pending progress once
    // every step of the upgrade has run.
    bool backfills_subject_progress = false;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            CREATE TABLE sync (
                assignments_updated_after TEXT,
                study_materials_updated_after TEXT
            );
            INSERT INTO sync (
                assignments_updated_after,
                study_materials_updated_after
            ) VALUES ('', '');

            CREATE TABLE assignments (
                id INTEGER PRIMARY KEY,
                pb BLOB
            );
            CREATE TABLE pending_progress (
                id INTEGER PRIMARY KEY,
                pb BLOB
            );
            CREATE TABLE study_materials (
                id INTEGER PRIMARY KEY,
                pb BLOB
            );
            CREATE TABLE user (
                id INTEGER PRIMARY KEY CHECK (id = 0),
                pb BLOB
            );
            CREATE TABLE pending_study_materials (
                id INTEGER PRIMARY KEY
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "assignments_by_subject",
        .up_sql = R"SQL(
            DELETE FROM assignments;
            UPDATE sync SET assignments_updated_after = '';
            ALTER TABLE assignments ADD COLUMN subject_id;
            CREATE INDEX idx_subject_id ON assignments (subject_id);
        )SQL"
    },
    {
        .version = 3,
        .name = "subject_progress",
        .up_sql = R"SQL(
            CREATE TABLE subject_progress (
                id INTEGER PRIMARY KEY,
                level INTEGER,
                srs_stage INTEGER,
                subject_type INTEGER
            );
        )SQL",
        .backfills_subject_progress = true
    },
    {
        .version = 4,
        .name = "error_log",
        .up_sql = R"SQL(
            CREATE TABLE error_log (
                date TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                stack TEXT,
                code INTEGER,
                description TEXT,
                request_url TEXT,
                response_url TEXT,
                request_data TEXT,
                request_headers TEXT,
                response_headers TEXT,
                response_data TEXT
            );
        )SQL"
    },
    {
        .version = 5,
        .name = "level_progressions",
        .up_sql = R"SQL(
            CREATE TABLE level_progressions (
                id INTEGER PRIMARY KEY,
                level INTEGER,
                pb BLOB
            );
        )SQL"
    }
};

/**
 * MigrationRunner - brings a store up to the latest schema.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Migrate to a specific version. All steps, the backfill and the version
     * bump happen in a single transaction.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> backfill_subject_progress();
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace kioku::storage
