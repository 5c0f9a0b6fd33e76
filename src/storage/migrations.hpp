#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace braid::storage {

/**
 * Migration - one forward step of the sync state schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "sync_state",
        .up_sql = R"SQL(
            -- Changes waiting for the next cycle. `position` orders the FIFO;
            -- entries put back after a failed cycle get positions below the head.
            CREATE TABLE IF NOT EXISTS offline_queue (
                id TEXT PRIMARY KEY,
                position INTEGER NOT NULL,
                data_type TEXT NOT NULL,
                change_json TEXT NOT NULL,
                queued_at INTEGER NOT NULL,
                attempts INTEGER NOT NULL DEFAULT 0,
                last_error TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_offline_queue_position ON offline_queue(position);

            -- Per data type progress against the remote
            CREATE TABLE IF NOT EXISTS sync_type_state (
                data_type TEXT PRIMARY KEY,
                last_sync INTEGER,
                remote_cursor INTEGER NOT NULL DEFAULT 0
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "entity_heads",
        .up_sql = R"SQL(
            -- Last change known for each entity, local or remote
            CREATE TABLE IF NOT EXISTS sync_entity_heads (
                data_type TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                change_json TEXT NOT NULL,
                PRIMARY KEY (data_type, entity_id)
            );
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database up to the latest schema.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations in one transaction.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace braid::storage
