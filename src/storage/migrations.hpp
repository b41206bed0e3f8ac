#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace jitstreamer::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 *
 * Only devices are durable. Sessions and the job queue live in memory and
 * start empty after a restart.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "devices",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS devices (
                identifier TEXT PRIMARY KEY,
                address TEXT NOT NULL UNIQUE,
                registered_at INTEGER NOT NULL,
                last_seen INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS devices;
        )SQL"
    },
    {
        .version = 2,
        .name = "device_peer_keys",
        .up_sql = R"SQL(
            ALTER TABLE devices ADD COLUMN public_key TEXT NOT NULL DEFAULT '';
            CREATE INDEX IF NOT EXISTS idx_devices_last_seen ON devices(last_seen);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_devices_last_seen;
            ALTER TABLE devices DROP COLUMN public_key;
        )SQL"
    }
};

/**
 * MigrationRunner - Applies and reverts schema migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);
    [[nodiscard]] Result<void, Error> rollback();
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> record_version(const Migration& m);
};

/**
 * Bring a database up to the latest schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace jitstreamer::storage
