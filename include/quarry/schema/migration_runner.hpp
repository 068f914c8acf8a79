#pragma once

/// @file migration_runner.hpp
/// @brief Applies, reverts and reports migrations, recording each applied
///        migration with its batch number.

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/config_manager.hpp"
#include "quarry/schema/migration.hpp"

namespace quarry::schema {

/// Runner settings, loadable from YAML:
/// @code
///   migrations:
///     table: migrations
///     directory: database/migrations
/// @endcode
struct MigratorConfig {
    std::string table = "migrations";
    std::filesystem::path directory = "migrations";

    /// Read settings under @p prefix; absent keys keep their defaults.
    [[nodiscard]] static OrmResult<MigratorConfig> load(const foundation::ConfigManager& config,
                                                        std::string_view prefix = "migrations");
};

/// One line of the status report.
struct MigrationStatus {
    std::string name;
    bool ran = false;
    std::optional<std::int64_t> batch;
};

/// True when @p name is "<14-digit timestamp>_<identifier>".
[[nodiscard]] bool isValidMigrationName(std::string_view name);

/// Runs migrations in lexicographic name order.
///
/// Each migrate() call applies every pending migration under one new batch
/// number and stops at the first failure; rollback() reverts the latest
/// batch in reverse order. Migrations run strictly one after another.
///
/// The repository table is created on first use and outlives rollback()
/// and reset(); only its records are removed.
///
/// Example:
/// @code
///   MigrationRunner runner(db);
///   (void)runner.discover();
///   auto ran = runner.migrate();
/// @endcode
class MigrationRunner {
public:
    explicit MigrationRunner(orm::Database& db, MigratorConfig config = {});

    /// Register @p migration under @p name.
    /// @return InvalidMigrationName or AlreadyExists on rejection.
    [[nodiscard]] OrmResult<void> add(std::string name, std::unique_ptr<Migration> migration);

    /// Register every "<name>.up.sql" in the configured directory together
    /// with its "<name>.down.sql". Returns the number registered.
    [[nodiscard]] OrmResult<std::size_t> discover();

    /// Apply pending migrations. Returns the names applied.
    [[nodiscard]] OrmResult<std::vector<std::string>> migrate();

    /// Revert the latest batch. Returns the names reverted. Fails with
    /// MigrationNotFound before reverting anything when a member of the
    /// batch is not registered.
    [[nodiscard]] OrmResult<std::vector<std::string>> rollback();

    /// Revert every batch, newest first.
    [[nodiscard]] OrmResult<std::vector<std::string>> reset();

    /// Drop every table, then migrate from scratch.
    [[nodiscard]] OrmResult<std::vector<std::string>> fresh();

    /// Every registered migration plus any recorded one no longer
    /// registered, in name order.
    [[nodiscard]] OrmResult<std::vector<MigrationStatus>> status();

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] const MigratorConfig& config() const noexcept { return config_; }

private:
    struct Record {
        std::string name;
        std::int64_t batch = 0;
    };

    [[nodiscard]] OrmResult<void> ensureRepository();
    [[nodiscard]] OrmResult<std::vector<Record>> records();
    [[nodiscard]] OrmResult<std::vector<std::string>> revert(std::vector<Record> records,
                                                             std::string_view verb);

    orm::Database* db_;
    MigratorConfig config_;
    std::map<std::string, std::unique_ptr<Migration>> migrations_;
};

} // namespace quarry::schema
