/// @file migration_runner.cpp
/// @brief MigrationRunner implementation.

#include "quarry/schema/migration_runner.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/orm/database.hpp"
#include "quarry/schema/schema.hpp"

namespace quarry::schema {

using db::DbValue;
using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;

namespace {

constexpr std::size_t kTimestampDigits = 14;
constexpr std::string_view kUpSuffix = ".up.sql";
constexpr std::string_view kDownSuffix = ".down.sql";

template <typename T>
OrmResult<T> migrationFail(ErrorCode code, std::string message, std::string_view operation,
                           std::string_view name = {}) {
    ErrorDetail detail;
    detail.operation = std::string(operation);
    detail.table = std::string(name);
    return foundation::failWith<T>(code, std::move(message), std::move(detail));
}

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration and naming
// ---------------------------------------------------------------------------

OrmResult<MigratorConfig> MigratorConfig::load(const foundation::ConfigManager& config,
                                               std::string_view prefix) {
    MigratorConfig out;
    std::string base(prefix);

    auto table = config.getOr<std::string>(base + ".table", out.table);
    if (table.hasError()) {
        return OrmResult<MigratorConfig>::err(std::move(table).error());
    }
    auto directory = config.getOr<std::string>(base + ".directory", out.directory.string());
    if (directory.hasError()) {
        return OrmResult<MigratorConfig>::err(std::move(directory).error());
    }
    out.table = std::move(table).value();
    out.directory = std::move(directory).value();

    if (out.table.empty()) {
        return OrmResult<MigratorConfig>::err(foundation::OrmError(
            ErrorCode::InvalidConfiguration, "migrations table name must not be empty"));
    }
    return OrmResult<MigratorConfig>::ok(std::move(out));
}

bool isValidMigrationName(std::string_view name) {
    if (name.size() < kTimestampDigits + 2 || name[kTimestampDigits] != '_') {
        return false;
    }
    for (std::size_t i = 0; i < kTimestampDigits; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    for (std::size_t i = kTimestampDigits + 1; i < name.size(); ++i) {
        auto c = static_cast<unsigned char>(name[i]);
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

MigrationRunner::MigrationRunner(orm::Database& db, MigratorConfig config)
    : db_(&db), config_(std::move(config)) {}

OrmResult<void> MigrationRunner::add(std::string name, std::unique_ptr<Migration> migration) {
    if (!isValidMigrationName(name)) {
        return migrationFail<void>(ErrorCode::InvalidMigrationName,
                                   "migration name '" + name +
                                       "' does not match <14-digit timestamp>_<name>",
                                   "register", name);
    }
    if (migrations_.count(name) > 0) {
        return migrationFail<void>(ErrorCode::AlreadyExists,
                                   "migration '" + name + "' is already registered", "register",
                                   name);
    }
    migrations_.emplace(std::move(name), std::move(migration));
    return OrmResult<void>::ok();
}

OrmResult<std::size_t> MigrationRunner::discover() {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.directory, ec)) {
        return migrationFail<std::size_t>(
            ErrorCode::MigrationNotFound,
            "migrations directory not found: " + config_.directory.string(), "discover");
    }

    std::vector<std::filesystem::path> ups;
    for (const auto& entry : std::filesystem::directory_iterator(config_.directory, ec)) {
        auto file = entry.path().filename().string();
        if (entry.is_regular_file() && endsWith(file, kUpSuffix)) {
            ups.push_back(entry.path());
        }
    }
    if (ec) {
        return migrationFail<std::size_t>(ErrorCode::MigrationFailed,
                                          "cannot list " + config_.directory.string() + ": " +
                                              ec.message(),
                                          "discover");
    }
    std::sort(ups.begin(), ups.end());

    std::size_t added = 0;
    for (const auto& up : ups) {
        auto file = up.filename().string();
        auto name = file.substr(0, file.size() - kUpSuffix.size());
        auto down = up.parent_path() / (name + std::string(kDownSuffix));
        if (!std::filesystem::exists(down, ec)) {
            return migrationFail<std::size_t>(ErrorCode::MigrationNotFound,
                                              "missing " + down.filename().string(), "discover",
                                              name);
        }
        if (migrations_.count(name) > 0) {
            continue;
        }
        auto registered = add(name, std::make_unique<SqlFileMigration>(up, down));
        if (registered.hasError()) {
            return OrmResult<std::size_t>::err(std::move(registered).error());
        }
        ++added;
    }
    QUARRY_LOG_DEBUG(LogCategory::Migration, "discovered " + std::to_string(added) +
                                                 " migration(s) in " +
                                                 config_.directory.string());
    return OrmResult<std::size_t>::ok(added);
}

std::vector<std::string> MigrationRunner::names() const {
    std::vector<std::string> out;
    out.reserve(migrations_.size());
    for (const auto& [name, migration] : migrations_) {
        out.push_back(name);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Repository
// ---------------------------------------------------------------------------

OrmResult<void> MigrationRunner::ensureRepository() {
    auto schema = db_->schema();
    auto exists = schema.hasTable(config_.table);
    if (exists.hasError()) {
        return OrmResult<void>::err(std::move(exists).error());
    }
    if (exists.value()) {
        return OrmResult<void>::ok();
    }
    return schema.create(config_.table, [](Blueprint& table) {
        table.increments("id");
        table.string("migration").unique();
        table.integer("batch");
        table.timestamp("executed_at").nullable();
    });
}

OrmResult<std::vector<MigrationRunner::Record>> MigrationRunner::records() {
    auto ready = ensureRepository();
    if (ready.hasError()) {
        return OrmResult<std::vector<Record>>::err(std::move(ready).error());
    }
    auto rows = db_->table(config_.table).orderBy("batch").orderBy("migration").get();
    if (rows.hasError()) {
        return OrmResult<std::vector<Record>>::err(std::move(rows).error());
    }
    std::vector<Record> out;
    out.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        Record record;
        if (auto it = row.find("migration"); it != row.end()) {
            record.name = db::toDisplayString(it->second);
        }
        if (auto it = row.find("batch"); it != row.end()) {
            if (auto number = db::toNumber(it->second)) {
                record.batch = static_cast<std::int64_t>(*number);
            }
        }
        out.push_back(std::move(record));
    }
    return OrmResult<std::vector<Record>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Verbs
// ---------------------------------------------------------------------------

OrmResult<std::vector<std::string>> MigrationRunner::migrate() {
    using Names = std::vector<std::string>;
    auto ran = records();
    if (ran.hasError()) {
        return OrmResult<Names>::err(std::move(ran).error());
    }

    std::set<std::string> applied;
    std::int64_t batch = 0;
    for (const auto& record : ran.value()) {
        applied.insert(record.name);
        batch = std::max(batch, record.batch);
    }
    ++batch;

    Names done;
    for (auto& [name, migration] : migrations_) {
        if (applied.count(name) > 0) {
            continue;
        }
        QUARRY_LOG_INFO(LogCategory::Migration, "migrating " + name);
        auto result = migration->up(*db_);
        if (result.hasError()) {
            QUARRY_LOG_ERROR(LogCategory::Migration,
                             "migration " + name + " failed: " +
                                 std::string(result.error().message()));
            return OrmResult<Names>::err(std::move(result).error());
        }
        auto recorded = db_->table(config_.table)
                            .insert({{"migration", name},
                                     {"batch", batch},
                                     {"executed_at", db::currentTimestamp()}});
        if (recorded.hasError()) {
            return OrmResult<Names>::err(std::move(recorded).error());
        }
        QUARRY_LOG_INFO(LogCategory::Migration, "migrated " + name);
        done.push_back(name);
    }
    if (done.empty()) {
        QUARRY_LOG_INFO(LogCategory::Migration, "nothing to migrate");
    }
    return OrmResult<Names>::ok(std::move(done));
}

OrmResult<std::vector<std::string>> MigrationRunner::revert(std::vector<Record> targets,
                                                           std::string_view verb) {
    using Names = std::vector<std::string>;
    // Newest batch first, reverse name order within a batch.
    std::sort(targets.begin(), targets.end(), [](const Record& a, const Record& b) {
        if (a.batch != b.batch) {
            return a.batch > b.batch;
        }
        return a.name > b.name;
    });

    // Resolve every target first so a missing one leaves the batch untouched.
    std::vector<Migration*> resolved;
    resolved.reserve(targets.size());
    for (const auto& record : targets) {
        auto it = migrations_.find(record.name);
        if (it == migrations_.end()) {
            return migrationFail<Names>(ErrorCode::MigrationNotFound,
                                        "migration '" + record.name + "' is not registered",
                                        verb, record.name);
        }
        resolved.push_back(it->second.get());
    }

    Names done;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        const auto& record = targets[i];
        QUARRY_LOG_INFO(LogCategory::Migration, "rolling back " + record.name);
        auto result = resolved[i]->down(*db_);
        if (result.hasError()) {
            QUARRY_LOG_ERROR(LogCategory::Migration,
                             "rollback of " + record.name + " failed: " +
                                 std::string(result.error().message()));
            return OrmResult<Names>::err(std::move(result).error());
        }
        auto removed = db_->table(config_.table).where("migration", record.name).remove();
        if (removed.hasError()) {
            return OrmResult<Names>::err(std::move(removed).error());
        }
        QUARRY_LOG_INFO(LogCategory::Migration, "rolled back " + record.name);
        done.push_back(record.name);
    }
    if (done.empty()) {
        QUARRY_LOG_INFO(LogCategory::Migration, "nothing to roll back");
    }
    return OrmResult<Names>::ok(std::move(done));
}

OrmResult<std::vector<std::string>> MigrationRunner::rollback() {
    auto ran = records();
    if (ran.hasError()) {
        return OrmResult<std::vector<std::string>>::err(std::move(ran).error());
    }
    std::int64_t latest = 0;
    for (const auto& record : ran.value()) {
        latest = std::max(latest, record.batch);
    }
    std::vector<Record> batch;
    for (auto& record : ran.value()) {
        if (record.batch == latest) {
            batch.push_back(std::move(record));
        }
    }
    return revert(std::move(batch), "rollback");
}

OrmResult<std::vector<std::string>> MigrationRunner::reset() {
    auto ran = records();
    if (ran.hasError()) {
        return OrmResult<std::vector<std::string>>::err(std::move(ran).error());
    }
    return revert(std::move(ran).value(), "reset");
}

OrmResult<std::vector<std::string>> MigrationRunner::fresh() {
    QUARRY_LOG_INFO(LogCategory::Migration, "dropping all tables");
    auto dropped = db_->schema().dropAllTables();
    if (dropped.hasError()) {
        return OrmResult<std::vector<std::string>>::err(std::move(dropped).error());
    }
    return migrate();
}

OrmResult<std::vector<MigrationStatus>> MigrationRunner::status() {
    auto ran = records();
    if (ran.hasError()) {
        return OrmResult<std::vector<MigrationStatus>>::err(std::move(ran).error());
    }

    std::map<std::string, MigrationStatus> report;
    for (const auto& [name, migration] : migrations_) {
        report[name].name = name;
    }
    for (const auto& record : ran.value()) {
        auto& line = report[record.name];
        line.name = record.name;
        line.ran = true;
        line.batch = record.batch;
    }

    std::vector<MigrationStatus> out;
    out.reserve(report.size());
    for (auto& [name, line] : report) {
        out.push_back(std::move(line));
    }
    return OrmResult<std::vector<MigrationStatus>>::ok(std::move(out));
}

} // namespace quarry::schema
