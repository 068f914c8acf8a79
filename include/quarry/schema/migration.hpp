#pragma once

/// @file migration.hpp
/// @brief Migration contract and the two shipped implementations.

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quarry/foundation/orm_result.hpp"

namespace quarry::orm {
class Database;
} // namespace quarry::orm

namespace quarry::schema {

using foundation::OrmResult;

/// One reversible schema change.
///
/// down() must undo exactly what up() did; running it on a migration that
/// is not applied is a caller error.
class Migration {
public:
    virtual ~Migration() = default;

    [[nodiscard]] virtual OrmResult<void> up(orm::Database& db) = 0;
    [[nodiscard]] virtual OrmResult<void> down(orm::Database& db) = 0;
};

/// Migration defined by two callables, for registration in code.
///
/// Example:
/// @code
///   runner.add("20240101000000_create_users",
///              std::make_unique<CallbackMigration>(
///                  [](orm::Database& db) {
///                      return db.schema().create("users", [](Blueprint& t) {
///                          t.id();
///                          t.string("email").unique();
///                      });
///                  },
///                  [](orm::Database& db) { return db.schema().dropIfExists("users"); }));
/// @endcode
class CallbackMigration final : public Migration {
public:
    using Step = std::function<OrmResult<void>(orm::Database&)>;

    CallbackMigration(Step up, Step down) : up_(std::move(up)), down_(std::move(down)) {}

    [[nodiscard]] OrmResult<void> up(orm::Database& db) override { return up_(db); }
    [[nodiscard]] OrmResult<void> down(orm::Database& db) override { return down_(db); }

private:
    Step up_;
    Step down_;
};

/// Migration read from a "<name>.up.sql" / "<name>.down.sql" pair. Each
/// file may hold several ';'-separated statements, run in order through
/// Database::raw().
class SqlFileMigration final : public Migration {
public:
    SqlFileMigration(std::filesystem::path upFile, std::filesystem::path downFile)
        : upFile_(std::move(upFile)), downFile_(std::move(downFile)) {}

    [[nodiscard]] OrmResult<void> up(orm::Database& db) override { return runFile(db, upFile_); }
    [[nodiscard]] OrmResult<void> down(orm::Database& db) override {
        return runFile(db, downFile_);
    }

    [[nodiscard]] const std::filesystem::path& upFile() const noexcept { return upFile_; }
    [[nodiscard]] const std::filesystem::path& downFile() const noexcept { return downFile_; }

private:
    [[nodiscard]] static OrmResult<void> runFile(orm::Database& db,
                                                 const std::filesystem::path& file);

    std::filesystem::path upFile_;
    std::filesystem::path downFile_;
};

/// Split SQL text into statements on ';' outside quotes and comments.
/// Blank statements are dropped.
[[nodiscard]] std::vector<std::string> splitStatements(std::string_view sql);

} // namespace quarry::schema
