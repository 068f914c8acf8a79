#pragma once

/// @file database.hpp
/// @brief Database handle: owns one adapter and one macro registry and
///        hands out query builders, schema builders and transactions.

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"
#include "quarry/foundation/config_manager.hpp"
#include "quarry/query/macro_registry.hpp"
#include "quarry/query/query_builder.hpp"

namespace quarry::schema {
class Schema;
} // namespace quarry::schema

namespace quarry::orm {

using foundation::OrmResult;

class Database;

// ── TransactionGuard ────────────────────────────────────────────────────────

/// RAII transaction guard.
///
/// Rolls back on destruction unless commit() or rollback() was called.
/// Guards nest: an inner guard maps to a savepoint on SQL backends.
///
/// Example:
/// @code
///   auto txn = db.beginTransaction();
///   if (txn.hasValue()) {
///       (void)db.table("accounts").where("id", 1).update({{"balance", 10}});
///       (void)txn.value().commit();
///   }
/// @endcode
class TransactionGuard {
public:
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    TransactionGuard(TransactionGuard&& other) noexcept;
    TransactionGuard& operator=(TransactionGuard&& other) noexcept;

    [[nodiscard]] OrmResult<void> commit();
    [[nodiscard]] OrmResult<void> rollback();

    /// True until commit() or rollback() is called.
    [[nodiscard]] bool isActive() const noexcept { return adapter_ != nullptr && active_; }

private:
    friend class Database;
    explicit TransactionGuard(db::DatabaseAdapter& adapter) noexcept;
    void release() noexcept;

    db::DatabaseAdapter* adapter_;
    bool active_ = true;
};

// ── Database ────────────────────────────────────────────────────────────────

/// Entry point for one configured backend.
///
/// Models, relations, schema builders and the migration runner all take a
/// Database explicitly; there is no process-wide default connection.
///
/// Example:
/// @code
///   auto db = Database::open(config);
///   if (db.hasError()) { ... }
///   auto users = db.value()->table("users").where("active", true).get();
/// @endcode
class Database {
public:
    /// Wrap an adapter. The macro registry is populated with the shipped
    /// verbs for the adapter's backend.
    explicit Database(std::unique_ptr<db::DatabaseAdapter> adapter);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Create the adapter for @p config.type and connect it.
    [[nodiscard]] static OrmResult<std::unique_ptr<Database>> open(
        const db::DatabaseConfig& config);

    /// Read a DatabaseConfig under @p prefix and open it.
    [[nodiscard]] static OrmResult<std::unique_ptr<Database>> open(
        const foundation::ConfigManager& config, std::string_view prefix = "database");

    /// Fresh builder targeting @p table ("table" or "table as alias").
    [[nodiscard]] query::QueryBuilder table(std::string_view table);

    [[nodiscard]] schema::Schema schema();

    [[nodiscard]] OrmResult<TransactionGuard> beginTransaction();

    /// Run @p fn inside a transaction: commit when it succeeds, roll back
    /// when it returns an error or throws.
    [[nodiscard]] OrmResult<void> transaction(const std::function<OrmResult<void>(Database&)>& fn);

    /// Backend passthrough (SQL text with '?' placeholders, or a JSON
    /// command for MongoDB).
    [[nodiscard]] OrmResult<db::QueryResult> raw(std::string_view statement,
                                                 const std::vector<db::DbValue>& params = {});

    [[nodiscard]] db::DatabaseAdapter& adapter() noexcept { return *adapter_; }
    [[nodiscard]] const db::DatabaseAdapter& adapter() const noexcept { return *adapter_; }
    [[nodiscard]] query::MacroRegistry& macros() noexcept { return macros_; }
    [[nodiscard]] db::BackendType backend() const noexcept { return adapter_->type(); }

    /// Disconnect the adapter. Safe to call more than once.
    void close();

private:
    std::unique_ptr<db::DatabaseAdapter> adapter_;
    query::MacroRegistry macros_;
};

} // namespace quarry::orm
