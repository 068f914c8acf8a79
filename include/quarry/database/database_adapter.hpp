#pragma once

/// @file database_adapter.hpp
/// @brief Uniform contract every backend implements.
///
/// The builder, models, relations and the migration runner only ever talk
/// to this interface. Adding a backend means implementing it and
/// registering a creator with the adapter factory.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_config.hpp"
#include "quarry/database/query_types.hpp"
#include "quarry/database/schema_types.hpp"
#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::db {

using foundation::OrmResult;

/// Backend adapter contract.
///
/// All methods are synchronous. After disconnect() every operation fails
/// with NotConnected. Errors carry an ErrorDetail naming the backend,
/// operation and table.
class DatabaseAdapter {
public:
    virtual ~DatabaseAdapter() = default;

    DatabaseAdapter(const DatabaseAdapter&) = delete;
    DatabaseAdapter& operator=(const DatabaseAdapter&) = delete;

    [[nodiscard]] virtual BackendType type() const noexcept = 0;

    /// Backend tag ("mysql", "postgres", "mongodb", "memory").
    [[nodiscard]] std::string_view name() const noexcept { return backendName(type()); }

    // ── Connection lifecycle ────────────────────────────────────────────

    [[nodiscard]] virtual OrmResult<void> connect(const DatabaseConfig& config) = 0;

    /// Release all connections. Idempotent.
    virtual void disconnect() = 0;

    [[nodiscard]] virtual bool isConnected() const noexcept = 0;

    // ── Schema ──────────────────────────────────────────────────────────

    [[nodiscard]] virtual OrmResult<void> createTable(const TableDefinition& table) = 0;
    [[nodiscard]] virtual OrmResult<void> alterTable(const TableDefinition& delta) = 0;
    [[nodiscard]] virtual OrmResult<void> dropTable(std::string_view table, bool ifExists) = 0;
    [[nodiscard]] virtual OrmResult<bool> hasTable(std::string_view table) = 0;
    [[nodiscard]] virtual OrmResult<bool> hasColumn(std::string_view table,
                                                    std::string_view column) = 0;
    [[nodiscard]] virtual OrmResult<std::vector<std::string>> listTables() = 0;

    // ── Reads ───────────────────────────────────────────────────────────

    [[nodiscard]] virtual OrmResult<QueryResult> select(const SelectQuery& query) = 0;

    /// Number of rows matching the predicates and joins. Ordering, limit
    /// and offset are ignored.
    [[nodiscard]] virtual OrmResult<std::uint64_t> count(const SelectQuery& query) = 0;

    [[nodiscard]] virtual OrmResult<bool> exists(const SelectQuery& query) = 0;

    /// SUM/AVG/MIN/MAX/COUNT over @p column. Null when no row matches
    /// (except Count, which yields 0).
    [[nodiscard]] virtual OrmResult<DbValue> aggregate(const SelectQuery& query,
                                                       AggregateFunction fn,
                                                       std::string_view column) = 0;

    // ── Writes ──────────────────────────────────────────────────────────

    /// Insert one row and return it as stored, generated key included.
    [[nodiscard]] virtual OrmResult<Row> insert(const InsertQuery& query) = 0;

    /// @return Number of affected rows.
    [[nodiscard]] virtual OrmResult<std::uint64_t> update(const MutationQuery& query,
                                                          const Row& values) = 0;

    /// @return Number of deleted rows.
    [[nodiscard]] virtual OrmResult<std::uint64_t> remove(const MutationQuery& query) = 0;

    // ── Transactions ────────────────────────────────────────────────────

    /// Begin a transaction, or a savepoint when one is already open.
    [[nodiscard]] virtual OrmResult<void> beginTransaction() = 0;
    [[nodiscard]] virtual OrmResult<void> commit() = 0;
    [[nodiscard]] virtual OrmResult<void> rollback() = 0;

    /// Current nesting depth; 0 outside a transaction.
    [[nodiscard]] virtual std::size_t transactionDepth() const noexcept = 0;

    // ── Passthrough ─────────────────────────────────────────────────────

    /// Run a native statement. SQL backends take '?' placeholders bound to
    /// @p params and return result rows; MongoDB takes a JSON command and
    /// returns the reply document as a single row.
    [[nodiscard]] virtual OrmResult<QueryResult> raw(std::string_view query,
                                                     const std::vector<DbValue>& params) = 0;

    /// Run an aggregation pipeline against a collection. Only document
    /// backends support this.
    [[nodiscard]] virtual OrmResult<QueryResult> aggregatePipeline(std::string_view collection,
                                                                   const Json& pipeline);

    // ── Capabilities ────────────────────────────────────────────────────

    [[nodiscard]] virtual bool supportsJoins() const noexcept = 0;
    [[nodiscard]] virtual bool supportsRawPredicates() const noexcept = 0;

protected:
    DatabaseAdapter() = default;

    /// Error result with backend/operation/table detail attached.
    template <typename T>
    [[nodiscard]] OrmResult<T> fail(foundation::ErrorCode code, std::string message,
                                    std::string_view operation,
                                    std::string_view table = {}) const {
        foundation::ErrorDetail detail;
        detail.backend = std::string(name());
        detail.operation = std::string(operation);
        detail.table = std::string(table);
        return foundation::failWith<T>(code, std::move(message), std::move(detail));
    }
};

} // namespace quarry::db
