#pragma once

/// @file sql_adapter.hpp
/// @brief MySQL/PostgreSQL adapter over kcenon database_system with
///        connection pooling and savepoint-based nested transactions.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"
#include "quarry/database/sql_grammar.hpp"

namespace quarry::db {

/// Map a driver error message to an error code.
///
/// Unique-key violations ("Duplicate entry", "duplicate key value violates
/// unique constraint") become UniqueViolation; lost or refused connections
/// become ConnectionFailed; rejected credentials AuthenticationFailed;
/// everything else QueryFailed.
[[nodiscard]] foundation::ErrorCode classifySqlError(std::string_view message) noexcept;

/// Relational adapter shared by the MySQL and PostgreSQL backends.
///
/// Manages a pool of driver connections bounded by the configured
/// min/max. Each statement checks a connection out for its duration;
/// checkout blocks up to the configured timeout. While a transaction is
/// open one connection is pinned and every operation is routed to it.
/// Nested beginTransaction() calls map to SAVEPOINT/RELEASE/ROLLBACK TO.
///
/// Example:
/// @code
///   SqlAdapter adapter(BackendType::PostgreSQL);
///   DatabaseConfig config;
///   config.type = BackendType::PostgreSQL;
///   config.database = "app";
///   if (auto r = adapter.connect(config); r.hasError()) {
///       // r.error().describe()
///   }
/// @endcode
class SqlAdapter final : public DatabaseAdapter {
public:
    /// @param type BackendType::MySQL or BackendType::PostgreSQL.
    explicit SqlAdapter(BackendType type);
    ~SqlAdapter() override;

    [[nodiscard]] BackendType type() const noexcept override;

    [[nodiscard]] OrmResult<void> connect(const DatabaseConfig& config) override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const noexcept override;

    [[nodiscard]] OrmResult<void> createTable(const TableDefinition& table) override;
    [[nodiscard]] OrmResult<void> alterTable(const TableDefinition& delta) override;
    [[nodiscard]] OrmResult<void> dropTable(std::string_view table, bool ifExists) override;
    [[nodiscard]] OrmResult<bool> hasTable(std::string_view table) override;
    [[nodiscard]] OrmResult<bool> hasColumn(std::string_view table,
                                            std::string_view column) override;
    [[nodiscard]] OrmResult<std::vector<std::string>> listTables() override;

    [[nodiscard]] OrmResult<QueryResult> select(const SelectQuery& query) override;
    [[nodiscard]] OrmResult<std::uint64_t> count(const SelectQuery& query) override;
    [[nodiscard]] OrmResult<bool> exists(const SelectQuery& query) override;
    [[nodiscard]] OrmResult<DbValue> aggregate(const SelectQuery& query, AggregateFunction fn,
                                               std::string_view column) override;

    [[nodiscard]] OrmResult<Row> insert(const InsertQuery& query) override;
    [[nodiscard]] OrmResult<std::uint64_t> update(const MutationQuery& query,
                                                  const Row& values) override;
    [[nodiscard]] OrmResult<std::uint64_t> remove(const MutationQuery& query) override;

    [[nodiscard]] OrmResult<void> beginTransaction() override;
    [[nodiscard]] OrmResult<void> commit() override;
    [[nodiscard]] OrmResult<void> rollback() override;
    [[nodiscard]] std::size_t transactionDepth() const noexcept override;

    [[nodiscard]] OrmResult<QueryResult> raw(std::string_view query,
                                             const std::vector<DbValue>& params) override;

    [[nodiscard]] bool supportsJoins() const noexcept override { return true; }
    [[nodiscard]] bool supportsRawPredicates() const noexcept override { return true; }

    [[nodiscard]] const SqlGrammar& grammar() const noexcept;

    // ── Pool information ────────────────────────────────────────────────

    /// Number of connections currently checked out.
    [[nodiscard]] std::size_t activeConnections() const;

    /// Total number of connections in the pool.
    [[nodiscard]] std::size_t poolSize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quarry::db
