#pragma once

/// @file memory_adapter.hpp
/// @brief Thread-safe in-process backend for tests and development.

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"

namespace quarry::db {

/// Operation counters kept by MemoryAdapter.
struct AdapterStats {
    std::uint64_t selects = 0;
    std::uint64_t counts = 0;
    std::uint64_t exists = 0;
    std::uint64_t aggregates = 0;
    std::uint64_t inserts = 0;
    std::uint64_t updates = 0;
    std::uint64_t deletes = 0;
    std::uint64_t schemaChanges = 0;

    /// Statements that read data.
    [[nodiscard]] std::uint64_t reads() const noexcept {
        return selects + counts + exists + aggregates;
    }
};

/// In-process relational backend.
///
/// Tables keep their column definitions so unknown tables and columns are
/// rejected the way a SQL server would reject them. Enforces unique
/// columns and unique indexes, fills auto-increment keys and defaults,
/// evaluates every operator, supports inner/left/right joins with
/// aliases, and implements nested transactions as a stack of snapshots.
/// Raw SQL is not supported.
///
/// Production deployments should use SqlAdapter or MongoAdapter.
class MemoryAdapter final : public DatabaseAdapter {
public:
    MemoryAdapter() = default;

    [[nodiscard]] BackendType type() const noexcept override { return BackendType::Memory; }

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
    [[nodiscard]] bool supportsRawPredicates() const noexcept override { return false; }

    [[nodiscard]] AdapterStats stats() const;
    void resetStats();

    struct Table {
        TableDefinition definition;
        std::vector<Row> rows;
        std::int64_t nextId = 1;
    };

private:
    using Tables = std::map<std::string, Table, std::less<>>;

    template <typename T>
    OrmResult<T> ensureConnected(std::string_view operation, std::string_view table) const;

    OrmResult<std::vector<Row>> evaluate(const SelectQuery& query) const;

    mutable std::mutex mutex_;
    std::atomic<bool> connected_{false};
    Tables tables_;
    std::vector<Tables> snapshots_;
    std::atomic<std::size_t> depth_{0}; ///< Mirrors snapshots_.size().
    mutable AdapterStats stats_;
};

} // namespace quarry::db
