#pragma once

/// @file mongo_adapter.hpp
/// @brief MongoDB adapter over the mongocxx driver.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"

namespace quarry::db {

/// Document adapter. Tables map to collections and rows to documents.
///
/// Every returned row carries a synthetic "id" equal to its "_id"; an "id"
/// given on insert or in a predicate is written as "_id" (ObjectId-looking
/// strings are converted to ObjectIds). Joins, raw predicates and
/// transactions are not supported and fail with an explicit error.
/// raw() takes a JSON command document and returns the server reply.
class MongoAdapter final : public DatabaseAdapter {
public:
    MongoAdapter();
    ~MongoAdapter() override;

    [[nodiscard]] BackendType type() const noexcept override { return BackendType::MongoDB; }

    [[nodiscard]] OrmResult<void> connect(const DatabaseConfig& config) override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const noexcept override;

    /// Creates the collection and its unique/secondary indexes.
    [[nodiscard]] OrmResult<void> createTable(const TableDefinition& table) override;

    /// Adds indexes, back-fills defaults for added fields, renames and
    /// unsets fields across all documents.
    [[nodiscard]] OrmResult<void> alterTable(const TableDefinition& delta) override;
    [[nodiscard]] OrmResult<void> dropTable(std::string_view table, bool ifExists) override;
    [[nodiscard]] OrmResult<bool> hasTable(std::string_view table) override;

    /// True when at least one document has the field.
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
    [[nodiscard]] std::size_t transactionDepth() const noexcept override { return 0; }

    [[nodiscard]] OrmResult<QueryResult> raw(std::string_view command,
                                             const std::vector<DbValue>& params) override;

    [[nodiscard]] OrmResult<QueryResult> aggregatePipeline(std::string_view collection,
                                                           const Json& pipeline) override;

    [[nodiscard]] bool supportsJoins() const noexcept override { return false; }
    [[nodiscard]] bool supportsRawPredicates() const noexcept override { return false; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quarry::db
