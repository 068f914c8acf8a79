#pragma once

/// @file sql_grammar.hpp
/// @brief Compiles backend-neutral query and schema descriptors into
///        dialect-specific SQL.
///
/// The grammar is pure: it performs no I/O, so every statement the SQL
/// adapters issue can be checked in isolation.

#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/prepared_statement.hpp"
#include "quarry/database/query_types.hpp"
#include "quarry/database/schema_types.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::db {

class SqlGrammar {
public:
    explicit SqlGrammar(SqlDialect dialect) noexcept : dialect_(dialect) {}

    [[nodiscard]] SqlDialect dialect() const noexcept { return dialect_; }

    // ── Identifiers ─────────────────────────────────────────────────────

    /// Quote an identifier. Handles "table.column", "*", "t.*" and
    /// "column as alias"; expressions containing '(' pass through as-is.
    [[nodiscard]] std::string wrap(std::string_view identifier) const;

    /// Quote a table reference, appending "AS alias" when aliased.
    [[nodiscard]] std::string wrapTable(const TableRef& table) const;

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileSelect(
        const SelectQuery& query) const;

    /// SELECT COUNT(*) AS aggregate ... ignoring order, limit and offset.
    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileCount(
        const SelectQuery& query) const;

    /// SELECT EXISTS(SELECT 1 ...) AS exists.
    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileExists(
        const SelectQuery& query) const;

    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileAggregate(
        const SelectQuery& query, AggregateFunction fn, std::string_view column) const;

    /// INSERT; PostgreSQL appends RETURNING * so the stored row comes back.
    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileInsert(
        const InsertQuery& query) const;

    /// UPDATE; PostgreSQL appends RETURNING 1 so the affected rows can be
    /// counted.
    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileUpdate(
        const MutationQuery& query, const Row& values) const;

    /// DELETE; PostgreSQL appends RETURNING 1.
    [[nodiscard]] foundation::OrmResult<PreparedStatement> compileDelete(
        const MutationQuery& query) const;

    /// WHERE clause body (without the keyword), appending bindings.
    [[nodiscard]] foundation::OrmResult<std::string> compileWheres(
        const std::vector<Predicate>& wheres, std::vector<DbValue>& bindings) const;

    // ── Schema ──────────────────────────────────────────────────────────

    /// CREATE TABLE followed by any CREATE INDEX statements.
    [[nodiscard]] foundation::OrmResult<std::vector<std::string>> compileCreateTable(
        const TableDefinition& table) const;

    /// One statement per added, dropped or renamed column and per index
    /// or foreign key change.
    [[nodiscard]] foundation::OrmResult<std::vector<std::string>> compileAlterTable(
        const TableDefinition& delta) const;

    [[nodiscard]] std::string compileDropTable(std::string_view table, bool ifExists) const;

    /// Column type plus modifiers, e.g. "VARCHAR(255) NOT NULL UNIQUE".
    [[nodiscard]] std::string compileColumn(const ColumnDefinition& column) const;

    [[nodiscard]] PreparedStatement compileHasTable(std::string_view table) const;
    [[nodiscard]] PreparedStatement compileHasColumn(std::string_view table,
                                                     std::string_view column) const;

    /// Lists base tables of the current schema as column "table_name".
    [[nodiscard]] PreparedStatement compileListTables() const;

    // ── Transactions ────────────────────────────────────────────────────

    [[nodiscard]] static std::string compileSavepoint(std::size_t depth);
    [[nodiscard]] static std::string compileReleaseSavepoint(std::size_t depth);
    [[nodiscard]] static std::string compileRollbackToSavepoint(std::size_t depth);

private:
    [[nodiscard]] std::string wrapSegment(std::string_view segment) const;
    [[nodiscard]] std::string placeholder(std::size_t index) const;

    [[nodiscard]] foundation::OrmResult<std::string> compilePredicate(
        const Predicate& predicate, std::vector<DbValue>& bindings) const;

    [[nodiscard]] foundation::OrmResult<std::string> compileJoins(
        const std::vector<JoinClause>& joins) const;

    [[nodiscard]] foundation::OrmResult<std::string> compileFromAndWhere(
        const SelectQuery& query, std::vector<DbValue>& bindings) const;

    [[nodiscard]] std::string compileForeignKey(std::string_view table,
                                                const ForeignKeyDefinition& fk) const;

    SqlDialect dialect_;
};

} // namespace quarry::db
