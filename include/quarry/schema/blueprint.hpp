#pragma once

/// @file blueprint.hpp
/// @brief Table structure DSL used inside Schema::create and Schema::table.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/schema_types.hpp"

namespace quarry::schema {

using db::ColumnDefinition;
using db::ColumnType;
using db::DbValue;
using db::TableDefinition;

class Blueprint;

/// Fluent modifiers for the column most recently added to a Blueprint.
///
/// Holds the column's position rather than a pointer so later additions
/// never invalidate it.
class ColumnBuilder {
public:
    ColumnBuilder& nullable(bool value = true);
    ColumnBuilder& defaultValue(DbValue value);
    /// Default to the current timestamp.
    ColumnBuilder& useCurrent();
    ColumnBuilder& unique();
    ColumnBuilder& primary();
    ColumnBuilder& autoIncrement();
    ColumnBuilder& asUnsigned();
    ColumnBuilder& index();

    /// Add a foreign key on this column. With no table given, "user_id"
    /// references "users".id.
    ColumnBuilder& constrained(std::string table = {}, std::string column = "id");
    ColumnBuilder& cascadeOnDelete();

    [[nodiscard]] const ColumnDefinition& definition() const;

private:
    friend class Blueprint;
    ColumnBuilder(Blueprint& blueprint, std::size_t position) noexcept
        : blueprint_(&blueprint), position_(position) {}

    ColumnDefinition& column();

    Blueprint* blueprint_;
    std::size_t position_;
    std::size_t foreignKey_ = static_cast<std::size_t>(-1);
};

/// Fluent builder for foreign("col").references("id").on("users").
class ForeignKeyBuilder {
public:
    ForeignKeyBuilder& references(std::string column);
    ForeignKeyBuilder& on(std::string table);
    ForeignKeyBuilder& onDelete(std::string action);
    ForeignKeyBuilder& onUpdate(std::string action);

private:
    friend class Blueprint;
    ForeignKeyBuilder(Blueprint& blueprint, std::size_t position) noexcept
        : blueprint_(&blueprint), position_(position) {}

    Blueprint* blueprint_;
    std::size_t position_;
};

/// Describes a new table or the changes to an existing one.
///
/// Example:
/// @code
///   schema.create("posts", [](Blueprint& table) {
///       table.id();
///       table.foreignId("user_id").constrained().cascadeOnDelete();
///       table.string("title");
///       table.string("status", 20).defaultValue("draft");
///       table.timestamps();
///   });
/// @endcode
class Blueprint {
public:
    explicit Blueprint(std::string table, bool creating = true);

    // ── Columns ─────────────────────────────────────────────────────────

    /// Auto-increment INT primary key.
    ColumnBuilder increments(std::string name = "id");
    /// Auto-increment BIGINT primary key.
    ColumnBuilder bigIncrements(std::string name = "id");
    ColumnBuilder id(std::string name = "id") { return bigIncrements(std::move(name)); }
    ColumnBuilder integer(std::string name);
    ColumnBuilder bigInteger(std::string name);
    ColumnBuilder string(std::string name, std::uint32_t length = 255);
    ColumnBuilder text(std::string name);
    ColumnBuilder boolean(std::string name);
    ColumnBuilder floatColumn(std::string name);
    ColumnBuilder doubleColumn(std::string name);
    ColumnBuilder decimal(std::string name, std::uint32_t precision = 8, std::uint32_t scale = 2);
    ColumnBuilder date(std::string name);
    ColumnBuilder dateTime(std::string name);
    ColumnBuilder timestamp(std::string name);
    ColumnBuilder json(std::string name);
    ColumnBuilder uuid(std::string name);
    /// Unsigned BIGINT intended as a foreign key.
    ColumnBuilder foreignId(std::string name);

    /// Nullable created_at and updated_at defaulting to the current time.
    void timestamps();

    // ── Commands ────────────────────────────────────────────────────────

    void dropColumn(std::string name);
    void dropColumns(const std::vector<std::string>& names);
    void renameColumn(std::string from, std::string to);

    /// Composite unique index; name defaults to "<table>_<cols>_unique".
    void unique(std::vector<std::string> columns, std::string name = {});
    /// Composite index; name defaults to "<table>_<cols>_index".
    void index(std::vector<std::string> columns, std::string name = {});
    void dropIndex(std::string name);
    void dropUnique(std::string name) { dropIndex(std::move(name)); }

    ForeignKeyBuilder foreign(std::string column);

    // ── Result ──────────────────────────────────────────────────────────

    [[nodiscard]] const TableDefinition& definition() const noexcept { return table_; }
    [[nodiscard]] const std::string& tableName() const noexcept { return table_.name; }
    [[nodiscard]] bool creating() const noexcept { return creating_; }

private:
    friend class ColumnBuilder;
    friend class ForeignKeyBuilder;

    ColumnBuilder addColumn(std::string name, ColumnType type);
    [[nodiscard]] std::string indexName(const std::vector<std::string>& columns,
                                        bool unique) const;

    TableDefinition table_;
    bool creating_;
};

} // namespace quarry::schema
