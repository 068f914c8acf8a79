#pragma once

/// @file schema_types.hpp
/// @brief Table structure descriptors produced by Blueprint and consumed
///        by adapters for createTable/alterTable.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "quarry/database/value.hpp"

namespace quarry::db {

enum class ColumnType : uint8_t {
    Increments,
    BigIncrements,
    Integer,
    BigInteger,
    String,
    Text,
    Boolean,
    Float,
    Double,
    Decimal,
    Date,
    DateTime,
    Timestamp,
    Json,
    Uuid
};

struct ColumnDefinition {
    std::string name;
    ColumnType type = ColumnType::String;
    std::uint32_t length = 255;
    std::uint32_t precision = 8;
    std::uint32_t scale = 2;
    bool nullable = false;
    std::optional<DbValue> defaultValue;
    bool useCurrent = false;
    bool unique = false;
    bool primary = false;
    bool autoIncrement = false;
    bool isUnsigned = false;
    bool index = false;
};

struct IndexDefinition {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

struct ForeignKeyDefinition {
    std::string column;
    std::string referencesColumn = "id";
    std::string onTable;
    std::string onDelete;
    std::string onUpdate;
};

/// Structure of a table for create, or the delta for alter.
struct TableDefinition {
    std::string name;
    std::vector<ColumnDefinition> columns;
    std::vector<IndexDefinition> indexes;
    std::vector<ForeignKeyDefinition> foreignKeys;
    std::vector<std::string> dropColumns;
    std::vector<std::pair<std::string, std::string>> renameColumns;
    std::vector<std::string> dropIndexes;

    /// Columns flagged primary (or auto-increment keys).
    [[nodiscard]] std::vector<std::string> primaryColumns() const {
        std::vector<std::string> out;
        for (const auto& c : columns) {
            if (c.primary) {
                out.push_back(c.name);
            }
        }
        return out;
    }
};

[[nodiscard]] constexpr bool isIncrementing(ColumnType type) noexcept {
    return type == ColumnType::Increments || type == ColumnType::BigIncrements;
}

} // namespace quarry::db
