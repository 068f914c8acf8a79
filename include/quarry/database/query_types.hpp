#pragma once

/// @file query_types.hpp
/// @brief Backend-neutral query descriptors handed from the builder to
///        adapters: predicates, joins, ordering, projection, pagination.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::db {

/// Comparison operators understood by every adapter (Raw only by SQL).
enum class Operator : uint8_t {
    Equal,
    NotEqual,
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    Like,
    NotLike,
    In,
    NotIn,
    Between,
    IsNull,
    IsNotNull,
    Raw,
    Group
};

/// How a predicate joins the one before it.
enum class Boolean : uint8_t { And, Or };

enum class JoinType : uint8_t { Inner, Left, Right };

enum class Direction : uint8_t { Asc, Desc };

enum class AggregateFunction : uint8_t { Count, Sum, Avg, Min, Max };

/// One filter predicate.
///
/// - Comparison operators use @c value.
/// - In/NotIn use @c values; Between uses values[0] and values[1].
/// - Raw carries backend SQL in @c column and its bindings in @c values.
/// - Group carries a parenthesized sub-list in @c nested.
struct Predicate {
    std::string column;
    Operator op = Operator::Equal;
    DbValue value;
    std::vector<DbValue> values;
    Boolean boolean = Boolean::And;
    std::vector<Predicate> nested;
};

struct JoinClause {
    JoinType type = JoinType::Inner;
    std::string table;
    std::string alias;
    std::string first;
    std::string op = "=";
    std::string second;
};

struct OrderClause {
    std::string column;
    Direction direction = Direction::Asc;
};

/// A table reference with optional alias, parsed from "table as alias".
struct TableRef {
    std::string name;
    std::string alias;

    /// Alias when present, else the table name.
    [[nodiscard]] const std::string& reference() const noexcept {
        return alias.empty() ? name : alias;
    }
};

/// Read descriptor used by select, count, exists and aggregates.
struct SelectQuery {
    TableRef from;
    std::vector<std::string> columns;  ///< Empty means all columns.
    std::vector<Predicate> wheres;
    std::vector<JoinClause> joins;
    std::vector<OrderClause> orders;
    std::optional<std::uint64_t> limit;
    std::optional<std::uint64_t> offset;
    bool distinct = false;
};

/// Write descriptor used by update and delete.
struct MutationQuery {
    TableRef from;
    std::vector<Predicate> wheres;
};

/// Insert descriptor. @c primaryKey names the column whose generated
/// value should be read back.
struct InsertQuery {
    std::string table;
    Row values;
    std::string primaryKey = "id";
};

/// Parse an operator token ("=", "<>", "like", "not in", ...).
/// Matching is case-insensitive; unknown tokens yield UnsupportedOperator.
[[nodiscard]] foundation::OrmResult<Operator> parseOperator(std::string_view token);

/// Canonical SQL spelling of an operator ("=", "!=", "LIKE", "IN", ...).
[[nodiscard]] std::string_view operatorSymbol(Operator op) noexcept;

/// Parse an order direction ("asc"/"desc", case-insensitive).
[[nodiscard]] foundation::OrmResult<Direction> parseDirection(std::string_view token);

/// Parse "table", "table as alias" or "table alias".
[[nodiscard]] TableRef parseTableRef(std::string_view expr);

/// Split "column as alias" into {column, alias}; alias empty when absent.
[[nodiscard]] std::pair<std::string, std::string> splitColumnAlias(std::string_view expr);

[[nodiscard]] std::string_view aggregateName(AggregateFunction fn) noexcept;

} // namespace quarry::db
