#pragma once

/// @file document_filter.hpp
/// @brief Translation of backend-neutral descriptors into MongoDB filter,
///        sort, projection and update documents (as extended JSON).
///
/// Everything here is pure so the document mapping can be tested without
/// a server.

#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/query_types.hpp"
#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::db::document {

/// True for a 24-character hexadecimal ObjectId string.
[[nodiscard]] bool isObjectId(std::string_view text) noexcept;

/// Document field for a column: "id" maps to "_id", others unchanged.
[[nodiscard]] std::string fieldName(std::string_view column);

/// Encode a value for @p field; ObjectId-looking strings in "_id" fields
/// become {"$oid": ...}.
[[nodiscard]] Json encodeValue(std::string_view field, const DbValue& value);

/// SQL LIKE pattern to an anchored regular expression: '%' becomes ".*",
/// '_' becomes '.', regex metacharacters are escaped.
[[nodiscard]] std::string likeToRegex(std::string_view pattern);

/// Predicate list to a filter document.
///
/// AND runs bind tighter than OR, as in SQL: "a AND b OR c" becomes
/// {"$or": [{"$and": [a, b]}, c]}. Raw predicates fail with
/// UnsupportedOperator.
[[nodiscard]] foundation::OrmResult<Json> compileFilter(const std::vector<Predicate>& wheres);

/// Order list to a sort document ({field: 1|-1}).
[[nodiscard]] Json compileSort(const std::vector<OrderClause>& orders);

/// Column list to a projection document; empty or "*" yields an empty
/// document. Aliased columns fail with UnsupportedOperation.
[[nodiscard]] foundation::OrmResult<Json> compileProjection(
    const std::vector<std::string>& columns);

/// Row to a document for insert: "id" is written as "_id", nulls for the
/// key are dropped.
[[nodiscard]] Json toDocument(const Row& row);

/// Row to a {"$set": ...} update document. The key is never rewritten.
[[nodiscard]] Json compileUpdate(const Row& values);

/// Decode a relaxed extended-JSON document into a Row and add a synthetic
/// "id" equal to "_id". {"$oid"} becomes its hex string, {"$date"} its ISO
/// string, {"$numberLong"} an integer.
[[nodiscard]] Row fromDocument(const Json& document);

/// $match/$group pipeline for SUM/AVG/MIN/MAX over @p column.
[[nodiscard]] foundation::OrmResult<Json> compileAggregatePipeline(
    const std::vector<Predicate>& wheres, AggregateFunction fn, std::string_view column);

} // namespace quarry::db::document
