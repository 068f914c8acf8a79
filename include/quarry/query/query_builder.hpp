#pragma once

/// @file query_builder.hpp
/// @brief Fluent, backend-agnostic query builder.

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"
#include "quarry/database/query_types.hpp"
#include "quarry/query/macro_registry.hpp"

namespace quarry::query {

using db::DbValue;
using db::Json;
using db::QueryResult;
using db::Row;
using foundation::OrmResult;

/// One page of results with navigation metadata.
template <typename T>
struct Page {
    std::vector<T> data;
    std::uint64_t total = 0;
    std::uint64_t perPage = 15;
    std::uint64_t currentPage = 1;
    std::uint64_t lastPage = 0;
    std::optional<std::uint64_t> from;  ///< 1-based index of the first item.
    std::optional<std::uint64_t> to;    ///< 1-based index of the last item.

    [[nodiscard]] bool hasMorePages() const noexcept { return currentPage < lastPage; }
};

/// Build page metadata for @p data fetched at @p page of size @p perPage.
template <typename T>
[[nodiscard]] Page<T> makePage(std::vector<T> data, std::uint64_t total, std::uint64_t perPage,
                               std::uint64_t page) {
    Page<T> out;
    out.total = total;
    out.perPage = perPage;
    out.currentPage = page;
    out.lastPage = perPage == 0 ? 0 : (total + perPage - 1) / perPage;
    if (!data.empty()) {
        out.from = (page - 1) * perPage + 1;
        out.to = (page - 1) * perPage + data.size();
    }
    out.data = std::move(data);
    return out;
}

/// Accumulates clauses for one logical query and hands them to the bound
/// adapter on a terminal call.
///
/// Builders are cheap value types: copying (or clone()) yields an
/// independent builder sharing only the adapter and macro registry.
/// Invalid input (unknown operator, bad direction) does not throw; the
/// first such error is kept and returned by the next terminal call.
///
/// Example:
/// @code
///   auto posts = db.table("posts")
///                    .where("status", "published")
///                    .orderBy("created_at", "desc")
///                    .limit(2)
///                    .get();
/// @endcode
class QueryBuilder {
public:
    QueryBuilder(db::DatabaseAdapter& adapter, const MacroRegistry& macros,
                 std::string_view table);

    // ── Source and projection ──────────────────────────────────────────

    /// Target table, optionally aliased ("users as u").
    QueryBuilder& from(std::string_view table);
    QueryBuilder& select(std::vector<std::string> columns);
    QueryBuilder& addSelect(std::string column);
    QueryBuilder& distinct(bool value = true);

    // ── Predicates ─────────────────────────────────────────────────────

    QueryBuilder& where(std::string column, DbValue value);
    QueryBuilder& where(std::string column, std::string_view op, DbValue value);
    QueryBuilder& orWhere(std::string column, DbValue value);
    QueryBuilder& orWhere(std::string column, std::string_view op, DbValue value);

    QueryBuilder& whereIn(std::string column, std::vector<DbValue> values);
    QueryBuilder& orWhereIn(std::string column, std::vector<DbValue> values);
    QueryBuilder& whereNotIn(std::string column, std::vector<DbValue> values);
    QueryBuilder& orWhereNotIn(std::string column, std::vector<DbValue> values);

    QueryBuilder& whereNull(std::string column);
    QueryBuilder& orWhereNull(std::string column);
    QueryBuilder& whereNotNull(std::string column);
    QueryBuilder& orWhereNotNull(std::string column);

    QueryBuilder& whereBetween(std::string column, DbValue low, DbValue high);
    QueryBuilder& orWhereBetween(std::string column, DbValue low, DbValue high);

    /// Backend SQL fragment with portable '?' placeholders.
    QueryBuilder& whereRaw(std::string sql, std::vector<DbValue> bindings = {});
    QueryBuilder& orWhereRaw(std::string sql, std::vector<DbValue> bindings = {});

    /// Parenthesized sub-list built by @p fn on a scratch builder.
    QueryBuilder& whereGroup(const std::function<void(QueryBuilder&)>& fn);
    QueryBuilder& orWhereGroup(const std::function<void(QueryBuilder&)>& fn);

    /// Apply @p fn only when @p condition holds.
    QueryBuilder& when(bool condition, const std::function<void(QueryBuilder&)>& fn);

    // ── Joins ──────────────────────────────────────────────────────────

    QueryBuilder& join(std::string_view table, std::string first, std::string op,
                       std::string second);
    QueryBuilder& leftJoin(std::string_view table, std::string first, std::string op,
                           std::string second);
    QueryBuilder& rightJoin(std::string_view table, std::string first, std::string op,
                            std::string second);

    // ── Ordering and pagination ────────────────────────────────────────

    QueryBuilder& orderBy(std::string column, std::string_view direction = "asc");
    QueryBuilder& orderByDesc(std::string column);
    QueryBuilder& latest(std::string column = "created_at");
    QueryBuilder& oldest(std::string column = "created_at");

    QueryBuilder& limit(std::uint64_t count);
    QueryBuilder& offset(std::uint64_t count);
    QueryBuilder& take(std::uint64_t count) { return limit(count); }
    QueryBuilder& skip(std::uint64_t count) { return offset(count); }
    /// limit(perPage).offset((page - 1) * perPage); pages start at 1.
    QueryBuilder& forPage(std::uint64_t page, std::uint64_t perPage = 15);

    /// Queue relations for eager loading (consumed by the model layer).
    QueryBuilder& with(std::string relation);
    QueryBuilder& with(const std::vector<std::string>& relations);

    // ── Terminals ──────────────────────────────────────────────────────

    [[nodiscard]] OrmResult<QueryResult> get() const;
    [[nodiscard]] OrmResult<std::optional<Row>> first() const;
    [[nodiscard]] OrmResult<std::optional<Row>> find(const DbValue& id,
                                                     std::string_view key = "id") const;
    [[nodiscard]] OrmResult<std::uint64_t> count() const;
    [[nodiscard]] OrmResult<bool> exists() const;
    [[nodiscard]] OrmResult<bool> doesntExist() const;

    [[nodiscard]] OrmResult<DbValue> sum(std::string_view column) const;
    [[nodiscard]] OrmResult<DbValue> avg(std::string_view column) const;
    [[nodiscard]] OrmResult<DbValue> min(std::string_view column) const;
    [[nodiscard]] OrmResult<DbValue> max(std::string_view column) const;

    /// Values of one column across the result set.
    [[nodiscard]] OrmResult<std::vector<DbValue>> pluck(std::string_view column) const;

    /// Insert one row and return it as stored, including the generated
    /// @p primaryKey.
    [[nodiscard]] OrmResult<Row> insert(Row values, std::string_view primaryKey = "id") const;
    /// Updates every matching row; with no predicates, every row.
    [[nodiscard]] OrmResult<std::uint64_t> update(Row values) const;
    /// Deletes every matching row; with no predicates, every row.
    [[nodiscard]] OrmResult<std::uint64_t> remove() const;

    [[nodiscard]] OrmResult<Page<Row>> paginate(std::uint64_t page = 1,
                                                std::uint64_t perPage = 15) const;

    /// Run get() on a separate thread.
    [[nodiscard]] std::future<OrmResult<QueryResult>> getAsync() const;

    /// Invoke a registered extension verb.
    [[nodiscard]] OrmResult<QueryResult> macro(std::string_view name,
                                               const Json& args = Json::object());
    [[nodiscard]] bool hasMacro(std::string_view name) const;

    // ── Introspection ──────────────────────────────────────────────────

    [[nodiscard]] QueryBuilder clone() const { return *this; }

    [[nodiscard]] const db::SelectQuery& query() const noexcept { return query_; }
    [[nodiscard]] db::MutationQuery mutation() const;
    [[nodiscard]] const std::string& tableName() const noexcept { return query_.from.name; }
    [[nodiscard]] const std::vector<std::string>& eagerLoads() const noexcept {
        return eagerLoads_;
    }
    [[nodiscard]] const std::optional<foundation::OrmError>& pendingError() const noexcept {
        return error_;
    }
    [[nodiscard]] db::DatabaseAdapter& adapter() const noexcept { return *adapter_; }
    [[nodiscard]] const MacroRegistry& macros() const noexcept { return *macros_; }

private:
    QueryBuilder& addPredicate(db::Predicate predicate);
    QueryBuilder& addComparison(std::string column, std::string_view op, DbValue value,
                                db::Boolean boolean);
    QueryBuilder& addGroup(const std::function<void(QueryBuilder&)>& fn, db::Boolean boolean);
    QueryBuilder& addJoin(db::JoinType type, std::string_view table, std::string first,
                          std::string op, std::string second);
    void recordError(foundation::OrmError error);

    template <typename T>
    [[nodiscard]] std::optional<OrmResult<T>> checkPending() const;

    [[nodiscard]] OrmResult<DbValue> aggregate(db::AggregateFunction fn,
                                               std::string_view column) const;

    db::DatabaseAdapter* adapter_;
    const MacroRegistry* macros_;
    db::SelectQuery query_;
    std::vector<std::string> eagerLoads_;
    std::optional<foundation::OrmError> error_;
};

} // namespace quarry::query
