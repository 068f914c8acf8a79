/// @file query_builder.cpp
/// @brief QueryBuilder implementation.

#include "quarry/query/query_builder.hpp"

#include "quarry/foundation/orm_logger.hpp"

namespace quarry::query {

using db::AggregateFunction;
using db::Boolean;
using db::JoinType;
using db::Operator;
using db::Predicate;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OrmError;

QueryBuilder::QueryBuilder(db::DatabaseAdapter& adapter, const MacroRegistry& macros,
                           std::string_view table)
    : adapter_(&adapter), macros_(&macros) {
    query_.from = db::parseTableRef(table);
}

// ---------------------------------------------------------------------------
// Source and projection
// ---------------------------------------------------------------------------

QueryBuilder& QueryBuilder::from(std::string_view table) {
    query_.from = db::parseTableRef(table);
    return *this;
}

QueryBuilder& QueryBuilder::select(std::vector<std::string> columns) {
    query_.columns = std::move(columns);
    return *this;
}

QueryBuilder& QueryBuilder::addSelect(std::string column) {
    query_.columns.push_back(std::move(column));
    return *this;
}

QueryBuilder& QueryBuilder::distinct(bool value) {
    query_.distinct = value;
    return *this;
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------

void QueryBuilder::recordError(OrmError error) {
    // Only the first error is reported.
    if (!error_) {
        error_ = std::move(error);
    }
}

QueryBuilder& QueryBuilder::addPredicate(Predicate predicate) {
    query_.wheres.push_back(std::move(predicate));
    return *this;
}

QueryBuilder& QueryBuilder::addComparison(std::string column, std::string_view op,
                                          DbValue value, Boolean boolean) {
    auto parsed = db::parseOperator(op);
    if (parsed.hasError()) {
        recordError(std::move(parsed).error());
        return *this;
    }

    Predicate p;
    p.column = std::move(column);
    p.op = parsed.value();
    p.boolean = boolean;

    switch (p.op) {
        case Operator::In:
        case Operator::NotIn:
        case Operator::Between: {
            const auto* list = std::get_if<db::JsonValue>(&value);
            if (!list || !list->data.is_array()) {
                foundation::ErrorDetail detail;
                detail.operation = "where";
                detail.table = query_.from.name;
                detail.column = p.column;
                detail.op = std::string(db::operatorSymbol(p.op));
                recordError(OrmError(ErrorCode::InvalidQuery,
                                     std::string(db::operatorSymbol(p.op)) +
                                         " requires a list of values",
                                     std::move(detail)));
                return *this;
            }
            for (const auto& item : list->data) {
                p.values.push_back(db::fromJson(item));
            }
            break;
        }
        case Operator::IsNull:
        case Operator::IsNotNull:
            break;
        case Operator::Raw:
        case Operator::Group:
            recordError(OrmError(ErrorCode::InvalidQuery,
                                 "use whereRaw() or whereGroup() for raw and grouped predicates"));
            return *this;
        default:
            p.value = std::move(value);
            break;
    }
    return addPredicate(std::move(p));
}

QueryBuilder& QueryBuilder::where(std::string column, DbValue value) {
    return addComparison(std::move(column), "=", std::move(value), Boolean::And);
}

QueryBuilder& QueryBuilder::where(std::string column, std::string_view op, DbValue value) {
    return addComparison(std::move(column), op, std::move(value), Boolean::And);
}

QueryBuilder& QueryBuilder::orWhere(std::string column, DbValue value) {
    return addComparison(std::move(column), "=", std::move(value), Boolean::Or);
}

QueryBuilder& QueryBuilder::orWhere(std::string column, std::string_view op, DbValue value) {
    return addComparison(std::move(column), op, std::move(value), Boolean::Or);
}

namespace {

Predicate listPredicate(std::string column, Operator op, std::vector<DbValue> values,
                        Boolean boolean) {
    Predicate p;
    p.column = std::move(column);
    p.op = op;
    p.values = std::move(values);
    p.boolean = boolean;
    return p;
}

Predicate nullPredicate(std::string column, Operator op, Boolean boolean) {
    Predicate p;
    p.column = std::move(column);
    p.op = op;
    p.boolean = boolean;
    return p;
}

} // namespace

QueryBuilder& QueryBuilder::whereIn(std::string column, std::vector<DbValue> values) {
    return addPredicate(listPredicate(std::move(column), Operator::In, std::move(values),
                                      Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereIn(std::string column, std::vector<DbValue> values) {
    return addPredicate(listPredicate(std::move(column), Operator::In, std::move(values),
                                      Boolean::Or));
}

QueryBuilder& QueryBuilder::whereNotIn(std::string column, std::vector<DbValue> values) {
    return addPredicate(listPredicate(std::move(column), Operator::NotIn, std::move(values),
                                      Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereNotIn(std::string column, std::vector<DbValue> values) {
    return addPredicate(listPredicate(std::move(column), Operator::NotIn, std::move(values),
                                      Boolean::Or));
}

QueryBuilder& QueryBuilder::whereNull(std::string column) {
    return addPredicate(nullPredicate(std::move(column), Operator::IsNull, Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereNull(std::string column) {
    return addPredicate(nullPredicate(std::move(column), Operator::IsNull, Boolean::Or));
}

QueryBuilder& QueryBuilder::whereNotNull(std::string column) {
    return addPredicate(nullPredicate(std::move(column), Operator::IsNotNull, Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereNotNull(std::string column) {
    return addPredicate(nullPredicate(std::move(column), Operator::IsNotNull, Boolean::Or));
}

QueryBuilder& QueryBuilder::whereBetween(std::string column, DbValue low, DbValue high) {
    return addPredicate(listPredicate(std::move(column), Operator::Between,
                                      {std::move(low), std::move(high)}, Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereBetween(std::string column, DbValue low, DbValue high) {
    return addPredicate(listPredicate(std::move(column), Operator::Between,
                                      {std::move(low), std::move(high)}, Boolean::Or));
}

QueryBuilder& QueryBuilder::whereRaw(std::string sql, std::vector<DbValue> bindings) {
    return addPredicate(listPredicate(std::move(sql), Operator::Raw, std::move(bindings),
                                      Boolean::And));
}

QueryBuilder& QueryBuilder::orWhereRaw(std::string sql, std::vector<DbValue> bindings) {
    return addPredicate(listPredicate(std::move(sql), Operator::Raw, std::move(bindings),
                                      Boolean::Or));
}

QueryBuilder& QueryBuilder::addGroup(const std::function<void(QueryBuilder&)>& fn,
                                     Boolean boolean) {
    QueryBuilder scratch(*adapter_, *macros_, {});
    scratch.query_.from = query_.from;
    fn(scratch);
    if (scratch.error_) {
        recordError(*scratch.error_);
        return *this;
    }

    Predicate p;
    p.op = Operator::Group;
    p.boolean = boolean;
    p.nested = std::move(scratch.query_.wheres);
    return addPredicate(std::move(p));
}

QueryBuilder& QueryBuilder::whereGroup(const std::function<void(QueryBuilder&)>& fn) {
    return addGroup(fn, Boolean::And);
}

QueryBuilder& QueryBuilder::orWhereGroup(const std::function<void(QueryBuilder&)>& fn) {
    return addGroup(fn, Boolean::Or);
}

QueryBuilder& QueryBuilder::when(bool condition, const std::function<void(QueryBuilder&)>& fn) {
    if (condition) {
        fn(*this);
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Joins
// ---------------------------------------------------------------------------

QueryBuilder& QueryBuilder::addJoin(JoinType type, std::string_view table, std::string first,
                                    std::string op, std::string second) {
    auto ref = db::parseTableRef(table);
    db::JoinClause clause;
    clause.type = type;
    clause.table = std::move(ref.name);
    clause.alias = std::move(ref.alias);
    clause.first = std::move(first);
    clause.op = std::move(op);
    clause.second = std::move(second);
    query_.joins.push_back(std::move(clause));
    return *this;
}

QueryBuilder& QueryBuilder::join(std::string_view table, std::string first, std::string op,
                                 std::string second) {
    return addJoin(JoinType::Inner, table, std::move(first), std::move(op), std::move(second));
}

QueryBuilder& QueryBuilder::leftJoin(std::string_view table, std::string first, std::string op,
                                     std::string second) {
    return addJoin(JoinType::Left, table, std::move(first), std::move(op), std::move(second));
}

QueryBuilder& QueryBuilder::rightJoin(std::string_view table, std::string first,
                                      std::string op, std::string second) {
    return addJoin(JoinType::Right, table, std::move(first), std::move(op), std::move(second));
}

// ---------------------------------------------------------------------------
// Ordering and pagination
// ---------------------------------------------------------------------------

QueryBuilder& QueryBuilder::orderBy(std::string column, std::string_view direction) {
    auto parsed = db::parseDirection(direction);
    if (parsed.hasError()) {
        recordError(std::move(parsed).error());
        return *this;
    }
    query_.orders.push_back({std::move(column), parsed.value()});
    return *this;
}

QueryBuilder& QueryBuilder::orderByDesc(std::string column) {
    return orderBy(std::move(column), "desc");
}

QueryBuilder& QueryBuilder::latest(std::string column) {
    return orderBy(std::move(column), "desc");
}

QueryBuilder& QueryBuilder::oldest(std::string column) {
    return orderBy(std::move(column), "asc");
}

QueryBuilder& QueryBuilder::limit(std::uint64_t count) {
    query_.limit = count;
    return *this;
}

QueryBuilder& QueryBuilder::offset(std::uint64_t count) {
    query_.offset = count;
    return *this;
}

QueryBuilder& QueryBuilder::forPage(std::uint64_t page, std::uint64_t perPage) {
    if (page == 0) {
        page = 1;
    }
    return limit(perPage).offset((page - 1) * perPage);
}

QueryBuilder& QueryBuilder::with(std::string relation) {
    eagerLoads_.push_back(std::move(relation));
    return *this;
}

QueryBuilder& QueryBuilder::with(const std::vector<std::string>& relations) {
    eagerLoads_.insert(eagerLoads_.end(), relations.begin(), relations.end());
    return *this;
}

// ---------------------------------------------------------------------------
// Terminals
// ---------------------------------------------------------------------------

template <typename T>
std::optional<OrmResult<T>> QueryBuilder::checkPending() const {
    if (error_) {
        return OrmResult<T>::err(*error_);
    }
    return std::nullopt;
}

db::MutationQuery QueryBuilder::mutation() const {
    db::MutationQuery m;
    m.from = query_.from;
    m.wheres = query_.wheres;
    return m;
}

OrmResult<QueryResult> QueryBuilder::get() const {
    if (auto pending = checkPending<QueryResult>()) {
        return std::move(*pending);
    }
    return adapter_->select(query_);
}

OrmResult<std::optional<Row>> QueryBuilder::first() const {
    auto rows = clone().limit(1).get();
    if (rows.hasError()) {
        return OrmResult<std::optional<Row>>::err(std::move(rows).error());
    }
    if (rows.value().empty()) {
        return OrmResult<std::optional<Row>>::ok(std::nullopt);
    }
    return OrmResult<std::optional<Row>>::ok(std::move(rows.value().front()));
}

OrmResult<std::optional<Row>> QueryBuilder::find(const DbValue& id, std::string_view key) const {
    return clone().where(std::string(key), id).first();
}

OrmResult<std::uint64_t> QueryBuilder::count() const {
    if (auto pending = checkPending<std::uint64_t>()) {
        return std::move(*pending);
    }
    return adapter_->count(query_);
}

OrmResult<bool> QueryBuilder::exists() const {
    if (auto pending = checkPending<bool>()) {
        return std::move(*pending);
    }
    return adapter_->exists(query_);
}

OrmResult<bool> QueryBuilder::doesntExist() const {
    auto found = exists();
    if (found.hasError()) {
        return found;
    }
    return OrmResult<bool>::ok(!found.value());
}

OrmResult<DbValue> QueryBuilder::aggregate(AggregateFunction fn, std::string_view column) const {
    if (auto pending = checkPending<DbValue>()) {
        return std::move(*pending);
    }
    return adapter_->aggregate(query_, fn, column);
}

OrmResult<DbValue> QueryBuilder::sum(std::string_view column) const {
    return aggregate(AggregateFunction::Sum, column);
}

OrmResult<DbValue> QueryBuilder::avg(std::string_view column) const {
    return aggregate(AggregateFunction::Avg, column);
}

OrmResult<DbValue> QueryBuilder::min(std::string_view column) const {
    return aggregate(AggregateFunction::Min, column);
}

OrmResult<DbValue> QueryBuilder::max(std::string_view column) const {
    return aggregate(AggregateFunction::Max, column);
}

OrmResult<std::vector<DbValue>> QueryBuilder::pluck(std::string_view column) const {
    auto [name, alias] = db::splitColumnAlias(column);
    std::string key = alias;
    if (key.empty()) {
        auto dot = name.rfind('.');
        key = dot == std::string::npos ? name : name.substr(dot + 1);
    }

    auto rows = clone().select({std::string(column)}).get();
    if (rows.hasError()) {
        return OrmResult<std::vector<DbValue>>::err(std::move(rows).error());
    }
    std::vector<DbValue> values;
    values.reserve(rows.value().size());
    for (auto& row : rows.value()) {
        auto it = row.find(key);
        values.push_back(it != row.end() ? std::move(it->second) : DbValue(db::DbNull{}));
    }
    return OrmResult<std::vector<DbValue>>::ok(std::move(values));
}

OrmResult<Row> QueryBuilder::insert(Row values, std::string_view primaryKey) const {
    if (auto pending = checkPending<Row>()) {
        return std::move(*pending);
    }
    db::InsertQuery q;
    q.table = query_.from.name;
    q.values = std::move(values);
    q.primaryKey = std::string(primaryKey);
    return adapter_->insert(q);
}

OrmResult<std::uint64_t> QueryBuilder::update(Row values) const {
    if (auto pending = checkPending<std::uint64_t>()) {
        return std::move(*pending);
    }
    if (query_.wheres.empty()) {
        QUARRY_LOG_DEBUG(LogCategory::Query, "update without predicates on " + tableName());
    }
    return adapter_->update(mutation(), values);
}

OrmResult<std::uint64_t> QueryBuilder::remove() const {
    if (auto pending = checkPending<std::uint64_t>()) {
        return std::move(*pending);
    }
    if (query_.wheres.empty()) {
        QUARRY_LOG_DEBUG(LogCategory::Query, "delete without predicates on " + tableName());
    }
    return adapter_->remove(mutation());
}

OrmResult<Page<Row>> QueryBuilder::paginate(std::uint64_t page, std::uint64_t perPage) const {
    if (page == 0) {
        page = 1;
    }
    auto total = count();
    if (total.hasError()) {
        return OrmResult<Page<Row>>::err(std::move(total).error());
    }
    auto rows = clone().forPage(page, perPage).get();
    if (rows.hasError()) {
        return OrmResult<Page<Row>>::err(std::move(rows).error());
    }
    return OrmResult<Page<Row>>::ok(
        makePage(std::move(rows).value(), total.value(), perPage, page));
}

std::future<OrmResult<QueryResult>> QueryBuilder::getAsync() const {
    return std::async(std::launch::async, [builder = clone()]() { return builder.get(); });
}

OrmResult<QueryResult> QueryBuilder::macro(std::string_view name, const Json& args) {
    if (auto pending = checkPending<QueryResult>()) {
        return std::move(*pending);
    }
    return macros_->invoke(name, *this, args);
}

bool QueryBuilder::hasMacro(std::string_view name) const {
    return macros_->has(name);
}

} // namespace quarry::query
