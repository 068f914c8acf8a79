/// @file sql_grammar.cpp
/// @brief MySQL and PostgreSQL statement compilation.

#include "quarry/database/sql_grammar.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::OrmError;
using foundation::OrmResult;

namespace {

constexpr std::array<std::string_view, 7> kJoinOperators = {
    "=", "!=", "<>", "<", ">", "<=", ">="
};

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

std::string trimmed(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

template <typename T>
OrmResult<T> invalidQuery(std::string message, std::string_view column = {},
                          std::string_view op = {}) {
    ErrorDetail detail;
    detail.operation = "compile";
    detail.column = std::string(column);
    detail.op = std::string(op);
    return foundation::failWith<T>(ErrorCode::InvalidQuery, std::move(message),
                                   std::move(detail));
}

std::string defaultIndexName(std::string_view table, const std::vector<std::string>& columns,
                             bool unique) {
    std::string name(table);
    for (const auto& c : columns) {
        name += '_';
        name += c;
    }
    name += unique ? "_unique" : "_index";
    std::replace(name.begin(), name.end(), '.', '_');
    return name;
}

} // namespace

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

std::string SqlGrammar::wrapSegment(std::string_view segment) const {
    char quote = dialect_ == SqlDialect::MySQL ? '`' : '"';
    std::string out;
    out.reserve(segment.size() + 2);
    out += quote;
    for (char c : segment) {
        if (c == quote) {
            out += quote;
        }
        out += c;
    }
    out += quote;
    return out;
}

std::string SqlGrammar::wrap(std::string_view identifier) const {
    auto [column, alias] = splitColumnAlias(identifier);
    if (!alias.empty()) {
        return wrap(column) + " AS " + wrapSegment(alias);
    }

    auto expr = trimmed(column);
    if (expr.empty() || expr.find('(') != std::string::npos) {
        return expr;
    }

    std::string out;
    std::size_t start = 0;
    while (true) {
        auto dot = expr.find('.', start);
        auto segment = std::string_view(expr).substr(
            start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!out.empty()) {
            out += '.';
        }
        out += segment == "*" ? std::string("*") : wrapSegment(segment);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return out;
}

std::string SqlGrammar::wrapTable(const TableRef& table) const {
    auto out = wrap(table.name);
    if (!table.alias.empty()) {
        out += " AS ";
        out += wrapSegment(table.alias);
    }
    return out;
}

std::string SqlGrammar::placeholder(std::size_t index) const {
    if (dialect_ == SqlDialect::MySQL) {
        return "?";
    }
    return "$" + std::to_string(index);
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------

OrmResult<std::string> SqlGrammar::compilePredicate(const Predicate& p,
                                                    std::vector<DbValue>& bindings) const {
    auto bindNext = [&](const DbValue& v) {
        bindings.push_back(v);
        return placeholder(bindings.size());
    };

    switch (p.op) {
        case Operator::Group: {
            if (p.nested.empty()) {
                return OrmResult<std::string>::ok(std::string());
            }
            auto inner = compileWheres(p.nested, bindings);
            if (inner.hasError()) {
                return inner;
            }
            if (inner.value().empty()) {
                return inner;
            }
            return OrmResult<std::string>::ok("(" + inner.value() + ")");
        }
        case Operator::Raw: {
            auto sql = nativePlaceholders(dialect_, p.column, bindings.size() + 1);
            bindings.insert(bindings.end(), p.values.begin(), p.values.end());
            return OrmResult<std::string>::ok("(" + sql + ")");
        }
        case Operator::IsNull:
            return OrmResult<std::string>::ok(wrap(p.column) + " IS NULL");
        case Operator::IsNotNull:
            return OrmResult<std::string>::ok(wrap(p.column) + " IS NOT NULL");
        case Operator::In:
        case Operator::NotIn: {
            if (p.values.empty()) {
                return OrmResult<std::string>::ok(p.op == Operator::In ? "0 = 1" : "1 = 1");
            }
            std::vector<std::string> marks;
            marks.reserve(p.values.size());
            for (const auto& v : p.values) {
                marks.push_back(bindNext(v));
            }
            return OrmResult<std::string>::ok(wrap(p.column) + " " +
                                              std::string(operatorSymbol(p.op)) + " (" +
                                              join(marks, ", ") + ")");
        }
        case Operator::Between: {
            if (p.values.size() != 2) {
                return invalidQuery<std::string>("BETWEEN requires exactly two values",
                                                 p.column, "between");
            }
            auto low = bindNext(p.values[0]);
            auto high = bindNext(p.values[1]);
            return OrmResult<std::string>::ok(wrap(p.column) + " BETWEEN " + low + " AND " + high);
        }
        case Operator::Equal:
            if (isNull(p.value)) {
                return OrmResult<std::string>::ok(wrap(p.column) + " IS NULL");
            }
            break;
        case Operator::NotEqual:
            if (isNull(p.value)) {
                return OrmResult<std::string>::ok(wrap(p.column) + " IS NOT NULL");
            }
            break;
        default:
            break;
    }

    auto column = wrap(p.column);
    auto mark = bindNext(p.value);
    return OrmResult<std::string>::ok(column + " " + std::string(operatorSymbol(p.op)) + " " +
                                      mark);
}

OrmResult<std::string> SqlGrammar::compileWheres(const std::vector<Predicate>& wheres,
                                                 std::vector<DbValue>& bindings) const {
    std::string out;
    for (const auto& predicate : wheres) {
        auto sql = compilePredicate(predicate, bindings);
        if (sql.hasError()) {
            return sql;
        }
        if (sql.value().empty()) {
            continue;
        }
        if (!out.empty()) {
            out += predicate.boolean == Boolean::Or ? " OR " : " AND ";
        }
        out += sql.value();
    }
    return OrmResult<std::string>::ok(std::move(out));
}

OrmResult<std::string> SqlGrammar::compileJoins(const std::vector<JoinClause>& joins) const {
    std::string out;
    for (const auto& j : joins) {
        if (std::find(kJoinOperators.begin(), kJoinOperators.end(), j.op) ==
            kJoinOperators.end()) {
            ErrorDetail detail;
            detail.operation = "join";
            detail.table = j.table;
            detail.op = j.op;
            return foundation::failWith<std::string>(
                ErrorCode::UnsupportedOperator,
                "unsupported join operator '" + j.op + "'", std::move(detail));
        }
        switch (j.type) {
            case JoinType::Inner: out += " INNER JOIN "; break;
            case JoinType::Left:  out += " LEFT JOIN ";  break;
            case JoinType::Right: out += " RIGHT JOIN "; break;
        }
        out += wrapTable(TableRef{j.table, j.alias});
        out += " ON " + wrap(j.first) + " " + j.op + " " + wrap(j.second);
    }
    return OrmResult<std::string>::ok(std::move(out));
}

OrmResult<std::string> SqlGrammar::compileFromAndWhere(const SelectQuery& query,
                                                       std::vector<DbValue>& bindings) const {
    if (query.from.name.empty()) {
        return invalidQuery<std::string>("query has no target table");
    }
    auto joins = compileJoins(query.joins);
    if (joins.hasError()) {
        return joins;
    }
    auto wheres = compileWheres(query.wheres, bindings);
    if (wheres.hasError()) {
        return wheres;
    }

    std::string out = " FROM " + wrapTable(query.from) + joins.value();
    if (!wheres.value().empty()) {
        out += " WHERE " + wheres.value();
    }
    return OrmResult<std::string>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

OrmResult<PreparedStatement> SqlGrammar::compileSelect(const SelectQuery& query) const {
    std::vector<DbValue> bindings;
    auto from = compileFromAndWhere(query, bindings);
    if (from.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(from).error());
    }

    std::string sql = query.distinct ? "SELECT DISTINCT " : "SELECT ";
    if (query.columns.empty()) {
        sql += "*";
    } else {
        std::vector<std::string> cols;
        cols.reserve(query.columns.size());
        for (const auto& c : query.columns) {
            cols.push_back(wrap(c));
        }
        sql += join(cols, ", ");
    }
    sql += from.value();

    if (!query.orders.empty()) {
        std::vector<std::string> orders;
        for (const auto& o : query.orders) {
            orders.push_back(wrap(o.column) +
                             (o.direction == Direction::Desc ? " DESC" : " ASC"));
        }
        sql += " ORDER BY " + join(orders, ", ");
    }

    if (query.limit) {
        sql += " LIMIT " + std::to_string(*query.limit);
    } else if (query.offset && dialect_ == SqlDialect::MySQL) {
        // MySQL has no OFFSET without LIMIT.
        sql += " LIMIT 18446744073709551615";
    }
    if (query.offset) {
        sql += " OFFSET " + std::to_string(*query.offset);
    }

    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileCount(const SelectQuery& query) const {
    if (query.distinct && !query.columns.empty()) {
        SelectQuery inner = query;
        inner.orders.clear();
        inner.limit.reset();
        inner.offset.reset();
        auto sub = compileSelect(inner);
        if (sub.hasError()) {
            return sub;
        }
        std::string sql = "SELECT COUNT(*) AS " + wrapSegment("aggregate") + " FROM (" +
                          std::string(sub.value().sql()) + ") AS " +
                          wrapSegment("aggregate_table");
        return OrmResult<PreparedStatement>::ok(
            PreparedStatement(dialect_, std::move(sql), sub.value().bindings()));
    }

    std::vector<DbValue> bindings;
    auto from = compileFromAndWhere(query, bindings);
    if (from.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(from).error());
    }
    std::string sql = "SELECT COUNT(*) AS " + wrapSegment("aggregate") + from.value();
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileExists(const SelectQuery& query) const {
    std::vector<DbValue> bindings;
    auto from = compileFromAndWhere(query, bindings);
    if (from.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(from).error());
    }
    std::string sql = "SELECT EXISTS(SELECT 1" + from.value() + ") AS " + wrapSegment("exists");
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileAggregate(const SelectQuery& query,
                                                          AggregateFunction fn,
                                                          std::string_view column) const {
    std::string target;
    if (column.empty() || column == "*") {
        if (fn != AggregateFunction::Count) {
            return invalidQuery<PreparedStatement>(
                std::string(aggregateName(fn)) + " requires a column");
        }
        target = "*";
    } else {
        target = wrap(column);
    }

    std::vector<DbValue> bindings;
    auto from = compileFromAndWhere(query, bindings);
    if (from.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(from).error());
    }

    std::string name(aggregateName(fn));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::string sql = "SELECT " + name + "(" + target + ") AS " + wrapSegment("aggregate") +
                      from.value();
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileInsert(const InsertQuery& query) const {
    if (query.table.empty()) {
        return invalidQuery<PreparedStatement>("insert has no target table");
    }

    std::string sql = "INSERT INTO " + wrap(query.table);
    std::vector<DbValue> bindings;

    if (query.values.empty()) {
        sql += dialect_ == SqlDialect::MySQL ? " () VALUES ()" : " DEFAULT VALUES";
    } else {
        std::vector<std::string> cols;
        std::vector<std::string> marks;
        for (const auto& [column, value] : query.values) {
            cols.push_back(wrap(column));
            bindings.push_back(value);
            marks.push_back(placeholder(bindings.size()));
        }
        sql += " (" + join(cols, ", ") + ") VALUES (" + join(marks, ", ") + ")";
    }

    if (dialect_ == SqlDialect::PostgreSQL) {
        sql += " RETURNING *";
    }
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileUpdate(const MutationQuery& query,
                                                       const Row& values) const {
    if (values.empty()) {
        return invalidQuery<PreparedStatement>("update has no values");
    }

    std::vector<DbValue> bindings;
    std::vector<std::string> sets;
    for (const auto& [column, value] : values) {
        bindings.push_back(value);
        sets.push_back(wrap(column) + " = " + placeholder(bindings.size()));
    }

    auto wheres = compileWheres(query.wheres, bindings);
    if (wheres.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(wheres).error());
    }

    std::string sql = "UPDATE " + wrapTable(query.from) + " SET " + join(sets, ", ");
    if (!wheres.value().empty()) {
        sql += " WHERE " + wheres.value();
    }
    if (dialect_ == SqlDialect::PostgreSQL) {
        sql += " RETURNING 1";
    }
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

OrmResult<PreparedStatement> SqlGrammar::compileDelete(const MutationQuery& query) const {
    std::vector<DbValue> bindings;
    auto wheres = compileWheres(query.wheres, bindings);
    if (wheres.hasError()) {
        return OrmResult<PreparedStatement>::err(std::move(wheres).error());
    }

    std::string sql = "DELETE FROM " + wrapTable(query.from);
    if (!wheres.value().empty()) {
        sql += " WHERE " + wheres.value();
    }
    if (dialect_ == SqlDialect::PostgreSQL) {
        sql += " RETURNING 1";
    }
    return OrmResult<PreparedStatement>::ok(
        PreparedStatement(dialect_, std::move(sql), std::move(bindings)));
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

std::string SqlGrammar::compileColumn(const ColumnDefinition& c) const {
    const bool mysql = dialect_ == SqlDialect::MySQL;
    const bool serial = isIncrementing(c.type) ||
                        (c.autoIncrement && (c.type == ColumnType::Integer ||
                                             c.type == ColumnType::BigInteger));
    const bool big = c.type == ColumnType::BigIncrements || c.type == ColumnType::BigInteger;

    std::string out = wrap(c.name) + " ";
    if (serial) {
        if (mysql) {
            out += big ? "BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY"
                       : "INT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY";
        } else {
            out += big ? "BIGSERIAL PRIMARY KEY" : "SERIAL PRIMARY KEY";
        }
        return out;
    }

    switch (c.type) {
        case ColumnType::Integer:
            out += mysql ? "INT" : "INTEGER";
            break;
        case ColumnType::BigInteger:
            out += "BIGINT";
            break;
        case ColumnType::String:
            out += "VARCHAR(" + std::to_string(c.length) + ")";
            break;
        case ColumnType::Text:
            out += "TEXT";
            break;
        case ColumnType::Boolean:
            out += mysql ? "TINYINT(1)" : "BOOLEAN";
            break;
        case ColumnType::Float:
            out += mysql ? "FLOAT" : "REAL";
            break;
        case ColumnType::Double:
            out += mysql ? "DOUBLE" : "DOUBLE PRECISION";
            break;
        case ColumnType::Decimal:
            out += "DECIMAL(" + std::to_string(c.precision) + ", " + std::to_string(c.scale) + ")";
            break;
        case ColumnType::Date:
            out += "DATE";
            break;
        case ColumnType::DateTime:
            out += mysql ? "DATETIME" : "TIMESTAMP(0) WITHOUT TIME ZONE";
            break;
        case ColumnType::Timestamp:
            out += mysql ? "TIMESTAMP" : "TIMESTAMP(0) WITHOUT TIME ZONE";
            break;
        case ColumnType::Json:
            out += mysql ? "JSON" : "JSONB";
            break;
        case ColumnType::Uuid:
            out += mysql ? "CHAR(36)" : "UUID";
            break;
        case ColumnType::Increments:
        case ColumnType::BigIncrements:
            break;
    }

    if (mysql && c.isUnsigned &&
        (c.type == ColumnType::Integer || c.type == ColumnType::BigInteger ||
         c.type == ColumnType::Decimal || c.type == ColumnType::Double ||
         c.type == ColumnType::Float)) {
        out += " UNSIGNED";
    }

    out += c.nullable ? " NULL" : " NOT NULL";

    if (c.useCurrent) {
        out += " DEFAULT CURRENT_TIMESTAMP";
    } else if (c.defaultValue) {
        out += " DEFAULT " + sqlLiteral(dialect_, *c.defaultValue);
    }

    if (c.unique) {
        out += " UNIQUE";
    }
    return out;
}

std::string SqlGrammar::compileForeignKey(std::string_view table,
                                          const ForeignKeyDefinition& fk) const {
    std::string out = "CONSTRAINT " + wrapSegment(std::string(table) + "_" + fk.column + "_foreign") +
                      " FOREIGN KEY (" + wrap(fk.column) + ") REFERENCES " + wrap(fk.onTable) +
                      " (" + wrap(fk.referencesColumn) + ")";
    if (!fk.onDelete.empty()) {
        out += " ON DELETE " + fk.onDelete;
    }
    if (!fk.onUpdate.empty()) {
        out += " ON UPDATE " + fk.onUpdate;
    }
    return out;
}

static OrmResult<std::vector<std::string>> schemaError(std::string message,
                                                       std::string_view table) {
    ErrorDetail detail;
    detail.operation = "schema";
    detail.table = std::string(table);
    return foundation::failWith<std::vector<std::string>>(ErrorCode::SchemaError,
                                                          std::move(message), std::move(detail));
}

OrmResult<std::vector<std::string>> SqlGrammar::compileCreateTable(
    const TableDefinition& table) const {
    if (table.name.empty()) {
        return schemaError("table name is required", table.name);
    }
    if (table.columns.empty()) {
        return schemaError("table '" + table.name + "' has no columns", table.name);
    }

    std::vector<std::string> parts;
    std::vector<std::string> primary;
    std::vector<std::string> statements;

    for (const auto& c : table.columns) {
        parts.push_back(compileColumn(c));
        if (c.primary && !isIncrementing(c.type) && !c.autoIncrement) {
            primary.push_back(wrap(c.name));
        }
    }
    if (!primary.empty()) {
        parts.push_back("PRIMARY KEY (" + join(primary, ", ") + ")");
    }
    for (const auto& fk : table.foreignKeys) {
        if (fk.onTable.empty()) {
            return schemaError("foreign key on '" + fk.column + "' has no referenced table",
                               table.name);
        }
        parts.push_back(compileForeignKey(table.name, fk));
    }

    statements.push_back("CREATE TABLE " + wrap(table.name) + " (" + join(parts, ", ") + ")");

    for (const auto& c : table.columns) {
        if (c.index) {
            statements.push_back("CREATE INDEX " +
                                 wrapSegment(defaultIndexName(table.name, {c.name}, false)) +
                                 " ON " + wrap(table.name) + " (" + wrap(c.name) + ")");
        }
    }
    for (const auto& idx : table.indexes) {
        std::vector<std::string> cols;
        for (const auto& col : idx.columns) {
            cols.push_back(wrap(col));
        }
        auto name = idx.name.empty() ? defaultIndexName(table.name, idx.columns, idx.unique)
                                     : idx.name;
        statements.push_back(std::string(idx.unique ? "CREATE UNIQUE INDEX " : "CREATE INDEX ") +
                             wrapSegment(name) + " ON " + wrap(table.name) + " (" +
                             join(cols, ", ") + ")");
    }
    return OrmResult<std::vector<std::string>>::ok(std::move(statements));
}

OrmResult<std::vector<std::string>> SqlGrammar::compileAlterTable(
    const TableDefinition& delta) const {
    if (delta.name.empty()) {
        return schemaError("table name is required", delta.name);
    }

    const auto table = wrap(delta.name);
    std::vector<std::string> statements;

    for (const auto& c : delta.columns) {
        statements.push_back("ALTER TABLE " + table + " ADD COLUMN " + compileColumn(c));
        if (c.index) {
            statements.push_back("CREATE INDEX " +
                                 wrapSegment(defaultIndexName(delta.name, {c.name}, false)) +
                                 " ON " + table + " (" + wrap(c.name) + ")");
        }
    }
    for (const auto& [from, to] : delta.renameColumns) {
        statements.push_back("ALTER TABLE " + table + " RENAME COLUMN " + wrap(from) + " TO " +
                             wrap(to));
    }
    for (const auto& name : delta.dropIndexes) {
        if (dialect_ == SqlDialect::MySQL) {
            statements.push_back("DROP INDEX " + wrapSegment(name) + " ON " + table);
        } else {
            statements.push_back("DROP INDEX " + wrapSegment(name));
        }
    }
    for (const auto& column : delta.dropColumns) {
        statements.push_back("ALTER TABLE " + table + " DROP COLUMN " + wrap(column));
    }
    for (const auto& idx : delta.indexes) {
        std::vector<std::string> cols;
        for (const auto& col : idx.columns) {
            cols.push_back(wrap(col));
        }
        auto name = idx.name.empty() ? defaultIndexName(delta.name, idx.columns, idx.unique)
                                     : idx.name;
        statements.push_back(std::string(idx.unique ? "CREATE UNIQUE INDEX " : "CREATE INDEX ") +
                             wrapSegment(name) + " ON " + table + " (" + join(cols, ", ") + ")");
    }
    for (const auto& fk : delta.foreignKeys) {
        if (fk.onTable.empty()) {
            return schemaError("foreign key on '" + fk.column + "' has no referenced table",
                               delta.name);
        }
        statements.push_back("ALTER TABLE " + table + " ADD " + compileForeignKey(delta.name, fk));
    }
    return OrmResult<std::vector<std::string>>::ok(std::move(statements));
}

std::string SqlGrammar::compileDropTable(std::string_view table, bool ifExists) const {
    return std::string(ifExists ? "DROP TABLE IF EXISTS " : "DROP TABLE ") + wrap(table);
}

PreparedStatement SqlGrammar::compileHasTable(std::string_view table) const {
    std::string schema = dialect_ == SqlDialect::MySQL ? "DATABASE()" : "current_schema()";
    std::string sql = "SELECT COUNT(*) AS " + wrapSegment("aggregate") +
                      " FROM information_schema.tables WHERE table_schema = " + schema +
                      " AND table_name = " + placeholder(1) + " AND table_type = 'BASE TABLE'";
    return PreparedStatement(dialect_, std::move(sql), {DbValue(std::string(table))});
}

PreparedStatement SqlGrammar::compileHasColumn(std::string_view table,
                                               std::string_view column) const {
    std::string schema = dialect_ == SqlDialect::MySQL ? "DATABASE()" : "current_schema()";
    std::string sql = "SELECT COUNT(*) AS " + wrapSegment("aggregate") +
                      " FROM information_schema.columns WHERE table_schema = " + schema +
                      " AND table_name = " + placeholder(1) + " AND column_name = " +
                      placeholder(2);
    return PreparedStatement(dialect_, std::move(sql),
                             {DbValue(std::string(table)), DbValue(std::string(column))});
}

PreparedStatement SqlGrammar::compileListTables() const {
    std::string schema = dialect_ == SqlDialect::MySQL ? "DATABASE()" : "current_schema()";
    std::string sql = "SELECT table_name AS " + wrapSegment("table_name") +
                      " FROM information_schema.tables WHERE table_schema = " + schema +
                      " AND table_type = 'BASE TABLE' ORDER BY table_name";
    return PreparedStatement(dialect_, std::move(sql));
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

std::string SqlGrammar::compileSavepoint(std::size_t depth) {
    return "SAVEPOINT sp_" + std::to_string(depth);
}

std::string SqlGrammar::compileReleaseSavepoint(std::size_t depth) {
    return "RELEASE SAVEPOINT sp_" + std::to_string(depth);
}

std::string SqlGrammar::compileRollbackToSavepoint(std::size_t depth) {
    return "ROLLBACK TO SAVEPOINT sp_" + std::to_string(depth);
}

} // namespace quarry::db
