/// @file memory_adapter.cpp
/// @brief MemoryAdapter implementation.

#include "quarry/database/memory_adapter.hpp"

#include "quarry/foundation/orm_logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;
using foundation::OrmError;

namespace {

// ---------------------------------------------------------------------------
// Column sources
// ---------------------------------------------------------------------------

/// One table taking part in a query, referenced by alias or name.
struct Source {
    std::string ref;
    std::vector<std::string> columns;
};

Source makeSource(const TableRef& ref, const TableDefinition& def) {
    Source s;
    s.ref = ref.reference();
    for (const auto& c : def.columns) {
        s.columns.push_back(c.name);
    }
    return s;
}

bool contains(const std::vector<std::string>& list, std::string_view name) {
    return std::find(list.begin(), list.end(), name) != list.end();
}

bool isKnownColumn(const std::vector<Source>& sources, std::string_view column) {
    auto dot = column.rfind('.');
    if (dot != std::string_view::npos) {
        auto ref = column.substr(0, dot);
        auto name = column.substr(dot + 1);
        for (const auto& s : sources) {
            if (s.ref == ref) {
                return name == "*" || contains(s.columns, name);
            }
        }
        return false;
    }
    return std::any_of(sources.begin(), sources.end(),
                       [&](const Source& s) { return contains(s.columns, column); });
}

/// A row keyed both by bare column name and by "ref.column".
Row makeRecord(const Source& source, const Row& row) {
    Row record;
    for (const auto& column : source.columns) {
        auto it = row.find(column);
        DbValue value = it != row.end() ? it->second : DbValue(DbNull{});
        record[source.ref + "." + column] = value;
        record[column] = std::move(value);
    }
    return record;
}

Row nullRecord(const Source& source) {
    return makeRecord(source, Row{});
}

// Later tables win on bare column names, as SQL drivers do for SELECT *.
void mergeInto(Row& target, const Row& add) {
    for (const auto& [k, v] : add) {
        target[k] = v;
    }
}

const DbValue& lookup(const Row& record, const std::string& column) {
    static const DbValue kNull = DbNull{};
    auto it = record.find(column);
    return it != record.end() ? it->second : kNull;
}

// ---------------------------------------------------------------------------
// Comparison
// ---------------------------------------------------------------------------

std::optional<double> parseNumber(const DbValue& value) {
    if (auto n = toNumber(value)) {
        return n;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        double parsed = 0.0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec == std::errc() && ptr == s->data() + s->size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

/// SQL-style comparison: unknown (nullopt) when either side is null;
/// numeric strings compare numerically against numbers.
std::optional<int> sqlCompare(const DbValue& a, const DbValue& b) {
    if (isNull(a) || isNull(b)) {
        return std::nullopt;
    }
    auto na = toNumber(a);
    auto nb = toNumber(b);
    if (na.has_value() != nb.has_value()) {
        na = parseNumber(a);
        nb = parseNumber(b);
    }
    if (na && nb) {
        return *na < *nb ? -1 : (*na > *nb ? 1 : 0);
    }
    return compareValues(a, b);
}

bool sqlEqual(const DbValue& a, const DbValue& b) {
    auto c = sqlCompare(a, b);
    return c && *c == 0;
}

char foldCase(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

/// Case-insensitive LIKE with '%' and '_' wildcards.
bool likeMatch(std::string_view text, std::string_view pattern) {
    std::size_t t = 0;
    std::size_t p = 0;
    std::size_t starP = std::string_view::npos;
    std::size_t starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() &&
            (pattern[p] == '_' || foldCase(pattern[p]) == foldCase(text[t]))) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '%') {
            starP = p++;
            starT = t;
        } else if (starP != std::string_view::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '%') {
        ++p;
    }
    return p == pattern.size();
}

bool compareWith(std::string_view op, const DbValue& a, const DbValue& b) {
    auto c = sqlCompare(a, b);
    if (!c) {
        return false;
    }
    if (op == "=") return *c == 0;
    if (op == "!=" || op == "<>") return *c != 0;
    if (op == "<") return *c < 0;
    if (op == ">") return *c > 0;
    if (op == "<=") return *c <= 0;
    if (op == ">=") return *c >= 0;
    return false;
}

// ---------------------------------------------------------------------------
// Predicate evaluation
// ---------------------------------------------------------------------------

bool isEmptyGroup(const Predicate& p) {
    if (p.op != Operator::Group) {
        return false;
    }
    return std::all_of(p.nested.begin(), p.nested.end(), isEmptyGroup);
}

bool matchesAll(const Row& record, const std::vector<Predicate>& wheres);

bool matches(const Row& record, const Predicate& p) {
    if (p.op == Operator::Group) {
        return matchesAll(record, p.nested);
    }

    const auto& lhs = lookup(record, p.column);
    switch (p.op) {
        case Operator::Equal:
            return isNull(p.value) ? isNull(lhs) : sqlEqual(lhs, p.value);
        case Operator::NotEqual:
            if (isNull(p.value)) {
                return !isNull(lhs);
            }
            return !isNull(lhs) && !sqlEqual(lhs, p.value);
        case Operator::Greater:      return compareWith(">", lhs, p.value);
        case Operator::Less:         return compareWith("<", lhs, p.value);
        case Operator::GreaterEqual: return compareWith(">=", lhs, p.value);
        case Operator::LessEqual:    return compareWith("<=", lhs, p.value);
        case Operator::Like:
        case Operator::NotLike: {
            if (isNull(lhs) || isNull(p.value)) {
                return false;
            }
            bool hit = likeMatch(toDisplayString(lhs), toDisplayString(p.value));
            return p.op == Operator::Like ? hit : !hit;
        }
        case Operator::In:
        case Operator::NotIn: {
            if (p.values.empty()) {
                return p.op == Operator::NotIn;
            }
            if (isNull(lhs)) {
                return false;
            }
            bool found = std::any_of(p.values.begin(), p.values.end(),
                                     [&](const DbValue& v) { return sqlEqual(lhs, v); });
            return p.op == Operator::In ? found : !found;
        }
        case Operator::Between: {
            if (p.values.size() != 2) {
                return false;
            }
            auto low = sqlCompare(lhs, p.values[0]);
            auto high = sqlCompare(lhs, p.values[1]);
            return low && high && *low >= 0 && *high <= 0;
        }
        case Operator::IsNull:
            return isNull(lhs);
        case Operator::IsNotNull:
            return !isNull(lhs);
        case Operator::Raw:
        case Operator::Group:
            break;
    }
    return false;
}

// AND binds tighter than OR.
bool matchesAll(const Row& record, const std::vector<Predicate>& wheres) {
    bool started = false;
    bool anySegment = false;
    bool segment = true;
    for (const auto& p : wheres) {
        if (isEmptyGroup(p)) {
            continue;
        }
        bool hit = matches(record, p);
        if (!started) {
            segment = hit;
            started = true;
        } else if (p.boolean == Boolean::Or) {
            anySegment = anySegment || segment;
            segment = hit;
        } else {
            segment = segment && hit;
        }
    }
    return !started || anySegment || segment;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

template <typename T>
OrmResult<T> memoryFail(ErrorCode code, std::string message, std::string_view operation,
                        std::string_view table, std::string_view column = {}) {
    ErrorDetail detail;
    detail.backend = "memory";
    detail.operation = std::string(operation);
    detail.table = std::string(table);
    detail.column = std::string(column);
    return foundation::failWith<T>(code, std::move(message), std::move(detail));
}

OrmResult<void> validatePredicates(const std::vector<Source>& sources,
                                   const std::vector<Predicate>& wheres,
                                   std::string_view operation, std::string_view table) {
    for (const auto& p : wheres) {
        if (p.op == Operator::Group) {
            auto r = validatePredicates(sources, p.nested, operation, table);
            if (r.hasError()) {
                return r;
            }
            continue;
        }
        if (p.op == Operator::Raw) {
            return memoryFail<void>(ErrorCode::UnsupportedOperation,
                                    "raw predicates are not supported by the memory backend",
                                    operation, table);
        }
        if (!isKnownColumn(sources, p.column)) {
            return memoryFail<void>(ErrorCode::QueryFailed,
                                    "unknown column '" + p.column + "' in where clause",
                                    operation, table, p.column);
        }
        if (p.op == Operator::Between && p.values.size() != 2) {
            return memoryFail<void>(ErrorCode::InvalidQuery,
                                    "BETWEEN requires exactly two values", operation, table,
                                    p.column);
        }
    }
    return OrmResult<void>::ok();
}

std::string keyName(std::string_view table, const std::vector<std::string>& columns) {
    std::string name(table);
    for (const auto& c : columns) {
        name += "_" + c;
    }
    return name + "_unique";
}

std::vector<std::pair<std::string, std::vector<std::string>>> uniqueKeys(
    const TableDefinition& def) {
    std::vector<std::pair<std::string, std::vector<std::string>>> keys;
    std::vector<std::string> primary;
    for (const auto& c : def.columns) {
        if (isIncrementing(c.type) || c.autoIncrement) {
            keys.emplace_back("PRIMARY", std::vector<std::string>{c.name});
        } else if (c.primary) {
            primary.push_back(c.name);
        }
        if (c.unique) {
            keys.emplace_back(keyName(def.name, {c.name}), std::vector<std::string>{c.name});
        }
    }
    if (!primary.empty()) {
        keys.emplace_back("PRIMARY", primary);
    }
    for (const auto& idx : def.indexes) {
        if (idx.unique) {
            keys.emplace_back(idx.name.empty() ? keyName(def.name, idx.columns) : idx.name,
                              idx.columns);
        }
    }
    return keys;
}

/// Reject @p candidate when it collides with any row other than @p self.
OrmResult<void> checkUnique(const MemoryAdapter::Table& table, const std::vector<Row>& rows,
                            const Row& candidate, std::size_t self, std::string_view operation) {
    for (const auto& [name, columns] : uniqueKeys(table.definition)) {
        std::vector<const DbValue*> values;
        bool hasNull = false;
        for (const auto& c : columns) {
            const auto& v = lookup(candidate, c);
            hasNull = hasNull || isNull(v);
            values.push_back(&v);
        }
        if (hasNull) {
            continue;
        }
        for (std::size_t i = 0; i < rows.size(); ++i) {
            if (i == self) {
                continue;
            }
            bool same = true;
            for (std::size_t k = 0; k < columns.size() && same; ++k) {
                same = sqlEqual(lookup(rows[i], columns[k]), *values[k]);
            }
            if (same) {
                std::string entry;
                for (std::size_t k = 0; k < values.size(); ++k) {
                    entry += (k > 0 ? "-" : "") + toDisplayString(*values[k]);
                }
                return memoryFail<void>(ErrorCode::UniqueViolation,
                                        "Duplicate entry '" + entry + "' for key '" + name + "'",
                                        operation, table.definition.name, columns.front());
            }
        }
    }
    return OrmResult<void>::ok();
}

const ColumnDefinition* findColumn(const TableDefinition& def, std::string_view name) {
    for (const auto& c : def.columns) {
        if (c.name == name) {
            return &c;
        }
    }
    return nullptr;
}

ColumnDefinition* findColumn(TableDefinition& def, std::string_view name) {
    for (auto& c : def.columns) {
        if (c.name == name) {
            return &c;
        }
    }
    return nullptr;
}

DbValue initialValue(const ColumnDefinition& column) {
    if (column.defaultValue) {
        return *column.defaultValue;
    }
    if (column.useCurrent) {
        return currentTimestamp();
    }
    return DbNull{};
}

std::string lastSegment(std::string_view column) {
    auto dot = column.rfind('.');
    return std::string(dot == std::string_view::npos ? column : column.substr(dot + 1));
}

/// Output row for one record under the select list.
Row project(const Row& record, const std::vector<std::string>& columns,
            const std::vector<Source>& sources) {
    Row out;
    auto all = [&](const Source& s) {
        for (const auto& c : s.columns) {
            out[c] = lookup(record, s.ref + "." + c);
        }
    };

    if (columns.empty()) {
        for (const auto& s : sources) {
            all(s);
        }
        return out;
    }
    for (const auto& expr : columns) {
        auto [column, alias] = splitColumnAlias(expr);
        if (column == "*") {
            for (const auto& s : sources) {
                all(s);
            }
        } else if (column.size() > 2 && column.substr(column.size() - 2) == ".*") {
            auto ref = column.substr(0, column.size() - 2);
            for (const auto& s : sources) {
                if (s.ref == ref) {
                    all(s);
                }
            }
        } else {
            out[alias.empty() ? lastSegment(column) : alias] = lookup(record, column);
        }
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

template <typename T>
OrmResult<T> MemoryAdapter::ensureConnected(std::string_view operation,
                                            std::string_view table) const {
    if (!connected_) {
        return memoryFail<T>(ErrorCode::NotConnected, "not connected to database", operation,
                             table);
    }
    if constexpr (std::is_void_v<T>) {
        return OrmResult<T>::ok();
    } else {
        return OrmResult<T>::ok(T{});
    }
}

OrmResult<void> MemoryAdapter::connect(const DatabaseConfig& config) {
    if (config.type != BackendType::Memory) {
        return fail<void>(ErrorCode::InvalidConfiguration,
                          "config is for backend '" + std::string(backendName(config.type)) + "'",
                          "connect");
    }
    if (auto valid = validateConfig(config); valid.hasError()) {
        return valid;
    }
    std::lock_guard lock(mutex_);
    if (connected_) {
        return fail<void>(ErrorCode::AlreadyExists, "already connected", "connect");
    }
    connected_ = true;
    QUARRY_LOG_INFO(LogCategory::Connection, "connected to memory backend");
    return OrmResult<void>::ok();
}

void MemoryAdapter::disconnect() {
    std::lock_guard lock(mutex_);
    connected_ = false;
    snapshots_.clear();
    depth_ = 0;
}

bool MemoryAdapter::isConnected() const noexcept {
    return connected_.load();
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

OrmResult<void> MemoryAdapter::createTable(const TableDefinition& table) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<void>("createTable", table.name); r.hasError()) {
        return r;
    }
    if (tables_.count(table.name) > 0) {
        return memoryFail<void>(ErrorCode::QueryFailed,
                                "table '" + table.name + "' already exists", "createTable",
                                table.name);
    }
    if (table.columns.empty()) {
        return memoryFail<void>(ErrorCode::SchemaError, "table '" + table.name + "' has no columns",
                                "createTable", table.name);
    }
    std::set<std::string> seen;
    for (const auto& c : table.columns) {
        if (!seen.insert(c.name).second) {
            return memoryFail<void>(ErrorCode::SchemaError,
                                    "duplicate column name '" + c.name + "'", "createTable",
                                    table.name, c.name);
        }
    }

    ++stats_.schemaChanges;
    Table t;
    t.definition = table;
    t.definition.dropColumns.clear();
    t.definition.renameColumns.clear();
    t.definition.dropIndexes.clear();
    tables_.emplace(table.name, std::move(t));
    return OrmResult<void>::ok();
}

OrmResult<void> MemoryAdapter::alterTable(const TableDefinition& delta) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<void>("alterTable", delta.name); r.hasError()) {
        return r;
    }
    auto it = tables_.find(delta.name);
    if (it == tables_.end()) {
        return memoryFail<void>(ErrorCode::QueryFailed,
                                "table '" + delta.name + "' doesn't exist", "alterTable",
                                delta.name);
    }

    // Work on a copy so a failing step leaves the table untouched.
    Table t = it->second;
    auto& def = t.definition;

    for (const auto& column : delta.columns) {
        if (findColumn(def, column.name)) {
            return memoryFail<void>(ErrorCode::SchemaError,
                                    "duplicate column name '" + column.name + "'", "alterTable",
                                    delta.name, column.name);
        }
        def.columns.push_back(column);
        for (auto& row : t.rows) {
            if (isIncrementing(column.type) || column.autoIncrement) {
                row[column.name] = t.nextId++;
            } else {
                row[column.name] = initialValue(column);
            }
        }
    }

    for (const auto& [from, to] : delta.renameColumns) {
        auto* column = findColumn(def, from);
        if (!column) {
            return memoryFail<void>(ErrorCode::QueryFailed, "unknown column '" + from + "'",
                                    "alterTable", delta.name, from);
        }
        if (findColumn(def, to) != column && findColumn(def, to) != nullptr) {
            return memoryFail<void>(ErrorCode::SchemaError, "duplicate column name '" + to + "'",
                                    "alterTable", delta.name, to);
        }
        column->name = to;
        for (auto& idx : def.indexes) {
            std::replace(idx.columns.begin(), idx.columns.end(), from, to);
        }
        for (auto& fk : def.foreignKeys) {
            if (fk.column == from) {
                fk.column = to;
            }
        }
        for (auto& row : t.rows) {
            auto node = row.extract(from);
            if (!node.empty()) {
                node.key() = to;
                row.insert(std::move(node));
            }
        }
    }

    for (const auto& name : delta.dropIndexes) {
        auto before = def.indexes.size();
        def.indexes.erase(std::remove_if(def.indexes.begin(), def.indexes.end(),
                                         [&](const IndexDefinition& idx) {
                                             return idx.name == name;
                                         }),
                          def.indexes.end());
        bool dropped = def.indexes.size() != before;
        for (auto& c : def.columns) {
            if (c.unique && keyName(def.name, {c.name}) == name) {
                c.unique = false;
                dropped = true;
            }
        }
        if (!dropped) {
            return memoryFail<void>(ErrorCode::QueryFailed, "unknown index '" + name + "'",
                                    "alterTable", delta.name);
        }
    }

    for (const auto& column : delta.dropColumns) {
        auto before = def.columns.size();
        def.columns.erase(std::remove_if(def.columns.begin(), def.columns.end(),
                                         [&](const ColumnDefinition& c) {
                                             return c.name == column;
                                         }),
                          def.columns.end());
        if (def.columns.size() == before) {
            return memoryFail<void>(ErrorCode::QueryFailed, "unknown column '" + column + "'",
                                    "alterTable", delta.name, column);
        }
        def.indexes.erase(std::remove_if(def.indexes.begin(), def.indexes.end(),
                                         [&](const IndexDefinition& idx) {
                                             return contains(idx.columns, column);
                                         }),
                          def.indexes.end());
        for (auto& row : t.rows) {
            row.erase(column);
        }
    }

    for (const auto& idx : delta.indexes) {
        for (const auto& c : idx.columns) {
            if (!findColumn(def, c)) {
                return memoryFail<void>(ErrorCode::QueryFailed, "unknown column '" + c + "'",
                                        "alterTable", delta.name, c);
            }
        }
        def.indexes.push_back(idx);
    }
    def.foreignKeys.insert(def.foreignKeys.end(), delta.foreignKeys.begin(),
                           delta.foreignKeys.end());

    // New unique constraints must hold for existing rows.
    for (std::size_t i = 0; i < t.rows.size(); ++i) {
        if (auto r = checkUnique(t, t.rows, t.rows[i], i, "alterTable"); r.hasError()) {
            return r;
        }
    }

    ++stats_.schemaChanges;
    it->second = std::move(t);
    return OrmResult<void>::ok();
}

OrmResult<void> MemoryAdapter::dropTable(std::string_view table, bool ifExists) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<void>("dropTable", table); r.hasError()) {
        return r;
    }
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        if (ifExists) {
            return OrmResult<void>::ok();
        }
        return memoryFail<void>(ErrorCode::QueryFailed,
                                "unknown table '" + std::string(table) + "'", "dropTable", table);
    }
    ++stats_.schemaChanges;
    tables_.erase(it);
    return OrmResult<void>::ok();
}

OrmResult<bool> MemoryAdapter::hasTable(std::string_view table) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<bool>("hasTable", table); r.hasError()) {
        return r;
    }
    return OrmResult<bool>::ok(tables_.find(table) != tables_.end());
}

OrmResult<bool> MemoryAdapter::hasColumn(std::string_view table, std::string_view column) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<bool>("hasColumn", table); r.hasError()) {
        return r;
    }
    auto it = tables_.find(table);
    return OrmResult<bool>::ok(it != tables_.end() &&
                               findColumn(it->second.definition, column) != nullptr);
}

OrmResult<std::vector<std::string>> MemoryAdapter::listTables() {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<std::vector<std::string>>("listTables", {}); r.hasError()) {
        return r;
    }
    std::vector<std::string> names;
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    return OrmResult<std::vector<std::string>>::ok(std::move(names));
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

OrmResult<std::vector<Row>> MemoryAdapter::evaluate(const SelectQuery& query) const {
    using Records = std::vector<Row>;
    const auto& tableName = query.from.name;

    if (auto r = ensureConnected<void>("select", tableName); r.hasError()) {
        return OrmResult<Records>::err(std::move(r).error());
    }
    auto base = tables_.find(tableName);
    if (base == tables_.end()) {
        return memoryFail<Records>(ErrorCode::QueryFailed,
                                   "table '" + tableName + "' doesn't exist", "select", tableName);
    }

    std::vector<Source> sources{makeSource(query.from, base->second.definition)};
    Records records;
    records.reserve(base->second.rows.size());
    for (const auto& row : base->second.rows) {
        records.push_back(makeRecord(sources.front(), row));
    }

    for (const auto& join : query.joins) {
        auto joined = tables_.find(join.table);
        if (joined == tables_.end()) {
            return memoryFail<Records>(ErrorCode::QueryFailed,
                                       "table '" + join.table + "' doesn't exist", "join",
                                       join.table);
        }
        auto source = makeSource(TableRef{join.table, join.alias}, joined->second.definition);
        auto scope = sources;
        scope.push_back(source);
        for (const auto* column : {&join.first, &join.second}) {
            if (!isKnownColumn(scope, *column)) {
                return memoryFail<Records>(ErrorCode::QueryFailed,
                                           "unknown column '" + *column + "' in on clause",
                                           "join", join.table, *column);
            }
        }

        auto on = [&](const Row& merged) {
            return compareWith(join.op, lookup(merged, join.first), lookup(merged, join.second));
        };

        Records next;
        if (join.type == JoinType::Right) {
            for (const auto& row : joined->second.rows) {
                auto right = makeRecord(source, row);
                bool matched = false;
                for (const auto& left : records) {
                    Row merged = left;
                    mergeInto(merged, right);
                    if (on(merged)) {
                        next.push_back(std::move(merged));
                        matched = true;
                    }
                }
                if (!matched) {
                    Row merged;
                    for (const auto& s : sources) {
                        mergeInto(merged, nullRecord(s));
                    }
                    mergeInto(merged, right);
                    next.push_back(std::move(merged));
                }
            }
        } else {
            for (const auto& left : records) {
                bool matched = false;
                for (const auto& row : joined->second.rows) {
                    Row merged = left;
                    mergeInto(merged, makeRecord(source, row));
                    if (on(merged)) {
                        next.push_back(std::move(merged));
                        matched = true;
                    }
                }
                if (!matched && join.type == JoinType::Left) {
                    Row merged = left;
                    mergeInto(merged, nullRecord(source));
                    next.push_back(std::move(merged));
                }
            }
        }
        records = std::move(next);
        sources = std::move(scope);
    }

    if (auto r = validatePredicates(sources, query.wheres, "select", tableName); r.hasError()) {
        return OrmResult<Records>::err(std::move(r).error());
    }

    // Projection aliases may be used for ordering.
    std::map<std::string, std::string> aliases;
    for (const auto& expr : query.columns) {
        auto [column, alias] = splitColumnAlias(expr);
        if (column.find('(') != std::string::npos) {
            return memoryFail<Records>(ErrorCode::UnsupportedOperation,
                                       "expressions are not supported by the memory backend",
                                       "select", tableName, column);
        }
        bool wildcard = column == "*" ||
                        (column.size() > 2 && column.substr(column.size() - 2) == ".*");
        if (!wildcard && !isKnownColumn(sources, column)) {
            return memoryFail<Records>(ErrorCode::QueryFailed,
                                       "unknown column '" + column + "' in field list", "select",
                                       tableName, column);
        }
        if (wildcard && column != "*" && !isKnownColumn(sources, column)) {
            return memoryFail<Records>(ErrorCode::QueryFailed,
                                       "unknown table '" + column.substr(0, column.size() - 2) +
                                           "'",
                                       "select", tableName);
        }
        if (!alias.empty()) {
            aliases[alias] = column;
        }
    }

    std::vector<std::string> orderColumns;
    for (const auto& order : query.orders) {
        if (isKnownColumn(sources, order.column)) {
            orderColumns.push_back(order.column);
        } else if (auto a = aliases.find(order.column); a != aliases.end()) {
            orderColumns.push_back(a->second);
        } else {
            return memoryFail<Records>(ErrorCode::QueryFailed,
                                       "unknown column '" + order.column + "' in order clause",
                                       "select", tableName, order.column);
        }
    }

    Records filtered;
    for (auto& record : records) {
        if (matchesAll(record, query.wheres)) {
            filtered.push_back(std::move(record));
        }
    }

    if (!query.orders.empty()) {
        std::stable_sort(filtered.begin(), filtered.end(), [&](const Row& a, const Row& b) {
            for (std::size_t i = 0; i < query.orders.size(); ++i) {
                int c = compareValues(lookup(a, orderColumns[i]), lookup(b, orderColumns[i]));
                if (c != 0) {
                    return query.orders[i].direction == Direction::Desc ? c > 0 : c < 0;
                }
            }
            return false;
        });
    }

    Records out;
    out.reserve(filtered.size());
    for (const auto& record : filtered) {
        out.push_back(project(record, query.columns, sources));
    }
    if (query.distinct) {
        Records unique;
        for (auto& row : out) {
            if (std::find(unique.begin(), unique.end(), row) == unique.end()) {
                unique.push_back(std::move(row));
            }
        }
        out = std::move(unique);
    }
    return OrmResult<Records>::ok(std::move(out));
}

OrmResult<QueryResult> MemoryAdapter::select(const SelectQuery& query) {
    std::lock_guard lock(mutex_);
    ++stats_.selects;
    auto rows = evaluate(query);
    if (rows.hasError()) {
        return rows;
    }

    auto& all = rows.value();
    std::size_t begin = std::min<std::size_t>(query.offset.value_or(0), all.size());
    std::size_t end = all.size();
    if (query.limit) {
        end = std::min<std::size_t>(begin + *query.limit, all.size());
    }
    auto first = all.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = all.begin() + static_cast<std::ptrdiff_t>(end);
    return OrmResult<QueryResult>::ok(
        QueryResult(std::make_move_iterator(first), std::make_move_iterator(last)));
}

OrmResult<std::uint64_t> MemoryAdapter::count(const SelectQuery& query) {
    std::lock_guard lock(mutex_);
    ++stats_.counts;
    SelectQuery unordered = query;
    unordered.orders.clear();
    if (!unordered.distinct) {
        unordered.columns.clear();
    }
    auto rows = evaluate(unordered);
    if (rows.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(rows).error());
    }
    return OrmResult<std::uint64_t>::ok(rows.value().size());
}

OrmResult<bool> MemoryAdapter::exists(const SelectQuery& query) {
    std::lock_guard lock(mutex_);
    ++stats_.exists;
    SelectQuery unordered = query;
    unordered.orders.clear();
    unordered.columns.clear();
    unordered.distinct = false;
    auto rows = evaluate(unordered);
    if (rows.hasError()) {
        return OrmResult<bool>::err(std::move(rows).error());
    }
    return OrmResult<bool>::ok(!rows.value().empty());
}

OrmResult<DbValue> MemoryAdapter::aggregate(const SelectQuery& query, AggregateFunction fn,
                                            std::string_view column) {
    std::lock_guard lock(mutex_);
    ++stats_.aggregates;

    bool star = column.empty() || column == "*";
    if (star && fn != AggregateFunction::Count) {
        return fail<DbValue>(ErrorCode::InvalidQuery,
                             std::string(aggregateName(fn)) + " requires a column", "aggregate",
                             query.from.name);
    }

    SelectQuery scoped = query;
    scoped.orders.clear();
    scoped.distinct = false;
    scoped.columns.clear();
    if (!star) {
        scoped.columns.push_back(std::string(column) + " as aggregate");
    }
    auto rows = evaluate(scoped);
    if (rows.hasError()) {
        return OrmResult<DbValue>::err(std::move(rows).error());
    }

    if (fn == AggregateFunction::Count) {
        if (star) {
            return OrmResult<DbValue>::ok(static_cast<std::int64_t>(rows.value().size()));
        }
        auto n = std::count_if(rows.value().begin(), rows.value().end(),
                               [](const Row& r) { return !isNull(lookup(r, "aggregate")); });
        return OrmResult<DbValue>::ok(static_cast<std::int64_t>(n));
    }

    std::vector<DbValue> values;
    for (const auto& r : rows.value()) {
        const auto& v = lookup(r, "aggregate");
        if (!isNull(v)) {
            values.push_back(v);
        }
    }
    if (values.empty()) {
        return OrmResult<DbValue>::ok(DbNull{});
    }

    switch (fn) {
        case AggregateFunction::Sum:
        case AggregateFunction::Avg: {
            bool integral = true;
            std::int64_t isum = 0;
            double dsum = 0.0;
            for (const auto& v : values) {
                auto n = parseNumber(v);
                if (!n) {
                    continue;
                }
                if (const auto* i = std::get_if<std::int64_t>(&v)) {
                    isum += *i;
                } else {
                    integral = false;
                }
                dsum += *n;
            }
            if (fn == AggregateFunction::Avg) {
                return OrmResult<DbValue>::ok(dsum / static_cast<double>(values.size()));
            }
            return OrmResult<DbValue>::ok(integral ? DbValue(isum) : DbValue(dsum));
        }
        case AggregateFunction::Min:
        case AggregateFunction::Max: {
            auto best = values.front();
            for (const auto& v : values) {
                int c = compareValues(v, best);
                if ((fn == AggregateFunction::Min && c < 0) ||
                    (fn == AggregateFunction::Max && c > 0)) {
                    best = v;
                }
            }
            return OrmResult<DbValue>::ok(best);
        }
        case AggregateFunction::Count:
            break;
    }
    return OrmResult<DbValue>::ok(DbNull{});
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

OrmResult<Row> MemoryAdapter::insert(const InsertQuery& query) {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<void>("insert", query.table); r.hasError()) {
        return OrmResult<Row>::err(std::move(r).error());
    }
    auto it = tables_.find(query.table);
    if (it == tables_.end()) {
        return memoryFail<Row>(ErrorCode::QueryFailed,
                               "table '" + query.table + "' doesn't exist", "insert", query.table);
    }
    auto& table = it->second;
    const auto& def = table.definition;

    for (const auto& [column, value] : query.values) {
        if (!findColumn(def, column)) {
            return memoryFail<Row>(ErrorCode::QueryFailed,
                                   "unknown column '" + column + "' in field list", "insert",
                                   query.table, column);
        }
    }

    Row row;
    std::int64_t nextId = table.nextId;
    for (const auto& column : def.columns) {
        auto given = query.values.find(column.name);
        bool serial = isIncrementing(column.type) || column.autoIncrement;

        if (given != query.values.end() && !isNull(given->second)) {
            row[column.name] = given->second;
            if (serial) {
                if (auto n = parseNumber(given->second)) {
                    nextId = std::max(nextId, static_cast<std::int64_t>(*n) + 1);
                }
            }
            continue;
        }
        if (serial) {
            row[column.name] = nextId++;
            continue;
        }
        if (given == query.values.end()) {
            row[column.name] = initialValue(column);
        } else {
            row[column.name] = DbNull{};
        }
        if (isNull(row[column.name]) && !column.nullable) {
            return memoryFail<Row>(ErrorCode::QueryFailed,
                                   "column '" + column.name + "' cannot be null", "insert",
                                   query.table, column.name);
        }
    }

    if (auto r = checkUnique(table, table.rows, row, table.rows.size(), "insert");
        r.hasError()) {
        return OrmResult<Row>::err(std::move(r).error());
    }

    ++stats_.inserts;
    table.nextId = nextId;
    table.rows.push_back(row);
    return OrmResult<Row>::ok(std::move(row));
}

OrmResult<std::uint64_t> MemoryAdapter::update(const MutationQuery& query, const Row& values) {
    std::lock_guard lock(mutex_);
    const auto& tableName = query.from.name;
    if (auto r = ensureConnected<void>("update", tableName); r.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(r).error());
    }
    auto it = tables_.find(tableName);
    if (it == tables_.end()) {
        return memoryFail<std::uint64_t>(ErrorCode::QueryFailed,
                                         "table '" + tableName + "' doesn't exist", "update",
                                         tableName);
    }
    auto& table = it->second;
    if (values.empty()) {
        return memoryFail<std::uint64_t>(ErrorCode::InvalidQuery, "update has no values",
                                         "update", tableName);
    }

    std::vector<Source> sources{makeSource(query.from, table.definition)};
    for (const auto& [column, value] : values) {
        const auto* def = findColumn(table.definition, lastSegment(column));
        if (!def) {
            return memoryFail<std::uint64_t>(ErrorCode::QueryFailed,
                                             "unknown column '" + column + "' in field list",
                                             "update", tableName, column);
        }
        if (isNull(value) && !def->nullable) {
            return memoryFail<std::uint64_t>(ErrorCode::QueryFailed,
                                             "column '" + column + "' cannot be null", "update",
                                             tableName, column);
        }
    }
    if (auto r = validatePredicates(sources, query.wheres, "update", tableName); r.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(r).error());
    }

    auto rows = table.rows;
    std::uint64_t affected = 0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (!matchesAll(makeRecord(sources.front(), rows[i]), query.wheres)) {
            continue;
        }
        for (const auto& [column, value] : values) {
            rows[i][lastSegment(column)] = value;
        }
        if (auto r = checkUnique(table, rows, rows[i], i, "update"); r.hasError()) {
            return OrmResult<std::uint64_t>::err(std::move(r).error());
        }
        ++affected;
    }

    ++stats_.updates;
    table.rows = std::move(rows);
    return OrmResult<std::uint64_t>::ok(affected);
}

OrmResult<std::uint64_t> MemoryAdapter::remove(const MutationQuery& query) {
    std::lock_guard lock(mutex_);
    const auto& tableName = query.from.name;
    if (auto r = ensureConnected<void>("delete", tableName); r.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(r).error());
    }
    auto it = tables_.find(tableName);
    if (it == tables_.end()) {
        return memoryFail<std::uint64_t>(ErrorCode::QueryFailed,
                                         "table '" + tableName + "' doesn't exist", "delete",
                                         tableName);
    }
    auto& table = it->second;
    std::vector<Source> sources{makeSource(query.from, table.definition)};
    if (auto r = validatePredicates(sources, query.wheres, "delete", tableName); r.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(r).error());
    }

    auto before = table.rows.size();
    table.rows.erase(std::remove_if(table.rows.begin(), table.rows.end(),
                                    [&](const Row& row) {
                                        return matchesAll(makeRecord(sources.front(), row),
                                                          query.wheres);
                                    }),
                     table.rows.end());
    ++stats_.deletes;
    return OrmResult<std::uint64_t>::ok(before - table.rows.size());
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

OrmResult<void> MemoryAdapter::beginTransaction() {
    std::lock_guard lock(mutex_);
    if (auto r = ensureConnected<void>("begin", {}); r.hasError()) {
        return r;
    }
    snapshots_.push_back(tables_);
    depth_ = snapshots_.size();
    return OrmResult<void>::ok();
}

OrmResult<void> MemoryAdapter::commit() {
    std::lock_guard lock(mutex_);
    if (snapshots_.empty()) {
        return fail<void>(ErrorCode::TransactionFailed, "no active transaction", "commit");
    }
    snapshots_.pop_back();
    depth_ = snapshots_.size();
    return OrmResult<void>::ok();
}

OrmResult<void> MemoryAdapter::rollback() {
    std::lock_guard lock(mutex_);
    if (snapshots_.empty()) {
        return fail<void>(ErrorCode::TransactionFailed, "no active transaction", "rollback");
    }
    tables_ = std::move(snapshots_.back());
    snapshots_.pop_back();
    depth_ = snapshots_.size();
    return OrmResult<void>::ok();
}

std::size_t MemoryAdapter::transactionDepth() const noexcept {
    return depth_.load();
}

OrmResult<QueryResult> MemoryAdapter::raw(std::string_view /*query*/,
                                          const std::vector<DbValue>& /*params*/) {
    return fail<QueryResult>(ErrorCode::UnsupportedOperation,
                             "raw statements are not supported by the memory backend", "raw");
}

AdapterStats MemoryAdapter::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void MemoryAdapter::resetStats() {
    std::lock_guard lock(mutex_);
    stats_ = AdapterStats{};
}

} // namespace quarry::db
