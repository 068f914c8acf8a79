/// @file sql_adapter.cpp
/// @brief SqlAdapter implementation wrapping kcenon database_system.

#include "quarry/database/sql_adapter.hpp"

#include "quarry/foundation/orm_logger.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <exception>
#include <mutex>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::OrmError;
using foundation::OrmLogger;

// ---------------------------------------------------------------------------
// Error classification
// ---------------------------------------------------------------------------

ErrorCode classifySqlError(std::string_view message) noexcept {
    auto contains = [message](std::string_view needle) {
        return message.find(needle) != std::string_view::npos;
    };

    if (contains("Duplicate entry") || contains("duplicate key value") ||
        contains("UNIQUE constraint failed") || contains("23505")) {
        return ErrorCode::UniqueViolation;
    }
    if (contains("Access denied") || contains("password authentication failed")) {
        return ErrorCode::AuthenticationFailed;
    }
    if (contains("Lost connection") || contains("gone away") ||
        contains("server closed the connection") || contains("could not connect") ||
        contains("Connection refused") || contains("no connection to the server") ||
        contains("Can't connect")) {
        return ErrorCode::ConnectionFailed;
    }
    return ErrorCode::QueryFailed;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ::database::database_types toKcenon(BackendType type) {
    return type == BackendType::MySQL ? ::database::database_types::mysql
                                      : ::database::database_types::postgres;
}

static SqlDialect toDialect(BackendType type) {
    return type == BackendType::MySQL ? SqlDialect::MySQL : SqlDialect::PostgreSQL;
}

static QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        Row row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    row[col] = DbNull{};
                } else if constexpr (std::is_same_v<T, std::string>) {
                    row[col] = arg;
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    row[col] = arg;
                } else if constexpr (std::is_same_v<T, double>) {
                    row[col] = arg;
                } else if constexpr (std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

/// Drivers may report numbers as text; parse those too.
static std::optional<double> scalarNumber(const DbValue& value) {
    if (auto n = toNumber(value)) {
        return n;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (*s == "t" || *s == "true") {
            return 1.0;
        }
        if (*s == "f" || *s == "false") {
            return 0.0;
        }
        double parsed = 0.0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec == std::errc() && ptr == s->data() + s->size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

static DbValue numericValue(const DbValue& value) {
    auto n = scalarNumber(value);
    if (!n || std::holds_alternative<bool>(value)) {
        return value;
    }
    if (std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value)) {
        return value;
    }
    if (const auto* s = std::get_if<std::string>(&value);
        s && s->find_first_of(".eE") == std::string::npos) {
        return static_cast<std::int64_t>(*n);
    }
    return *n;
}

static bool returnsRows(std::string_view sql) {
    auto first = sql.find_first_not_of(" \t\r\n(");
    if (first == std::string_view::npos) {
        return false;
    }
    std::string head;
    for (auto i = first; i < sql.size() && std::isalpha(static_cast<unsigned char>(sql[i])); ++i) {
        head += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[i])));
    }
    if (head == "SELECT" || head == "WITH" || head == "SHOW" || head == "EXPLAIN" ||
        head == "DESCRIBE" || head == "VALUES") {
        return true;
    }
    std::string upper(sql);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper.find(" RETURNING ") != std::string::npos;
}

// ---------------------------------------------------------------------------
// Connection pool entry
// ---------------------------------------------------------------------------

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

enum class CheckoutStatus : uint8_t { Ok, Timeout, Disconnected };

// ---------------------------------------------------------------------------
// SqlAdapter::Impl
// ---------------------------------------------------------------------------

struct SqlAdapter::Impl {
    using Manager = ::database::database_manager;

    explicit Impl(BackendType t) : type(t), grammar(toDialect(t)) {}

    BackendType type;
    SqlGrammar grammar;
    DatabaseConfig config;
    std::string connectionString;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    // Transaction state. txMutex also serializes statements on the pinned
    // connection.
    mutable std::mutex txMutex;
    std::shared_ptr<Manager> pinned;
    std::atomic<std::size_t> depth{0};

    template <typename T>
    OrmResult<T> fail(ErrorCode code, std::string message, std::string_view operation,
                      std::string_view table = {}) const {
        ErrorDetail detail;
        detail.backend = std::string(backendName(type));
        detail.operation = std::string(operation);
        detail.table = std::string(table);
        return foundation::failWith<T>(code, std::move(message), std::move(detail));
    }

    void logStatement(std::string_view sql, std::string_view table) const {
        auto& logger = OrmLogger::instance();
        if (!logger.isEnabled(LogLevel::Debug, LogCategory::Query)) {
            return;
        }
        LogContext ctx;
        ctx.backend = std::string(backendName(type));
        if (!table.empty()) {
            ctx.table = std::string(table);
        }
        logger.logWithContext(LogLevel::Debug, LogCategory::Query, sql, ctx);
    }

    // Checkout a connection from the pool (blocking with timeout)
    std::shared_ptr<Manager> checkout(CheckoutStatus& status) {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            if (!connected.load()) {
                status = CheckoutStatus::Disconnected;
                return nullptr;
            }
            for (auto& conn : pool) {
                if (!conn.inUse) {
                    conn.inUse = true;
                    status = CheckoutStatus::Ok;
                    return conn.manager;
                }
            }

            // Try to grow pool if under max
            if (pool.size() < config.pool.max) {
                std::string ignored;
                auto conn = createConnection(ignored);
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    status = CheckoutStatus::Ok;
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                status = connected.load() ? CheckoutStatus::Timeout
                                          : CheckoutStatus::Disconnected;
                return nullptr;
            }
        }
    }

    // Return a connection to the pool
    void checkin(Manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection createConnection(std::string& error) {
        PooledConnection conn;
        try {
            conn.context = std::make_shared<::database::database_context>();
            conn.manager = std::make_shared<Manager>(conn.context);

            if (!conn.manager->set_mode(toKcenon(type))) {
                error = "driver for " + std::string(backendName(type)) + " is unavailable";
                conn.manager.reset();
                return conn;
            }

            auto result = conn.manager->connect_result(connectionString);
            if (!result.is_ok()) {
                error = result.error().message;
                conn.manager.reset();
                return conn;
            }
        } catch (const std::exception& e) {
            error = e.what();
            conn.manager.reset();
        }
        return conn;
    }

    std::size_t countActive() const {
        std::lock_guard lock(poolMutex);
        return static_cast<std::size_t>(std::count_if(
            pool.begin(), pool.end(),
            [](const PooledConnection& c) { return c.inUse; }));
    }

    /// Run @p fn with a connection: the pinned one inside a transaction,
    /// otherwise one checked out of the pool for the call's duration.
    template <typename T, typename Fn>
    OrmResult<T> withConnection(std::string_view operation, std::string_view table, Fn&& fn) {
        if (!connected.load()) {
            return fail<T>(ErrorCode::NotConnected, "not connected to database", operation,
                           table);
        }

        {
            std::unique_lock txLock(txMutex);
            if (pinned) {
                auto mgr = pinned;
                return fn(*mgr);
            }
        }

        CheckoutStatus status = CheckoutStatus::Ok;
        auto mgr = checkout(status);
        if (!mgr) {
            if (status == CheckoutStatus::Disconnected) {
                return fail<T>(ErrorCode::NotConnected, "adapter was disconnected", operation,
                               table);
            }
            return fail<T>(ErrorCode::ConnectionPoolTimeout,
                           "no connection available within " +
                               std::to_string(config.connectionTimeout.count()) + "s",
                           operation, table);
        }

        struct Checkin {
            Impl* impl;
            Manager* mgr;
            ~Checkin() { impl->checkin(mgr); }
        } guard{this, mgr.get()};

        return fn(*mgr);
    }

    OrmResult<std::string> resolve(const PreparedStatement& stmt, std::string_view operation,
                                   std::string_view table) const {
        auto sql = stmt.resolve();
        if (sql.hasError()) {
            return fail<std::string>(sql.error().code(), std::string(sql.error().message()),
                                     operation, table);
        }
        return sql;
    }

    OrmResult<QueryResult> query(Manager& mgr, std::string_view sql, std::string_view operation,
                                 std::string_view table) const {
        logStatement(sql, table);
        try {
            auto result = mgr.select_query_result(std::string(sql));
            if (!result.is_ok()) {
                const auto& message = result.error().message;
                return fail<QueryResult>(classifySqlError(message), message, operation, table);
            }
            return OrmResult<QueryResult>::ok(convertResult(result.value()));
        } catch (const std::exception& e) {
            return fail<QueryResult>(classifySqlError(e.what()), e.what(), operation, table);
        }
    }

    OrmResult<void> execute(Manager& mgr, std::string_view sql, std::string_view operation,
                            std::string_view table) const {
        logStatement(sql, table);
        try {
            auto result = mgr.execute_query_result(std::string(sql));
            if (!result.is_ok()) {
                const auto& message = result.error().message;
                return fail<void>(classifySqlError(message), message, operation, table);
            }
            return OrmResult<void>::ok();
        } catch (const std::exception& e) {
            return fail<void>(classifySqlError(e.what()), e.what(), operation, table);
        }
    }

    OrmResult<QueryResult> query(Manager& mgr, const PreparedStatement& stmt,
                                 std::string_view operation, std::string_view table) const {
        auto sql = resolve(stmt, operation, table);
        if (sql.hasError()) {
            return OrmResult<QueryResult>::err(std::move(sql).error());
        }
        return query(mgr, sql.value(), operation, table);
    }

    OrmResult<void> execute(Manager& mgr, const PreparedStatement& stmt,
                            std::string_view operation, std::string_view table) const {
        auto sql = resolve(stmt, operation, table);
        if (sql.hasError()) {
            return OrmResult<void>::err(std::move(sql).error());
        }
        return execute(mgr, sql.value(), operation, table);
    }

    /// First column of the first row as an unsigned count.
    OrmResult<std::uint64_t> scalar(const OrmResult<QueryResult>& rows,
                                    std::string_view column) const {
        if (rows.hasError()) {
            return OrmResult<std::uint64_t>::err(rows.error());
        }
        if (rows.value().empty()) {
            return OrmResult<std::uint64_t>::ok(0);
        }
        const auto& row = rows.value().front();
        auto it = row.find(std::string(column));
        const DbValue& value = it != row.end() ? it->second : row.begin()->second;
        auto n = scalarNumber(value);
        return OrmResult<std::uint64_t>::ok(n && *n > 0 ? static_cast<std::uint64_t>(*n) : 0);
    }

    OrmResult<void> runStatements(const std::vector<std::string>& statements,
                                  std::string_view operation, std::string_view table) {
        return withConnection<void>(operation, table, [&](Manager& mgr) -> OrmResult<void> {
            for (const auto& sql : statements) {
                auto r = execute(mgr, sql, operation, table);
                if (r.hasError()) {
                    return r;
                }
            }
            return OrmResult<void>::ok();
        });
    }

    // Release the pinned connection back to the pool. Caller holds txMutex.
    void unpin() {
        if (pinned) {
            checkin(pinned.get());
            pinned.reset();
        }
        depth.store(0);
    }
};

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SqlAdapter::SqlAdapter(BackendType type)
    : impl_(std::make_unique<Impl>(type)) {}

SqlAdapter::~SqlAdapter() {
    if (impl_) {
        disconnect();
    }
}

BackendType SqlAdapter::type() const noexcept {
    return impl_->type;
}

const SqlGrammar& SqlAdapter::grammar() const noexcept {
    return impl_->grammar;
}

// ---------------------------------------------------------------------------
// connect() / disconnect()
// ---------------------------------------------------------------------------

OrmResult<void> SqlAdapter::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return fail<void>(ErrorCode::AlreadyExists, "already connected", "connect");
    }
    if (config.type != impl_->type) {
        return fail<void>(ErrorCode::InvalidConfiguration,
                          "config is for backend '" + std::string(backendName(config.type)) + "'",
                          "connect");
    }
    if (auto valid = validateConfig(config); valid.hasError()) {
        return valid;
    }

    impl_->config = config;
    impl_->connectionString = buildConnectionString(config);

    // Create minimum number of connections
    uint32_t initial = std::max<uint32_t>(config.pool.min, 1);
    for (uint32_t i = 0; i < initial; ++i) {
        std::string error;
        auto conn = impl_->createConnection(error);
        if (!conn.manager) {
            disconnect();
            auto code = classifySqlError(error);
            if (code == ErrorCode::QueryFailed || code == ErrorCode::UniqueViolation) {
                code = ErrorCode::ConnectionFailed;
            }
            return fail<void>(code,
                              "failed to create connection " + std::to_string(i + 1) + "/" +
                                  std::to_string(initial) + ": " + error,
                              "connect", config.database);
        }
        std::lock_guard lock(impl_->poolMutex);
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);

    LogContext ctx;
    ctx.backend = std::string(name());
    ctx.extra["database"] = config.database;
    ctx.extra["pool"] = std::to_string(initial) + "/" + std::to_string(config.pool.max);
    OrmLogger::instance().logWithContext(LogLevel::Info, LogCategory::Connection, "connected",
                                         ctx);
    return OrmResult<void>::ok();
}

void SqlAdapter::disconnect() {
    bool wasConnected = impl_->connected.exchange(false);

    {
        std::lock_guard txLock(impl_->txMutex);
        impl_->pinned.reset();
        impl_->depth.store(0);
    }

    {
        std::lock_guard lock(impl_->poolMutex);
        for (auto& conn : impl_->pool) {
            if (conn.manager) {
                (void)conn.manager->disconnect_result();
            }
        }
        impl_->pool.clear();
    }
    // Wake waiters so they fail with NotConnected instead of timing out.
    impl_->poolCv.notify_all();

    if (wasConnected) {
        QUARRY_LOG_INFO(LogCategory::Connection,
                        "disconnected from " + std::string(name()));
    }
}

bool SqlAdapter::isConnected() const noexcept {
    return impl_->connected.load();
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

OrmResult<void> SqlAdapter::createTable(const TableDefinition& table) {
    auto statements = impl_->grammar.compileCreateTable(table);
    if (statements.hasError()) {
        return OrmResult<void>::err(std::move(statements).error());
    }
    QUARRY_LOG_INFO(LogCategory::Schema, "create table " + table.name);
    return impl_->runStatements(statements.value(), "createTable", table.name);
}

OrmResult<void> SqlAdapter::alterTable(const TableDefinition& delta) {
    auto statements = impl_->grammar.compileAlterTable(delta);
    if (statements.hasError()) {
        return OrmResult<void>::err(std::move(statements).error());
    }
    QUARRY_LOG_INFO(LogCategory::Schema, "alter table " + delta.name);
    return impl_->runStatements(statements.value(), "alterTable", delta.name);
}

OrmResult<void> SqlAdapter::dropTable(std::string_view table, bool ifExists) {
    QUARRY_LOG_INFO(LogCategory::Schema, "drop table " + std::string(table));
    return impl_->runStatements({impl_->grammar.compileDropTable(table, ifExists)}, "dropTable",
                                table);
}

OrmResult<bool> SqlAdapter::hasTable(std::string_view table) {
    auto stmt = impl_->grammar.compileHasTable(table);
    return impl_->withConnection<bool>("hasTable", table, [&](auto& mgr) -> OrmResult<bool> {
        auto n = impl_->scalar(impl_->query(mgr, stmt, "hasTable", table), "aggregate");
        if (n.hasError()) {
            return OrmResult<bool>::err(std::move(n).error());
        }
        return OrmResult<bool>::ok(n.value() > 0);
    });
}

OrmResult<bool> SqlAdapter::hasColumn(std::string_view table, std::string_view column) {
    auto stmt = impl_->grammar.compileHasColumn(table, column);
    return impl_->withConnection<bool>("hasColumn", table, [&](auto& mgr) -> OrmResult<bool> {
        auto n = impl_->scalar(impl_->query(mgr, stmt, "hasColumn", table), "aggregate");
        if (n.hasError()) {
            return OrmResult<bool>::err(std::move(n).error());
        }
        return OrmResult<bool>::ok(n.value() > 0);
    });
}

OrmResult<std::vector<std::string>> SqlAdapter::listTables() {
    using Tables = std::vector<std::string>;
    auto stmt = impl_->grammar.compileListTables();
    return impl_->withConnection<Tables>("listTables", {}, [&](auto& mgr) -> OrmResult<Tables> {
        auto rows = impl_->query(mgr, stmt, "listTables", {});
        if (rows.hasError()) {
            return OrmResult<Tables>::err(std::move(rows).error());
        }
        Tables tables;
        for (const auto& row : rows.value()) {
            auto it = row.find("table_name");
            if (it == row.end()) {
                it = row.find("TABLE_NAME");
            }
            if (it != row.end()) {
                tables.push_back(toDisplayString(it->second));
            }
        }
        return OrmResult<Tables>::ok(std::move(tables));
    });
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

OrmResult<QueryResult> SqlAdapter::select(const SelectQuery& query) {
    auto stmt = impl_->grammar.compileSelect(query);
    if (stmt.hasError()) {
        return OrmResult<QueryResult>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;
    return impl_->withConnection<QueryResult>("select", table, [&](auto& mgr) {
        return impl_->query(mgr, stmt.value(), "select", table);
    });
}

OrmResult<std::uint64_t> SqlAdapter::count(const SelectQuery& query) {
    auto stmt = impl_->grammar.compileCount(query);
    if (stmt.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;
    return impl_->withConnection<std::uint64_t>("count", table, [&](auto& mgr) {
        return impl_->scalar(impl_->query(mgr, stmt.value(), "count", table), "aggregate");
    });
}

OrmResult<bool> SqlAdapter::exists(const SelectQuery& query) {
    auto stmt = impl_->grammar.compileExists(query);
    if (stmt.hasError()) {
        return OrmResult<bool>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;
    return impl_->withConnection<bool>("exists", table, [&](auto& mgr) -> OrmResult<bool> {
        auto n = impl_->scalar(impl_->query(mgr, stmt.value(), "exists", table), "exists");
        if (n.hasError()) {
            return OrmResult<bool>::err(std::move(n).error());
        }
        return OrmResult<bool>::ok(n.value() > 0);
    });
}

OrmResult<DbValue> SqlAdapter::aggregate(const SelectQuery& query, AggregateFunction fn,
                                         std::string_view column) {
    auto stmt = impl_->grammar.compileAggregate(query, fn, column);
    if (stmt.hasError()) {
        return OrmResult<DbValue>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;
    return impl_->withConnection<DbValue>("aggregate", table, [&](auto& mgr) -> OrmResult<DbValue> {
        auto rows = impl_->query(mgr, stmt.value(), "aggregate", table);
        if (rows.hasError()) {
            return OrmResult<DbValue>::err(std::move(rows).error());
        }
        if (rows.value().empty() || rows.value().front().empty()) {
            return OrmResult<DbValue>::ok(fn == AggregateFunction::Count ? DbValue(std::int64_t{0})
                                                                         : DbValue(DbNull{}));
        }
        const auto& row = rows.value().front();
        auto it = row.find("aggregate");
        const DbValue& value = it != row.end() ? it->second : row.begin()->second;
        return OrmResult<DbValue>::ok(numericValue(value));
    });
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

OrmResult<Row> SqlAdapter::insert(const InsertQuery& query) {
    auto stmt = impl_->grammar.compileInsert(query);
    if (stmt.hasError()) {
        return OrmResult<Row>::err(std::move(stmt).error());
    }
    const auto& table = query.table;

    return impl_->withConnection<Row>("insert", table, [&](auto& mgr) -> OrmResult<Row> {
        if (impl_->type == BackendType::PostgreSQL) {
            auto rows = impl_->query(mgr, stmt.value(), "insert", table);
            if (rows.hasError()) {
                return OrmResult<Row>::err(std::move(rows).error());
            }
            if (rows.value().empty()) {
                return OrmResult<Row>::ok(query.values);
            }
            return OrmResult<Row>::ok(std::move(rows.value().front()));
        }

        auto inserted = impl_->execute(mgr, stmt.value(), "insert", table);
        if (inserted.hasError()) {
            return OrmResult<Row>::err(std::move(inserted).error());
        }

        // LAST_INSERT_ID() is per connection, so it must run on this one.
        DbValue key = DbNull{};
        if (auto it = query.values.find(query.primaryKey);
            it != query.values.end() && !isNull(it->second)) {
            key = it->second;
        } else {
            auto id = impl_->scalar(
                impl_->query(mgr, std::string_view("SELECT LAST_INSERT_ID() AS `id`"), "insert",
                             table),
                "id");
            if (id.hasError()) {
                return OrmResult<Row>::err(std::move(id).error());
            }
            if (id.value() > 0) {
                key = static_cast<std::int64_t>(id.value());
            }
        }

        Row stored = query.values;
        if (isNull(key)) {
            return OrmResult<Row>::ok(std::move(stored));
        }

        SelectQuery fetch;
        fetch.from.name = table;
        fetch.wheres.push_back(Predicate{query.primaryKey, Operator::Equal, key, {}, Boolean::And, {}});
        fetch.limit = 1;
        auto select = impl_->grammar.compileSelect(fetch);
        if (select.hasError()) {
            return OrmResult<Row>::err(std::move(select).error());
        }
        auto rows = impl_->query(mgr, select.value(), "insert", table);
        if (rows.hasError()) {
            return OrmResult<Row>::err(std::move(rows).error());
        }
        if (rows.value().empty()) {
            stored[query.primaryKey] = key;
            return OrmResult<Row>::ok(std::move(stored));
        }
        return OrmResult<Row>::ok(std::move(rows.value().front()));
    });
}

OrmResult<std::uint64_t> SqlAdapter::update(const MutationQuery& query, const Row& values) {
    auto stmt = impl_->grammar.compileUpdate(query, values);
    if (stmt.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;

    return impl_->withConnection<std::uint64_t>(
        "update", table, [&](auto& mgr) -> OrmResult<std::uint64_t> {
            if (impl_->type == BackendType::PostgreSQL) {
                auto rows = impl_->query(mgr, stmt.value(), "update", table);
                if (rows.hasError()) {
                    return OrmResult<std::uint64_t>::err(std::move(rows).error());
                }
                return OrmResult<std::uint64_t>::ok(rows.value().size());
            }
            auto r = impl_->execute(mgr, stmt.value(), "update", table);
            if (r.hasError()) {
                return OrmResult<std::uint64_t>::err(std::move(r).error());
            }
            return impl_->scalar(
                impl_->query(mgr, std::string_view("SELECT ROW_COUNT() AS `affected`"), "update",
                             table),
                "affected");
        });
}

OrmResult<std::uint64_t> SqlAdapter::remove(const MutationQuery& query) {
    auto stmt = impl_->grammar.compileDelete(query);
    if (stmt.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(stmt).error());
    }
    const auto& table = query.from.name;

    return impl_->withConnection<std::uint64_t>(
        "delete", table, [&](auto& mgr) -> OrmResult<std::uint64_t> {
            if (impl_->type == BackendType::PostgreSQL) {
                auto rows = impl_->query(mgr, stmt.value(), "delete", table);
                if (rows.hasError()) {
                    return OrmResult<std::uint64_t>::err(std::move(rows).error());
                }
                return OrmResult<std::uint64_t>::ok(rows.value().size());
            }
            auto r = impl_->execute(mgr, stmt.value(), "delete", table);
            if (r.hasError()) {
                return OrmResult<std::uint64_t>::err(std::move(r).error());
            }
            return impl_->scalar(
                impl_->query(mgr, std::string_view("SELECT ROW_COUNT() AS `affected`"), "delete",
                             table),
                "affected");
        });
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

OrmResult<void> SqlAdapter::beginTransaction() {
    if (!impl_->connected.load()) {
        return fail<void>(ErrorCode::NotConnected, "not connected to database", "begin");
    }

    std::lock_guard txLock(impl_->txMutex);
    auto depth = impl_->depth.load();

    if (depth > 0) {
        auto r = impl_->execute(*impl_->pinned, SqlGrammar::compileSavepoint(depth + 1), "begin",
                                {});
        if (r.hasError()) {
            return fail<void>(ErrorCode::TransactionFailed,
                              "savepoint failed: " + std::string(r.error().message()), "begin");
        }
        impl_->depth.store(depth + 1);
        return OrmResult<void>::ok();
    }

    CheckoutStatus status = CheckoutStatus::Ok;
    auto mgr = impl_->checkout(status);
    if (!mgr) {
        return fail<void>(status == CheckoutStatus::Disconnected
                              ? ErrorCode::NotConnected
                              : ErrorCode::ConnectionPoolTimeout,
                          "no connection available for transaction", "begin");
    }

    auto result = mgr->begin_transaction();
    if (!result.is_ok()) {
        impl_->checkin(mgr.get());
        return fail<void>(ErrorCode::TransactionFailed,
                          "failed to begin transaction: " + result.error().message, "begin");
    }

    impl_->pinned = std::move(mgr);
    impl_->depth.store(1);
    QUARRY_LOG_DEBUG(LogCategory::Query, "BEGIN");
    return OrmResult<void>::ok();
}

OrmResult<void> SqlAdapter::commit() {
    std::lock_guard txLock(impl_->txMutex);
    auto depth = impl_->depth.load();
    if (depth == 0 || !impl_->pinned) {
        return fail<void>(ErrorCode::TransactionFailed, "no active transaction", "commit");
    }

    if (depth > 1) {
        auto r = impl_->execute(*impl_->pinned, SqlGrammar::compileReleaseSavepoint(depth),
                                "commit", {});
        if (r.hasError()) {
            return fail<void>(ErrorCode::TransactionFailed,
                              "release savepoint failed: " + std::string(r.error().message()),
                              "commit");
        }
        impl_->depth.store(depth - 1);
        return OrmResult<void>::ok();
    }

    auto result = impl_->pinned->commit_transaction();
    impl_->unpin();
    if (!result.is_ok()) {
        return fail<void>(ErrorCode::TransactionFailed,
                          "commit failed: " + result.error().message, "commit");
    }
    QUARRY_LOG_DEBUG(LogCategory::Query, "COMMIT");
    return OrmResult<void>::ok();
}

OrmResult<void> SqlAdapter::rollback() {
    std::lock_guard txLock(impl_->txMutex);
    auto depth = impl_->depth.load();
    if (depth == 0 || !impl_->pinned) {
        return fail<void>(ErrorCode::TransactionFailed, "no active transaction", "rollback");
    }

    if (depth > 1) {
        auto r = impl_->execute(*impl_->pinned, SqlGrammar::compileRollbackToSavepoint(depth),
                                "rollback", {});
        impl_->depth.store(depth - 1);
        if (r.hasError()) {
            return fail<void>(ErrorCode::TransactionFailed,
                              "rollback to savepoint failed: " + std::string(r.error().message()),
                              "rollback");
        }
        return OrmResult<void>::ok();
    }

    auto result = impl_->pinned->rollback_transaction();
    impl_->unpin();
    if (!result.is_ok()) {
        return fail<void>(ErrorCode::TransactionFailed,
                          "rollback failed: " + result.error().message, "rollback");
    }
    QUARRY_LOG_DEBUG(LogCategory::Query, "ROLLBACK");
    return OrmResult<void>::ok();
}

std::size_t SqlAdapter::transactionDepth() const noexcept {
    return impl_->depth.load();
}

// ---------------------------------------------------------------------------
// raw()
// ---------------------------------------------------------------------------

OrmResult<QueryResult> SqlAdapter::raw(std::string_view query,
                                       const std::vector<DbValue>& params) {
    PreparedStatement stmt(impl_->grammar.dialect(),
                           nativePlaceholders(impl_->grammar.dialect(), query), params);
    bool rows = returnsRows(query);

    return impl_->withConnection<QueryResult>("raw", {}, [&](auto& mgr) -> OrmResult<QueryResult> {
        if (rows) {
            return impl_->query(mgr, stmt, "raw", {});
        }
        auto r = impl_->execute(mgr, stmt, "raw", {});
        if (r.hasError()) {
            return OrmResult<QueryResult>::err(std::move(r).error());
        }
        return OrmResult<QueryResult>::ok(QueryResult{});
    });
}

// ---------------------------------------------------------------------------
// Pool information
// ---------------------------------------------------------------------------

std::size_t SqlAdapter::activeConnections() const {
    return impl_->countActive();
}

std::size_t SqlAdapter::poolSize() const {
    std::lock_guard lock(impl_->poolMutex);
    return impl_->pool.size();
}

} // namespace quarry::db
