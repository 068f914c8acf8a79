/// @file mongo_adapter.cpp
/// @brief MongoAdapter implementation over mongocxx/bsoncxx.

#include "quarry/database/mongo_adapter.hpp"

#include "quarry/database/document_filter.hpp"
#include "quarry/foundation/orm_logger.hpp"

// mongocxx headers (hidden behind PIMPL)
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/oid.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/count.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/pipeline.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

#include <atomic>
#include <mutex>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::OrmLogger;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static mongocxx::instance& driverInstance() {
    static mongocxx::instance instance{};
    return instance;
}

static bsoncxx::document::value toBson(const Json& json) {
    return bsoncxx::from_json(json.dump());
}

static Json fromBson(bsoncxx::document::view view) {
    return Json::parse(bsoncxx::to_json(view, bsoncxx::ExtendedJsonMode::k_relaxed));
}

static ErrorCode classifyMongoError(std::string_view message) {
    if (message.find("E11000") != std::string_view::npos) {
        return ErrorCode::UniqueViolation;
    }
    if (message.find("Authentication failed") != std::string_view::npos) {
        return ErrorCode::AuthenticationFailed;
    }
    if (message.find("No suitable servers") != std::string_view::npos ||
        message.find("connection refused") != std::string_view::npos) {
        return ErrorCode::ConnectionFailed;
    }
    if (message.find("timed out") != std::string_view::npos) {
        return ErrorCode::ConnectionPoolTimeout;
    }
    return ErrorCode::QueryFailed;
}

/// Connection URI with pool bounds appended as driver options.
static std::string poolUri(const DatabaseConfig& config) {
    auto uri = buildConnectionString(config);
    uri += uri.find('?') == std::string::npos ? '?' : '&';
    uri += "minPoolSize=" + std::to_string(config.pool.min);
    uri += "&maxPoolSize=" + std::to_string(config.pool.max);
    uri += "&waitQueueTimeoutMS=" + std::to_string(config.connectionTimeout.count() * 1000);
    return uri;
}

// ---------------------------------------------------------------------------
// MongoAdapter::Impl
// ---------------------------------------------------------------------------

struct MongoAdapter::Impl {
    std::shared_ptr<mongocxx::pool> pool;
    std::string database;
    mutable std::mutex mutex;
    std::atomic<bool> connected{false};

    template <typename T>
    OrmResult<T> fail(ErrorCode code, std::string message, std::string_view operation,
                      std::string_view table = {}) const {
        ErrorDetail detail;
        detail.backend = "mongodb";
        detail.operation = std::string(operation);
        detail.table = std::string(table);
        return foundation::failWith<T>(code, std::move(message), std::move(detail));
    }

    void logCommand(std::string_view operation, std::string_view table, const Json& body) const {
        auto& logger = OrmLogger::instance();
        if (!logger.isEnabled(LogLevel::Debug, LogCategory::Query)) {
            return;
        }
        LogContext ctx;
        ctx.backend = "mongodb";
        ctx.table = std::string(table);
        logger.logWithContext(LogLevel::Debug, LogCategory::Query,
                              std::string(operation) + " " + body.dump(), ctx);
    }

    /// Run @p fn against the configured database with a pooled client.
    /// Driver exceptions are converted at this boundary.
    template <typename T, typename Fn>
    OrmResult<T> withDatabase(std::string_view operation, std::string_view table, Fn&& fn) {
        std::shared_ptr<mongocxx::pool> current;
        {
            std::lock_guard lock(mutex);
            current = pool;
        }
        if (!connected.load() || !current) {
            return fail<T>(ErrorCode::NotConnected, "not connected to database", operation, table);
        }

        try {
            auto client = current->acquire();
            auto db = (*client)[database];
            return fn(db);
        } catch (const mongocxx::exception& e) {
            return fail<T>(classifyMongoError(e.what()), e.what(), operation, table);
        } catch (const bsoncxx::exception& e) {
            return fail<T>(ErrorCode::InvalidQuery, e.what(), operation, table);
        } catch (const Json::exception& e) {
            return fail<T>(ErrorCode::QueryFailed, e.what(), operation, table);
        }
    }

    template <typename T, typename Fn>
    OrmResult<T> withCollection(std::string_view operation, std::string_view table, Fn&& fn) {
        return withDatabase<T>(operation, table, [&](mongocxx::database& db) {
            auto collection = db[std::string(table)];
            return fn(collection);
        });
    }

    OrmResult<void> rejectUnsupported(const SelectQuery& query, std::string_view operation) const {
        if (!query.joins.empty()) {
            return fail<void>(ErrorCode::UnsupportedOperation, "joins are not supported on mongodb",
                              operation, query.from.name);
        }
        if (!query.from.alias.empty()) {
            return fail<void>(ErrorCode::UnsupportedOperation,
                              "table aliases are not supported on mongodb", operation,
                              query.from.name);
        }
        return OrmResult<void>::ok();
    }
};

// ---------------------------------------------------------------------------
// Construction / connection
// ---------------------------------------------------------------------------

MongoAdapter::MongoAdapter()
    : impl_(std::make_unique<Impl>()) {}

MongoAdapter::~MongoAdapter() {
    if (impl_) {
        disconnect();
    }
}

OrmResult<void> MongoAdapter::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return fail<void>(ErrorCode::AlreadyExists, "already connected", "connect");
    }
    if (config.type != BackendType::MongoDB) {
        return fail<void>(ErrorCode::InvalidConfiguration,
                          "config is for backend '" + std::string(backendName(config.type)) + "'",
                          "connect");
    }
    if (auto valid = validateConfig(config); valid.hasError()) {
        return valid;
    }

    (void)driverInstance();

    try {
        mongocxx::uri uri{poolUri(config)};
        auto pool = std::make_shared<mongocxx::pool>(uri);
        auto database = config.database.empty() ? uri.database() : config.database;
        if (database.empty()) {
            return fail<void>(ErrorCode::InvalidConfiguration,
                              "no database named in config or url", "connect");
        }

        // Round-trip once so unreachable hosts and bad credentials fail here.
        {
            auto client = pool->acquire();
            (void)(*client)[database].run_command(toBson(Json{{"ping", 1}}));
        }

        std::lock_guard lock(impl_->mutex);
        impl_->pool = std::move(pool);
        impl_->database = std::move(database);
        impl_->connected.store(true);
    } catch (const mongocxx::exception& e) {
        auto code = classifyMongoError(e.what());
        if (code == ErrorCode::QueryFailed || code == ErrorCode::ConnectionPoolTimeout) {
            code = ErrorCode::ConnectionFailed;
        }
        return fail<void>(code, e.what(), "connect", config.database);
    }

    LogContext ctx;
    ctx.backend = "mongodb";
    ctx.extra["database"] = impl_->database;
    OrmLogger::instance().logWithContext(LogLevel::Info, LogCategory::Connection, "connected",
                                         ctx);
    return OrmResult<void>::ok();
}

void MongoAdapter::disconnect() {
    bool wasConnected = impl_->connected.exchange(false);
    {
        std::lock_guard lock(impl_->mutex);
        impl_->pool.reset();
    }
    if (wasConnected) {
        QUARRY_LOG_INFO(LogCategory::Connection, "disconnected from mongodb");
    }
}

bool MongoAdapter::isConnected() const noexcept {
    return impl_->connected.load();
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

OrmResult<void> MongoAdapter::createTable(const TableDefinition& table) {
    QUARRY_LOG_INFO(LogCategory::Schema, "create collection " + table.name);
    return impl_->withDatabase<void>("createTable", table.name,
                                     [&](mongocxx::database& db) -> OrmResult<void> {
        if (db.has_collection(table.name)) {
            return fail<void>(ErrorCode::AlreadyExists,
                              "collection '" + table.name + "' already exists", "createTable",
                              table.name);
        }
        auto collection = db.create_collection(table.name);

        for (const auto& column : table.columns) {
            if (isIncrementing(column.type) || column.name == "id" || column.name == "_id") {
                continue;
            }
            if (column.unique || column.index) {
                Json options{{"unique", column.unique},
                             {"name", table.name + "_" + column.name +
                                          (column.unique ? "_unique" : "_index")}};
                collection.create_index(toBson(Json{{column.name, 1}}), toBson(options));
            }
        }
        for (const auto& index : table.indexes) {
            Json keys = Json::object();
            for (const auto& c : index.columns) {
                keys[document::fieldName(c)] = 1;
            }
            Json options{{"unique", index.unique}};
            if (!index.name.empty()) {
                options["name"] = index.name;
            }
            collection.create_index(toBson(keys), toBson(options));
        }
        return OrmResult<void>::ok();
    });
}

OrmResult<void> MongoAdapter::alterTable(const TableDefinition& delta) {
    QUARRY_LOG_INFO(LogCategory::Schema, "alter collection " + delta.name);
    return impl_->withCollection<void>("alterTable", delta.name,
                                       [&](mongocxx::collection& collection) -> OrmResult<void> {
        for (const auto& column : delta.columns) {
            if (column.defaultValue) {
                Json filter{{column.name, Json{{"$exists", false}}}};
                Json set{{"$set", Json{{column.name, toJson(*column.defaultValue)}}}};
                (void)collection.update_many(toBson(filter), toBson(set));
            }
            if (column.unique || column.index) {
                Json options{{"unique", column.unique},
                             {"name", delta.name + "_" + column.name +
                                          (column.unique ? "_unique" : "_index")}};
                collection.create_index(toBson(Json{{column.name, 1}}), toBson(options));
            }
        }
        for (const auto& [from, to] : delta.renameColumns) {
            Json rename{{"$rename", Json{{from, to}}}};
            (void)collection.update_many(toBson(Json::object()), toBson(rename));
        }
        for (const auto& column : delta.dropColumns) {
            Json unset{{"$unset", Json{{column, ""}}}};
            (void)collection.update_many(toBson(Json::object()), toBson(unset));
        }
        for (const auto& name : delta.dropIndexes) {
            collection.indexes().drop_one(name);
        }
        for (const auto& index : delta.indexes) {
            Json keys = Json::object();
            for (const auto& c : index.columns) {
                keys[document::fieldName(c)] = 1;
            }
            Json options{{"unique", index.unique}};
            if (!index.name.empty()) {
                options["name"] = index.name;
            }
            collection.create_index(toBson(keys), toBson(options));
        }
        return OrmResult<void>::ok();
    });
}

OrmResult<void> MongoAdapter::dropTable(std::string_view table, bool ifExists) {
    QUARRY_LOG_INFO(LogCategory::Schema, "drop collection " + std::string(table));
    return impl_->withDatabase<void>("dropTable", table,
                                     [&](mongocxx::database& db) -> OrmResult<void> {
        if (!db.has_collection(std::string(table))) {
            if (ifExists) {
                return OrmResult<void>::ok();
            }
            return fail<void>(ErrorCode::NotFound,
                              "collection '" + std::string(table) + "' does not exist",
                              "dropTable", table);
        }
        db[std::string(table)].drop();
        return OrmResult<void>::ok();
    });
}

OrmResult<bool> MongoAdapter::hasTable(std::string_view table) {
    return impl_->withDatabase<bool>("hasTable", table, [&](mongocxx::database& db) {
        return OrmResult<bool>::ok(db.has_collection(std::string(table)));
    });
}

OrmResult<bool> MongoAdapter::hasColumn(std::string_view table, std::string_view column) {
    return impl_->withCollection<bool>("hasColumn", table, [&](mongocxx::collection& c) {
        Json filter{{document::fieldName(column), Json{{"$exists", true}}}};
        mongocxx::options::count options;
        options.limit(1);
        return OrmResult<bool>::ok(c.count_documents(toBson(filter), options) > 0);
    });
}

OrmResult<std::vector<std::string>> MongoAdapter::listTables() {
    using Tables = std::vector<std::string>;
    return impl_->withDatabase<Tables>("listTables", {}, [&](mongocxx::database& db) {
        return OrmResult<Tables>::ok(db.list_collection_names());
    });
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

OrmResult<QueryResult> MongoAdapter::select(const SelectQuery& query) {
    if (auto r = impl_->rejectUnsupported(query, "select"); r.hasError()) {
        return OrmResult<QueryResult>::err(std::move(r).error());
    }
    auto filter = document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return OrmResult<QueryResult>::err(std::move(filter).error());
    }

    if (query.distinct) {
        if (query.columns.size() != 1) {
            return fail<QueryResult>(ErrorCode::UnsupportedOperation,
                                     "distinct needs exactly one column on mongodb", "select",
                                     query.from.name);
        }
        auto field = document::fieldName(query.columns.front());
        return impl_->withCollection<QueryResult>(
            "select", query.from.name, [&](mongocxx::collection& c) -> OrmResult<QueryResult> {
                impl_->logCommand("distinct", query.from.name, filter.value());
                QueryResult rows;
                for (auto&& doc : c.distinct(field, toBson(filter.value()))) {
                    auto reply = fromBson(doc);
                    for (const auto& v : reply.value("values", Json::array())) {
                        rows.push_back(document::fromDocument(Json{{field, v}}));
                    }
                }
                return OrmResult<QueryResult>::ok(std::move(rows));
            });
    }

    auto projection = document::compileProjection(query.columns);
    if (projection.hasError()) {
        return OrmResult<QueryResult>::err(std::move(projection).error());
    }

    return impl_->withCollection<QueryResult>(
        "select", query.from.name, [&](mongocxx::collection& c) -> OrmResult<QueryResult> {
            mongocxx::options::find options;
            if (!query.orders.empty()) {
                options.sort(toBson(document::compileSort(query.orders)));
            }
            if (!projection.value().empty()) {
                options.projection(toBson(projection.value()));
            }
            if (query.limit) {
                options.limit(static_cast<std::int64_t>(*query.limit));
            }
            if (query.offset) {
                options.skip(static_cast<std::int64_t>(*query.offset));
            }

            impl_->logCommand("find", query.from.name, filter.value());
            QueryResult rows;
            for (auto&& doc : c.find(toBson(filter.value()), options)) {
                rows.push_back(document::fromDocument(fromBson(doc)));
            }
            return OrmResult<QueryResult>::ok(std::move(rows));
        });
}

OrmResult<std::uint64_t> MongoAdapter::count(const SelectQuery& query) {
    if (auto r = impl_->rejectUnsupported(query, "count"); r.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(r).error());
    }
    auto filter = document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(filter).error());
    }
    return impl_->withCollection<std::uint64_t>("count", query.from.name,
                                                [&](mongocxx::collection& c) {
        impl_->logCommand("countDocuments", query.from.name, filter.value());
        auto n = c.count_documents(toBson(filter.value()));
        return OrmResult<std::uint64_t>::ok(static_cast<std::uint64_t>(n));
    });
}

OrmResult<bool> MongoAdapter::exists(const SelectQuery& query) {
    if (auto r = impl_->rejectUnsupported(query, "exists"); r.hasError()) {
        return OrmResult<bool>::err(std::move(r).error());
    }
    auto filter = document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return OrmResult<bool>::err(std::move(filter).error());
    }
    return impl_->withCollection<bool>("exists", query.from.name, [&](mongocxx::collection& c) {
        mongocxx::options::count options;
        options.limit(1);
        return OrmResult<bool>::ok(c.count_documents(toBson(filter.value()), options) > 0);
    });
}

OrmResult<DbValue> MongoAdapter::aggregate(const SelectQuery& query, AggregateFunction fn,
                                           std::string_view column) {
    if (fn == AggregateFunction::Count) {
        auto n = count(query);
        if (n.hasError()) {
            return OrmResult<DbValue>::err(std::move(n).error());
        }
        return OrmResult<DbValue>::ok(static_cast<std::int64_t>(n.value()));
    }
    if (auto r = impl_->rejectUnsupported(query, "aggregate"); r.hasError()) {
        return OrmResult<DbValue>::err(std::move(r).error());
    }

    auto pipeline = document::compileAggregatePipeline(query.wheres, fn, column);
    if (pipeline.hasError()) {
        return OrmResult<DbValue>::err(std::move(pipeline).error());
    }
    auto rows = aggregatePipeline(query.from.name, pipeline.value());
    if (rows.hasError()) {
        return OrmResult<DbValue>::err(std::move(rows).error());
    }
    if (rows.value().empty()) {
        return OrmResult<DbValue>::ok(DbNull{});
    }
    const auto& row = rows.value().front();
    auto it = row.find("aggregate");
    return OrmResult<DbValue>::ok(it != row.end() ? it->second : DbValue(DbNull{}));
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

OrmResult<Row> MongoAdapter::insert(const InsertQuery& query) {
    auto doc = document::toDocument(query.values);
    if (!doc.contains("_id")) {
        doc["_id"] = Json{{"$oid", bsoncxx::oid{}.to_string()}};
    }

    return impl_->withCollection<Row>("insert", query.table,
                                      [&](mongocxx::collection& c) -> OrmResult<Row> {
        impl_->logCommand("insertOne", query.table, doc);
        (void)c.insert_one(toBson(doc));
        return OrmResult<Row>::ok(document::fromDocument(doc));
    });
}

OrmResult<std::uint64_t> MongoAdapter::update(const MutationQuery& query, const Row& values) {
    if (!query.from.alias.empty()) {
        return fail<std::uint64_t>(ErrorCode::UnsupportedOperation,
                                   "table aliases are not supported on mongodb", "update",
                                   query.from.name);
    }
    auto filter = document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(filter).error());
    }
    auto changes = document::compileUpdate(values);

    return impl_->withCollection<std::uint64_t>("update", query.from.name,
                                                [&](mongocxx::collection& c) {
        impl_->logCommand("updateMany", query.from.name, filter.value());
        auto result = c.update_many(toBson(filter.value()), toBson(changes));
        std::uint64_t matched = result ? static_cast<std::uint64_t>(result->matched_count()) : 0;
        return OrmResult<std::uint64_t>::ok(matched);
    });
}

OrmResult<std::uint64_t> MongoAdapter::remove(const MutationQuery& query) {
    if (!query.from.alias.empty()) {
        return fail<std::uint64_t>(ErrorCode::UnsupportedOperation,
                                   "table aliases are not supported on mongodb", "delete",
                                   query.from.name);
    }
    auto filter = document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return OrmResult<std::uint64_t>::err(std::move(filter).error());
    }

    return impl_->withCollection<std::uint64_t>("delete", query.from.name,
                                                [&](mongocxx::collection& c) {
        impl_->logCommand("deleteMany", query.from.name, filter.value());
        auto result = c.delete_many(toBson(filter.value()));
        std::uint64_t deleted = result ? static_cast<std::uint64_t>(result->deleted_count()) : 0;
        return OrmResult<std::uint64_t>::ok(deleted);
    });
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

OrmResult<void> MongoAdapter::beginTransaction() {
    return fail<void>(ErrorCode::UnsupportedOperation,
                      "transactions are not supported by the mongodb adapter", "begin");
}

OrmResult<void> MongoAdapter::commit() {
    return fail<void>(ErrorCode::UnsupportedOperation,
                      "transactions are not supported by the mongodb adapter", "commit");
}

OrmResult<void> MongoAdapter::rollback() {
    return fail<void>(ErrorCode::UnsupportedOperation,
                      "transactions are not supported by the mongodb adapter", "rollback");
}

// ---------------------------------------------------------------------------
// Passthrough
// ---------------------------------------------------------------------------

OrmResult<QueryResult> MongoAdapter::raw(std::string_view command,
                                         const std::vector<DbValue>& params) {
    if (!params.empty()) {
        return fail<QueryResult>(ErrorCode::InvalidQuery,
                                 "mongodb commands take no positional bindings", "raw");
    }
    auto parsed = Json::parse(command, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return fail<QueryResult>(ErrorCode::InvalidQuery,
                                 "mongodb raw command must be a JSON object", "raw");
    }

    return impl_->withDatabase<QueryResult>("raw", {}, [&](mongocxx::database& db) {
        impl_->logCommand("runCommand", {}, parsed);
        auto reply = db.run_command(toBson(parsed));
        return OrmResult<QueryResult>::ok(QueryResult{document::fromDocument(fromBson(reply.view()))});
    });
}

OrmResult<QueryResult> MongoAdapter::aggregatePipeline(std::string_view collection,
                                                       const Json& pipeline) {
    if (!pipeline.is_array()) {
        return fail<QueryResult>(ErrorCode::InvalidQuery, "pipeline must be a JSON array",
                                 "aggregate", collection);
    }

    return impl_->withCollection<QueryResult>("aggregate", collection,
                                              [&](mongocxx::collection& c) {
        impl_->logCommand("aggregate", collection, pipeline);
        // bsoncxx parses documents only, so the stage array travels wrapped.
        auto wrapped = toBson(Json{{"stages", pipeline}});
        mongocxx::pipeline stages;
        stages.append_stages(wrapped.view()["stages"].get_array().value);

        QueryResult rows;
        for (auto&& doc : c.aggregate(stages)) {
            rows.push_back(document::fromDocument(fromBson(doc)));
        }
        return OrmResult<QueryResult>::ok(std::move(rows));
    });
}

} // namespace quarry::db
