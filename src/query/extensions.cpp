/// @file extensions.cpp
/// @brief Shipped macro implementations.

#include "quarry/query/extensions.hpp"

#include "quarry/database/document_filter.hpp"
#include "quarry/database/sql_grammar.hpp"
#include "quarry/foundation/orm_logger.hpp"
#include "quarry/query/query_builder.hpp"

namespace quarry::query {

using db::Json;
using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;

namespace {

template <typename T>
OrmResult<T> extensionFail(ErrorCode code, std::string message, std::string_view operation,
                           const QueryBuilder* builder = nullptr) {
    ErrorDetail detail;
    detail.operation = std::string(operation);
    if (builder) {
        detail.backend = std::string(builder->adapter().name());
        detail.table = builder->tableName();
    }
    return foundation::failWith<T>(code, std::move(message), std::move(detail));
}

std::string stringOr(const Json& args, const char* key, std::string fallback) {
    auto it = args.find(key);
    if (it != args.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

} // namespace

// ---------------------------------------------------------------------------
// MongoDB
// ---------------------------------------------------------------------------

OrmResult<PopulateOptions> PopulateOptions::fromJson(const Json& args) {
    PopulateOptions options;
    if (args.is_string()) {
        options.field = args.get<std::string>();
    } else if (args.is_object()) {
        options.field = stringOr(args, "field", {});
    }
    if (options.field.empty()) {
        return extensionFail<PopulateOptions>(ErrorCode::InvalidArgument,
                                              "populate requires a field name", "populate");
    }

    const Json& opts = args.is_object() ? args : Json::object();
    options.from = stringOr(opts, "from", options.field + "s");
    options.localField = stringOr(opts, "localField", options.field + "_id");
    options.foreignField = stringOr(opts, "foreignField", "_id");
    options.as = stringOr(opts, "as", options.field);

    if (auto it = opts.find("select"); it != opts.end()) {
        if (!it->is_array()) {
            return extensionFail<PopulateOptions>(ErrorCode::InvalidArgument,
                                                  "populate select must be an array",
                                                  "populate");
        }
        for (const auto& column : *it) {
            if (column.is_string()) {
                options.select.push_back(column.get<std::string>());
            }
        }
    }
    return OrmResult<PopulateOptions>::ok(std::move(options));
}

OrmResult<Json> buildPopulatePipeline(const db::SelectQuery& query,
                                      const PopulateOptions& options) {
    auto filter = db::document::compileFilter(query.wheres);
    if (filter.hasError()) {
        return filter;
    }

    Json pipeline = Json::array();
    if (!filter.value().empty()) {
        pipeline.push_back({{"$match", filter.value()}});
    }

    Json lookup;
    if (!options.select.empty()) {
        Json projection = Json::object();
        for (const auto& column : options.select) {
            projection[db::document::fieldName(column)] = 1;
        }
        Json match = {{"$match",
                       {{"$expr",
                         {{"$eq", Json::array({"$" + options.foreignField, "$$localId"})}}}}}};
        Json project = {{"$project", projection}};
        lookup = {
            {"from", options.from},
            {"let", {{"localId", "$" + options.localField}}},
            {"pipeline", Json::array({match, project})},
            {"as", options.as},
        };
    } else {
        lookup = {
            {"from", options.from},
            {"localField", options.localField},
            {"foreignField", options.foreignField},
            {"as", options.as},
        };
    }
    pipeline.push_back({{"$lookup", lookup}});
    pipeline.push_back(
        {{"$unwind", {{"path", "$" + options.as}, {"preserveNullAndEmptyArrays", true}}}});

    if (!query.orders.empty()) {
        pipeline.push_back({{"$sort", db::document::compileSort(query.orders)}});
    }
    if (query.offset) {
        pipeline.push_back({{"$skip", *query.offset}});
    }
    if (query.limit) {
        pipeline.push_back({{"$limit", *query.limit}});
    }
    return OrmResult<Json>::ok(std::move(pipeline));
}

void registerMongoExtensions(MacroRegistry& registry) {
    registry.define("populate", [](QueryBuilder& builder, const Json& args) {
        auto options = PopulateOptions::fromJson(args);
        if (options.hasError()) {
            return OrmResult<QueryResult>::err(std::move(options).error());
        }
        auto pipeline = buildPopulatePipeline(builder.query(), options.value());
        if (pipeline.hasError()) {
            return OrmResult<QueryResult>::err(std::move(pipeline).error());
        }
        QUARRY_LOG_DEBUG(LogCategory::Query,
                         "populate " + options.value().field + " on " + builder.tableName());
        return builder.adapter().aggregatePipeline(builder.tableName(), pipeline.value());
    });

    registry.define("aggregate", [](QueryBuilder& builder, const Json& args) {
        const Json* stages = &args;
        if (args.is_object()) {
            auto it = args.find("pipeline");
            if (it == args.end()) {
                return extensionFail<QueryResult>(ErrorCode::InvalidArgument,
                                                  "aggregate requires a pipeline array",
                                                  "aggregate", &builder);
            }
            stages = &*it;
        }
        if (!stages->is_array()) {
            return extensionFail<QueryResult>(ErrorCode::InvalidArgument,
                                              "aggregate requires a pipeline array", "aggregate",
                                              &builder);
        }
        return builder.adapter().aggregatePipeline(builder.tableName(), *stages);
    });
}

// ---------------------------------------------------------------------------
// PostgreSQL
// ---------------------------------------------------------------------------

std::string buildSearchPredicate(const std::vector<std::string>& columns) {
    db::SqlGrammar grammar(db::SqlDialect::PostgreSQL);
    std::string document;
    for (const auto& column : columns) {
        if (!document.empty()) {
            document += " || ' ' || ";
        }
        document += "coalesce(" + grammar.wrap(column) + "::text, '')";
    }
    return "to_tsvector(?, " + document + ") @@ plainto_tsquery(?, ?)";
}

void registerPostgresExtensions(MacroRegistry& registry) {
    registry.define("search", [](QueryBuilder& builder, const Json& args) {
        if (builder.adapter().type() != db::BackendType::PostgreSQL) {
            return extensionFail<QueryResult>(ErrorCode::UnsupportedOperation,
                                              "full-text search requires PostgreSQL", "search",
                                              &builder);
        }
        auto text = stringOr(args, "query", {});
        auto columns = args.find("columns");
        if (text.empty() || columns == args.end() || !columns->is_array() ||
            columns->empty()) {
            return extensionFail<QueryResult>(ErrorCode::InvalidArgument,
                                              "search requires 'query' and 'columns'", "search",
                                              &builder);
        }

        std::vector<std::string> names;
        for (const auto& c : *columns) {
            if (c.is_string()) {
                names.push_back(c.get<std::string>());
            }
        }
        auto language = stringOr(args, "language", "english");
        return builder.clone()
            .whereRaw(buildSearchPredicate(names), {language, language, text})
            .get();
    });
}

void registerDefaultExtensions(MacroRegistry& registry, db::BackendType type) {
    registry.define("exec", [](QueryBuilder& builder, const Json&) { return builder.get(); });
    switch (type) {
        case db::BackendType::MongoDB:
            registerMongoExtensions(registry);
            break;
        case db::BackendType::PostgreSQL:
            registerPostgresExtensions(registry);
            break;
        default:
            break;
    }
}

} // namespace quarry::query
