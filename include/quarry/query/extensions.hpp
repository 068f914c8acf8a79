#pragma once

/// @file extensions.hpp
/// @brief Backend-specific verbs shipped as macros: MongoDB populate,
///        aggregate and exec, PostgreSQL full-text search.

#include <string>
#include <vector>

#include "quarry/database/database_config.hpp"
#include "quarry/database/query_types.hpp"
#include "quarry/query/macro_registry.hpp"

namespace quarry::query {

/// $lookup options for populate. Defaults follow the naming convention
/// field "author" -> collection "authors", local key "author_id",
/// foreign key "_id", output field "author".
struct PopulateOptions {
    std::string field;
    std::string from;
    std::string localField;
    std::string foreignField = "_id";
    std::string as;
    std::vector<std::string> select;

    /// Parse {"field": ..., "from": ..., "localField": ..., "foreignField": ...,
    /// "as": ..., "select": [...]}; missing names take the defaults.
    [[nodiscard]] static foundation::OrmResult<PopulateOptions> fromJson(const db::Json& args);
};

/// Aggregation pipeline for populate: $match on the builder predicates,
/// $lookup (pipeline form when a projection is requested), $unwind that
/// keeps unmatched documents, then $sort, $skip and $limit.
[[nodiscard]] foundation::OrmResult<db::Json> buildPopulatePipeline(
    const db::SelectQuery& query, const PopulateOptions& options);

/// Full-text search predicate for PostgreSQL over @p columns.
/// Produces whereRaw SQL with three bindings: language, language, text.
[[nodiscard]] std::string buildSearchPredicate(const std::vector<std::string>& columns);

void registerMongoExtensions(MacroRegistry& registry);
void registerPostgresExtensions(MacroRegistry& registry);

/// Install the verbs matching @p type ("exec" is installed for every backend).
void registerDefaultExtensions(MacroRegistry& registry, db::BackendType type);

} // namespace quarry::query
