/// @file database_adapter.cpp
/// @brief Default implementations for optional adapter capabilities.

#include "quarry/database/database_adapter.hpp"

namespace quarry::db {

OrmResult<QueryResult> DatabaseAdapter::aggregatePipeline(std::string_view collection,
                                                          const Json& /*pipeline*/) {
    return fail<QueryResult>(foundation::ErrorCode::UnsupportedOperation,
                             "aggregation pipelines are only available on document backends",
                             "aggregate", collection);
}

} // namespace quarry::db
