/// @file schema.cpp
/// @brief Schema implementation.

#include "quarry/schema/schema.hpp"

#include <optional>

#include "quarry/foundation/orm_logger.hpp"

namespace quarry::schema {

using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

OrmResult<void> schemaFail(std::string message, std::string_view operation,
                           std::string_view table, std::string_view backend) {
    foundation::ErrorDetail detail;
    detail.backend = std::string(backend);
    detail.operation = std::string(operation);
    detail.table = std::string(table);
    return foundation::failWith<void>(ErrorCode::SchemaError, std::move(message),
                                      std::move(detail));
}

} // namespace

OrmResult<void> Schema::create(std::string_view table,
                               const std::function<void(Blueprint&)>& build) {
    Blueprint blueprint{std::string(table), true};
    build(blueprint);

    const auto& def = blueprint.definition();
    if (!def.dropColumns.empty() || !def.renameColumns.empty() || !def.dropIndexes.empty()) {
        return schemaFail("drop and rename commands are only valid when altering a table",
                          "createTable", table, adapter_->name());
    }

    QUARRY_LOG_INFO(LogCategory::Schema, "create table " + std::string(table));
    return adapter_->createTable(def);
}

OrmResult<void> Schema::table(std::string_view table,
                              const std::function<void(Blueprint&)>& build) {
    Blueprint blueprint{std::string(table), false};
    build(blueprint);

    QUARRY_LOG_INFO(LogCategory::Schema, "alter table " + std::string(table));
    return adapter_->alterTable(blueprint.definition());
}

OrmResult<void> Schema::drop(std::string_view table) {
    QUARRY_LOG_INFO(LogCategory::Schema, "drop table " + std::string(table));
    return adapter_->dropTable(table, false);
}

OrmResult<void> Schema::dropIfExists(std::string_view table) {
    QUARRY_LOG_INFO(LogCategory::Schema, "drop table if exists " + std::string(table));
    return adapter_->dropTable(table, true);
}

OrmResult<void> Schema::dropAllTables() {
    auto tables = adapter_->listTables();
    if (tables.hasError()) {
        return OrmResult<void>::err(std::move(tables).error());
    }
    // Tables referenced by foreign keys only drop once their dependents
    // are gone, so repeat passes until nothing is left or nothing moves.
    auto pending = tables.value();
    while (!pending.empty()) {
        std::vector<std::string> blocked;
        std::optional<foundation::OrmError> lastError;
        for (const auto& name : pending) {
            auto dropped = adapter_->dropTable(name, true);
            if (dropped.hasError()) {
                blocked.push_back(name);
                lastError = std::move(dropped).error();
            }
        }
        if (blocked.size() == pending.size()) {
            return OrmResult<void>::err(std::move(*lastError));
        }
        pending = std::move(blocked);
    }
    QUARRY_LOG_INFO(LogCategory::Schema,
                    "dropped " + std::to_string(tables.value().size()) + " tables");
    return OrmResult<void>::ok();
}

OrmResult<bool> Schema::hasTable(std::string_view table) {
    return adapter_->hasTable(table);
}

OrmResult<bool> Schema::hasColumn(std::string_view table, std::string_view column) {
    return adapter_->hasColumn(table, column);
}

OrmResult<std::vector<std::string>> Schema::listTables() {
    return adapter_->listTables();
}

} // namespace quarry::schema
