/// @file adapter_factory.cpp
/// @brief Backend registration table.

#include "quarry/database/adapter_factory.hpp"

#include "quarry/database/memory_adapter.hpp"
#include "quarry/database/mongo_adapter.hpp"
#include "quarry/database/sql_adapter.hpp"

namespace quarry::db {

using foundation::ErrorCode;

namespace {

std::unique_ptr<DatabaseAdapter> makeMySql() {
    return std::make_unique<SqlAdapter>(BackendType::MySQL);
}

std::unique_ptr<DatabaseAdapter> makePostgres() {
    return std::make_unique<SqlAdapter>(BackendType::PostgreSQL);
}

std::unique_ptr<DatabaseAdapter> makeMongo() {
    return std::make_unique<MongoAdapter>();
}

std::unique_ptr<DatabaseAdapter> makeMemory() {
    return std::make_unique<MemoryAdapter>();
}

constexpr std::array<AdapterRegistration, 4> kAdapters{{
    {BackendType::MySQL, &makeMySql},
    {BackendType::PostgreSQL, &makePostgres},
    {BackendType::MongoDB, &makeMongo},
    {BackendType::Memory, &makeMemory},
}};

} // namespace

const std::array<AdapterRegistration, 4>& registeredAdapters() noexcept {
    return kAdapters;
}

OrmResult<std::unique_ptr<DatabaseAdapter>> createAdapter(BackendType type) {
    for (const auto& entry : kAdapters) {
        if (entry.type == type) {
            return OrmResult<std::unique_ptr<DatabaseAdapter>>::ok(entry.create());
        }
    }
    foundation::ErrorDetail detail;
    detail.operation = "createAdapter";
    return foundation::failWith<std::unique_ptr<DatabaseAdapter>>(
        ErrorCode::UnknownBackend, "no adapter registered for backend", std::move(detail));
}

OrmResult<std::unique_ptr<DatabaseAdapter>> createAdapter(std::string_view tag) {
    auto type = parseBackendType(tag);
    if (type.hasError()) {
        return OrmResult<std::unique_ptr<DatabaseAdapter>>::err(std::move(type).error());
    }
    return createAdapter(type.value());
}

} // namespace quarry::db
