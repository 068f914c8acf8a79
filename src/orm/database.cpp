/// @file database.cpp
/// @brief Database and TransactionGuard implementation.

#include "quarry/orm/database.hpp"

#include "quarry/database/adapter_factory.hpp"
#include "quarry/foundation/orm_logger.hpp"
#include "quarry/query/extensions.hpp"
#include "quarry/schema/schema.hpp"

namespace quarry::orm {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OrmError;

// ---------------------------------------------------------------------------
// TransactionGuard
// ---------------------------------------------------------------------------

TransactionGuard::TransactionGuard(db::DatabaseAdapter& adapter) noexcept
    : adapter_(&adapter) {}

TransactionGuard::~TransactionGuard() {
    release();
}

TransactionGuard::TransactionGuard(TransactionGuard&& other) noexcept
    : adapter_(other.adapter_), active_(other.active_) {
    other.adapter_ = nullptr;
    other.active_ = false;
}

TransactionGuard& TransactionGuard::operator=(TransactionGuard&& other) noexcept {
    if (this != &other) {
        release();
        adapter_ = other.adapter_;
        active_ = other.active_;
        other.adapter_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void TransactionGuard::release() noexcept {
    if (!isActive()) {
        return;
    }
    active_ = false;
    QUARRY_LOG_WARN(LogCategory::Connection, "transaction guard released without commit");
    auto result = adapter_->rollback();
    if (result.hasError()) {
        QUARRY_LOG_ERROR(LogCategory::Connection,
                         "auto-rollback failed: " + std::string(result.error().message()));
    }
}

OrmResult<void> TransactionGuard::commit() {
    if (!isActive()) {
        return OrmResult<void>::err(OrmError(ErrorCode::TransactionFailed,
                                             "transaction not active"));
    }
    active_ = false;
    return adapter_->commit();
}

OrmResult<void> TransactionGuard::rollback() {
    if (!isActive()) {
        return OrmResult<void>::err(OrmError(ErrorCode::TransactionFailed,
                                             "transaction not active"));
    }
    active_ = false;
    return adapter_->rollback();
}

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

Database::Database(std::unique_ptr<db::DatabaseAdapter> adapter)
    : adapter_(std::move(adapter)) {
    query::registerDefaultExtensions(macros_, adapter_->type());
}

Database::~Database() {
    close();
}

OrmResult<std::unique_ptr<Database>> Database::open(const db::DatabaseConfig& config) {
    auto adapter = db::createAdapter(config.type);
    if (adapter.hasError()) {
        return OrmResult<std::unique_ptr<Database>>::err(std::move(adapter).error());
    }
    auto connected = adapter.value()->connect(config);
    if (connected.hasError()) {
        return OrmResult<std::unique_ptr<Database>>::err(std::move(connected).error());
    }
    return OrmResult<std::unique_ptr<Database>>::ok(
        std::make_unique<Database>(std::move(adapter).value()));
}

OrmResult<std::unique_ptr<Database>> Database::open(const foundation::ConfigManager& config,
                                                    std::string_view prefix) {
    auto loaded = db::loadDatabaseConfig(config, prefix);
    if (loaded.hasError()) {
        return OrmResult<std::unique_ptr<Database>>::err(std::move(loaded).error());
    }
    return open(loaded.value());
}

query::QueryBuilder Database::table(std::string_view table) {
    return query::QueryBuilder(*adapter_, macros_, table);
}

schema::Schema Database::schema() {
    return schema::Schema(*adapter_);
}

OrmResult<TransactionGuard> Database::beginTransaction() {
    auto begun = adapter_->beginTransaction();
    if (begun.hasError()) {
        return OrmResult<TransactionGuard>::err(std::move(begun).error());
    }
    return OrmResult<TransactionGuard>::ok(TransactionGuard(*adapter_));
}

OrmResult<void> Database::transaction(const std::function<OrmResult<void>(Database&)>& fn) {
    auto txn = beginTransaction();
    if (txn.hasError()) {
        return OrmResult<void>::err(std::move(txn).error());
    }

    // An exception unwinds through the guard, which rolls back.
    auto result = fn(*this);
    if (result.hasError()) {
        auto rolledBack = txn.value().rollback();
        if (rolledBack.hasError()) {
            QUARRY_LOG_ERROR(LogCategory::Connection,
                             "rollback failed: " + std::string(rolledBack.error().message()));
        }
        return result;
    }
    return txn.value().commit();
}

OrmResult<db::QueryResult> Database::raw(std::string_view statement,
                                         const std::vector<db::DbValue>& params) {
    return adapter_->raw(statement, params);
}

void Database::close() {
    if (adapter_ && adapter_->isConnected()) {
        adapter_->disconnect();
        QUARRY_LOG_INFO(LogCategory::Connection,
                        "closed " + std::string(adapter_->name()) + " database");
    }
}

} // namespace quarry::orm
