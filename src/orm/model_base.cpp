/// @file model_base.cpp
/// @brief ModelBase implementation.

#include "quarry/orm/model_base.hpp"

#include <algorithm>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/orm/database.hpp"

namespace quarry::orm {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;

namespace {

template <typename T>
OrmResult<T> modelFail(ErrorCode code, std::string message, const ModelMeta& meta,
                       std::string_view operation, std::string_view column = {}) {
    ErrorDetail detail;
    detail.operation = std::string(operation);
    detail.table = meta.table;
    detail.column = std::string(column);
    return foundation::failWith<T>(code, std::move(message), std::move(detail));
}

bool contains(const std::vector<std::string>& list, std::string_view key) {
    return std::find(list.begin(), list.end(), key) != list.end();
}

} // namespace

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

DbValue ModelBase::getAttribute(std::string_view key) const {
    auto it = attributes_.find(std::string(key));
    return it != attributes_.end() ? it->second : DbValue(db::DbNull{});
}

void ModelBase::setAttribute(std::string key, DbValue value) {
    const auto& casts = meta().casts;
    if (auto cast = casts.find(key); cast != casts.end()) {
        auto converted = castAttribute(cast->second, value);
        if (converted.hasValue()) {
            value = std::move(converted).value();
        }
    }
    attributes_[std::move(key)] = std::move(value);
}

bool ModelBase::hasAttribute(std::string_view key) const {
    return attributes_.count(std::string(key)) > 0;
}

bool ModelBase::isFillable(std::string_view key) const {
    return contains(meta().fillable, key);
}

void ModelBase::fillAttributes(const Row& values) {
    for (const auto& [key, value] : values) {
        if (isFillable(key)) {
            setAttribute(key, value);
        }
    }
}

// ---------------------------------------------------------------------------
// Dirty tracking
// ---------------------------------------------------------------------------

bool ModelBase::isDirty(std::string_view key) const {
    auto dirty = getDirty();
    return dirty.count(std::string(key)) > 0;
}

Row ModelBase::getDirty() const {
    Row dirty;
    for (const auto& [key, value] : attributes_) {
        auto it = original_.find(key);
        if (it == original_.end() || !db::looselyEqual(it->second, value)) {
            dirty.emplace(key, value);
        }
    }
    return dirty;
}

// ---------------------------------------------------------------------------
// Pivot and relations
// ---------------------------------------------------------------------------

void ModelBase::extractPivot(std::string_view prefix) {
    for (auto it = attributes_.begin(); it != attributes_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            pivot_[it->first.substr(prefix.size())] = std::move(it->second);
            original_.erase(it->first);
            it = attributes_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ModelBase::relationLoaded(std::string_view name) const {
    return relations_.find(name) != relations_.end();
}

const RelationValue* ModelBase::relation(std::string_view name) const {
    auto it = relations_.find(name);
    return it != relations_.end() ? &it->second : nullptr;
}

void ModelBase::setRelation(std::string name, RelationValue value) {
    relations_[std::move(name)] = std::move(value);
}

void ModelBase::unsetRelation(std::string_view name) {
    if (auto it = relations_.find(name); it != relations_.end()) {
        relations_.erase(it);
    }
}

std::vector<std::string> ModelBase::loadedRelations() const {
    std::vector<std::string> names;
    for (const auto& [name, value] : relations_) {
        names.push_back(name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

Json ModelBase::toJson() const {
    const auto& hidden = meta().hidden;
    Json out = Json::object();
    for (const auto& [key, value] : attributes_) {
        if (!contains(hidden, key)) {
            out[key] = db::toJson(value);
        }
    }
    if (!pivot_.empty()) {
        Json pivot = Json::object();
        for (const auto& [key, value] : pivot_) {
            pivot[key] = db::toJson(value);
        }
        out["pivot"] = std::move(pivot);
    }
    for (const auto& [name, value] : relations_) {
        if (value.many) {
            Json list = Json::array();
            for (const auto& model : value.models) {
                list.push_back(model->toJson());
            }
            out[name] = std::move(list);
        } else {
            out[name] = value.models.empty() ? Json(nullptr) : value.models.front()->toJson();
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

OrmResult<Row> ModelBase::encodeForWrite(const Row& values) const {
    const auto& casts = meta().casts;
    Row out;
    for (const auto& [key, value] : values) {
        auto cast = casts.find(key);
        if (cast == casts.end()) {
            out.emplace(key, value);
            continue;
        }
        auto converted = castAttribute(cast->second, value);
        if (converted.hasError()) {
            return modelFail<Row>(ErrorCode::CastFailed,
                                  std::string(converted.error().message()), meta(), "cast",
                                  key);
        }
        out.emplace(key, std::move(converted).value());
    }
    return OrmResult<Row>::ok(std::move(out));
}

OrmResult<void> ModelBase::assignFromRow(const Row& row) {
    const auto& casts = meta().casts;
    Row decoded;
    for (const auto& [key, value] : row) {
        auto cast = casts.find(key);
        if (cast == casts.end()) {
            decoded.emplace(key, value);
            continue;
        }
        auto converted = castAttribute(cast->second, value);
        if (converted.hasError()) {
            return modelFail<void>(ErrorCode::CastFailed,
                                   std::string(converted.error().message()), meta(), "hydrate",
                                   key);
        }
        decoded.emplace(key, std::move(converted).value());
    }
    attributes_ = std::move(decoded);
    original_ = attributes_;
    return OrmResult<void>::ok();
}

OrmResult<void> ModelBase::performSave(Database& db) {
    const auto& m = meta();
    auto now = db::currentTimestamp();

    if (!exists()) {
        if (m.timestamps) {
            if (db::isNull(getAttribute(m.createdAtColumn))) {
                setAttribute(m.createdAtColumn, now);
            }
            if (db::isNull(getAttribute(m.updatedAtColumn))) {
                setAttribute(m.updatedAtColumn, now);
            }
        }
        auto values = encodeForWrite(attributes_);
        if (values.hasError()) {
            return OrmResult<void>::err(std::move(values).error());
        }
        values.value().erase(m.primaryKey);

        auto inserted = db.table(m.table).insert(std::move(values).value(), m.primaryKey);
        if (inserted.hasError()) {
            return OrmResult<void>::err(std::move(inserted).error());
        }
        auto assigned = assignFromRow(inserted.value());
        if (assigned.hasError()) {
            return assigned;
        }
        QUARRY_LOG_DEBUG(LogCategory::Model,
                         "inserted " + m.table + "#" + db::toDisplayString(getKey()));
        return OrmResult<void>::ok();
    }

    auto dirty = getDirty();
    if (dirty.empty()) {
        return OrmResult<void>::ok();
    }
    if (m.timestamps && dirty.count(m.updatedAtColumn) == 0) {
        setAttribute(m.updatedAtColumn, now);
        dirty[m.updatedAtColumn] = getAttribute(m.updatedAtColumn);
    }
    auto values = encodeForWrite(dirty);
    if (values.hasError()) {
        return OrmResult<void>::err(std::move(values).error());
    }

    // Match on the key as loaded so a changed key still finds its row.
    auto key = getKey();
    if (auto it = original_.find(m.primaryKey); it != original_.end() && !db::isNull(it->second)) {
        key = it->second;
    }
    auto updated = db.table(m.table).where(m.primaryKey, key).update(std::move(values).value());
    if (updated.hasError()) {
        return OrmResult<void>::err(std::move(updated).error());
    }
    syncOriginal();
    QUARRY_LOG_DEBUG(LogCategory::Model, "updated " + m.table + "#" + db::toDisplayString(key));
    return OrmResult<void>::ok();
}

OrmResult<void> ModelBase::performDelete(Database& db) {
    const auto& m = meta();
    if (!exists()) {
        return modelFail<void>(ErrorCode::InvalidArgument, "model has no primary key value", m,
                               "delete", m.primaryKey);
    }
    auto removed = db.table(m.table).where(m.primaryKey, getKey()).remove();
    if (removed.hasError()) {
        return OrmResult<void>::err(std::move(removed).error());
    }
    if (removed.value() == 0) {
        return modelFail<void>(ErrorCode::ModelNotFound,
                               "no " + m.table + " row with key " +
                                   db::toDisplayString(getKey()),
                               m, "delete", m.primaryKey);
    }
    QUARRY_LOG_DEBUG(LogCategory::Model, "deleted " + m.table + "#" + db::toDisplayString(getKey()));
    return OrmResult<void>::ok();
}

OrmResult<void> ModelBase::performRefresh(Database& db) {
    const auto& m = meta();
    if (!exists()) {
        return modelFail<void>(ErrorCode::InvalidArgument, "model has no primary key value", m,
                               "refresh", m.primaryKey);
    }
    auto row = db.table(m.table).find(getKey(), m.primaryKey);
    if (row.hasError()) {
        return OrmResult<void>::err(std::move(row).error());
    }
    if (!row.value()) {
        return modelFail<void>(ErrorCode::ModelNotFound,
                               "no " + m.table + " row with key " +
                                   db::toDisplayString(getKey()),
                               m, "refresh", m.primaryKey);
    }
    clearRelations();
    return assignFromRow(*row.value());
}

} // namespace quarry::orm
