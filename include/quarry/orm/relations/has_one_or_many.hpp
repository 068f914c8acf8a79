#pragma once

/// @file has_one_or_many.hpp
/// @brief HasOne and HasMany: the related table holds a foreign key to
///        the parent.

#include <string>
#include <utility>
#include <vector>

#include "quarry/orm/relations/relation.hpp"

namespace quarry::orm {

/// Shared implementation of HasOne and HasMany.
///
/// Related rows are those whose @c foreignKey equals the parent's
/// @c localKey. Defaults: foreignKey = "<singular parent table>_id",
/// localKey = the parent's primary key.
template <typename R>
class HasOneOrMany : public Relation<R> {
public:
    [[nodiscard]] const std::string& foreignKey() const noexcept { return foreignKey_; }
    [[nodiscard]] const std::string& localKey() const noexcept { return localKey_; }

    /// New, unsaved related model with @p attributes (fillable only) and
    /// the foreign key set to the parent.
    [[nodiscard]] R make(const Row& attributes = {}) const {
        R model = R::make(attributes);
        model.setAttribute(foreignKey_, this->parent().getAttribute(localKey_));
        return model;
    }

    [[nodiscard]] std::vector<R> makeMany(const std::vector<Row>& records) const {
        std::vector<R> models;
        models.reserve(records.size());
        for (const auto& attributes : records) {
            models.push_back(make(attributes));
        }
        return models;
    }

    /// Related model with primary key @p id; ModelNotFound when it does
    /// not exist or belongs to another parent.
    [[nodiscard]] OrmResult<R> findOrFail(const DbValue& id) const {
        const auto& meta = R::metadata();
        auto found = firstMatching({{meta.primaryKey, id}});
        if (found.hasError()) {
            return OrmResult<R>::err(std::move(found).error());
        }
        if (!found.value()) {
            foundation::ErrorDetail detail;
            detail.operation = "find";
            detail.table = meta.table;
            detail.column = meta.primaryKey;
            return foundation::failWith<R>(foundation::ErrorCode::ModelNotFound,
                                           "no related " + meta.table + " row with key " +
                                               db::toDisplayString(id),
                                           std::move(detail));
        }
        return OrmResult<R>::ok(std::move(*found.value()));
    }

    /// Primary keys of every related model.
    [[nodiscard]] OrmResult<std::vector<DbValue>> pluckIds() const {
        auto models = this->get();
        if (models.hasError()) {
            return OrmResult<std::vector<DbValue>>::err(std::move(models).error());
        }
        std::vector<DbValue> ids;
        ids.reserve(models.value().size());
        for (const auto& model : models.value()) {
            ids.push_back(model.getKey());
        }
        return OrmResult<std::vector<DbValue>>::ok(std::move(ids));
    }

    /// Point @p model at the parent and persist it.
    [[nodiscard]] OrmResult<void> save(R& model) const {
        model.setAttribute(foreignKey_, this->parent().getAttribute(localKey_));
        return model.save(this->database());
    }

    [[nodiscard]] OrmResult<void> saveMany(std::vector<R>& models) const {
        for (auto& model : models) {
            auto saved = save(model);
            if (saved.hasError()) {
                return saved;
            }
        }
        return OrmResult<void>::ok();
    }

    [[nodiscard]] OrmResult<R> create(const Row& attributes) const {
        R model = make(attributes);
        auto saved = model.save(this->database());
        if (saved.hasError()) {
            return OrmResult<R>::err(std::move(saved).error());
        }
        return OrmResult<R>::ok(std::move(model));
    }

    [[nodiscard]] OrmResult<std::vector<R>> createMany(const std::vector<Row>& records) const {
        std::vector<R> models;
        models.reserve(records.size());
        for (const auto& attributes : records) {
            auto created = create(attributes);
            if (created.hasError()) {
                return OrmResult<std::vector<R>>::err(std::move(created).error());
            }
            models.push_back(std::move(created).value());
        }
        return OrmResult<std::vector<R>>::ok(std::move(models));
    }

    /// First related model matching @p attributes, or an unsaved one built
    /// from @p attributes and @p values.
    [[nodiscard]] OrmResult<R> firstOrNew(const Row& attributes, const Row& values = {}) const {
        auto found = firstMatching(attributes);
        if (found.hasError()) {
            return OrmResult<R>::err(std::move(found).error());
        }
        if (found.value()) {
            return OrmResult<R>::ok(std::move(*found.value()));
        }
        return OrmResult<R>::ok(make(merged(attributes, values)));
    }

    [[nodiscard]] OrmResult<R> firstOrCreate(const Row& attributes, const Row& values = {}) const {
        auto model = firstOrNew(attributes, values);
        if (model.hasError() || model.value().exists()) {
            return model;
        }
        auto saved = model.value().save(this->database());
        if (saved.hasError()) {
            return OrmResult<R>::err(std::move(saved).error());
        }
        return model;
    }

    /// Update the first related model matching @p attributes with
    /// @p values, creating it when none matches.
    [[nodiscard]] OrmResult<R> updateOrCreate(const Row& attributes, const Row& values) const {
        auto model = firstOrNew(attributes, values);
        if (model.hasError()) {
            return model;
        }
        model.value().fill(values);
        auto saved = model.value().save(this->database());
        if (saved.hasError()) {
            return OrmResult<R>::err(std::move(saved).error());
        }
        return model;
    }

protected:
    HasOneOrMany(Database& db, ModelBase& parent, std::string foreignKey, std::string localKey)
        : Relation<R>(db, parent),
          foreignKey_(foreignKey.empty() ? foreignKeyFor(parent.meta().table)
                                         : std::move(foreignKey)),
          localKey_(localKey.empty() ? parent.meta().primaryKey : std::move(localKey)) {}

    [[nodiscard]] const std::string& parentKeyName() const noexcept override { return localKey_; }
    [[nodiscard]] const std::string& resultKeyName() const noexcept override {
        return foreignKey_;
    }

    void applyConstraints(query::QueryBuilder& q,
                          const std::vector<DbValue>& keys) const override {
        constrainToKeys(q, foreignKey_, keys);
    }

private:
    [[nodiscard]] OrmResult<std::optional<R>> firstMatching(const Row& attributes) const {
        auto q = this->query().clone();
        for (const auto& [column, value] : attributes) {
            q.where(column, value);
        }
        auto keys = collectKeys({&this->parent()}, localKey_);
        if (keys.empty()) {
            return OrmResult<std::optional<R>>::ok(std::nullopt);
        }
        q.limit(1);
        auto models = this->fetchResults(std::move(q), keys);
        if (models.hasError()) {
            return OrmResult<std::optional<R>>::err(std::move(models).error());
        }
        if (models.value().empty()) {
            return OrmResult<std::optional<R>>::ok(std::nullopt);
        }
        return OrmResult<std::optional<R>>::ok(std::move(models.value().front()));
    }

    static Row merged(Row base, const Row& extra) {
        for (const auto& [key, value] : extra) {
            base[key] = value;
        }
        return base;
    }

    std::string foreignKey_;
    std::string localKey_;
};

/// One related model (or none).
///
/// Example:
/// @code
///   auto profile = user.hasOne<Profile>(db).first();
/// @endcode
template <typename R>
class HasOne final : public HasOneOrMany<R> {
public:
    HasOne(Database& db, ModelBase& parent, std::string foreignKey = {}, std::string localKey = {})
        : HasOneOrMany<R>(db, parent, std::move(foreignKey), std::move(localKey)) {}

    [[nodiscard]] bool isSingular() const noexcept override { return true; }
};

/// Any number of related models.
///
/// Example:
/// @code
///   auto posts = user.hasMany<Post>(db).latest().limit(5).get();
/// @endcode
template <typename R>
class HasMany final : public HasOneOrMany<R> {
public:
    HasMany(Database& db, ModelBase& parent, std::string foreignKey = {},
            std::string localKey = {})
        : HasOneOrMany<R>(db, parent, std::move(foreignKey), std::move(localKey)) {}

    [[nodiscard]] bool isSingular() const noexcept override { return false; }
};

} // namespace quarry::orm
