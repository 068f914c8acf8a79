#pragma once

/// @file relation.hpp
/// @brief Common machinery for model relations: key collection, result
///        matching and the typed Relation<R> base.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quarry/orm/database.hpp"
#include "quarry/orm/model_base.hpp"
#include "quarry/query/query_builder.hpp"

namespace quarry::orm {

// ── Naming helpers ──────────────────────────────────────────────────────────

/// "users" -> "user", "categories" -> "category", "statuses" -> "status".
[[nodiscard]] std::string singularize(std::string_view table);

/// Conventional foreign key referencing @p table ("users" -> "user_id").
[[nodiscard]] std::string foreignKeyFor(std::string_view table);

/// Conventional pivot table joining two tables: both singulars in
/// alphabetical order joined by '_' ("users", "roles" -> "role_user").
[[nodiscard]] std::string pivotTableFor(std::string_view first, std::string_view second);

// ── Matching ────────────────────────────────────────────────────────────────

/// Where a result model keeps the key it is matched on.
enum class KeySource : std::uint8_t { Attributes, Pivot };

/// Distinct non-null values of @p key across @p models, in first-seen order.
[[nodiscard]] std::vector<DbValue> collectKeys(const std::vector<ModelBase*>& models,
                                               std::string_view key);

/// Restrict @p query to rows whose @p column is one of @p keys.
void constrainToKeys(query::QueryBuilder& query, const std::string& column,
                     const std::vector<DbValue>& keys);

/// Attach @p results to @p parents under @p name.
///
/// Results are bucketed by the normalized value of @p resultKey; each
/// parent receives the bucket for its normalized @p parentKey. Parents
/// without a bucket (or with a null key) receive the default: an empty
/// list, or no model for singular relations.
void matchByKey(const std::vector<ModelBase*>& parents, std::string_view parentKey,
                const std::vector<std::shared_ptr<const ModelBase>>& results,
                std::string_view resultKey, KeySource source, bool singular,
                const std::string& name);

// ── RelationBase ────────────────────────────────────────────────────────────

/// Type-erased relation, used by eager loading and the relation registry.
class RelationBase {
public:
    virtual ~RelationBase() = default;

    [[nodiscard]] virtual bool isSingular() const noexcept = 0;

    /// Run the relation for its own parent.
    [[nodiscard]] virtual OrmResult<RelationValue> loadLazy() = 0;

    /// Run one query covering every model in @p parents and store the
    /// matched results on each of them under @p name.
    [[nodiscard]] virtual OrmResult<void> loadEager(const std::vector<ModelBase*>& parents,
                                                    const std::string& name) = 0;
};

// ── Relation<R> ─────────────────────────────────────────────────────────────

/// Relation whose far side is model type @p R.
///
/// Clauses added through query() or the forwarding helpers are kept apart
/// from the relation's own key constraints, which are applied on each
/// terminal call. The same relation can therefore run lazily for its
/// parent and eagerly for a batch of parents.
template <typename R>
class Relation : public RelationBase {
public:
    using Related = R;

    [[nodiscard]] query::QueryBuilder& query() noexcept { return query_; }
    [[nodiscard]] const query::QueryBuilder& query() const noexcept { return query_; }

    Relation& where(std::string column, DbValue value) {
        query_.where(std::move(column), std::move(value));
        return *this;
    }

    Relation& where(std::string column, std::string_view op, DbValue value) {
        query_.where(std::move(column), op, std::move(value));
        return *this;
    }

    Relation& orderBy(std::string column, std::string_view direction = "asc") {
        query_.orderBy(std::move(column), direction);
        return *this;
    }

    Relation& latest(std::string column = "created_at") {
        query_.latest(std::move(column));
        return *this;
    }

    Relation& oldest(std::string column = "created_at") {
        query_.oldest(std::move(column));
        return *this;
    }

    Relation& limit(std::uint64_t count) {
        query_.limit(count);
        return *this;
    }

    /// Related models of the parent. A parent without a key value yields
    /// an empty list without querying.
    [[nodiscard]] OrmResult<std::vector<R>> get() const {
        auto keys = collectKeys({parent_}, parentKeyName());
        if (keys.empty()) {
            return OrmResult<std::vector<R>>::ok({});
        }
        return fetchResults(query_.clone(), keys);
    }

    [[nodiscard]] OrmResult<std::optional<R>> first() const {
        auto keys = collectKeys({parent_}, parentKeyName());
        if (keys.empty()) {
            return OrmResult<std::optional<R>>::ok(std::nullopt);
        }
        auto q = query_.clone();
        q.limit(1);
        auto models = fetchResults(std::move(q), keys);
        if (models.hasError()) {
            return OrmResult<std::optional<R>>::err(std::move(models).error());
        }
        if (models.value().empty()) {
            return OrmResult<std::optional<R>>::ok(std::nullopt);
        }
        return OrmResult<std::optional<R>>::ok(std::move(models.value().front()));
    }

    [[nodiscard]] OrmResult<std::uint64_t> count() const {
        auto keys = collectKeys({parent_}, parentKeyName());
        if (keys.empty()) {
            return OrmResult<std::uint64_t>::ok(0);
        }
        return countResults(query_.clone(), keys);
    }

    [[nodiscard]] OrmResult<query::Page<R>> paginate(std::uint64_t page = 1,
                                                     std::uint64_t perPage = 15) const {
        if (page == 0) {
            page = 1;
        }
        auto total = count();
        if (total.hasError()) {
            return OrmResult<query::Page<R>>::err(std::move(total).error());
        }
        auto keys = collectKeys({parent_}, parentKeyName());
        std::vector<R> data;
        if (!keys.empty()) {
            auto q = query_.clone();
            q.forPage(page, perPage);
            auto models = fetchResults(std::move(q), keys);
            if (models.hasError()) {
                return OrmResult<query::Page<R>>::err(std::move(models).error());
            }
            data = std::move(models).value();
        }
        return OrmResult<query::Page<R>>::ok(
            query::makePage(std::move(data), total.value(), perPage, page));
    }

    [[nodiscard]] OrmResult<RelationValue> loadLazy() override {
        auto models = get();
        if (models.hasError()) {
            return OrmResult<RelationValue>::err(std::move(models).error());
        }
        RelationValue value;
        value.many = !isSingular();
        for (auto& model : models.value()) {
            value.models.push_back(std::make_shared<const R>(std::move(model)));
            if (!value.many) {
                break;
            }
        }
        return OrmResult<RelationValue>::ok(std::move(value));
    }

    [[nodiscard]] OrmResult<void> loadEager(const std::vector<ModelBase*>& parents,
                                            const std::string& name) override {
        std::vector<std::shared_ptr<const ModelBase>> results;
        auto keys = collectKeys(parents, parentKeyName());
        if (!keys.empty()) {
            auto models = fetchResults(query_.clone(), keys);
            if (models.hasError()) {
                return OrmResult<void>::err(std::move(models).error());
            }
            results.reserve(models.value().size());
            for (auto& model : models.value()) {
                results.push_back(std::make_shared<const R>(std::move(model)));
            }
        }
        matchByKey(parents, parentKeyName(), results, resultKeyName(), resultKeySource(),
                   isSingular(), name);
        return OrmResult<void>::ok();
    }

protected:
    Relation(Database& db, ModelBase& parent)
        : db_(&db), parent_(&parent), query_(db.table(R::metadata().table)) {}

    /// Attribute of the parent whose values select related rows.
    [[nodiscard]] virtual const std::string& parentKeyName() const noexcept = 0;

    /// Attribute (or pivot entry) of a related model matched against
    /// parentKeyName().
    [[nodiscard]] virtual const std::string& resultKeyName() const noexcept = 0;

    [[nodiscard]] virtual KeySource resultKeySource() const noexcept {
        return KeySource::Attributes;
    }

    /// Add the relation's key constraints for parent keys @p keys.
    virtual void applyConstraints(query::QueryBuilder& q,
                                  const std::vector<DbValue>& keys) const = 0;

    /// Hook run on every hydrated related model.
    virtual void prepareModel(R& /*model*/) const {}

    [[nodiscard]] virtual OrmResult<std::vector<R>> fetchResults(
        query::QueryBuilder q, const std::vector<DbValue>& keys) const {
        applyConstraints(q, keys);
        return hydrateRows(q);
    }

    [[nodiscard]] virtual OrmResult<std::uint64_t> countResults(
        query::QueryBuilder q, const std::vector<DbValue>& keys) const {
        applyConstraints(q, keys);
        return q.count();
    }

    /// Run @p q and hydrate each row as an @p R.
    [[nodiscard]] OrmResult<std::vector<R>> hydrateRows(const query::QueryBuilder& q) const {
        auto rows = q.get();
        if (rows.hasError()) {
            return OrmResult<std::vector<R>>::err(std::move(rows).error());
        }
        std::vector<R> models;
        models.reserve(rows.value().size());
        for (const auto& row : rows.value()) {
            auto model = R::hydrate(row);
            if (model.hasError()) {
                return OrmResult<std::vector<R>>::err(std::move(model).error());
            }
            prepareModel(model.value());
            models.push_back(std::move(model).value());
        }
        return OrmResult<std::vector<R>>::ok(std::move(models));
    }

    [[nodiscard]] Database& database() const noexcept { return *db_; }
    [[nodiscard]] ModelBase& parent() const noexcept { return *parent_; }

private:
    Database* db_;
    ModelBase* parent_;
    query::QueryBuilder query_;
};

} // namespace quarry::orm
