#pragma once

/// @file model.hpp
/// @brief Model<Derived> (active-record base) and ModelQuery<M> (typed
///        query builder that hydrates models and eager-loads relations).

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quarry/orm/database.hpp"
#include "quarry/orm/model_base.hpp"
#include "quarry/orm/relations/relation_registry.hpp"

namespace quarry::orm {

template <typename M>
class ModelQuery;

namespace detail {

template <typename T>
OrmResult<T> modelError(foundation::ErrorCode code, std::string message, const ModelMeta& meta,
                        std::string_view operation, std::string_view column) {
    foundation::ErrorDetail info;
    info.operation = std::string(operation);
    info.table = meta.table;
    info.column = std::string(column);
    return foundation::failWith<T>(code, std::move(message), std::move(info));
}

/// Bind relation @p name of model type @p M to @p model.
template <typename M>
OrmResult<std::unique_ptr<RelationBase>> bindRelation(Database& db, ModelBase& model,
                                                      std::string_view name) {
    const auto* factory = M::relationRegistry().find(name);
    if (factory == nullptr) {
        return modelError<std::unique_ptr<RelationBase>>(
            foundation::ErrorCode::RelationNotDefined,
            "relation '" + std::string(name) + "' is not defined on " + M::metadata().table,
            M::metadata(), "relation", name);
    }
    return OrmResult<std::unique_ptr<RelationBase>>::ok((*factory)(db, model));
}

/// Load each relation in @p names for all of @p models, one query per
/// relation.
template <typename M>
OrmResult<void> eagerLoad(Database& db, std::vector<M>& models,
                          const std::vector<std::string>& names) {
    if (models.empty()) {
        return OrmResult<void>::ok();
    }
    std::vector<ModelBase*> parents;
    parents.reserve(models.size());
    for (auto& model : models) {
        parents.push_back(&model);
    }
    for (const auto& name : names) {
        auto relation = bindRelation<M>(db, models.front(), name);
        if (relation.hasError()) {
            return OrmResult<void>::err(std::move(relation).error());
        }
        auto loaded = relation.value()->loadEager(parents, name);
        if (loaded.hasError()) {
            return loaded;
        }
    }
    return OrmResult<void>::ok();
}

} // namespace detail

// ── Model ───────────────────────────────────────────────────────────────────

/// Active-record base class.
///
/// A model type supplies its metadata through a static describe() and,
/// optionally, its named relations through a static relations() hook.
/// Every operation that touches storage takes the Database explicitly.
///
/// Example:
/// @code
///   class User : public Model<User> {
///   public:
///       static ModelMeta describe() {
///           ModelMeta m;
///           m.table = "users";
///           m.fillable = {"name", "email"};
///           m.hidden = {"password"};
///           m.casts = {{"is_admin", CastType::Boolean}};
///           return m;
///       }
///       static void relations(RelationRegistry& r) { r.hasMany<Post>("posts"); }
///   };
///
///   auto user = User::create(db, {{"name", "Ada"}, {"email", "ada@example.com"}});
///   auto posts = user.value().getMany<Post>(db, "posts");
/// @endcode
template <typename Derived>
class Model : public ModelBase {
public:
    Model() = default;

    // ── Type-level metadata ─────────────────────────────────────────────

    [[nodiscard]] static const ModelMeta& metadata() {
        static const ModelMeta meta = Derived::describe();
        return meta;
    }

    [[nodiscard]] const ModelMeta& meta() const override { return metadata(); }

    [[nodiscard]] static const RelationRegistry& relationRegistry() {
        static const RelationRegistry registry = [] {
            RelationRegistry r;
            Derived::relations(r);
            return r;
        }();
        return registry;
    }

    /// Default: no named relations.
    static void relations(RelationRegistry& /*registry*/) {}

    // ── Static surface ──────────────────────────────────────────────────

    /// Model built from a stored row (casts applied, not dirty).
    [[nodiscard]] static OrmResult<Derived> hydrate(const Row& row) {
        Derived model;
        auto assigned = model.assignFromRow(row);
        if (assigned.hasError()) {
            return OrmResult<Derived>::err(std::move(assigned).error());
        }
        return OrmResult<Derived>::ok(std::move(model));
    }

    /// Unsaved model filled with the fillable keys of @p attributes.
    [[nodiscard]] static Derived make(const Row& attributes = {}) {
        Derived model;
        model.fillAttributes(attributes);
        return model;
    }

    [[nodiscard]] static ModelQuery<Derived> query(Database& db) { return ModelQuery<Derived>(db); }

    [[nodiscard]] static OrmResult<std::vector<Derived>> all(Database& db) {
        return query(db).get();
    }

    [[nodiscard]] static OrmResult<std::optional<Derived>> find(Database& db, const DbValue& id) {
        return query(db).find(id);
    }

    [[nodiscard]] static OrmResult<Derived> findOrFail(Database& db, const DbValue& id) {
        return query(db).findOrFail(id);
    }

    /// Fill, persist and return a new model.
    [[nodiscard]] static OrmResult<Derived> create(Database& db, const Row& attributes) {
        Derived model = make(attributes);
        auto saved = model.save(db);
        if (saved.hasError()) {
            return OrmResult<Derived>::err(std::move(saved).error());
        }
        return OrmResult<Derived>::ok(std::move(model));
    }

    /// Delete the rows with the given keys. Returns the number removed.
    [[nodiscard]] static OrmResult<std::uint64_t> destroy(Database& db,
                                                          const std::vector<DbValue>& ids) {
        if (ids.empty()) {
            return OrmResult<std::uint64_t>::ok(0);
        }
        return db.table(metadata().table).whereIn(metadata().primaryKey, ids).remove();
    }

    // ── Instance surface ────────────────────────────────────────────────

    Derived& fill(const Row& values) {
        fillAttributes(values);
        return self();
    }

    Derived& set(std::string key, DbValue value) {
        setAttribute(std::move(key), std::move(value));
        return self();
    }

    [[nodiscard]] OrmResult<void> save(Database& db) { return performSave(db); }

    /// fill() then save().
    [[nodiscard]] OrmResult<void> update(Database& db, const Row& values) {
        fill(values);
        return save(db);
    }

    [[nodiscard]] OrmResult<void> remove(Database& db) { return performDelete(db); }

    /// Reload attributes from storage and drop cached relations.
    [[nodiscard]] OrmResult<void> refresh(Database& db) { return performRefresh(db); }

    // ── Named relations ─────────────────────────────────────────────────

    /// Bind the declared relation @p name to this model.
    [[nodiscard]] OrmResult<std::unique_ptr<RelationBase>> relationNamed(Database& db,
                                                                         std::string_view name) {
        return detail::bindRelation<Derived>(db, *this, name);
    }

    /// Load (or reload) the named relations into the cache.
    [[nodiscard]] OrmResult<void> load(Database& db, const std::vector<std::string>& names) {
        for (const auto& name : names) {
            auto loaded = resolve(db, name, true);
            if (loaded.hasError()) {
                return loaded;
            }
        }
        return OrmResult<void>::ok();
    }

    /// Models of a plural relation, loaded on first access and cached.
    template <typename R>
    [[nodiscard]] OrmResult<std::vector<std::shared_ptr<const R>>> getMany(Database& db,
                                                                           std::string_view name) {
        using Models = std::vector<std::shared_ptr<const R>>;
        auto loaded = resolve(db, name, false);
        if (loaded.hasError()) {
            return OrmResult<Models>::err(std::move(loaded).error());
        }
        Models out;
        for (const auto& model : relation(name)->models) {
            auto typed = std::dynamic_pointer_cast<const R>(model);
            if (!typed) {
                return detail::modelError<Models>(
                    foundation::ErrorCode::InvalidArgument,
                    "relation '" + std::string(name) + "' does not hold " + R::metadata().table,
                    metadata(), "relation", name);
            }
            out.push_back(std::move(typed));
        }
        return OrmResult<Models>::ok(std::move(out));
    }

    /// Model of a singular relation (nullptr when there is none), loaded
    /// on first access and cached.
    template <typename R>
    [[nodiscard]] OrmResult<std::shared_ptr<const R>> getOne(Database& db, std::string_view name) {
        using One = std::shared_ptr<const R>;
        auto many = getMany<R>(db, name);
        if (many.hasError()) {
            return OrmResult<One>::err(std::move(many).error());
        }
        if (many.value().empty()) {
            return OrmResult<One>::ok(nullptr);
        }
        return OrmResult<One>::ok(many.value().front());
    }

    // ── Relation declarations ───────────────────────────────────────────

    template <typename R>
    [[nodiscard]] HasOne<R> hasOne(Database& db, std::string foreignKey = {},
                                   std::string localKey = {}) {
        return HasOne<R>(db, *this, std::move(foreignKey), std::move(localKey));
    }

    template <typename R>
    [[nodiscard]] HasMany<R> hasMany(Database& db, std::string foreignKey = {},
                                     std::string localKey = {}) {
        return HasMany<R>(db, *this, std::move(foreignKey), std::move(localKey));
    }

    template <typename R>
    [[nodiscard]] BelongsTo<R> belongsTo(Database& db, std::string foreignKey = {},
                                         std::string ownerKey = {},
                                         std::string relationName = {}) {
        return BelongsTo<R>(db, *this, std::move(foreignKey), std::move(ownerKey),
                            std::move(relationName));
    }

    template <typename R>
    [[nodiscard]] BelongsToMany<R> belongsToMany(Database& db, std::string pivotTable = {},
                                                 std::string foreignPivotKey = {},
                                                 std::string relatedPivotKey = {}) {
        return BelongsToMany<R>(db, *this, std::move(pivotTable), std::move(foreignPivotKey),
                                std::move(relatedPivotKey));
    }

private:
    Derived& self() { return static_cast<Derived&>(*this); }

    OrmResult<void> resolve(Database& db, std::string_view name, bool reload) {
        if (!reload && relationLoaded(name)) {
            return OrmResult<void>::ok();
        }
        auto bound = relationNamed(db, name);
        if (bound.hasError()) {
            return OrmResult<void>::err(std::move(bound).error());
        }
        auto value = bound.value()->loadLazy();
        if (value.hasError()) {
            return OrmResult<void>::err(std::move(value).error());
        }
        setRelation(std::string(name), std::move(value).value());
        return OrmResult<void>::ok();
    }
};

// ── ModelQuery ──────────────────────────────────────────────────────────────

/// QueryBuilder scoped to the table of model type @p M.
///
/// Terminals return hydrated models and load every relation queued with
/// with(); each such relation costs exactly one additional query.
template <typename M>
class ModelQuery {
public:
    explicit ModelQuery(Database& db) : db_(&db), builder_(db.table(M::metadata().table)) {}

    // ── Clauses ─────────────────────────────────────────────────────────

    ModelQuery& select(std::vector<std::string> columns) {
        builder_.select(std::move(columns));
        return *this;
    }

    ModelQuery& where(std::string column, DbValue value) {
        builder_.where(std::move(column), std::move(value));
        return *this;
    }

    ModelQuery& where(std::string column, std::string_view op, DbValue value) {
        builder_.where(std::move(column), op, std::move(value));
        return *this;
    }

    ModelQuery& orWhere(std::string column, DbValue value) {
        builder_.orWhere(std::move(column), std::move(value));
        return *this;
    }

    ModelQuery& orWhere(std::string column, std::string_view op, DbValue value) {
        builder_.orWhere(std::move(column), op, std::move(value));
        return *this;
    }

    ModelQuery& whereIn(std::string column, std::vector<DbValue> values) {
        builder_.whereIn(std::move(column), std::move(values));
        return *this;
    }

    ModelQuery& whereNotIn(std::string column, std::vector<DbValue> values) {
        builder_.whereNotIn(std::move(column), std::move(values));
        return *this;
    }

    ModelQuery& whereNull(std::string column) {
        builder_.whereNull(std::move(column));
        return *this;
    }

    ModelQuery& whereNotNull(std::string column) {
        builder_.whereNotNull(std::move(column));
        return *this;
    }

    ModelQuery& whereBetween(std::string column, DbValue low, DbValue high) {
        builder_.whereBetween(std::move(column), std::move(low), std::move(high));
        return *this;
    }

    ModelQuery& whereRaw(std::string sql, std::vector<DbValue> bindings = {}) {
        builder_.whereRaw(std::move(sql), std::move(bindings));
        return *this;
    }

    ModelQuery& whereGroup(const std::function<void(query::QueryBuilder&)>& fn) {
        builder_.whereGroup(fn);
        return *this;
    }

    ModelQuery& orWhereGroup(const std::function<void(query::QueryBuilder&)>& fn) {
        builder_.orWhereGroup(fn);
        return *this;
    }

    ModelQuery& when(bool condition, const std::function<void(ModelQuery&)>& fn) {
        if (condition) {
            fn(*this);
        }
        return *this;
    }

    ModelQuery& orderBy(std::string column, std::string_view direction = "asc") {
        builder_.orderBy(std::move(column), direction);
        return *this;
    }

    ModelQuery& orderByDesc(std::string column) {
        builder_.orderByDesc(std::move(column));
        return *this;
    }

    ModelQuery& latest() {
        builder_.latest(M::metadata().createdAtColumn);
        return *this;
    }

    ModelQuery& latest(std::string column) {
        builder_.latest(std::move(column));
        return *this;
    }

    ModelQuery& oldest() {
        builder_.oldest(M::metadata().createdAtColumn);
        return *this;
    }

    ModelQuery& oldest(std::string column) {
        builder_.oldest(std::move(column));
        return *this;
    }

    ModelQuery& limit(std::uint64_t count) {
        builder_.limit(count);
        return *this;
    }

    ModelQuery& offset(std::uint64_t count) {
        builder_.offset(count);
        return *this;
    }

    ModelQuery& take(std::uint64_t count) { return limit(count); }
    ModelQuery& skip(std::uint64_t count) { return offset(count); }

    ModelQuery& forPage(std::uint64_t page, std::uint64_t perPage = 15) {
        builder_.forPage(page, perPage);
        return *this;
    }

    /// Queue a declared relation for eager loading.
    ModelQuery& with(std::string relation) {
        builder_.with(std::move(relation));
        return *this;
    }

    ModelQuery& with(const std::vector<std::string>& relations) {
        builder_.with(relations);
        return *this;
    }

    // ── Terminals ───────────────────────────────────────────────────────

    [[nodiscard]] OrmResult<std::vector<M>> get() const {
        auto rows = builder_.get();
        if (rows.hasError()) {
            return OrmResult<std::vector<M>>::err(std::move(rows).error());
        }
        std::vector<M> models;
        models.reserve(rows.value().size());
        for (const auto& row : rows.value()) {
            auto model = M::hydrate(row);
            if (model.hasError()) {
                return OrmResult<std::vector<M>>::err(std::move(model).error());
            }
            models.push_back(std::move(model).value());
        }
        auto loaded = detail::eagerLoad(*db_, models, builder_.eagerLoads());
        if (loaded.hasError()) {
            return OrmResult<std::vector<M>>::err(std::move(loaded).error());
        }
        return OrmResult<std::vector<M>>::ok(std::move(models));
    }

    [[nodiscard]] OrmResult<std::optional<M>> first() const {
        auto copy = clone();
        copy.limit(1);
        auto models = copy.get();
        if (models.hasError()) {
            return OrmResult<std::optional<M>>::err(std::move(models).error());
        }
        if (models.value().empty()) {
            return OrmResult<std::optional<M>>::ok(std::nullopt);
        }
        return OrmResult<std::optional<M>>::ok(std::move(models.value().front()));
    }

    [[nodiscard]] OrmResult<M> firstOrFail() const {
        auto found = first();
        if (found.hasError()) {
            return OrmResult<M>::err(std::move(found).error());
        }
        if (!found.value()) {
            return detail::modelError<M>(foundation::ErrorCode::ModelNotFound,
                                           "no matching " + M::metadata().table + " row",
                                           M::metadata(), "first", {});
        }
        return OrmResult<M>::ok(std::move(*found.value()));
    }

    [[nodiscard]] OrmResult<std::optional<M>> find(const DbValue& id) const {
        auto copy = clone();
        copy.where(M::metadata().primaryKey, id);
        return copy.first();
    }

    [[nodiscard]] OrmResult<M> findOrFail(const DbValue& id) const {
        auto found = find(id);
        if (found.hasError()) {
            return OrmResult<M>::err(std::move(found).error());
        }
        if (!found.value()) {
            return detail::modelError<M>(foundation::ErrorCode::ModelNotFound,
                                           "no " + M::metadata().table + " row with key " +
                                               db::toDisplayString(id),
                                           M::metadata(), "find", M::metadata().primaryKey);
        }
        return OrmResult<M>::ok(std::move(*found.value()));
    }

    [[nodiscard]] OrmResult<std::uint64_t> count() const { return builder_.count(); }
    [[nodiscard]] OrmResult<bool> exists() const { return builder_.exists(); }
    [[nodiscard]] OrmResult<DbValue> sum(std::string_view column) const {
        return builder_.sum(column);
    }
    [[nodiscard]] OrmResult<DbValue> avg(std::string_view column) const {
        return builder_.avg(column);
    }
    [[nodiscard]] OrmResult<DbValue> min(std::string_view column) const {
        return builder_.min(column);
    }
    [[nodiscard]] OrmResult<DbValue> max(std::string_view column) const {
        return builder_.max(column);
    }
    [[nodiscard]] OrmResult<std::vector<DbValue>> pluck(std::string_view column) const {
        return builder_.pluck(column);
    }

    /// Bulk update of every matching row, with casts applied and the
    /// update timestamp refreshed.
    [[nodiscard]] OrmResult<std::uint64_t> update(const Row& values) const {
        M scratch;
        auto encoded = scratch.encodeForWrite(values);
        if (encoded.hasError()) {
            return OrmResult<std::uint64_t>::err(std::move(encoded).error());
        }
        const auto& meta = M::metadata();
        if (meta.timestamps && encoded.value().count(meta.updatedAtColumn) == 0) {
            encoded.value()[meta.updatedAtColumn] = db::currentTimestamp();
        }
        return builder_.update(std::move(encoded).value());
    }

    [[nodiscard]] OrmResult<std::uint64_t> remove() const { return builder_.remove(); }

    [[nodiscard]] OrmResult<query::Page<M>> paginate(std::uint64_t page = 1,
                                                     std::uint64_t perPage = 15) const {
        if (page == 0) {
            page = 1;
        }
        auto total = builder_.count();
        if (total.hasError()) {
            return OrmResult<query::Page<M>>::err(std::move(total).error());
        }
        auto copy = clone();
        copy.forPage(page, perPage);
        auto models = copy.get();
        if (models.hasError()) {
            return OrmResult<query::Page<M>>::err(std::move(models).error());
        }
        return OrmResult<query::Page<M>>::ok(
            query::makePage(std::move(models).value(), total.value(), perPage, page));
    }

    /// Run get() on a separate thread against a snapshot of this query.
    [[nodiscard]] std::future<OrmResult<std::vector<M>>> getAsync() const {
        return std::async(std::launch::async, [snapshot = clone()] { return snapshot.get(); });
    }

    [[nodiscard]] ModelQuery clone() const { return *this; }

    /// The underlying row-level builder.
    [[nodiscard]] const query::QueryBuilder& toBase() const noexcept { return builder_; }

private:
    Database* db_;
    query::QueryBuilder builder_;
};

} // namespace quarry::orm
