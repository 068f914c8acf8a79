#pragma once

/// @file belongs_to_many.hpp
/// @brief BelongsToMany: parent and related rows linked through a pivot
///        table.

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/orm/relations/relation.hpp"

namespace quarry::orm {

/// Ids added and removed by BelongsToMany::sync().
struct SyncResult {
    std::vector<DbValue> attached;
    std::vector<DbValue> detached;
};

/// Many-to-many relation through @c pivotTable.
///
/// Related rows are selected together with their pivot columns under a
/// "pivot_" prefix; those columns are moved into each model's pivot bag
/// and matched on the pivot's parent key, so a related row shared by
/// several parents is attached to each with its own pivot data. Backends
/// without joins run a pivot query followed by a related query.
///
/// Defaults: pivotTable = pivotTableFor(parent table, related table),
/// foreignPivotKey = "<singular parent table>_id", relatedPivotKey =
/// "<singular related table>_id", parent and related keys = primary keys.
///
/// Example:
/// @code
///   auto roles = user.belongsToMany<Role>(db).withPivot({"granted_at"}).get();
///   for (const auto& role : roles.value()) {
///       auto granted = role.pivot().at("granted_at");
///   }
/// @endcode
template <typename R>
class BelongsToMany final : public Relation<R> {
public:
    BelongsToMany(Database& db, ModelBase& parent, std::string pivotTable = {},
                  std::string foreignPivotKey = {}, std::string relatedPivotKey = {},
                  std::string parentKey = {}, std::string relatedKey = {})
        : Relation<R>(db, parent),
          pivotTable_(pivotTable.empty()
                          ? pivotTableFor(parent.meta().table, R::metadata().table)
                          : std::move(pivotTable)),
          foreignPivotKey_(foreignPivotKey.empty() ? foreignKeyFor(parent.meta().table)
                                                   : std::move(foreignPivotKey)),
          relatedPivotKey_(relatedPivotKey.empty() ? foreignKeyFor(R::metadata().table)
                                                   : std::move(relatedPivotKey)),
          parentKey_(parentKey.empty() ? parent.meta().primaryKey : std::move(parentKey)),
          relatedKey_(relatedKey.empty() ? R::metadata().primaryKey : std::move(relatedKey)) {}

    [[nodiscard]] bool isSingular() const noexcept override { return false; }

    /// Extra pivot columns to load into each model's pivot bag.
    BelongsToMany& withPivot(std::vector<std::string> columns) {
        for (auto& column : columns) {
            pivotColumns_.push_back(std::move(column));
        }
        return *this;
    }

    [[nodiscard]] const std::string& pivotTable() const noexcept { return pivotTable_; }
    [[nodiscard]] const std::string& foreignPivotKey() const noexcept { return foreignPivotKey_; }
    [[nodiscard]] const std::string& relatedPivotKey() const noexcept { return relatedPivotKey_; }

    // ── Pivot maintenance ──────────────────────────────────────────────

    /// Insert one pivot row per id in @p ids, each carrying @p extra.
    [[nodiscard]] OrmResult<void> attach(const std::vector<DbValue>& ids, const Row& extra = {}) {
        auto owner = ownerKey("attach");
        if (owner.hasError()) {
            return OrmResult<void>::err(std::move(owner).error());
        }
        for (const auto& id : ids) {
            Row record = extra;
            record[foreignPivotKey_] = owner.value();
            record[relatedPivotKey_] = id;
            auto inserted = this->database().table(pivotTable_).insert(std::move(record));
            if (inserted.hasError()) {
                return OrmResult<void>::err(std::move(inserted).error());
            }
        }
        return OrmResult<void>::ok();
    }

    /// Delete pivot rows for @p ids, or every pivot row of the parent when
    /// @p ids is empty. Returns the number of rows removed.
    [[nodiscard]] OrmResult<std::uint64_t> detach(const std::vector<DbValue>& ids = {}) {
        auto owner = ownerKey("detach");
        if (owner.hasError()) {
            return OrmResult<std::uint64_t>::err(std::move(owner).error());
        }
        auto q = this->database().table(pivotTable_);
        q.where(foreignPivotKey_, owner.value());
        if (!ids.empty()) {
            q.whereIn(relatedPivotKey_, ids);
        }
        return q.remove();
    }

    /// Make @p ids the exact set of related ids.
    [[nodiscard]] OrmResult<SyncResult> sync(const std::vector<DbValue>& ids) {
        auto current = currentIds();
        if (current.hasError()) {
            return OrmResult<SyncResult>::err(std::move(current).error());
        }

        // Attach in caller order, skipping duplicates.
        std::set<std::string> wanted;
        SyncResult result;
        for (const auto& id : ids) {
            auto key = db::normalizeKey(id);
            if (!key || !wanted.insert(*key).second) {
                continue;
            }
            if (current.value().count(*key) == 0) {
                result.attached.push_back(id);
            }
        }
        for (const auto& [key, id] : current.value()) {
            if (wanted.count(key) == 0) {
                result.detached.push_back(id);
            }
        }

        if (!result.detached.empty()) {
            auto removed = detach(result.detached);
            if (removed.hasError()) {
                return OrmResult<SyncResult>::err(std::move(removed).error());
            }
        }
        if (!result.attached.empty()) {
            auto added = attach(result.attached);
            if (added.hasError()) {
                return OrmResult<SyncResult>::err(std::move(added).error());
            }
        }
        QUARRY_LOG_DEBUG(foundation::LogCategory::Model,
                         pivotTable_ + " sync: +" + std::to_string(result.attached.size()) +
                             " -" + std::to_string(result.detached.size()));
        return OrmResult<SyncResult>::ok(std::move(result));
    }

    /// Update the extra columns of the pivot row linking the parent to @p id.
    [[nodiscard]] OrmResult<std::uint64_t> updateExistingPivot(const DbValue& id,
                                                               const Row& values) {
        auto owner = ownerKey("updateExistingPivot");
        if (owner.hasError()) {
            return OrmResult<std::uint64_t>::err(std::move(owner).error());
        }
        return this->database()
            .table(pivotTable_)
            .where(foreignPivotKey_, owner.value())
            .where(relatedPivotKey_, id)
            .update(values);
    }

protected:
    [[nodiscard]] const std::string& parentKeyName() const noexcept override {
        return parentKey_;
    }
    [[nodiscard]] const std::string& resultKeyName() const noexcept override {
        return foreignPivotKey_;
    }
    [[nodiscard]] KeySource resultKeySource() const noexcept override { return KeySource::Pivot; }

    void applyConstraints(query::QueryBuilder& q,
                          const std::vector<DbValue>& keys) const override {
        const auto& related = R::metadata().table;
        std::vector<std::string> columns{related + ".*"};
        for (const auto& column : pivotSelection()) {
            columns.push_back(pivotTable_ + "." + column + " as " + kPivotPrefix + column);
        }
        q.select(std::move(columns));
        q.join(pivotTable_, related + "." + relatedKey_, "=",
               pivotTable_ + "." + relatedPivotKey_);
        constrainToKeys(q, pivotTable_ + "." + foreignPivotKey_, keys);
    }

    void prepareModel(R& model) const override { model.extractPivot(kPivotPrefix); }

    [[nodiscard]] OrmResult<std::vector<R>> fetchResults(
        query::QueryBuilder q, const std::vector<DbValue>& keys) const override {
        if (q.adapter().supportsJoins()) {
            applyConstraints(q, keys);
            return this->hydrateRows(q);
        }
        return fetchWithoutJoins(std::move(q), keys);
    }

    [[nodiscard]] OrmResult<std::uint64_t> countResults(
        query::QueryBuilder q, const std::vector<DbValue>& keys) const override {
        if (q.adapter().supportsJoins()) {
            applyConstraints(q, keys);
            return q.count();
        }
        auto models = fetchWithoutJoins(std::move(q), keys);
        if (models.hasError()) {
            return OrmResult<std::uint64_t>::err(std::move(models).error());
        }
        return OrmResult<std::uint64_t>::ok(models.value().size());
    }

private:
    static constexpr const char* kPivotPrefix = "pivot_";

    [[nodiscard]] std::vector<std::string> pivotSelection() const {
        std::vector<std::string> columns{foreignPivotKey_, relatedPivotKey_};
        columns.insert(columns.end(), pivotColumns_.begin(), pivotColumns_.end());
        return columns;
    }

    /// Pivot query, then related query; each related model is repeated
    /// once per pivot row that references it.
    [[nodiscard]] OrmResult<std::vector<R>> fetchWithoutJoins(
        query::QueryBuilder q, const std::vector<DbValue>& keys) const {
        auto pivotQuery = this->database().table(pivotTable_);
        constrainToKeys(pivotQuery, foreignPivotKey_, keys);
        auto pivotRows = pivotQuery.get();
        if (pivotRows.hasError()) {
            return OrmResult<std::vector<R>>::err(std::move(pivotRows).error());
        }

        std::map<std::string, std::vector<Row>> byRelated;
        std::vector<DbValue> relatedIds;
        for (const auto& row : pivotRows.value()) {
            auto it = row.find(relatedPivotKey_);
            if (it == row.end()) {
                continue;
            }
            auto key = db::normalizeKey(it->second);
            if (!key) {
                continue;
            }
            auto& bucket = byRelated[*key];
            if (bucket.empty()) {
                relatedIds.push_back(it->second);
            }
            Row pivot;
            for (const auto& column : pivotSelection()) {
                if (auto field = row.find(column); field != row.end()) {
                    pivot.emplace(column, field->second);
                }
            }
            bucket.push_back(std::move(pivot));
        }
        if (relatedIds.empty()) {
            return OrmResult<std::vector<R>>::ok({});
        }

        constrainToKeys(q, relatedKey_, relatedIds);
        auto related = this->hydrateRows(q);
        if (related.hasError()) {
            return related;
        }

        std::vector<R> models;
        for (const auto& model : related.value()) {
            auto key = db::normalizeKey(model.getAttribute(relatedKey_));
            if (!key) {
                continue;
            }
            auto bucket = byRelated.find(*key);
            if (bucket == byRelated.end()) {
                continue;
            }
            for (const auto& pivot : bucket->second) {
                R copy = model;
                copy.setPivot(pivot);
                models.push_back(std::move(copy));
            }
        }
        return OrmResult<std::vector<R>>::ok(std::move(models));
    }

    /// Related ids currently linked to the parent, keyed by normalized id.
    [[nodiscard]] OrmResult<std::map<std::string, DbValue>> currentIds() const {
        using Ids = std::map<std::string, DbValue>;
        auto owner = ownerKey("sync");
        if (owner.hasError()) {
            return OrmResult<Ids>::err(std::move(owner).error());
        }
        auto ids = this->database()
                       .table(pivotTable_)
                       .where(foreignPivotKey_, owner.value())
                       .pluck(relatedPivotKey_);
        if (ids.hasError()) {
            return OrmResult<Ids>::err(std::move(ids).error());
        }
        Ids out;
        for (auto& id : ids.value()) {
            if (auto key = db::normalizeKey(id)) {
                out.emplace(*key, std::move(id));
            }
        }
        return OrmResult<Ids>::ok(std::move(out));
    }

    [[nodiscard]] OrmResult<DbValue> ownerKey(std::string_view operation) const {
        auto key = this->parent().getAttribute(parentKey_);
        if (db::isNull(key)) {
            foundation::ErrorDetail detail;
            detail.operation = std::string(operation);
            detail.table = pivotTable_;
            detail.column = parentKey_;
            return foundation::failWith<DbValue>(foundation::ErrorCode::InvalidArgument,
                                                 "parent has no " + parentKey_ + " value",
                                                 std::move(detail));
        }
        return OrmResult<DbValue>::ok(std::move(key));
    }

    std::string pivotTable_;
    std::string foreignPivotKey_;
    std::string relatedPivotKey_;
    std::string parentKey_;
    std::string relatedKey_;
    std::vector<std::string> pivotColumns_;
};

} // namespace quarry::orm
