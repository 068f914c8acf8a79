#pragma once

/// @file model_base.hpp
/// @brief Type-independent part of every model: attribute bag, dirty
///        tracking, pivot data, relation cache and persistence.

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"
#include "quarry/orm/attribute_cast.hpp"

namespace quarry::orm {

using db::DbValue;
using db::Json;
using db::Row;
using foundation::OrmResult;

class Database;
class ModelBase;

/// Static description of a model type.
struct ModelMeta {
    std::string table;
    std::string primaryKey = "id";
    std::vector<std::string> fillable;  ///< Mass-assignable attributes.
    std::vector<std::string> hidden;    ///< Excluded from toJson().
    std::map<std::string, CastType> casts;
    bool timestamps = true;
    std::string createdAtColumn = "created_at";
    std::string updatedAtColumn = "updated_at";
};

/// Loaded relation: one model (or none) for singular relations, a list
/// for plural ones.
struct RelationValue {
    bool many = false;
    std::vector<std::shared_ptr<const ModelBase>> models;
};

/// Attribute storage and persistence shared by all Model<T>.
///
/// Attributes hold cast (semantic) values. Writes go through the same
/// casts, so a value set by the caller and a value read back from the
/// backend compare equal.
class ModelBase {
public:
    virtual ~ModelBase() = default;

    [[nodiscard]] virtual const ModelMeta& meta() const = 0;

    // ── Attributes ──────────────────────────────────────────────────────

    /// Value of @p key; null when absent.
    [[nodiscard]] DbValue getAttribute(std::string_view key) const;

    template <typename T>
    [[nodiscard]] std::optional<T> get(std::string_view key) const {
        return db::valueAs<T>(getAttribute(key));
    }

    /// Store @p value under @p key, cast when a cast is registered. A value
    /// the cast rejects is kept as given and reported by save().
    void setAttribute(std::string key, DbValue value);

    [[nodiscard]] bool hasAttribute(std::string_view key) const;
    [[nodiscard]] const Row& attributes() const noexcept { return attributes_; }

    [[nodiscard]] bool isFillable(std::string_view key) const;

    /// Assign every fillable key of @p values; other keys are dropped.
    void fillAttributes(const Row& values);

    [[nodiscard]] DbValue getKey() const { return getAttribute(meta().primaryKey); }

    /// True when the primary key holds a value.
    [[nodiscard]] bool exists() const { return !db::isNull(getKey()); }

    // ── Dirty tracking ──────────────────────────────────────────────────

    [[nodiscard]] bool isDirty() const { return !getDirty().empty(); }
    [[nodiscard]] bool isDirty(std::string_view key) const;
    /// Attributes changed since the last load or save.
    [[nodiscard]] Row getDirty() const;
    [[nodiscard]] const Row& original() const noexcept { return original_; }
    void syncOriginal() { original_ = attributes_; }

    // ── Pivot ───────────────────────────────────────────────────────────

    [[nodiscard]] const Row& pivot() const noexcept { return pivot_; }
    void setPivot(Row pivot) { pivot_ = std::move(pivot); }

    /// Move every "<prefix>name" attribute into the pivot bag as "name".
    void extractPivot(std::string_view prefix);

    // ── Relation cache ──────────────────────────────────────────────────

    [[nodiscard]] bool relationLoaded(std::string_view name) const;
    [[nodiscard]] const RelationValue* relation(std::string_view name) const;
    void setRelation(std::string name, RelationValue value);
    void unsetRelation(std::string_view name);
    void clearRelations() { relations_.clear(); }
    [[nodiscard]] std::vector<std::string> loadedRelations() const;

    // ── Serialization ───────────────────────────────────────────────────

    /// Attributes without hidden keys, plus "pivot" when present and each
    /// loaded relation (object, null or array).
    [[nodiscard]] Json toJson() const;

    // ── Persistence ─────────────────────────────────────────────────────

    /// Replace attributes with @p row after casting, and sync original.
    [[nodiscard]] OrmResult<void> assignFromRow(const Row& row);

    /// Cast every attribute in @p values for writing.
    [[nodiscard]] OrmResult<Row> encodeForWrite(const Row& values) const;

protected:
    ModelBase() = default;
    ModelBase(const ModelBase&) = default;
    ModelBase& operator=(const ModelBase&) = default;
    ModelBase(ModelBase&&) noexcept = default;
    ModelBase& operator=(ModelBase&&) noexcept = default;

    /// Insert when the primary key is absent, otherwise update dirty
    /// attributes. Fills timestamps when enabled.
    [[nodiscard]] OrmResult<void> performSave(Database& db);
    [[nodiscard]] OrmResult<void> performDelete(Database& db);
    [[nodiscard]] OrmResult<void> performRefresh(Database& db);

private:
    Row attributes_;
    Row original_;
    Row pivot_;
    std::map<std::string, RelationValue, std::less<>> relations_;
};

} // namespace quarry::orm
