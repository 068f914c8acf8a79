#pragma once

/// @file relation_registry.hpp
/// @brief Named relation declarations of one model type.

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quarry/orm/relations/belongs_to.hpp"
#include "quarry/orm/relations/belongs_to_many.hpp"
#include "quarry/orm/relations/has_one_or_many.hpp"

namespace quarry::orm {

/// Maps relation names to factories that bind a relation to a model
/// instance. Filled once per model type by its static relations() hook
/// and consulted by with(), load() and the relation accessors.
///
/// Example:
/// @code
///   static void relations(RelationRegistry& r) {
///       r.hasMany<Post>("posts");
///       r.belongsToMany<Role>("roles", "role_user");
///   }
/// @endcode
class RelationRegistry {
public:
    using Factory = std::function<std::unique_ptr<RelationBase>(Database&, ModelBase&)>;

    void define(std::string name, Factory factory) {
        factories_[std::move(name)] = std::move(factory);
    }

    [[nodiscard]] const Factory* find(std::string_view name) const {
        auto it = factories_.find(name);
        return it != factories_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& [name, factory] : factories_) {
            out.push_back(name);
        }
        return out;
    }

    template <typename R>
    void hasOne(std::string name, std::string foreignKey = {}, std::string localKey = {}) {
        define(std::move(name), [foreignKey, localKey](Database& db, ModelBase& parent) {
            return std::unique_ptr<RelationBase>(
                std::make_unique<HasOne<R>>(db, parent, foreignKey, localKey));
        });
    }

    template <typename R>
    void hasMany(std::string name, std::string foreignKey = {}, std::string localKey = {}) {
        define(std::move(name), [foreignKey, localKey](Database& db, ModelBase& parent) {
            return std::unique_ptr<RelationBase>(
                std::make_unique<HasMany<R>>(db, parent, foreignKey, localKey));
        });
    }

    /// The foreign key defaults to "<name>_id" and the loaded model is
    /// cached under @p name.
    template <typename R>
    void belongsTo(std::string name, std::string foreignKey = {}, std::string ownerKey = {}) {
        if (foreignKey.empty()) {
            foreignKey = name + "_id";
        }
        define(name, [name, foreignKey, ownerKey](Database& db, ModelBase& child) {
            return std::unique_ptr<RelationBase>(
                std::make_unique<BelongsTo<R>>(db, child, foreignKey, ownerKey, name));
        });
    }

    template <typename R>
    void belongsToMany(std::string name, std::string pivotTable = {},
                       std::string foreignPivotKey = {}, std::string relatedPivotKey = {},
                       std::vector<std::string> pivotColumns = {}) {
        define(std::move(name), [pivotTable, foreignPivotKey, relatedPivotKey,
                                 pivotColumns](Database& db, ModelBase& parent) {
            auto relation = std::make_unique<BelongsToMany<R>>(db, parent, pivotTable,
                                                               foreignPivotKey, relatedPivotKey);
            relation->withPivot(pivotColumns);
            return std::unique_ptr<RelationBase>(std::move(relation));
        });
    }

private:
    std::map<std::string, Factory, std::less<>> factories_;
};

} // namespace quarry::orm
