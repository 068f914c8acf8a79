#pragma once

/// @file belongs_to.hpp
/// @brief BelongsTo: the parent holds a foreign key to the related table.

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "quarry/orm/relations/relation.hpp"

namespace quarry::orm {

/// Inverse of HasOne/HasMany.
///
/// The owning model is the one whose @c ownerKey equals the child's
/// @c foreignKey. Defaults: relation name = singular related table,
/// foreignKey = "<relation name>_id", ownerKey = the related primary key.
///
/// Example:
/// @code
///   auto post = Post::make({{"title", "Hello"}});
///   post.belongsTo<User>(db).associate(author);
///   (void)post.save(db);
/// @endcode
template <typename R>
class BelongsTo final : public Relation<R> {
public:
    BelongsTo(Database& db, ModelBase& child, std::string foreignKey = {},
              std::string ownerKey = {}, std::string relationName = {})
        : Relation<R>(db, child),
          relationName_(relationName.empty() ? singularize(R::metadata().table)
                                             : std::move(relationName)),
          foreignKey_(foreignKey.empty() ? relationName_ + "_id" : std::move(foreignKey)),
          ownerKey_(ownerKey.empty() ? R::metadata().primaryKey : std::move(ownerKey)) {}

    [[nodiscard]] bool isSingular() const noexcept override { return true; }

    [[nodiscard]] const std::string& foreignKey() const noexcept { return foreignKey_; }
    [[nodiscard]] const std::string& ownerKey() const noexcept { return ownerKey_; }
    [[nodiscard]] const std::string& relationName() const noexcept { return relationName_; }

    /// Point the child at @p owner and cache @p owner as the loaded
    /// relation. The child is not saved.
    [[nodiscard]] OrmResult<void> associate(const R& owner) {
        auto key = owner.getAttribute(ownerKey_);
        if (db::isNull(key)) {
            foundation::ErrorDetail detail;
            detail.operation = "associate";
            detail.table = R::metadata().table;
            detail.column = ownerKey_;
            return foundation::failWith<void>(foundation::ErrorCode::InvalidArgument,
                                              "owner has no " + ownerKey_ + " value",
                                              std::move(detail));
        }
        this->parent().setAttribute(foreignKey_, std::move(key));
        RelationValue value;
        value.models.push_back(std::make_shared<const R>(owner));
        this->parent().setRelation(relationName_, std::move(value));
        return OrmResult<void>::ok();
    }

    /// Clear the child's foreign key and cache an empty relation.
    void dissociate() {
        this->parent().setAttribute(foreignKey_, db::DbNull{});
        this->parent().setRelation(relationName_, RelationValue{});
    }

protected:
    [[nodiscard]] const std::string& parentKeyName() const noexcept override {
        return foreignKey_;
    }
    [[nodiscard]] const std::string& resultKeyName() const noexcept override { return ownerKey_; }

    void applyConstraints(query::QueryBuilder& q,
                          const std::vector<DbValue>& keys) const override {
        constrainToKeys(q, ownerKey_, keys);
    }

private:
    std::string relationName_;
    std::string foreignKey_;
    std::string ownerKey_;
};

} // namespace quarry::orm
