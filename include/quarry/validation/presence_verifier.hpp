#pragma once

/// @file presence_verifier.hpp
/// @brief Database lookups behind "unique" and "exists" validation rules.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::orm {
class Database;
} // namespace quarry::orm

namespace quarry::validation {

using db::DbValue;
using db::Row;
using foundation::OrmResult;

/// Counts rows for request validators.
///
/// Example:
/// @code
///   PresenceVerifier verifier(db);
///   auto free = verifier.isUnique("users", "email", input, userId);
///   auto known = verifier.exists("roles", "id", roleId);
/// @endcode
class PresenceVerifier {
public:
    explicit PresenceVerifier(orm::Database& db) noexcept : db_(&db) {}

    /// Rows of @p table where @p column equals @p value and every pair in
    /// @p extra matches. A row whose @p idColumn equals @p excludeId is
    /// not counted.
    [[nodiscard]] OrmResult<std::uint64_t> getCount(std::string_view table,
                                                    std::string column, const DbValue& value,
                                                    const std::optional<DbValue>& excludeId = {},
                                                    std::string idColumn = "id",
                                                    const Row& extra = {}) const;

    /// Rows of @p table where @p column is any of @p values.
    [[nodiscard]] OrmResult<std::uint64_t> getMultiCount(std::string_view table,
                                                         std::string column,
                                                         const std::vector<DbValue>& values,
                                                         const Row& extra = {}) const;

    /// "unique" rule: no other row holds @p value.
    [[nodiscard]] OrmResult<bool> isUnique(std::string_view table, std::string column,
                                           const DbValue& value,
                                           const std::optional<DbValue>& excludeId = {},
                                           std::string idColumn = "id") const;

    /// "exists" rule: at least one row holds @p value.
    [[nodiscard]] OrmResult<bool> exists(std::string_view table, std::string column,
                                         const DbValue& value, const Row& extra = {}) const;

    /// "exists" rule over a list: every distinct value is present.
    [[nodiscard]] OrmResult<bool> existsAll(std::string_view table, std::string column,
                                            const std::vector<DbValue>& values) const;

private:
    orm::Database* db_;
};

} // namespace quarry::validation
