#pragma once

/// @file schema.hpp
/// @brief Executes Blueprints against an adapter.

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/database_adapter.hpp"
#include "quarry/schema/blueprint.hpp"

namespace quarry::schema {

using foundation::OrmResult;

/// Schema operations bound to one adapter.
///
/// Example:
/// @code
///   auto schema = db.schema();
///   auto created = schema.create("users", [](Blueprint& table) {
///       table.id();
///       table.string("email").unique();
///   });
/// @endcode
class Schema {
public:
    explicit Schema(db::DatabaseAdapter& adapter) noexcept : adapter_(&adapter) {}

    /// Create a table described by @p build.
    [[nodiscard]] OrmResult<void> create(std::string_view table,
                                         const std::function<void(Blueprint&)>& build);

    /// Alter an existing table with the changes described by @p build.
    [[nodiscard]] OrmResult<void> table(std::string_view table,
                                        const std::function<void(Blueprint&)>& build);

    [[nodiscard]] OrmResult<void> drop(std::string_view table);
    [[nodiscard]] OrmResult<void> dropIfExists(std::string_view table);

    /// Drop every table the adapter lists.
    [[nodiscard]] OrmResult<void> dropAllTables();

    [[nodiscard]] OrmResult<bool> hasTable(std::string_view table);
    [[nodiscard]] OrmResult<bool> hasColumn(std::string_view table, std::string_view column);
    [[nodiscard]] OrmResult<std::vector<std::string>> listTables();

private:
    db::DatabaseAdapter* adapter_;
};

} // namespace quarry::schema
