#pragma once

/// @file prepared_statement.hpp
/// @brief Parameterized SQL statement with positional bindings.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::db {

/// SQL flavours understood by the grammar and the binding resolver.
enum class SqlDialect : uint8_t { MySQL, PostgreSQL };

/// A compiled SQL statement and the values bound to its placeholders.
///
/// Placeholders are '?' for MySQL and '$1', '$2', ... for PostgreSQL. The
/// statement stays parameterized until resolve() is called right before it
/// is handed to the driver, which is the only place values are escaped.
///
/// Example:
/// @code
///   PreparedStatement stmt(SqlDialect::PostgreSQL,
///                          "SELECT * FROM \"users\" WHERE \"email\" = $1");
///   stmt.bind(std::string("a@x.io"));
///   auto sql = stmt.resolve();  // ... WHERE "email" = 'a@x.io'
/// @endcode
class PreparedStatement {
public:
    PreparedStatement(SqlDialect dialect, std::string sql,
                      std::vector<DbValue> bindings = {});

    /// Append a binding for the next placeholder.
    PreparedStatement& bind(DbValue value);

    [[nodiscard]] SqlDialect dialect() const noexcept { return dialect_; }

    /// The SQL template with placeholders.
    [[nodiscard]] std::string_view sql() const noexcept { return sql_; }

    [[nodiscard]] const std::vector<DbValue>& bindings() const noexcept { return bindings_; }

    /// Substitute every placeholder outside quoted literals and identifiers
    /// with its escaped binding.
    /// @return InvalidQuery when placeholder and binding counts differ.
    [[nodiscard]] foundation::OrmResult<std::string> resolve() const;

    void clearBindings();

private:
    SqlDialect dialect_;
    std::string sql_;
    std::vector<DbValue> bindings_;
};

/// Render a value as a SQL literal for @p dialect.
///
/// MySQL escapes backslashes and doubles quotes, PostgreSQL (with standard
/// conforming strings) only doubles quotes. Booleans render as 1/0 on
/// MySQL and TRUE/FALSE on PostgreSQL; JSON renders as a quoted dump.
[[nodiscard]] std::string sqlLiteral(SqlDialect dialect, const DbValue& value);

/// Rewrite '?' placeholders outside quotes into the dialect's native form,
/// numbering PostgreSQL placeholders from @p firstIndex.
[[nodiscard]] std::string nativePlaceholders(SqlDialect dialect, std::string_view sql,
                                             std::size_t firstIndex = 1);

} // namespace quarry::db
