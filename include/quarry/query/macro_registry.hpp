#pragma once

/// @file macro_registry.hpp
/// @brief Named extension verbs attached to query builders.

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::query {

class QueryBuilder;

/// Extension verb. Receives the builder it was invoked on (and through it
/// the bound adapter) plus free-form JSON arguments.
using Macro = std::function<foundation::OrmResult<db::QueryResult>(QueryBuilder&,
                                                                   const db::Json&)>;

/// Registry of extension verbs, injected into every builder a Database
/// creates.
///
/// Example:
/// @code
///   MacroRegistry macros;
///   macros.define("active", [](QueryBuilder& q, const Json&) {
///       return q.where("active", true).get();
///   });
///   auto rows = db.table("users").macro("active");
/// @endcode
class MacroRegistry {
public:
    MacroRegistry() = default;

    MacroRegistry(const MacroRegistry&) = delete;
    MacroRegistry& operator=(const MacroRegistry&) = delete;

    /// Register @p fn under @p name, replacing any earlier definition.
    void define(std::string name, Macro fn);

    /// Remove a definition. Returns false when none existed.
    bool remove(std::string_view name);

    [[nodiscard]] bool has(std::string_view name) const;

    /// Run the named verb. Unknown names fail with MacroNotDefined.
    [[nodiscard]] foundation::OrmResult<db::QueryResult> invoke(std::string_view name,
                                                                QueryBuilder& builder,
                                                                const db::Json& args) const;

    /// Registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Macro> macros_;
};

} // namespace quarry::query
