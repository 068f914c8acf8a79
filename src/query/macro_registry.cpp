/// @file macro_registry.cpp
/// @brief MacroRegistry implementation.

#include "quarry/query/macro_registry.hpp"

#include <algorithm>

#include "quarry/query/query_builder.hpp"

namespace quarry::query {

using foundation::ErrorCode;

void MacroRegistry::define(std::string name, Macro fn) {
    std::lock_guard lock(mutex_);
    macros_[std::move(name)] = std::move(fn);
}

bool MacroRegistry::remove(std::string_view name) {
    std::lock_guard lock(mutex_);
    return macros_.erase(std::string(name)) > 0;
}

bool MacroRegistry::has(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return macros_.count(std::string(name)) > 0;
}

foundation::OrmResult<db::QueryResult> MacroRegistry::invoke(std::string_view name,
                                                             QueryBuilder& builder,
                                                             const db::Json& args) const {
    Macro fn;
    {
        std::lock_guard lock(mutex_);
        auto it = macros_.find(std::string(name));
        if (it == macros_.end()) {
            foundation::ErrorDetail detail;
            detail.operation = "macro";
            detail.table = builder.tableName();
            return foundation::failWith<db::QueryResult>(
                ErrorCode::MacroNotDefined,
                "macro '" + std::string(name) + "' is not defined", std::move(detail));
        }
        fn = it->second;
    }
    // Run outside the lock so a macro may call other macros.
    return fn(builder, args);
}

std::vector<std::string> MacroRegistry::names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(macros_.size());
    for (const auto& [name, fn] : macros_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace quarry::query
