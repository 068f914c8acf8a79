#pragma once

/// @file adapter_factory.hpp
/// @brief Compile-time table mapping backend tags to adapter constructors.

#include <array>
#include <memory>
#include <string_view>

#include "quarry/database/database_adapter.hpp"

namespace quarry::db {

/// Constructor for one backend's adapter.
using AdapterCreator = std::unique_ptr<DatabaseAdapter> (*)();

struct AdapterRegistration {
    BackendType type;
    AdapterCreator create;
};

/// Every adapter compiled into the library, one entry per BackendType.
[[nodiscard]] const std::array<AdapterRegistration, 4>& registeredAdapters() noexcept;

/// Construct an unconnected adapter for @p type.
[[nodiscard]] OrmResult<std::unique_ptr<DatabaseAdapter>> createAdapter(BackendType type);

/// Construct an unconnected adapter from a backend tag ("mysql", "mongo", ...).
/// Unknown tags fail with UnknownBackend.
[[nodiscard]] OrmResult<std::unique_ptr<DatabaseAdapter>> createAdapter(std::string_view tag);

} // namespace quarry::db
