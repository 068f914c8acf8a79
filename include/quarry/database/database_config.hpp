#pragma once

/// @file database_config.hpp
/// @brief Adapter construction config, backend tags and YAML loading.

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "quarry/foundation/orm_result.hpp"

namespace quarry::foundation {
class ConfigManager;
}

namespace quarry::db {

/// Supported backend types.
enum class BackendType : uint8_t {
    MySQL,
    PostgreSQL,
    MongoDB,
    Memory
};

/// Relational backends accept SQL, joins and raw predicates.
enum class BackendFamily : uint8_t { Relational, Document };

struct PoolConfig {
    uint32_t min = 1;
    uint32_t max = 10;
};

/// Connection settings for one adapter.
///
/// Either @c url is given (taken verbatim as the driver connection string,
/// e.g. "mongodb://..." or "host=... dbname=...") or host/port/database and
/// credentials are assembled into one.
struct DatabaseConfig {
    BackendType type = BackendType::PostgreSQL;
    std::string host = "127.0.0.1";
    uint16_t port = 0;  ///< 0 selects the backend default.
    std::string database;
    std::string username;
    std::string password;
    bool ssl = false;
    std::string url;
    PoolConfig pool;
    std::chrono::seconds connectionTimeout{30};
};

/// Parse a backend tag: "mysql", "postgres"/"postgresql"/"pgsql",
/// "mongodb"/"mongo", "memory". Unknown tags yield UnknownBackend.
[[nodiscard]] foundation::OrmResult<BackendType> parseBackendType(std::string_view tag);

/// Canonical tag for a backend ("mysql", "postgres", "mongodb", "memory").
[[nodiscard]] std::string_view backendName(BackendType type) noexcept;

[[nodiscard]] BackendFamily backendFamily(BackendType type) noexcept;

[[nodiscard]] uint16_t defaultPort(BackendType type) noexcept;

/// Reject unsupported combinations before any network I/O.
///
/// Fails with InvalidConfiguration when: the database name is missing
/// (except for Memory or when a url is given), pool.min > pool.max,
/// pool.max is 0, or a url is given whose scheme does not match the
/// backend (a "mongodb://" url for a SQL backend or vice versa).
[[nodiscard]] foundation::OrmResult<void> validateConfig(const DatabaseConfig& config);

/// Build the driver connection string for the configured backend.
///
/// PostgreSQL: "host=H port=P dbname=D user=U password=W [sslmode=require]"
/// MySQL:      "host=H port=P database=D user=U password=W [ssl=true]"
/// MongoDB:    "mongodb://U:W@H:P/D[?tls=true]"
[[nodiscard]] std::string buildConnectionString(const DatabaseConfig& config);

/// Read a DatabaseConfig from dotted keys under @p prefix:
/// type, host, port, database, username, password, ssl, url, pool.min,
/// pool.max, timeout (seconds). Missing optional keys keep defaults.
[[nodiscard]] foundation::OrmResult<DatabaseConfig> loadDatabaseConfig(
    const foundation::ConfigManager& config, std::string_view prefix = "database");

} // namespace quarry::db
