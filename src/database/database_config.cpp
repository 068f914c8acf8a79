/// @file database_config.cpp
/// @brief Backend tag parsing, config validation and connection strings.

#include "quarry/database/database_config.hpp"

#include "quarry/foundation/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace quarry::db {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::OrmError;
using foundation::OrmResult;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

OrmResult<void> invalid(std::string message) {
    return OrmResult<void>::err(OrmError(ErrorCode::InvalidConfiguration, std::move(message)));
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

OrmResult<BackendType> parseBackendType(std::string_view tag) {
    auto lower = toLower(tag);
    if (lower == "mysql" || lower == "mariadb") {
        return OrmResult<BackendType>::ok(BackendType::MySQL);
    }
    if (lower == "postgres" || lower == "postgresql" || lower == "pgsql") {
        return OrmResult<BackendType>::ok(BackendType::PostgreSQL);
    }
    if (lower == "mongodb" || lower == "mongo") {
        return OrmResult<BackendType>::ok(BackendType::MongoDB);
    }
    if (lower == "memory") {
        return OrmResult<BackendType>::ok(BackendType::Memory);
    }
    return OrmResult<BackendType>::err(
        OrmError(ErrorCode::UnknownBackend,
                 "unsupported database type '" + std::string(tag) + "'"));
}

std::string_view backendName(BackendType type) noexcept {
    switch (type) {
        case BackendType::MySQL:      return "mysql";
        case BackendType::PostgreSQL: return "postgres";
        case BackendType::MongoDB:    return "mongodb";
        case BackendType::Memory:     return "memory";
    }
    return "unknown";
}

BackendFamily backendFamily(BackendType type) noexcept {
    return type == BackendType::MongoDB ? BackendFamily::Document
                                        : BackendFamily::Relational;
}

uint16_t defaultPort(BackendType type) noexcept {
    switch (type) {
        case BackendType::MySQL:      return 3306;
        case BackendType::PostgreSQL: return 5432;
        case BackendType::MongoDB:    return 27017;
        case BackendType::Memory:     return 0;
    }
    return 0;
}

OrmResult<void> validateConfig(const DatabaseConfig& config) {
    if (config.pool.max == 0) {
        return invalid("pool.max must be at least 1");
    }
    if (config.pool.min > config.pool.max) {
        return invalid("pool.min (" + std::to_string(config.pool.min) +
                       ") exceeds pool.max (" + std::to_string(config.pool.max) + ")");
    }

    if (!config.url.empty()) {
        bool mongoUrl = startsWith(config.url, "mongodb://") ||
                        startsWith(config.url, "mongodb+srv://");
        if (config.type == BackendType::MongoDB && !mongoUrl) {
            return invalid("mongodb backend requires a mongodb:// url");
        }
        if (config.type != BackendType::MongoDB && mongoUrl) {
            return invalid("a mongodb url cannot be used with the " +
                           std::string(backendName(config.type)) + " backend");
        }
        return OrmResult<void>::ok();
    }

    if (config.type != BackendType::Memory && config.database.empty()) {
        return invalid("database name is required for the " +
                       std::string(backendName(config.type)) + " backend");
    }
    return OrmResult<void>::ok();
}

std::string buildConnectionString(const DatabaseConfig& config) {
    if (!config.url.empty()) {
        return config.url;
    }

    auto port = config.port != 0 ? config.port : defaultPort(config.type);
    std::ostringstream oss;
    switch (config.type) {
        case BackendType::PostgreSQL:
            oss << "host=" << config.host << " port=" << port
                << " dbname=" << config.database;
            if (!config.username.empty()) {
                oss << " user=" << config.username;
            }
            if (!config.password.empty()) {
                oss << " password=" << config.password;
            }
            oss << " connect_timeout=" << config.connectionTimeout.count();
            if (config.ssl) {
                oss << " sslmode=require";
            }
            break;
        case BackendType::MySQL:
            oss << "host=" << config.host << " port=" << port
                << " database=" << config.database;
            if (!config.username.empty()) {
                oss << " user=" << config.username;
            }
            if (!config.password.empty()) {
                oss << " password=" << config.password;
            }
            if (config.ssl) {
                oss << " ssl=true";
            }
            break;
        case BackendType::MongoDB:
            oss << "mongodb://";
            if (!config.username.empty()) {
                oss << config.username;
                if (!config.password.empty()) {
                    oss << ':' << config.password;
                }
                oss << '@';
            }
            oss << config.host << ':' << port << '/' << config.database;
            if (config.ssl) {
                oss << "?tls=true";
            }
            break;
        case BackendType::Memory:
            oss << "memory:" << config.database;
            break;
    }
    return oss.str();
}

OrmResult<DatabaseConfig> loadDatabaseConfig(const ConfigManager& manager,
                                             std::string_view prefix) {
    auto key = [&](std::string_view name) {
        std::string k(prefix);
        if (!k.empty()) {
            k += '.';
        }
        k += name;
        return k;
    };

    auto typeTag = manager.get<std::string>(key("type"));
    if (typeTag.hasError()) {
        return OrmResult<DatabaseConfig>::err(typeTag.error());
    }
    auto type = parseBackendType(typeTag.value());
    if (type.hasError()) {
        return OrmResult<DatabaseConfig>::err(type.error());
    }

    DatabaseConfig config;
    config.type = type.value();

    // Each optional key keeps its default when absent but must parse when present.
    auto host = manager.getOr<std::string>(key("host"), config.host);
    auto port = manager.getOr<uint16_t>(key("port"), config.port);
    auto database = manager.getOr<std::string>(key("database"), config.database);
    auto username = manager.getOr<std::string>(key("username"), config.username);
    auto password = manager.getOr<std::string>(key("password"), config.password);
    auto ssl = manager.getOr<bool>(key("ssl"), config.ssl);
    auto url = manager.getOr<std::string>(key("url"), config.url);
    auto poolMin = manager.getOr<uint32_t>(key("pool.min"), config.pool.min);
    auto poolMax = manager.getOr<uint32_t>(key("pool.max"), config.pool.max);
    auto timeout = manager.getOr<int64_t>(key("timeout"), config.connectionTimeout.count());

    for (const auto* err : {host.hasError() ? &host.error() : nullptr,
                            database.hasError() ? &database.error() : nullptr,
                            username.hasError() ? &username.error() : nullptr,
                            password.hasError() ? &password.error() : nullptr,
                            url.hasError() ? &url.error() : nullptr}) {
        if (err) {
            return OrmResult<DatabaseConfig>::err(*err);
        }
    }
    if (port.hasError()) {
        return OrmResult<DatabaseConfig>::err(port.error());
    }
    if (ssl.hasError()) {
        return OrmResult<DatabaseConfig>::err(ssl.error());
    }
    if (poolMin.hasError()) {
        return OrmResult<DatabaseConfig>::err(poolMin.error());
    }
    if (poolMax.hasError()) {
        return OrmResult<DatabaseConfig>::err(poolMax.error());
    }
    if (timeout.hasError()) {
        return OrmResult<DatabaseConfig>::err(timeout.error());
    }

    config.host = host.value();
    config.port = port.value();
    config.database = database.value();
    config.username = username.value();
    config.password = password.value();
    config.ssl = ssl.value();
    config.url = url.value();
    config.pool.min = poolMin.value();
    config.pool.max = poolMax.value();
    config.connectionTimeout = std::chrono::seconds(timeout.value());

    auto valid = validateConfig(config);
    if (valid.hasError()) {
        return OrmResult<DatabaseConfig>::err(valid.error());
    }
    return OrmResult<DatabaseConfig>::ok(std::move(config));
}

} // namespace quarry::db
