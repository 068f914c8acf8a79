#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the data-access layer.

#include <cstdint>
#include <string_view>

namespace quarry::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Connection (0x0100 - 0x01FF)
    ConnectionError = 0x0100,
    ConnectionFailed = 0x0101,
    NotConnected = 0x0102,
    ConnectionPoolExhausted = 0x0103,
    ConnectionPoolTimeout = 0x0104,
    AuthenticationFailed = 0x0105,

    // Query (0x0200 - 0x02FF)
    QueryError = 0x0200,
    QueryFailed = 0x0201,
    UniqueViolation = 0x0202,
    UnsupportedOperator = 0x0203,
    UnsupportedOperation = 0x0204,
    TransactionFailed = 0x0205,
    InvalidQuery = 0x0206,

    // Model (0x0300 - 0x03FF)
    ModelError = 0x0300,
    ModelNotFound = 0x0301,
    CastFailed = 0x0302,

    // Schema (0x0400 - 0x04FF)
    SchemaError = 0x0400,
    MigrationFailed = 0x0401,
    InvalidMigrationName = 0x0402,
    MigrationNotFound = 0x0403,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    UnknownBackend = 0x0603,
    InvalidConfiguration = 0x0604,
    RelationNotDefined = 0x0605,
    MacroNotDefined = 0x0606,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Connection";
        case 0x0200: return "Query";
        case 0x0300: return "Model";
        case 0x0400: return "Schema";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for codes that belong to the configuration taxonomy
/// (unknown backend, bad config, undeclared relation or macro).
constexpr bool isConfigurationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0600;
}

/// True for codes that belong to the connection taxonomy.
constexpr bool isConnectionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0100;
}

} // namespace quarry::foundation
