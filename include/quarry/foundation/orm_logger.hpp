#pragma once

/// @file orm_logger.hpp
/// @brief OrmLogger wrapping kcenon logger interfaces for categorized
///        data-access logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "quarry/foundation/orm_result.hpp"

namespace quarry::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for the data-access layer.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Library setup, factory, config
    Connection = 1, ///< Connect, disconnect, pool
    Query      = 2, ///< Compiled statements and filters
    Schema     = 3, ///< DDL issued through Schema/Blueprint
    Migration  = 4, ///< Migration runner
    Model      = 5  ///< Hydration, relations, casts
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Connection", "Query", "Schema", "Migration", "Model"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.backend = "postgres";
///   ctx.table = "users";
///   ctx.extra["bindings"] = "2";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Query, sql, ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> backend;
    std::optional<std::string> table;
    std::optional<std::string> migration;
    std::unordered_map<std::string, std::string> extra;
};

/// Categorized logger over kcenon's logger registry.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Connection | Info          |
/// | Query      | Warning       |
/// | Schema     | Info          |
/// | Migration  | Info          |
/// | Model      | Warning       |
///
/// Statement logging is noisy, so Query starts at Warning; lower it with
/// setCategoryLevel(LogCategory::Query, LogLevel::Debug) to trace SQL.
class OrmLogger {
public:
    OrmLogger();
    ~OrmLogger();

    OrmLogger(const OrmLogger&) = delete;
    OrmLogger& operator=(const OrmLogger&) = delete;
    OrmLogger(OrmLogger&&) noexcept;
    OrmLogger& operator=(OrmLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    OrmResult<void> flush();

    /// Process-wide logger instance.
    static OrmLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quarry::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name QUARRY_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// QUARRY_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef QUARRY_MIN_LOG_LEVEL
    #define QUARRY_MIN_LOG_LEVEL 0
#endif

#define QUARRY_LOG(level, cat, msg)                                                    \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= QUARRY_MIN_LOG_LEVEL &&                         \
            ::quarry::foundation::OrmLogger::instance().isEnabled((level), (cat)))     \
        {                                                                              \
            ::quarry::foundation::OrmLogger::instance().log((level), (cat), (msg));    \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define QUARRY_LOG_DEBUG(cat, msg) \
    QUARRY_LOG(::quarry::foundation::LogLevel::Debug, (cat), (msg))

#define QUARRY_LOG_INFO(cat, msg) \
    QUARRY_LOG(::quarry::foundation::LogLevel::Info, (cat), (msg))

#define QUARRY_LOG_WARN(cat, msg) \
    QUARRY_LOG(::quarry::foundation::LogLevel::Warning, (cat), (msg))

#define QUARRY_LOG_ERROR(cat, msg) \
    QUARRY_LOG(::quarry::foundation::LogLevel::Error, (cat), (msg))

/// @}
