#pragma once

/// @file attribute_cast.hpp
/// @brief Attribute casts applied on hydration and before writes.

#include <cstdint>
#include <string_view>

#include "quarry/database/value.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::orm {

/// Semantic type of a model attribute.
enum class CastType : uint8_t {
    Integer,
    Float,
    Boolean,
    String,
    Json,      ///< Also registered as "array" and "object".
    DateTime   ///< Canonical form "YYYY-MM-DD HH:MM:SS" (UTC).
};

/// Parse a cast name: "int"/"integer", "float"/"double"/"real",
/// "bool"/"boolean", "string", "json"/"array"/"object", "datetime"/"date"/
/// "timestamp". Unknown names fail with CastFailed.
[[nodiscard]] foundation::OrmResult<CastType> parseCastType(std::string_view name);

[[nodiscard]] std::string_view castName(CastType type) noexcept;

/// Convert @p value to the semantic form of @p type.
///
/// Null passes through unchanged. The conversion is idempotent, so the
/// same function serves hydration and writes and
/// castAttribute(t, castAttribute(t, x)) == castAttribute(t, x).
/// Unconvertible input (e.g. "abc" as Integer) fails with CastFailed.
[[nodiscard]] foundation::OrmResult<db::DbValue> castAttribute(CastType type,
                                                               const db::DbValue& value);

/// Parse a date/time string ("YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS",
/// ISO 8601 with 'T', optional fraction, 'Z' or a "+HH:MM" offset) into
/// canonical UTC form. Trailing input and impossible dates are rejected.
[[nodiscard]] foundation::OrmResult<std::string> normalizeDateTime(std::string_view text);

} // namespace quarry::orm
