#pragma once

/// @file value.hpp
/// @brief Backend-neutral column values, rows and key normalization.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace quarry::db {

using Json = nlohmann::json;

/// Sentinel type representing SQL NULL / a missing document field.
struct DbNull {
    bool operator==(const DbNull&) const noexcept { return true; }
};

/// Structured value (JSON column, embedded document, array).
///
/// Construction from nlohmann::json is implicit so a Json can be assigned
/// straight into a DbValue; literals never convert to it.
struct JsonValue {
    Json data;

    JsonValue() = default;
    JsonValue(Json value) : data(std::move(value)) {}

    bool operator==(const JsonValue& other) const { return data == other.data; }
};

/// A single column value.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool, JsonValue>;

/// A single row or document: column name -> value.
using Row = std::map<std::string, DbValue>;

/// Complete result set.
using QueryResult = std::vector<Row>;

[[nodiscard]] inline bool isNull(const DbValue& value) noexcept {
    return std::holds_alternative<DbNull>(value);
}

/// Name of the held alternative ("null", "string", "integer", ...).
[[nodiscard]] std::string_view typeName(const DbValue& value) noexcept;

/// Human-readable rendering used in messages and logs. Strings are not
/// quoted; JSON renders as its compact dump.
[[nodiscard]] std::string toDisplayString(const DbValue& value);

/// Numeric view of integers, doubles and booleans.
[[nodiscard]] std::optional<double> toNumber(const DbValue& value) noexcept;

/// Three-way comparison with numeric promotion across integer, double and
/// boolean. Null sorts before everything; values of unrelated types order
/// by type index. Returns <0, 0 or >0.
[[nodiscard]] int compareValues(const DbValue& a, const DbValue& b);

/// Equality with numeric promotion (42 == 42.0), strict otherwise.
[[nodiscard]] bool looselyEqual(const DbValue& a, const DbValue& b);

/// Normalize a join-key value for dictionary matching.
///
/// Rule: null never matches (nullopt); integers render in decimal;
/// doubles with an integral value render as that integer, others in
/// shortest round-trip form; strings are kept verbatim; booleans render
/// as "1"/"0"; JSON renders as its compact dump. As a result 42, 42.0
/// and "42" share one key.
[[nodiscard]] std::optional<std::string> normalizeKey(const DbValue& value);

/// Convert to JSON (null, string, number, bool, nested).
[[nodiscard]] Json toJson(const DbValue& value);

/// Convert from JSON; objects and arrays become JsonValue, unsigned
/// integers are narrowed to int64.
[[nodiscard]] DbValue fromJson(const Json& json);

/// Current UTC time formatted as "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::string currentTimestamp();

/// Typed accessor; nullopt when the value holds another alternative.
template <typename T>
[[nodiscard]] std::optional<T> valueAs(const DbValue& value) {
    if (const auto* p = std::get_if<T>(&value)) {
        return *p;
    }
    return std::nullopt;
}

} // namespace quarry::db
