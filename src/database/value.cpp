/// @file value.cpp
/// @brief DbValue helpers: comparison, key normalization, JSON bridging.

#include "quarry/database/value.hpp"

#include <charconv>
#include <chrono>
#include <ctime>
#include <cmath>
#include <limits>

namespace quarry::db {

namespace {

std::string formatDouble(double d) {
    if (std::isfinite(d) && std::floor(d) == d &&
        std::fabs(d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::to_string(static_cast<std::int64_t>(d));
    }
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        return std::to_string(d);
    }
    return std::string(buf, end);
}

} // namespace

std::string_view typeName(const DbValue& value) noexcept {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "string";
        case 2: return "integer";
        case 3: return "double";
        case 4: return "boolean";
        case 5: return "json";
    }
    return "unknown";
}

std::string toDisplayString(const DbValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return formatDouble(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            return v.data.dump();
        }
    }, value);
}

std::optional<double> toNumber(const DbValue& value) noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    return std::nullopt;
}

int compareValues(const DbValue& a, const DbValue& b) {
    if (isNull(a) || isNull(b)) {
        return static_cast<int>(!isNull(a)) - static_cast<int>(!isNull(b));
    }

    auto na = toNumber(a);
    auto nb = toNumber(b);
    if (na && nb) {
        if (*na < *nb) return -1;
        if (*na > *nb) return 1;
        return 0;
    }

    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (sa && sb) {
        auto c = sa->compare(*sb);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }

    // Both JSON
    const auto& ja = std::get<JsonValue>(a).data;
    const auto& jb = std::get<JsonValue>(b).data;
    if (ja == jb) return 0;
    return ja < jb ? -1 : 1;
}

bool looselyEqual(const DbValue& a, const DbValue& b) {
    if (isNull(a) || isNull(b)) {
        return isNull(a) && isNull(b);
    }
    auto na = toNumber(a);
    auto nb = toNumber(b);
    if (na && nb) {
        return *na == *nb;
    }
    return a == b;
}

std::optional<std::string> normalizeKey(const DbValue& value) {
    return std::visit([](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return formatDouble(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "1" : "0");
        } else {
            return v.data.dump();
        }
    }, value);
}

Json toJson(const DbValue& value) {
    return std::visit([](const auto& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return Json(nullptr);
        } else if constexpr (std::is_same_v<T, JsonValue>) {
            return v.data;
        } else {
            return Json(v);
        }
    }, value);
}

DbValue fromJson(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return DbNull{};
        case Json::value_t::string:
            return json.get<std::string>();
        case Json::value_t::boolean:
            return json.get<bool>();
        case Json::value_t::number_integer:
            return json.get<std::int64_t>();
        case Json::value_t::number_unsigned:
            return static_cast<std::int64_t>(json.get<std::uint64_t>());
        case Json::value_t::number_float:
            return json.get<double>();
        default:
            return JsonValue{json};
    }
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace quarry::db
