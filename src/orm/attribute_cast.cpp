/// @file attribute_cast.cpp
/// @brief Cast conversions.

#include "quarry/orm/attribute_cast.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <string>

namespace quarry::orm {

using db::DbNull;
using db::DbValue;
using db::Json;
using db::JsonValue;
using foundation::ErrorCode;
using foundation::OrmError;
using foundation::OrmResult;

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

OrmResult<DbValue> castError(CastType type, const DbValue& value) {
    return OrmResult<DbValue>::err(
        OrmError(ErrorCode::CastFailed, "cannot cast " + std::string(db::typeName(value)) +
                                            " '" + db::toDisplayString(value) + "' to " +
                                            std::string(castName(type))));
}

template <typename T>
bool parseWhole(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool readDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expectChar(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

int daysInMonth(int year, int month) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30,
                                                  31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : kDays[static_cast<std::size_t>(month - 1)];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const auto doy = static_cast<unsigned>((153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1);
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::string formatEpoch(std::int64_t seconds) {
    auto t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace

OrmResult<CastType> parseCastType(std::string_view name) {
    static const std::array<std::pair<std::string_view, CastType>, 14> kNames = {{
        {"int", CastType::Integer},
        {"integer", CastType::Integer},
        {"float", CastType::Float},
        {"double", CastType::Float},
        {"real", CastType::Float},
        {"bool", CastType::Boolean},
        {"boolean", CastType::Boolean},
        {"string", CastType::String},
        {"json", CastType::Json},
        {"array", CastType::Json},
        {"object", CastType::Json},
        {"datetime", CastType::DateTime},
        {"date", CastType::DateTime},
        {"timestamp", CastType::DateTime},
    }};
    auto key = lower(name);
    for (const auto& [n, type] : kNames) {
        if (n == key) {
            return OrmResult<CastType>::ok(type);
        }
    }
    return OrmResult<CastType>::err(
        OrmError(ErrorCode::CastFailed, "unknown cast type '" + std::string(name) + "'"));
}

std::string_view castName(CastType type) noexcept {
    switch (type) {
        case CastType::Integer:  return "integer";
        case CastType::Float:    return "float";
        case CastType::Boolean:  return "boolean";
        case CastType::String:   return "string";
        case CastType::Json:     return "json";
        case CastType::DateTime: return "datetime";
    }
    return "unknown";
}

OrmResult<std::string> normalizeDateTime(std::string_view text) {
    auto invalid = [&] {
        return OrmResult<std::string>::err(
            OrmError(ErrorCode::CastFailed, "invalid date/time '" + std::string(text) + "'"));
    };

    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return invalid();
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') {
            return invalid();
        }
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
            !readDigits(text, pos, 2, minute) || !expectChar(text, pos, ':') ||
            !readDigits(text, pos, 2, second)) {
            return invalid();
        }
        // Fractional seconds are accepted and dropped.
        if (pos < text.size() && text[pos] == '.') {
            std::size_t digits = ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            if (pos == digits) {
                return invalid();
            }
        }
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offsetHours = 0, offsetMinutes = 0;
            if (!readDigits(text, pos, 2, offsetHours)) {
                return invalid();
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!readDigits(text, pos, 2, offsetMinutes) || offsetHours > 23 ||
                offsetMinutes > 59) {
                return invalid();
            }
            offsetSeconds = sign * (offsetHours * 3600 + offsetMinutes * 60);
        }
        if (pos != text.size()) {
            return invalid();
        }
    }

    if (year <= 0 || month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return invalid();
    }

    if (offsetSeconds != 0) {
        // Stored values are UTC wall time.
        std::int64_t epoch = daysFromCivil(year, month, day) * 86400 + hour * 3600 +
                             minute * 60 + second - offsetSeconds;
        return OrmResult<std::string>::ok(formatEpoch(epoch));
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour,
                  minute, second);
    return OrmResult<std::string>::ok(buf);
}

OrmResult<DbValue> castAttribute(CastType type, const DbValue& value) {
    if (db::isNull(value)) {
        return OrmResult<DbValue>::ok(DbNull{});
    }

    switch (type) {
        case CastType::Integer: {
            if (const auto* i = std::get_if<std::int64_t>(&value)) {
                return OrmResult<DbValue>::ok(*i);
            }
            if (const auto* d = std::get_if<double>(&value)) {
                if (!std::isfinite(*d)) {
                    return castError(type, value);
                }
                return OrmResult<DbValue>::ok(static_cast<std::int64_t>(std::trunc(*d)));
            }
            if (const auto* b = std::get_if<bool>(&value)) {
                return OrmResult<DbValue>::ok(std::int64_t{*b ? 1 : 0});
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                std::int64_t parsed = 0;
                if (parseWhole(*s, parsed)) {
                    return OrmResult<DbValue>::ok(parsed);
                }
            }
            return castError(type, value);
        }
        case CastType::Float: {
            if (auto n = db::toNumber(value)) {
                return OrmResult<DbValue>::ok(*n);
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                double parsed = 0.0;
                if (parseWhole(*s, parsed)) {
                    return OrmResult<DbValue>::ok(parsed);
                }
            }
            return castError(type, value);
        }
        case CastType::Boolean: {
            if (const auto* b = std::get_if<bool>(&value)) {
                return OrmResult<DbValue>::ok(*b);
            }
            if (auto n = db::toNumber(value)) {
                return OrmResult<DbValue>::ok(*n != 0.0);
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                auto text = lower(*s);
                if (text == "1" || text == "true" || text == "t" || text == "yes") {
                    return OrmResult<DbValue>::ok(true);
                }
                if (text == "0" || text == "false" || text == "f" || text == "no" ||
                    text.empty()) {
                    return OrmResult<DbValue>::ok(false);
                }
            }
            return castError(type, value);
        }
        case CastType::String: {
            if (const auto* s = std::get_if<std::string>(&value)) {
                return OrmResult<DbValue>::ok(*s);
            }
            return OrmResult<DbValue>::ok(db::toDisplayString(value));
        }
        case CastType::Json: {
            if (const auto* j = std::get_if<JsonValue>(&value)) {
                return OrmResult<DbValue>::ok(*j);
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                auto parsed = Json::parse(*s, nullptr, false);
                if (parsed.is_discarded()) {
                    return castError(type, value);
                }
                return OrmResult<DbValue>::ok(JsonValue(std::move(parsed)));
            }
            return OrmResult<DbValue>::ok(JsonValue(db::toJson(value)));
        }
        case CastType::DateTime: {
            if (const auto* s = std::get_if<std::string>(&value)) {
                auto normalized = normalizeDateTime(*s);
                if (normalized.hasError()) {
                    return castError(type, value);
                }
                return OrmResult<DbValue>::ok(std::move(normalized).value());
            }
            if (const auto* i = std::get_if<std::int64_t>(&value)) {
                return OrmResult<DbValue>::ok(formatEpoch(*i));
            }
            return castError(type, value);
        }
    }
    return castError(type, value);
}

} // namespace quarry::orm
