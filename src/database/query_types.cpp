/// @file query_types.cpp
/// @brief Token parsing for operators, directions and aliases.

#include "quarry/database/query_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::OrmError;
using foundation::OrmResult;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Collapse runs of whitespace so "not   in" parses like "not in".
std::string collapseSpaces(std::string_view s) {
    std::string out;
    bool space = false;
    for (char c : trim(s)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = true;
            continue;
        }
        if (space && !out.empty()) {
            out += ' ';
        }
        space = false;
        out += c;
    }
    return out;
}

// Case-insensitive search for " as " outside of the leading token.
std::size_t findAsKeyword(const std::string& lower) {
    return lower.find(" as ");
}

} // namespace

OrmResult<Operator> parseOperator(std::string_view token) {
    static const std::array<std::pair<std::string_view, Operator>, 16> kTable = {{
        {"=", Operator::Equal},
        {"==", Operator::Equal},
        {"!=", Operator::NotEqual},
        {"<>", Operator::NotEqual},
        {">", Operator::Greater},
        {"<", Operator::Less},
        {">=", Operator::GreaterEqual},
        {"<=", Operator::LessEqual},
        {"like", Operator::Like},
        {"not like", Operator::NotLike},
        {"in", Operator::In},
        {"not in", Operator::NotIn},
        {"between", Operator::Between},
        {"is null", Operator::IsNull},
        {"is not null", Operator::IsNotNull},
        {"raw", Operator::Raw},
    }};

    auto normalized = toLower(collapseSpaces(token));
    for (const auto& [symbol, op] : kTable) {
        if (normalized == symbol) {
            return OrmResult<Operator>::ok(op);
        }
    }

    ErrorDetail detail;
    detail.operation = "where";
    detail.op = std::string(token);
    return OrmResult<Operator>::err(
        OrmError(ErrorCode::UnsupportedOperator,
                 "unsupported operator '" + std::string(token) + "'",
                 std::move(detail)));
}

std::string_view operatorSymbol(Operator op) noexcept {
    switch (op) {
        case Operator::Equal:        return "=";
        case Operator::NotEqual:     return "!=";
        case Operator::Greater:      return ">";
        case Operator::Less:         return "<";
        case Operator::GreaterEqual: return ">=";
        case Operator::LessEqual:    return "<=";
        case Operator::Like:         return "LIKE";
        case Operator::NotLike:      return "NOT LIKE";
        case Operator::In:           return "IN";
        case Operator::NotIn:        return "NOT IN";
        case Operator::Between:      return "BETWEEN";
        case Operator::IsNull:       return "IS NULL";
        case Operator::IsNotNull:    return "IS NOT NULL";
        case Operator::Raw:          return "RAW";
        case Operator::Group:        return "GROUP";
    }
    return "?";
}

OrmResult<Direction> parseDirection(std::string_view token) {
    auto lower = toLower(trim(token));
    if (lower == "asc") {
        return OrmResult<Direction>::ok(Direction::Asc);
    }
    if (lower == "desc") {
        return OrmResult<Direction>::ok(Direction::Desc);
    }
    return OrmResult<Direction>::err(
        OrmError(ErrorCode::InvalidQuery,
                 "order direction must be 'asc' or 'desc', got '" + std::string(token) + "'"));
}

TableRef parseTableRef(std::string_view expr) {
    auto text = collapseSpaces(expr);
    auto lower = toLower(text);

    TableRef ref;
    if (auto pos = findAsKeyword(lower); pos != std::string::npos) {
        ref.name = text.substr(0, pos);
        ref.alias = text.substr(pos + 4);
        return ref;
    }
    if (auto pos = text.find(' '); pos != std::string::npos) {
        ref.name = text.substr(0, pos);
        ref.alias = text.substr(pos + 1);
        return ref;
    }
    ref.name = text;
    return ref;
}

std::pair<std::string, std::string> splitColumnAlias(std::string_view expr) {
    auto text = collapseSpaces(expr);
    auto lower = toLower(text);
    if (auto pos = findAsKeyword(lower); pos != std::string::npos) {
        return {text.substr(0, pos), text.substr(pos + 4)};
    }
    return {text, std::string()};
}

std::string_view aggregateName(AggregateFunction fn) noexcept {
    switch (fn) {
        case AggregateFunction::Count: return "count";
        case AggregateFunction::Sum:   return "sum";
        case AggregateFunction::Avg:   return "avg";
        case AggregateFunction::Min:   return "min";
        case AggregateFunction::Max:   return "max";
    }
    return "count";
}

} // namespace quarry::db
