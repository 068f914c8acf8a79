/// @file document_filter.cpp
/// @brief Predicate and row translation for the document backend.

#include "quarry/database/document_filter.hpp"

#include <cctype>
#include <charconv>

namespace quarry::db::document {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::OrmResult;

namespace {

template <typename T>
OrmResult<T> unsupported(ErrorCode code, std::string message, std::string_view operation,
                         std::string_view column = {}, std::string_view op = {}) {
    ErrorDetail detail;
    detail.backend = "mongodb";
    detail.operation = std::string(operation);
    detail.column = std::string(column);
    detail.op = std::string(op);
    return foundation::failWith<T>(code, std::move(message), std::move(detail));
}

bool isKeyField(std::string_view field) {
    return field == "_id" ||
           (field.size() > 4 && field.substr(field.size() - 4) == "._id");
}

OrmResult<Json> compileCondition(const Predicate& p);

OrmResult<Json> compileList(const std::vector<Predicate>& wheres) {
    // Split into OR-separated runs of AND-ed conditions.
    std::vector<Json> segments;
    Json current = Json::array();

    for (const auto& p : wheres) {
        auto cond = compileCondition(p);
        if (cond.hasError()) {
            return cond;
        }
        if (cond.value().is_object() && cond.value().empty()) {
            continue;
        }
        if (p.boolean == Boolean::Or && !current.empty()) {
            segments.push_back(std::move(current));
            current = Json::array();
        }
        current.push_back(std::move(cond.value()));
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }

    auto collapse = [](Json& conditions) -> Json {
        if (conditions.size() == 1) {
            return std::move(conditions[0]);
        }
        return Json{{"$and", std::move(conditions)}};
    };

    if (segments.empty()) {
        return OrmResult<Json>::ok(Json::object());
    }
    if (segments.size() == 1) {
        return OrmResult<Json>::ok(collapse(segments[0]));
    }
    Json anyOf = Json::array();
    for (auto& segment : segments) {
        anyOf.push_back(collapse(segment));
    }
    return OrmResult<Json>::ok(Json{{"$or", std::move(anyOf)}});
}

OrmResult<Json> compileCondition(const Predicate& p) {
    if (p.op == Operator::Group) {
        return compileList(p.nested);
    }
    if (p.op == Operator::Raw) {
        return unsupported<Json>(ErrorCode::UnsupportedOperator,
                                 "raw predicates are not supported on mongodb", "where",
                                 p.column, "raw");
    }

    auto field = fieldName(p.column);
    auto encode = [&](const DbValue& v) { return encodeValue(field, v); };
    auto condition = [&](std::string_view op, Json value) {
        return OrmResult<Json>::ok(Json{{field, Json{{std::string(op), std::move(value)}}}});
    };

    switch (p.op) {
        case Operator::Equal:
            // Explicit $eq keeps an object value from being read as an operator.
            return condition("$eq", encode(p.value));
        case Operator::NotEqual:
            return condition("$ne", encode(p.value));
        case Operator::Greater:
            return condition("$gt", encode(p.value));
        case Operator::Less:
            return condition("$lt", encode(p.value));
        case Operator::GreaterEqual:
            return condition("$gte", encode(p.value));
        case Operator::LessEqual:
            return condition("$lte", encode(p.value));
        case Operator::Like:
        case Operator::NotLike: {
            const auto* pattern = std::get_if<std::string>(&p.value);
            if (!pattern) {
                return unsupported<Json>(ErrorCode::InvalidQuery, "LIKE requires a string pattern",
                                         "where", p.column, "like");
            }
            Json regex{{"$regex", likeToRegex(*pattern)}, {"$options", "i"}};
            if (p.op == Operator::NotLike) {
                return condition("$not", std::move(regex));
            }
            return OrmResult<Json>::ok(Json{{field, std::move(regex)}});
        }
        case Operator::In:
        case Operator::NotIn: {
            Json list = Json::array();
            for (const auto& v : p.values) {
                list.push_back(encode(v));
            }
            return condition(p.op == Operator::In ? "$in" : "$nin", std::move(list));
        }
        case Operator::Between: {
            if (p.values.size() != 2) {
                return unsupported<Json>(ErrorCode::InvalidQuery,
                                         "BETWEEN requires exactly two values", "where", p.column,
                                         "between");
            }
            return OrmResult<Json>::ok(
                Json{{field, Json{{"$gte", encode(p.values[0])}, {"$lte", encode(p.values[1])}}}});
        }
        case Operator::IsNull:
            return OrmResult<Json>::ok(Json{{field, nullptr}});
        case Operator::IsNotNull:
            return condition("$ne", nullptr);
        case Operator::Raw:
        case Operator::Group:
            break;
    }
    return unsupported<Json>(ErrorCode::UnsupportedOperator, "unsupported operator", "where",
                             p.column, operatorSymbol(p.op));
}

DbValue decodeField(const Json& value) {
    if (value.is_object() && value.size() == 1) {
        if (auto it = value.find("$oid"); it != value.end() && it->is_string()) {
            return it->get<std::string>();
        }
        if (auto it = value.find("$date"); it != value.end()) {
            if (it->is_string()) {
                return it->get<std::string>();
            }
            if (it->is_number_integer()) {
                return it->get<std::int64_t>();
            }
            if (it->is_object()) {
                if (auto n = it->find("$numberLong"); n != it->end() && n->is_string()) {
                    return decodeField(Json{{"$numberLong", *n}});
                }
            }
        }
        if (auto it = value.find("$numberLong"); it != value.end() && it->is_string()) {
            const auto& s = it->get_ref<const std::string&>();
            std::int64_t n = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
            if (ec == std::errc()) {
                return n;
            }
            return s;
        }
        if (auto it = value.find("$numberDecimal"); it != value.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fromJson(value);
}

} // namespace

bool isObjectId(std::string_view text) noexcept {
    if (text.size() != 24) {
        return false;
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string fieldName(std::string_view column) {
    if (column == "id") {
        return "_id";
    }
    return std::string(column);
}

Json encodeValue(std::string_view field, const DbValue& value) {
    if (isKeyField(field)) {
        if (const auto* s = std::get_if<std::string>(&value); s && isObjectId(*s)) {
            return Json{{"$oid", *s}};
        }
    }
    return toJson(value);
}

std::string likeToRegex(std::string_view pattern) {
    std::string out = "^";
    for (char c : pattern) {
        switch (c) {
            case '%':
                out += ".*";
                break;
            case '_':
                out += '.';
                break;
            case '.': case '*': case '+': case '?': case '^': case '$':
            case '(': case ')': case '[': case ']': case '{': case '}':
            case '|': case '\\':
                out += '\\';
                out += c;
                break;
            default:
                out += c;
        }
    }
    out += '$';
    return out;
}

OrmResult<Json> compileFilter(const std::vector<Predicate>& wheres) {
    return compileList(wheres);
}

Json compileSort(const std::vector<OrderClause>& orders) {
    Json sort = Json::object();
    for (const auto& o : orders) {
        sort[fieldName(o.column)] = o.direction == Direction::Desc ? -1 : 1;
    }
    return sort;
}

OrmResult<Json> compileProjection(const std::vector<std::string>& columns) {
    Json projection = Json::object();
    for (const auto& column : columns) {
        auto [name, alias] = splitColumnAlias(column);
        if (!alias.empty()) {
            return unsupported<Json>(ErrorCode::UnsupportedOperation,
                                     "column aliases are not supported on mongodb", "select",
                                     column);
        }
        if (name == "*") {
            return OrmResult<Json>::ok(Json::object());
        }
        projection[fieldName(name)] = 1;
    }
    return OrmResult<Json>::ok(std::move(projection));
}

Json toDocument(const Row& row) {
    Json doc = Json::object();
    for (const auto& [column, value] : row) {
        auto field = fieldName(column);
        if (field == "_id" && isNull(value)) {
            continue;
        }
        doc[field] = encodeValue(field, value);
    }
    return doc;
}

Json compileUpdate(const Row& values) {
    Json set = toDocument(values);
    set.erase("_id");
    return Json{{"$set", std::move(set)}};
}

Row fromDocument(const Json& document) {
    Row row;
    if (!document.is_object()) {
        return row;
    }
    for (const auto& [key, value] : document.items()) {
        row[key] = decodeField(value);
    }
    if (auto it = row.find("_id"); it != row.end()) {
        row["id"] = it->second;
    }
    return row;
}

OrmResult<Json> compileAggregatePipeline(const std::vector<Predicate>& wheres,
                                         AggregateFunction fn, std::string_view column) {
    auto filter = compileFilter(wheres);
    if (filter.hasError()) {
        return filter;
    }

    Json accumulator;
    auto field = "$" + fieldName(column);
    switch (fn) {
        case AggregateFunction::Count: accumulator = Json{{"$sum", 1}}; break;
        case AggregateFunction::Sum:   accumulator = Json{{"$sum", field}}; break;
        case AggregateFunction::Avg:   accumulator = Json{{"$avg", field}}; break;
        case AggregateFunction::Min:   accumulator = Json{{"$min", field}}; break;
        case AggregateFunction::Max:   accumulator = Json{{"$max", field}}; break;
    }

    Json pipeline = Json::array();
    if (!filter.value().empty()) {
        pipeline.push_back(Json{{"$match", filter.value()}});
    }
    pipeline.push_back(Json{{"$group", Json{{"_id", nullptr}, {"aggregate", accumulator}}}});
    return OrmResult<Json>::ok(std::move(pipeline));
}

} // namespace quarry::db::document
