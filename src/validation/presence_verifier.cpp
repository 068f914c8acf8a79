/// @file presence_verifier.cpp
/// @brief PresenceVerifier implementation.

#include "quarry/validation/presence_verifier.hpp"

#include <set>

#include "quarry/orm/database.hpp"

namespace quarry::validation {

OrmResult<std::uint64_t> PresenceVerifier::getCount(std::string_view table, std::string column,
                                                    const DbValue& value,
                                                    const std::optional<DbValue>& excludeId,
                                                    std::string idColumn,
                                                    const Row& extra) const {
    auto query = db_->table(table);
    query.where(std::move(column), value);
    if (excludeId && !db::isNull(*excludeId)) {
        query.where(std::move(idColumn), "!=", *excludeId);
    }
    for (const auto& [key, expected] : extra) {
        if (db::isNull(expected)) {
            query.whereNull(key);
        } else {
            query.where(key, expected);
        }
    }
    return query.count();
}

OrmResult<std::uint64_t> PresenceVerifier::getMultiCount(std::string_view table,
                                                         std::string column,
                                                         const std::vector<DbValue>& values,
                                                         const Row& extra) const {
    if (values.empty()) {
        return OrmResult<std::uint64_t>::ok(0);
    }
    auto query = db_->table(table);
    query.whereIn(std::move(column), values);
    for (const auto& [key, expected] : extra) {
        query.where(key, expected);
    }
    return query.count();
}

OrmResult<bool> PresenceVerifier::isUnique(std::string_view table, std::string column,
                                           const DbValue& value,
                                           const std::optional<DbValue>& excludeId,
                                           std::string idColumn) const {
    auto count = getCount(table, std::move(column), value, excludeId, std::move(idColumn));
    if (count.hasError()) {
        return OrmResult<bool>::err(std::move(count).error());
    }
    return OrmResult<bool>::ok(count.value() == 0);
}

OrmResult<bool> PresenceVerifier::exists(std::string_view table, std::string column,
                                         const DbValue& value, const Row& extra) const {
    auto count = getCount(table, std::move(column), value, std::nullopt, "id", extra);
    if (count.hasError()) {
        return OrmResult<bool>::err(std::move(count).error());
    }
    return OrmResult<bool>::ok(count.value() > 0);
}

OrmResult<bool> PresenceVerifier::existsAll(std::string_view table, std::string column,
                                            const std::vector<DbValue>& values) const {
    std::set<std::string> seen;
    std::vector<DbValue> distinct;
    for (const auto& value : values) {
        auto key = db::normalizeKey(value);
        // Null is never present.
        if (!key) {
            return OrmResult<bool>::ok(false);
        }
        if (seen.insert(*key).second) {
            distinct.push_back(value);
        }
    }
    if (distinct.empty()) {
        return OrmResult<bool>::ok(true);
    }
    auto count = db_->table(table).whereIn(column, distinct).distinct().select({column}).count();
    if (count.hasError()) {
        return OrmResult<bool>::err(std::move(count).error());
    }
    return OrmResult<bool>::ok(count.value() >= distinct.size());
}

} // namespace quarry::validation
