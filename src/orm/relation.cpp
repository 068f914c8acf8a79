/// @file relation.cpp
/// @brief Relation naming and matching helpers.

#include "quarry/orm/relations/relation.hpp"

#include <map>
#include <set>

namespace quarry::orm {

namespace {

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ---------------------------------------------------------------------------
// Naming
// ---------------------------------------------------------------------------

std::string singularize(std::string_view table) {
    std::string word(table);
    if (endsWith(word, "ies") && word.size() > 3) {
        return word.substr(0, word.size() - 3) + "y";
    }
    for (std::string_view suffix : {"sses", "shes", "ches", "xes", "zes", "uses"}) {
        if (endsWith(word, suffix)) {
            return word.substr(0, word.size() - 2);
        }
    }
    if (endsWith(word, "s") && !endsWith(word, "ss") && word.size() > 1) {
        word.pop_back();
    }
    return word;
}

std::string foreignKeyFor(std::string_view table) {
    return singularize(table) + "_id";
}

std::string pivotTableFor(std::string_view first, std::string_view second) {
    auto a = singularize(first);
    auto b = singularize(second);
    if (b < a) {
        std::swap(a, b);
    }
    return a + "_" + b;
}

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

std::vector<DbValue> collectKeys(const std::vector<ModelBase*>& models, std::string_view key) {
    std::vector<DbValue> keys;
    std::set<std::string> seen;
    for (const auto* model : models) {
        auto value = model->getAttribute(key);
        auto normalized = db::normalizeKey(value);
        if (!normalized || !seen.insert(*normalized).second) {
            continue;
        }
        keys.push_back(std::move(value));
    }
    return keys;
}

void constrainToKeys(query::QueryBuilder& query, const std::string& column,
                     const std::vector<DbValue>& keys) {
    if (keys.size() == 1) {
        query.where(column, keys.front());
    } else {
        query.whereIn(column, keys);
    }
}

void matchByKey(const std::vector<ModelBase*>& parents, std::string_view parentKey,
                const std::vector<std::shared_ptr<const ModelBase>>& results,
                std::string_view resultKey, KeySource source, bool singular,
                const std::string& name) {
    std::map<std::string, std::vector<std::shared_ptr<const ModelBase>>> buckets;
    for (const auto& result : results) {
        DbValue key;
        if (source == KeySource::Pivot) {
            const auto& pivot = result->pivot();
            if (auto it = pivot.find(std::string(resultKey)); it != pivot.end()) {
                key = it->second;
            }
        } else {
            key = result->getAttribute(resultKey);
        }
        if (auto normalized = db::normalizeKey(key)) {
            buckets[*normalized].push_back(result);
        }
    }

    for (auto* parent : parents) {
        RelationValue value;
        value.many = !singular;
        if (auto normalized = db::normalizeKey(parent->getAttribute(parentKey))) {
            if (auto it = buckets.find(*normalized); it != buckets.end()) {
                if (singular) {
                    value.models.push_back(it->second.front());
                } else {
                    value.models = it->second;
                }
            }
        }
        parent->setRelation(name, std::move(value));
    }
}

} // namespace quarry::orm
