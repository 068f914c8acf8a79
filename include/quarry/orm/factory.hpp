#pragma once

/// @file factory.hpp
/// @brief Model factories producing fixture models from a default
///        attribute definition.

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/foundation/orm_result.hpp"
#include "quarry/orm/model.hpp"

namespace quarry::orm {

/// Builds models of type @p M from definition() merged with caller
/// overrides. Attributes go through fill(), so only fillable keys apply.
///
/// Each make() advances sequence(), which definitions can use to keep
/// unique columns distinct.
///
/// Example:
/// @code
///   class UserFactory : public Factory<User> {
///   public:
///       Row definition() override {
///           return {{"name", std::string("user")},
///                   {"email", "user" + std::to_string(sequence()) + "@example.com"}};
///       }
///   };
///
///   auto admins = UserFactory().count(3).createMany(db, {{"is_admin", true}});
/// @endcode
template <typename M>
class Factory {
public:
    virtual ~Factory() = default;

    /// Default attributes for one model.
    [[nodiscard]] virtual Row definition() = 0;

    /// Number of models the next createMany()/makeMany() call without an
    /// explicit count produces.
    Factory& count(std::size_t n) noexcept {
        count_ = n;
        return *this;
    }

    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    /// Number of models made so far, starting at 1 inside definition().
    [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }

    /// Unsaved model from definition() with @p overrides applied on top.
    [[nodiscard]] M make(const Row& overrides = {}) {
        ++sequence_;
        Row attributes = definition();
        for (const auto& [key, value] : overrides) {
            attributes[key] = value;
        }
        return M::make(attributes);
    }

    [[nodiscard]] std::vector<M> makeMany(const Row& overrides = {}) {
        return makeMany(count_, overrides);
    }

    [[nodiscard]] std::vector<M> makeMany(std::size_t n, const Row& overrides = {}) {
        std::vector<M> models;
        models.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            models.push_back(make(overrides));
        }
        return models;
    }

    /// Make and persist one model.
    [[nodiscard]] OrmResult<M> create(Database& db, const Row& overrides = {}) {
        M model = make(overrides);
        auto saved = model.save(db);
        if (saved.hasError()) {
            return OrmResult<M>::err(std::move(saved).error());
        }
        return OrmResult<M>::ok(std::move(model));
    }

    [[nodiscard]] OrmResult<std::vector<M>> createMany(Database& db, const Row& overrides = {}) {
        return createMany(db, count_, overrides);
    }

    /// Make and persist @p n models, stopping at the first failure.
    [[nodiscard]] OrmResult<std::vector<M>> createMany(Database& db, std::size_t n,
                                                       const Row& overrides = {}) {
        std::vector<M> models;
        models.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            auto created = create(db, overrides);
            if (created.hasError()) {
                return OrmResult<std::vector<M>>::err(std::move(created).error());
            }
            models.push_back(std::move(created).value());
        }
        QUARRY_LOG_DEBUG(foundation::LogCategory::Model,
                         "factory created " + std::to_string(n) + " " + M::metadata().table);
        return OrmResult<std::vector<M>>::ok(std::move(models));
    }

private:
    std::size_t count_ = 1;
    std::uint64_t sequence_ = 0;
};

} // namespace quarry::orm
