#pragma once

/// @file seeder.hpp
/// @brief Base class for database seeders.

#include <string>
#include <typeinfo>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/foundation/orm_result.hpp"

namespace quarry::orm {
class Database;
} // namespace quarry::orm

namespace quarry::schema {

using foundation::OrmResult;

/// Populates a database with fixture or reference data.
///
/// Example:
/// @code
///   class DatabaseSeeder : public Seeder {
///   public:
///       OrmResult<void> run(orm::Database& db) override {
///           if (auto r = call<UserSeeder>(db); r.hasError()) {
///               return r;
///           }
///           return call<PostSeeder>(db);
///       }
///   };
/// @endcode
class Seeder {
public:
    virtual ~Seeder() = default;

    [[nodiscard]] virtual OrmResult<void> run(orm::Database& db) = 0;

protected:
    /// Run another seeder type against the same database.
    template <typename S>
    [[nodiscard]] OrmResult<void> call(orm::Database& db) {
        S seeder;
        QUARRY_LOG_INFO(foundation::LogCategory::Migration,
                        std::string("seeding ") + typeid(S).name());
        return seeder.run(db);
    }
};

} // namespace quarry::schema
