#pragma once

/// @file orm_result.hpp
/// @brief OrmResult<T> type alias for data-access error handling.

#include "quarry/core/result.hpp"
#include "quarry/foundation/orm_error.hpp"

namespace quarry::foundation {

/// Result type specialized with OrmError.
///
/// Example:
/// @code
///   OrmResult<std::uint64_t> countActive(Database& db) {
///       return db.table("users").where("active", true).count();
///   }
/// @endcode
template <typename T>
using OrmResult = quarry::Result<T, OrmError>;

/// Build an error result with structured detail attached.
template <typename T>
OrmResult<T> failWith(ErrorCode code, std::string message, ErrorDetail detail) {
    return OrmResult<T>::err(OrmError(code, std::move(message), std::move(detail)));
}

}  // namespace quarry::foundation
