#pragma once

/// @file orm_error.hpp
/// @brief Error type used with Result<T, OrmError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "quarry/foundation/error_code.hpp"

namespace quarry::foundation {

/// Structured context attached to errors raised below the model layer.
///
/// Carries enough detail for a caller to build an actionable message
/// without re-deriving which backend and statement failed.
struct ErrorDetail {
    std::string backend;    ///< Backend tag ("mysql", "postgres", ...).
    std::string operation;  ///< Operation attempted ("select", "insert", ...).
    std::string table;      ///< Target table or collection.
    std::string column;     ///< Offending column, if any.
    std::string op;         ///< Offending operator, if any.
};

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data.
class OrmError {
public:
    OrmError() = default;

    explicit OrmError(ErrorCode code)
        : code_(code) {}

    OrmError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    OrmError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Shorthand for context<ErrorDetail>().
    [[nodiscard]] const ErrorDetail* detail() const noexcept {
        return context<ErrorDetail>();
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// Message prefixed with subsystem and backend, e.g.
    /// "[Query/postgres] select on users: relation does not exist".
    [[nodiscard]] std::string describe() const {
        std::string out = "[";
        out += subsystem();
        if (const auto* d = detail(); d && !d->backend.empty()) {
            out += '/';
            out += d->backend;
        }
        out += "] ";
        if (const auto* d = detail(); d && !d->operation.empty()) {
            out += d->operation;
            if (!d->table.empty()) {
                out += " on ";
                out += d->table;
            }
            out += ": ";
        }
        out += message_;
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace quarry::foundation
