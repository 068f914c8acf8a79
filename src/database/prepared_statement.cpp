/// @file prepared_statement.cpp
/// @brief Placeholder scanning and literal escaping for SQL backends.

#include "quarry/database/prepared_statement.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>

namespace quarry::db {

using foundation::ErrorCode;
using foundation::OrmError;
using foundation::OrmResult;

// ---------------------------------------------------------------------------
// Literal rendering
// ---------------------------------------------------------------------------

static std::string quoteString(SqlDialect dialect, std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    escaped += '\'';
    for (char c : text) {
        if (c == '\'') {
            escaped += "''";
        } else if (c == '\\' && dialect == SqlDialect::MySQL) {
            escaped += "\\\\";
        } else if (c == '\0' && dialect == SqlDialect::MySQL) {
            escaped += "\\0";
        } else {
            escaped += c;
        }
    }
    escaped += '\'';
    return escaped;
}

static std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "NULL";
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buf, end);
}

std::string sqlLiteral(SqlDialect dialect, const DbValue& value) {
    return std::visit([dialect](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quoteString(dialect, arg);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return formatDouble(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (dialect == SqlDialect::MySQL) {
                return arg ? "1" : "0";
            }
            return arg ? "TRUE" : "FALSE";
        } else {
            return quoteString(dialect, arg.data.dump());
        }
    }, value);
}

// ---------------------------------------------------------------------------
// Quote-aware scanner
// ---------------------------------------------------------------------------

namespace {

/// Walks SQL text, reporting each character together with whether it lies
/// inside a quoted literal or identifier.
class SqlScanner {
public:
    SqlScanner(SqlDialect dialect, std::string_view sql)
        : dialect_(dialect), sql_(sql) {}

    template <typename Fn>
    void run(Fn&& onCode) {
        char quote = 0;
        for (pos_ = 0; pos_ < sql_.size(); ++pos_) {
            char c = sql_[pos_];
            if (quote != 0) {
                out_ += c;
                if (c == '\\' && quote == '\'' && dialect_ == SqlDialect::MySQL &&
                    pos_ + 1 < sql_.size()) {
                    out_ += sql_[++pos_];
                } else if (c == quote) {
                    // Doubled quote inside a literal stays inside it.
                    if (pos_ + 1 < sql_.size() && sql_[pos_ + 1] == quote) {
                        out_ += sql_[++pos_];
                    } else {
                        quote = 0;
                    }
                }
                continue;
            }
            if (c == '\'' || c == '"' || c == '`') {
                quote = c;
                out_ += c;
                continue;
            }
            onCode(c);
        }
    }

    std::string& out() noexcept { return out_; }
    std::size_t& pos() noexcept { return pos_; }
    std::string_view sql() const noexcept { return sql_; }

private:
    SqlDialect dialect_;
    std::string_view sql_;
    std::string out_;
    std::size_t pos_ = 0;
};

} // namespace

std::string nativePlaceholders(SqlDialect dialect, std::string_view sql,
                               std::size_t firstIndex) {
    if (dialect == SqlDialect::MySQL) {
        return std::string(sql);
    }
    SqlScanner scanner(dialect, sql);
    std::size_t next = firstIndex;
    scanner.run([&](char c) {
        if (c == '?') {
            scanner.out() += '$';
            scanner.out() += std::to_string(next++);
        } else {
            scanner.out() += c;
        }
    });
    return std::move(scanner.out());
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(SqlDialect dialect, std::string sql,
                                     std::vector<DbValue> bindings)
    : dialect_(dialect), sql_(std::move(sql)), bindings_(std::move(bindings)) {}

PreparedStatement& PreparedStatement::bind(DbValue value) {
    bindings_.push_back(std::move(value));
    return *this;
}

OrmResult<std::string> PreparedStatement::resolve() const {
    SqlScanner scanner(dialect_, sql_);
    std::size_t used = 0;
    std::size_t maxIndex = 0;
    bool outOfRange = false;

    scanner.run([&](char c) {
        auto& out = scanner.out();
        auto& pos = scanner.pos();
        auto sql = scanner.sql();

        if (dialect_ == SqlDialect::MySQL && c == '?') {
            if (used < bindings_.size()) {
                out += sqlLiteral(dialect_, bindings_[used]);
            } else {
                outOfRange = true;
            }
            ++used;
            return;
        }

        if (dialect_ == SqlDialect::PostgreSQL && c == '$' && pos + 1 < sql.size() &&
            std::isdigit(static_cast<unsigned char>(sql[pos + 1]))) {
            std::size_t end = pos + 1;
            std::size_t index = 0;
            while (end < sql.size() && std::isdigit(static_cast<unsigned char>(sql[end]))) {
                index = index * 10 + static_cast<std::size_t>(sql[end] - '0');
                ++end;
            }
            if (index == 0 || index > bindings_.size()) {
                outOfRange = true;
            } else {
                out += sqlLiteral(dialect_, bindings_[index - 1]);
            }
            maxIndex = std::max(maxIndex, index);
            pos = end - 1;
            return;
        }

        out += c;
    });

    std::size_t expected = dialect_ == SqlDialect::MySQL ? used : maxIndex;
    if (outOfRange || expected != bindings_.size()) {
        return OrmResult<std::string>::err(
            OrmError(ErrorCode::InvalidQuery,
                     "statement has " + std::to_string(expected) + " placeholder(s) but " +
                         std::to_string(bindings_.size()) + " binding(s)"));
    }
    return OrmResult<std::string>::ok(std::move(scanner.out()));
}

void PreparedStatement::clearBindings() {
    bindings_.clear();
}

} // namespace quarry::db
