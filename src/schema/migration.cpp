/// @file migration.cpp
/// @brief SQL file migrations.

#include "quarry/schema/migration.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "quarry/foundation/orm_logger.hpp"
#include "quarry/orm/database.hpp"

namespace quarry::schema {

using foundation::ErrorCode;
using foundation::ErrorDetail;
using foundation::LogCategory;

namespace {

bool isBlank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::vector<std::string> splitStatements(std::string_view sql) {
    std::vector<std::string> statements;
    std::string current;
    char quote = 0;

    auto flush = [&] {
        if (!isBlank(current)) {
            statements.push_back(current);
        }
        current.clear();
    };

    for (std::size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];
        if (quote != 0) {
            current += c;
            if (c == quote) {
                // Doubled quote is an escaped quote.
                if (i + 1 < sql.size() && sql[i + 1] == quote) {
                    current += sql[++i];
                } else {
                    quote = 0;
                }
            }
            continue;
        }
        if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            while (i < sql.size() && sql[i] != '\n') {
                ++i;
            }
            current += '\n';
            continue;
        }
        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            auto end = sql.find("*/", i + 2);
            i = end == std::string_view::npos ? sql.size() : end + 1;
            current += ' ';
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            current += c;
            continue;
        }
        if (c == ';') {
            flush();
            continue;
        }
        current += c;
    }
    flush();
    return statements;
}

OrmResult<void> SqlFileMigration::runFile(orm::Database& db, const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        ErrorDetail detail;
        detail.operation = "migrate";
        detail.table = file.filename().string();
        return foundation::failWith<void>(ErrorCode::MigrationNotFound,
                                          "cannot read migration file " + file.string(),
                                          std::move(detail));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    for (const auto& statement : splitStatements(buffer.str())) {
        auto result = db.raw(statement);
        if (result.hasError()) {
            return OrmResult<void>::err(std::move(result).error());
        }
    }
    QUARRY_LOG_DEBUG(LogCategory::Migration, "ran " + file.filename().string());
    return OrmResult<void>::ok();
}

} // namespace quarry::schema
