/// @file blueprint.cpp
/// @brief Blueprint implementation.

#include "quarry/schema/blueprint.hpp"

namespace quarry::schema {

// ---------------------------------------------------------------------------
// ColumnBuilder
// ---------------------------------------------------------------------------

ColumnDefinition& ColumnBuilder::column() {
    return blueprint_->table_.columns[position_];
}

const ColumnDefinition& ColumnBuilder::definition() const {
    return blueprint_->table_.columns[position_];
}

ColumnBuilder& ColumnBuilder::nullable(bool value) {
    column().nullable = value;
    return *this;
}

ColumnBuilder& ColumnBuilder::defaultValue(DbValue value) {
    column().defaultValue = std::move(value);
    return *this;
}

ColumnBuilder& ColumnBuilder::useCurrent() {
    column().useCurrent = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::unique() {
    column().unique = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::primary() {
    column().primary = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::autoIncrement() {
    column().autoIncrement = true;
    column().primary = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::asUnsigned() {
    column().isUnsigned = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::index() {
    column().index = true;
    return *this;
}

ColumnBuilder& ColumnBuilder::constrained(std::string table, std::string referenced) {
    const auto& name = column().name;
    if (table.empty()) {
        auto base = name;
        if (base.size() > 3 && base.compare(base.size() - 3, 3, "_id") == 0) {
            base.resize(base.size() - 3);
        }
        table = base + "s";
    }
    db::ForeignKeyDefinition fk;
    fk.column = name;
    fk.referencesColumn = std::move(referenced);
    fk.onTable = std::move(table);
    foreignKey_ = blueprint_->table_.foreignKeys.size();
    blueprint_->table_.foreignKeys.push_back(std::move(fk));
    return *this;
}

ColumnBuilder& ColumnBuilder::cascadeOnDelete() {
    if (foreignKey_ < blueprint_->table_.foreignKeys.size()) {
        blueprint_->table_.foreignKeys[foreignKey_].onDelete = "cascade";
    }
    return *this;
}

// ---------------------------------------------------------------------------
// ForeignKeyBuilder
// ---------------------------------------------------------------------------

ForeignKeyBuilder& ForeignKeyBuilder::references(std::string column) {
    blueprint_->table_.foreignKeys[position_].referencesColumn = std::move(column);
    return *this;
}

ForeignKeyBuilder& ForeignKeyBuilder::on(std::string table) {
    blueprint_->table_.foreignKeys[position_].onTable = std::move(table);
    return *this;
}

ForeignKeyBuilder& ForeignKeyBuilder::onDelete(std::string action) {
    blueprint_->table_.foreignKeys[position_].onDelete = std::move(action);
    return *this;
}

ForeignKeyBuilder& ForeignKeyBuilder::onUpdate(std::string action) {
    blueprint_->table_.foreignKeys[position_].onUpdate = std::move(action);
    return *this;
}

// ---------------------------------------------------------------------------
// Blueprint
// ---------------------------------------------------------------------------

Blueprint::Blueprint(std::string table, bool creating) : creating_(creating) {
    table_.name = std::move(table);
}

ColumnBuilder Blueprint::addColumn(std::string name, ColumnType type) {
    ColumnDefinition column;
    column.name = std::move(name);
    column.type = type;
    table_.columns.push_back(std::move(column));
    return ColumnBuilder(*this, table_.columns.size() - 1);
}

ColumnBuilder Blueprint::increments(std::string name) {
    auto builder = addColumn(std::move(name), ColumnType::Increments);
    builder.column().primary = true;
    builder.column().isUnsigned = true;
    return builder;
}

ColumnBuilder Blueprint::bigIncrements(std::string name) {
    auto builder = addColumn(std::move(name), ColumnType::BigIncrements);
    builder.column().primary = true;
    builder.column().isUnsigned = true;
    return builder;
}

ColumnBuilder Blueprint::integer(std::string name) {
    return addColumn(std::move(name), ColumnType::Integer);
}

ColumnBuilder Blueprint::bigInteger(std::string name) {
    return addColumn(std::move(name), ColumnType::BigInteger);
}

ColumnBuilder Blueprint::string(std::string name, std::uint32_t length) {
    auto builder = addColumn(std::move(name), ColumnType::String);
    builder.column().length = length;
    return builder;
}

ColumnBuilder Blueprint::text(std::string name) {
    return addColumn(std::move(name), ColumnType::Text);
}

ColumnBuilder Blueprint::boolean(std::string name) {
    return addColumn(std::move(name), ColumnType::Boolean);
}

ColumnBuilder Blueprint::floatColumn(std::string name) {
    return addColumn(std::move(name), ColumnType::Float);
}

ColumnBuilder Blueprint::doubleColumn(std::string name) {
    return addColumn(std::move(name), ColumnType::Double);
}

ColumnBuilder Blueprint::decimal(std::string name, std::uint32_t precision, std::uint32_t scale) {
    auto builder = addColumn(std::move(name), ColumnType::Decimal);
    builder.column().precision = precision;
    builder.column().scale = scale;
    return builder;
}

ColumnBuilder Blueprint::date(std::string name) {
    return addColumn(std::move(name), ColumnType::Date);
}

ColumnBuilder Blueprint::dateTime(std::string name) {
    return addColumn(std::move(name), ColumnType::DateTime);
}

ColumnBuilder Blueprint::timestamp(std::string name) {
    return addColumn(std::move(name), ColumnType::Timestamp);
}

ColumnBuilder Blueprint::json(std::string name) {
    return addColumn(std::move(name), ColumnType::Json);
}

ColumnBuilder Blueprint::uuid(std::string name) {
    return addColumn(std::move(name), ColumnType::Uuid);
}

ColumnBuilder Blueprint::foreignId(std::string name) {
    return addColumn(std::move(name), ColumnType::BigInteger).asUnsigned();
}

void Blueprint::timestamps() {
    timestamp("created_at").nullable().useCurrent();
    timestamp("updated_at").nullable().useCurrent();
}

void Blueprint::dropColumn(std::string name) {
    table_.dropColumns.push_back(std::move(name));
}

void Blueprint::dropColumns(const std::vector<std::string>& names) {
    table_.dropColumns.insert(table_.dropColumns.end(), names.begin(), names.end());
}

void Blueprint::renameColumn(std::string from, std::string to) {
    table_.renameColumns.emplace_back(std::move(from), std::move(to));
}

std::string Blueprint::indexName(const std::vector<std::string>& columns, bool unique) const {
    std::string name = table_.name;
    for (const auto& c : columns) {
        name += "_" + c;
    }
    return name + (unique ? "_unique" : "_index");
}

void Blueprint::unique(std::vector<std::string> columns, std::string name) {
    if (name.empty()) {
        name = indexName(columns, true);
    }
    table_.indexes.push_back({std::move(name), std::move(columns), true});
}

void Blueprint::index(std::vector<std::string> columns, std::string name) {
    if (name.empty()) {
        name = indexName(columns, false);
    }
    table_.indexes.push_back({std::move(name), std::move(columns), false});
}

void Blueprint::dropIndex(std::string name) {
    table_.dropIndexes.push_back(std::move(name));
}

ForeignKeyBuilder Blueprint::foreign(std::string column) {
    db::ForeignKeyDefinition fk;
    fk.column = std::move(column);
    table_.foreignKeys.push_back(std::move(fk));
    return ForeignKeyBuilder(*this, table_.foreignKeys.size() - 1);
}

} // namespace quarry::schema
