/**
 * @file catalog_rows.cpp
 * @brief Catalog row field accessors
 */

#include "catalog/catalog_rows.hpp"

#include <algorithm>
#include <array>

namespace schemata {

namespace {

template <size_t N>
bool contains(const std::array<std::string_view, N> &names,
              std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

constexpr std::array<std::string_view, 7> kColumnFields = {
    "TABLE_CATALOG", "TABLE_SCHEMA",  "TABLE_NAME",  "COLUMN_NAME",
    "ORDINAL_POSITION", "IS_NULLABLE", "SPANNER_TYPE"};

constexpr std::array<std::string_view, 9> kIndexFields = {
    "TABLE_CATALOG",     "TABLE_SCHEMA", "TABLE_NAME",
    "INDEX_NAME",        "INDEX_TYPE",   "PARENT_TABLE_NAME",
    "IS_UNIQUE",         "IS_NULL_FILTERED", "INDEX_STATE"};

constexpr std::array<std::string_view, 9> kIndexColumnFields = {
    "TABLE_CATALOG", "TABLE_SCHEMA",     "TABLE_NAME",
    "INDEX_NAME",    "COLUMN_NAME",      "ORDINAL_POSITION",
    "COLUMN_ORDERING", "IS_NULLABLE",    "SPANNER_TYPE"};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ColumnSchemaRow
// ─────────────────────────────────────────────────────────────────────────────

Status ColumnSchemaRow::type(Field *out) const {
  return Field::parse(spanner_type, is_nullable == "YES", out);
}

bool ColumnSchemaRow::has_field(std::string_view name) {
  return contains(kColumnFields, name);
}

std::optional<Value> ColumnSchemaRow::field(std::string_view name) const {
  if (name == "TABLE_CATALOG") return Value(table_catalog);
  if (name == "TABLE_SCHEMA") return Value(table_schema);
  if (name == "TABLE_NAME") return Value(table_name);
  if (name == "COLUMN_NAME") return Value(column_name);
  if (name == "ORDINAL_POSITION") return Value(ordinal_position);
  if (name == "IS_NULLABLE") return Value(is_nullable);
  if (name == "SPANNER_TYPE") return Value(spanner_type);
  return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// IndexSchemaRow
// ─────────────────────────────────────────────────────────────────────────────

bool IndexSchemaRow::has_field(std::string_view name) {
  return contains(kIndexFields, name);
}

std::optional<Value> IndexSchemaRow::field(std::string_view name) const {
  if (name == "TABLE_CATALOG") return Value(table_catalog);
  if (name == "TABLE_SCHEMA") return Value(table_schema);
  if (name == "TABLE_NAME") return Value(table_name);
  if (name == "INDEX_NAME") return Value(index_name);
  if (name == "INDEX_TYPE") return Value(index_type);
  if (name == "PARENT_TABLE_NAME") return Value(parent_table_name);
  if (name == "IS_UNIQUE") return Value(is_unique);
  if (name == "IS_NULL_FILTERED") return Value(is_null_filtered);
  if (name == "INDEX_STATE") return Value::from_optional(index_state);
  return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// IndexColumnSchemaRow
// ─────────────────────────────────────────────────────────────────────────────

bool IndexColumnSchemaRow::has_field(std::string_view name) {
  return contains(kIndexColumnFields, name);
}

std::optional<Value> IndexColumnSchemaRow::field(std::string_view name) const {
  if (name == "TABLE_CATALOG") return Value(table_catalog);
  if (name == "TABLE_SCHEMA") return Value(table_schema);
  if (name == "TABLE_NAME") return Value(table_name);
  if (name == "INDEX_NAME") return Value(index_name);
  if (name == "COLUMN_NAME") return Value(column_name);
  if (name == "ORDINAL_POSITION") return Value::from_optional(ordinal_position);
  if (name == "COLUMN_ORDERING") return Value::from_optional(column_ordering);
  if (name == "IS_NULLABLE") return Value(is_nullable);
  if (name == "SPANNER_TYPE") return Value(spanner_type);
  return std::nullopt;
}

} // namespace schemata
