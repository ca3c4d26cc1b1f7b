#pragma once

/**
 * @file catalog_rows.hpp
 * @brief Rows of the three catalog relations read by CatalogReader
 *
 * Each row type mirrors one information schema relation. Cells are
 * addressable by their upper-case catalog column name through field(), which
 * is what the fetch primitive's conditions refer to.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "catalog/field.hpp"
#include "query/value.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// information_schema.columns
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One physical column of one table
 */
struct ColumnSchemaRow {
  std::string table_catalog;
  std::string table_schema;
  std::string table_name;
  std::string column_name;
  int64_t ordinal_position = 0; ///< 1-based position in the table
  std::string is_nullable = "YES";
  std::string spanner_type;

  /// Field described by spanner_type and is_nullable
  [[nodiscard]] Status type(Field *out) const;

  [[nodiscard]] static bool has_field(std::string_view name);
  [[nodiscard]] std::optional<Value> field(std::string_view name) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// information_schema.indexes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One index of one table; the primary key appears as PRIMARY_KEY
 */
struct IndexSchemaRow {
  std::string table_catalog;
  std::string table_schema;
  std::string table_name;
  std::string index_name;
  std::string index_type;
  std::string parent_table_name;
  bool is_unique = false;
  bool is_null_filtered = false;
  std::optional<std::string> index_state; ///< NULL for PRIMARY_KEY

  [[nodiscard]] static bool has_field(std::string_view name);
  [[nodiscard]] std::optional<Value> field(std::string_view name) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// information_schema.index_columns
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One column of one index
 *
 * ordinal_position is absent for stored (non-key) columns.
 */
struct IndexColumnSchemaRow {
  std::string table_catalog;
  std::string table_schema;
  std::string table_name;
  std::string index_name;
  std::string column_name;
  std::optional<int64_t> ordinal_position;
  std::optional<std::string> column_ordering; ///< "ASC" / "DESC" for keys
  std::string is_nullable = "YES";
  std::string spanner_type;

  [[nodiscard]] static bool has_field(std::string_view name);
  [[nodiscard]] std::optional<Value> field(std::string_view name) const;
};

} // namespace schemata
