#pragma once

/**
 * @file information_schema.hpp
 * @brief Materializes the catalog relations of one schema snapshot
 *
 * Rows are produced the way the hosted database reports them:
 * - user tables live in the emulator's namespace, the catalog relations
 *   themselves in INFORMATION_SCHEMA
 * - every table has a PRIMARY_KEY index (index_state NULL)
 * - secondary indexes are READ_WRITE
 * - key columns carry 1-based ordinals; stored columns carry NULL
 * - index_columns lists secondary indexes before the primary key, so readers
 *   must not rely on fetch order without an ORDER BY
 */

#include <initializer_list>
#include <string>
#include <vector>

#include "catalog/catalog_rows.hpp"
#include "common/config.hpp"
#include "emulator/schema_snapshot.hpp"

namespace schemata {

class InformationSchema {
public:
  InformationSchema(const SchemaSnapshot &snapshot, CatalogNamespace ns);

  [[nodiscard]] const std::vector<ColumnSchemaRow> &columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] const std::vector<IndexSchemaRow> &indexes() const noexcept {
    return indexes_;
  }
  [[nodiscard]] const std::vector<IndexColumnSchemaRow> &
  index_columns() const noexcept {
    return index_columns_;
  }

  /**
   * @brief Definitions of the COLUMNS, INDEXES and INDEX_COLUMNS relations
   */
  [[nodiscard]] static const std::vector<TableDef> &catalog_tables();

private:
  void add_table(const TableDef &table, const std::string &table_catalog,
                 const std::string &table_schema);

  std::vector<ColumnSchemaRow> columns_;
  std::vector<IndexSchemaRow> indexes_;
  std::vector<IndexColumnSchemaRow> index_columns_;
};

} // namespace schemata
