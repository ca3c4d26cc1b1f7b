#pragma once

/**
 * @file catalog_reader.hpp
 * @brief Folds the catalog relations into TableSchemaMap and IndexMap
 *
 * Reads are scoped to one CatalogNamespace (the unqualified namespace by
 * default). Pass the same Transaction to read_columns() and read_indexes()
 * to observe one snapshot; without one, each fetch may see a different
 * schema version.
 */

#include "catalog/catalog_source.hpp"
#include "catalog/schema.hpp"
#include "common/config.hpp"
#include "common/status.hpp"

namespace schemata {

class Transaction;

/**
 * @brief Reads table and index metadata through a CatalogSource
 */
class CatalogReader {
public:
  /**
   * @param source Fetch primitive (not owned, must outlive the reader)
   * @param catalog_namespace Namespace filter applied to every fetch
   */
  explicit CatalogReader(CatalogSource *source,
                         CatalogNamespace catalog_namespace = {});

  /**
   * @brief Build table -> column -> type
   *
   * Duplicate (table, column) rows overwrite each other.
   */
  [[nodiscard]] Status read_columns(const Transaction *txn,
                                    TableSchemaMap *out) const;

  /**
   * @brief Build table -> index -> {columns, type, unique, state}
   *
   * Key columns are fetched with ORDINAL_POSITION IS NOT NULL ordered by
   * ORDINAL_POSITION ASC and appended in fetch order; the fold relies on the
   * source honoring that order. Rows with a NULL ordinal are reported
   * separately as stored columns.
   */
  [[nodiscard]] Status read_indexes(const Transaction *txn,
                                    IndexMap *out) const;

  [[nodiscard]] const CatalogNamespace &catalog_namespace() const noexcept {
    return namespace_;
  }

private:
  /// TABLE_CATALOG = ns.catalog AND TABLE_SCHEMA = ns.schema
  [[nodiscard]] ConditionList namespace_filter() const;

  CatalogSource *source_;
  CatalogNamespace namespace_;
};

} // namespace schemata
