#pragma once

/**
 * @file catalog_source.hpp
 * @brief Catalog fetch primitive consumed by CatalogReader
 */

#include <vector>

#include "catalog/catalog_rows.hpp"
#include "common/status.hpp"
#include "query/condition.hpp"

namespace schemata {

class Transaction;

/**
 * @brief Filtered, ordered reads of the catalog relations
 *
 * Implementations must:
 * - return only rows satisfying every filter condition
 * - return rows in the order requested by OrderByCondition keys
 * - serve every read issued with the same Transaction from one snapshot
 *
 * A null transaction means a single-use strong read. Failures are reported
 * as kCatalogRead.
 */
class CatalogSource {
public:
  virtual ~CatalogSource() = default;

  [[nodiscard]] virtual Status
  fetch_columns(const Transaction *txn, const ConditionList &conditions,
                std::vector<ColumnSchemaRow> *out) = 0;

  [[nodiscard]] virtual Status
  fetch_indexes(const Transaction *txn, const ConditionList &conditions,
                std::vector<IndexSchemaRow> *out) = 0;

  [[nodiscard]] virtual Status
  fetch_index_columns(const Transaction *txn, const ConditionList &conditions,
                      std::vector<IndexColumnSchemaRow> *out) = 0;
};

} // namespace schemata
