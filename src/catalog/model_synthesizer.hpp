#pragma once

/**
 * @file model_synthesizer.hpp
 * @brief Builds one Model per table from the folded catalog maps
 */

#include "catalog/model.hpp"
#include "catalog/schema.hpp"
#include "common/status.hpp"

namespace schemata {

class CatalogReader;
class Transaction;

/**
 * @brief Zips TableSchemaMap and IndexMap into table -> Model
 *
 * Both maps must come from the same read cycle.
 */
class ModelSynthesizer {
public:
  /**
   * @brief Synthesize a descriptor for every table in @p tables
   * @return kMissingPrimaryKey if a table has no PRIMARY_KEY index; @p out is
   *         left untouched in that case
   */
  [[nodiscard]] static Status synthesize(const TableSchemaMap &tables,
                                         const IndexMap &indexes,
                                         ModelMap *out);

  /**
   * @brief Read both maps through @p reader and synthesize them
   *
   * Columns and indexes are read with the same @p txn.
   */
  [[nodiscard]] static Status load(const CatalogReader &reader,
                                   const Transaction *txn, ModelMap *out);
};

} // namespace schemata
