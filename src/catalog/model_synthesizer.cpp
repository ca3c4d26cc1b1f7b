/**
 * @file model_synthesizer.cpp
 * @brief ModelSynthesizer implementation
 */

#include "catalog/model_synthesizer.hpp"

#include "catalog/catalog_reader.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"

namespace schemata {

Status ModelSynthesizer::synthesize(const TableSchemaMap &tables,
                                    const IndexMap &indexes, ModelMap *out) {
  if (out == nullptr) {
    return Status::InvalidArgument("Output pointer cannot be null");
  }

  ModelMap models;
  models.reserve(tables.size());

  for (const auto &[table_name, schema] : tables) {
    auto table_indexes = indexes.find(table_name);
    if (table_indexes == indexes.end()) {
      return Status::MissingPrimaryKey("Table has no indexes: " + table_name);
    }

    auto primary = table_indexes->second.find(config::kPrimaryKeyIndexName);
    if (primary == table_indexes->second.end()) {
      return Status::MissingPrimaryKey("Table has no PRIMARY_KEY index: " +
                                       table_name);
    }

    TableIndexMap secondary;
    for (const auto &[index_name, info] : table_indexes->second) {
      if (index_name != config::kPrimaryKeyIndexName) {
        secondary.emplace(index_name, info);
      }
    }

    models.emplace(table_name, Model(table_name, schema,
                                     primary->second.columns,
                                     std::move(secondary)));
  }

  LOG_DEBUG("Synthesized {} models", models.size());
  *out = std::move(models);
  return Status::Ok();
}

Status ModelSynthesizer::load(const CatalogReader &reader,
                              const Transaction *txn, ModelMap *out) {
  TableSchemaMap tables;
  SCHEMATA_RETURN_IF_ERROR(reader.read_columns(txn, &tables));

  IndexMap indexes;
  SCHEMATA_RETURN_IF_ERROR(reader.read_indexes(txn, &indexes));

  return synthesize(tables, indexes, out);
}

} // namespace schemata
