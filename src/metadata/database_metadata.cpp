/**
 * @file database_metadata.cpp
 * @brief DatabaseMetadata implementation
 */

#include "metadata/database_metadata.hpp"

#include <utility>

#include "catalog/model_synthesizer.hpp"

namespace schemata {

DatabaseMetadata::DatabaseMetadata(CatalogSource *source, SchemaAdmin *admin,
                                   CatalogNamespace catalog_namespace)
    : reader_(source, std::move(catalog_namespace)),
      applier_(&reader_, admin) {}

Status DatabaseMetadata::models(const Transaction *txn, ModelMap *out) const {
  return ModelSynthesizer::load(reader_, txn, out);
}

Status DatabaseMetadata::tables(const Transaction *txn,
                                TableSchemaMap *out) const {
  return reader_.read_columns(txn, out);
}

Status DatabaseMetadata::indexes(const Transaction *txn, IndexMap *out) const {
  return reader_.read_indexes(txn, out);
}

Status DatabaseMetadata::column_update(const SchemaUpdate &update,
                                       SchemaChangeResult *result,
                                       const Transaction *txn) {
  return applier_.apply_column_update(update, result, txn);
}

Status DatabaseMetadata::create_table(const SchemaUpdate &update,
                                      SchemaChangeResult *result,
                                      const Transaction *txn) {
  return applier_.apply_create_table_update(update, result, txn);
}

Status DatabaseMetadata::index_update(const SchemaUpdate &update,
                                      SchemaChangeResult *result,
                                      const Transaction *txn) {
  return applier_.apply_index_update(update, result, txn);
}

} // namespace schemata
