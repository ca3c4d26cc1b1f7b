#pragma once

/**
 * @file database_metadata.hpp
 * @brief Entry point: compile the live catalog into models and apply
 *        schema changes
 *
 * Example usage:
 * @code
 * schemata::DatabaseMetadata metadata(&source, &admin);
 * schemata::ModelMap models;
 * auto status = metadata.models(&models);
 * status = metadata.column_update(
 *     schemata::AddColumn("Users", "email", schemata::Field(FieldType::STRING)));
 * @endcode
 */

#include "admin/schema_admin.hpp"
#include "catalog/catalog_reader.hpp"
#include "catalog/catalog_source.hpp"
#include "catalog/model.hpp"
#include "catalog/schema.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "metadata/schema_change_applier.hpp"
#include "schema/schema_update.hpp"

namespace schemata {

class Transaction;

class DatabaseMetadata {
public:
  /**
   * @param source Catalog fetch primitive (not owned)
   * @param admin DDL submission collaborator (not owned)
   * @param catalog_namespace Namespace the catalog reads are scoped to
   */
  DatabaseMetadata(CatalogSource *source, SchemaAdmin *admin,
                   CatalogNamespace catalog_namespace = {});

  // Non-copyable: the applier points at reader_
  DatabaseMetadata(const DatabaseMetadata &) = delete;
  DatabaseMetadata &operator=(const DatabaseMetadata &) = delete;

  // ─────────────────────────────────────────────────────────────────────────
  // Metadata
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Build a fresh table -> Model map from the catalog
   * @param txn Snapshot shared by all catalog reads, or nullptr
   */
  [[nodiscard]] Status models(const Transaction *txn, ModelMap *out) const;
  [[nodiscard]] Status models(ModelMap *out) const {
    return models(nullptr, out);
  }

  /// table -> column -> type
  [[nodiscard]] Status tables(const Transaction *txn,
                              TableSchemaMap *out) const;

  /// table -> index -> IndexInfo
  [[nodiscard]] Status indexes(const Transaction *txn, IndexMap *out) const;

  // ─────────────────────────────────────────────────────────────────────────
  // Migrations
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] Status column_update(const SchemaUpdate &update,
                                     SchemaChangeResult *result = nullptr,
                                     const Transaction *txn = nullptr);

  [[nodiscard]] Status create_table(const SchemaUpdate &update,
                                    SchemaChangeResult *result = nullptr,
                                    const Transaction *txn = nullptr);

  [[nodiscard]] Status index_update(const SchemaUpdate &update,
                                    SchemaChangeResult *result = nullptr,
                                    const Transaction *txn = nullptr);

  [[nodiscard]] const CatalogReader &reader() const noexcept {
    return reader_;
  }

private:
  CatalogReader reader_;
  SchemaChangeApplier applier_;
};

} // namespace schemata
