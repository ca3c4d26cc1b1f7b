#pragma once

/**
 * @file schema_change_applier.hpp
 * @brief Validates schema-change requests and submits their DDL
 *
 * Every request goes through:
 *   RECEIVED -> VALIDATED -> DDL_EMITTED -> SUBMITTED
 * or stops at REJECTED. Nothing is retained between requests: each apply
 * re-reads the catalog, and no lock is taken around the change.
 */

#include <string>
#include <vector>

#include "admin/schema_admin.hpp"
#include "catalog/catalog_reader.hpp"
#include "common/status.hpp"
#include "schema/schema_update.hpp"

namespace schemata {

class Transaction;

// ─────────────────────────────────────────────────────────────────────────────
// Request State Machine
// ─────────────────────────────────────────────────────────────────────────────

enum class SchemaChangeState {
  RECEIVED,    // Request accepted for processing
  VALIDATED,   // Preconditions and request validation passed
  DDL_EMITTED, // DDL rendered
  SUBMITTED,   // Admin collaborator accepted the DDL
  REJECTED,    // Stopped before any DDL was emitted
};

[[nodiscard]] const char *
schema_change_state_to_string(SchemaChangeState state);

/**
 * @brief Outcome of one apply call
 */
struct SchemaChangeResult {
  SchemaChangeState state = SchemaChangeState::RECEIVED;
  std::vector<std::string> ddl; ///< Empty unless DDL was emitted
  OperationHandle operation;    ///< Filled in once SUBMITTED
  Status status;
};

// ─────────────────────────────────────────────────────────────────────────────
// SchemaChangeApplier
// ─────────────────────────────────────────────────────────────────────────────

class SchemaChangeApplier {
public:
  /**
   * @param reader Catalog reader used to fetch the current models (not owned)
   * @param admin DDL submission collaborator (not owned)
   */
  SchemaChangeApplier(const CatalogReader *reader, SchemaAdmin *admin);

  /**
   * @brief Apply a ColumnUpdate; the table must exist
   * @return kSchemaChangeTypeMismatch, kUnknownTable, kInvalidSchemaChange,
   *         kSubmission or a catalog read error
   */
  [[nodiscard]] Status apply_column_update(const SchemaUpdate &update,
                                           SchemaChangeResult *result = nullptr,
                                           const Transaction *txn = nullptr);

  /**
   * @brief Apply a CreateTableUpdate; the table must not exist
   * @return kSchemaChangeTypeMismatch, kTableAlreadyExists,
   *         kInvalidSchemaChange, kSubmission or a catalog read error
   */
  [[nodiscard]] Status
  apply_create_table_update(const SchemaUpdate &update,
                            SchemaChangeResult *result = nullptr,
                            const Transaction *txn = nullptr);

  /**
   * @brief Apply an IndexUpdate; the table must exist
   */
  [[nodiscard]] Status apply_index_update(const SchemaUpdate &update,
                                          SchemaChangeResult *result = nullptr,
                                          const Transaction *txn = nullptr);

private:
  [[nodiscard]] Status apply(SchemaUpdateKind expected,
                             const SchemaUpdate &update,
                             SchemaChangeResult *result,
                             const Transaction *txn);

  const CatalogReader *reader_;
  SchemaAdmin *admin_;
};

} // namespace schemata
