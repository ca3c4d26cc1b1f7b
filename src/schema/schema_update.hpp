#pragma once

/**
 * @file schema_update.hpp
 * @brief Base class of schema-change requests
 *
 * A request names its target table, validates itself against the table's
 * current Model (or against nothing, for a table that does not exist yet)
 * and renders the DDL that performs it.
 */

#include <string>
#include <string_view>

#include "catalog/model.hpp"
#include "common/status.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Update Kinds
// ─────────────────────────────────────────────────────────────────────────────

enum class SchemaUpdateKind {
  COLUMN,       // AddColumn, AlterColumn, DropColumn
  CREATE_TABLE, // CreateTableUpdate
  INDEX,        // CreateIndex, DropIndex
};

[[nodiscard]] const char *schema_update_kind_to_string(SchemaUpdateKind kind);

// ─────────────────────────────────────────────────────────────────────────────
// SchemaUpdate
// ─────────────────────────────────────────────────────────────────────────────

class SchemaUpdate {
public:
  SchemaUpdate(SchemaUpdateKind kind, std::string table)
      : kind_(kind), table_(std::move(table)) {}
  virtual ~SchemaUpdate() = default;

  [[nodiscard]] SchemaUpdateKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string &table() const noexcept { return table_; }

  /**
   * @brief Check the change is legal against the current table
   * @param model Current descriptor of table(), or nullptr for CREATE_TABLE
   * @return kInvalidSchemaChange with the reason if the change is rejected
   */
  [[nodiscard]] virtual Status validate(const Model *model) const = 0;

  /**
   * @brief Check names the change introduces against the whole schema
   *
   * Tables and indexes share one database-wide namespace. Changes that
   * introduce no name accept.
   */
  [[nodiscard]] virtual Status validate_names(const ModelMap &models) const;

  /**
   * @brief DDL statement performing the change
   *
   * Only meaningful after validate() accepted the same @p model.
   */
  [[nodiscard]] virtual std::string ddl(const Model *model) const = 0;

protected:
  /// Rejects a null model or one describing another table
  [[nodiscard]] Status check_model(const Model *model) const;

private:
  SchemaUpdateKind kind_;
  std::string table_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Check a table, column or index name is a legal identifier
 *
 * Identifiers start with a letter, continue with letters, digits or
 * underscores, and are at most config::kMaxIdentifierLength long.
 */
[[nodiscard]] Status validate_identifier(std::string_view what,
                                         const std::string &name);

/// Owner of @p name among all tables and their indexes, or nullptr
[[nodiscard]] const Model *find_name_owner(const ModelMap &models,
                                           const std::string &name);

/// Rejects an untyped field or a length that does not fit its type
[[nodiscard]] Status validate_field(const std::string &column,
                                    const Field &field);

} // namespace schemata
