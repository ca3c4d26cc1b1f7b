#pragma once

/**
 * @file schema_snapshot.hpp
 * @brief Versioned set of table definitions held by the emulated database
 *
 * A SchemaSnapshot is a value: applying a DDL statement produces a new
 * snapshot and leaves the original untouched. Tables keep their creation
 * order and columns keep their declaration order, which is what the
 * information schema reports as ORDINAL_POSITION.
 */

#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/types.hpp"
#include "ddl/ddl_statement.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Definitions
// ─────────────────────────────────────────────────────────────────────────────

struct IndexDef {
  std::string name;
  std::vector<KeyPart> columns;
  std::vector<std::string> storing;
  bool unique = false;
  bool null_filtered = false;

  [[nodiscard]] bool has_key_column(const std::string &column) const;
  [[nodiscard]] bool stores(const std::string &column) const;
};

struct TableDef {
  std::string name;
  std::vector<ColumnDef> columns;
  std::vector<KeyPart> primary_key;
  std::vector<IndexDef> indexes;

  [[nodiscard]] const ColumnDef *find_column(const std::string &column) const;
  [[nodiscard]] const IndexDef *find_index(const std::string &index) const;
  [[nodiscard]] bool is_key_column(const std::string &column) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// SchemaSnapshot
// ─────────────────────────────────────────────────────────────────────────────

class SchemaSnapshot {
public:
  SchemaSnapshot() = default;

  [[nodiscard]] schema_version_t version() const noexcept { return version_; }
  void set_version(schema_version_t version) noexcept { version_ = version; }

  [[nodiscard]] const std::vector<TableDef> &tables() const noexcept {
    return tables_;
  }

  [[nodiscard]] const TableDef *find_table(const std::string &name) const;

  /**
   * @brief Find the table owning an index (index names are database-wide)
   */
  [[nodiscard]] const TableDef *
  find_index_owner(const std::string &index) const;

  /**
   * @brief Apply one statement
   *
   * On success *next holds this snapshot with the change applied and the
   * same version; on failure *next is left unchanged.
   *
   * @return kNotFound for unknown tables, columns and indexes,
   *         kAlreadyExists for name collisions,
   *         kInvalidArgument for changes the database refuses
   */
  [[nodiscard]] Status apply(const DdlStatement &statement,
                             SchemaSnapshot *next) const;

private:
  Status create_table(const CreateTableStatement &stmt);
  Status drop_table(const DropTableStatement &stmt);
  Status alter_table(const AlterTableStatement &stmt);
  Status create_index(const CreateIndexStatement &stmt);
  Status drop_index(const DropIndexStatement &stmt);

  TableDef *mutable_table(const std::string &name);
  [[nodiscard]] bool name_in_use(const std::string &name) const;

  schema_version_t version_ = config::kInitialSchemaVersion;
  std::vector<TableDef> tables_;
};

} // namespace schemata
