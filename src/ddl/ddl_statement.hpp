#pragma once

/**
 * @file ddl_statement.hpp
 * @brief DDL Statement AST nodes
 *
 * Defines the Abstract Syntax Tree nodes for parsed schema statements.
 * Each statement type has its own class with specific fields.
 */

#include <string>
#include <vector>

#include "catalog/field.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Statement Types
// ─────────────────────────────────────────────────────────────────────────────

enum class DdlStatementType {
  CREATE_TABLE,
  DROP_TABLE,
  ALTER_TABLE,
  CREATE_INDEX,
  DROP_INDEX,
};

// ─────────────────────────────────────────────────────────────────────────────
// Base Statement Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Base class for all DDL statements
 */
class DdlStatement {
public:
  explicit DdlStatement(DdlStatementType type) : type_(type) {}
  virtual ~DdlStatement() = default;

  [[nodiscard]] DdlStatementType type() const noexcept { return type_; }

private:
  DdlStatementType type_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Shared pieces
// ─────────────────────────────────────────────────────────────────────────────

struct ColumnDef {
  std::string name;
  Field field;
};

/// One column of a primary key or index key
struct KeyPart {
  std::string column;
  bool descending = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// CREATE TABLE / DROP TABLE
// ─────────────────────────────────────────────────────────────────────────────

class CreateTableStatement : public DdlStatement {
public:
  CreateTableStatement() : DdlStatement(DdlStatementType::CREATE_TABLE) {}

  std::string table_name;
  std::vector<ColumnDef> columns;
  std::vector<KeyPart> primary_key;
};

class DropTableStatement : public DdlStatement {
public:
  DropTableStatement() : DdlStatement(DdlStatementType::DROP_TABLE) {}

  std::string table_name;
};

// ─────────────────────────────────────────────────────────────────────────────
// ALTER TABLE
// ─────────────────────────────────────────────────────────────────────────────

enum class AlterAction {
  ADD_COLUMN,
  ALTER_COLUMN,
  DROP_COLUMN,
};

/**
 * @brief ALTER TABLE t {ADD|ALTER} COLUMN c <type> / ALTER TABLE t DROP COLUMN c
 *
 * `column.field` is unset for DROP_COLUMN.
 */
class AlterTableStatement : public DdlStatement {
public:
  AlterTableStatement() : DdlStatement(DdlStatementType::ALTER_TABLE) {}

  std::string table_name;
  AlterAction action = AlterAction::ADD_COLUMN;
  ColumnDef column;
};

// ─────────────────────────────────────────────────────────────────────────────
// CREATE INDEX / DROP INDEX
// ─────────────────────────────────────────────────────────────────────────────

class CreateIndexStatement : public DdlStatement {
public:
  CreateIndexStatement() : DdlStatement(DdlStatementType::CREATE_INDEX) {}

  std::string index_name;
  std::string table_name;
  bool unique = false;
  bool null_filtered = false;
  std::vector<KeyPart> columns;
  std::vector<std::string> storing;
};

class DropIndexStatement : public DdlStatement {
public:
  DropIndexStatement() : DdlStatement(DdlStatementType::DROP_INDEX) {}

  std::string index_name;
};

} // namespace schemata
