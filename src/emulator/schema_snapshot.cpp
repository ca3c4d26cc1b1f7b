/**
 * @file schema_snapshot.cpp
 * @brief SchemaSnapshot implementation
 */

#include "emulator/schema_snapshot.hpp"

#include <algorithm>
#include <unordered_set>

namespace schemata {

namespace {

bool compatible_types(FieldType from, FieldType to) {
  if (from == to) {
    return true;
  }
  return (from == FieldType::STRING && to == FieldType::BYTES) ||
         (from == FieldType::BYTES && to == FieldType::STRING);
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// IndexDef / TableDef
// ─────────────────────────────────────────────────────────────────────────────

bool IndexDef::has_key_column(const std::string &column) const {
  return std::any_of(columns.begin(), columns.end(),
                     [&](const KeyPart &part) { return part.column == column; });
}

bool IndexDef::stores(const std::string &column) const {
  return std::find(storing.begin(), storing.end(), column) != storing.end();
}

const ColumnDef *TableDef::find_column(const std::string &column) const {
  for (const auto &def : columns) {
    if (def.name == column) {
      return &def;
    }
  }
  return nullptr;
}

const IndexDef *TableDef::find_index(const std::string &index) const {
  for (const auto &def : indexes) {
    if (def.name == index) {
      return &def;
    }
  }
  return nullptr;
}

bool TableDef::is_key_column(const std::string &column) const {
  return std::any_of(primary_key.begin(), primary_key.end(),
                     [&](const KeyPart &part) { return part.column == column; });
}

// ─────────────────────────────────────────────────────────────────────────────
// SchemaSnapshot
// ─────────────────────────────────────────────────────────────────────────────

const TableDef *SchemaSnapshot::find_table(const std::string &name) const {
  for (const auto &table : tables_) {
    if (table.name == name) {
      return &table;
    }
  }
  return nullptr;
}

const TableDef *
SchemaSnapshot::find_index_owner(const std::string &index) const {
  for (const auto &table : tables_) {
    if (table.find_index(index) != nullptr) {
      return &table;
    }
  }
  return nullptr;
}

TableDef *SchemaSnapshot::mutable_table(const std::string &name) {
  for (auto &table : tables_) {
    if (table.name == name) {
      return &table;
    }
  }
  return nullptr;
}

bool SchemaSnapshot::name_in_use(const std::string &name) const {
  return find_table(name) != nullptr || find_index_owner(name) != nullptr ||
         name == config::kPrimaryKeyIndexName;
}

Status SchemaSnapshot::apply(const DdlStatement &statement,
                             SchemaSnapshot *next) const {
  if (next == nullptr) {
    return Status::InvalidArgument("Output snapshot cannot be null");
  }

  SchemaSnapshot working = *this;
  Status status;
  switch (statement.type()) {
  case DdlStatementType::CREATE_TABLE:
    status = working.create_table(
        static_cast<const CreateTableStatement &>(statement));
    break;
  case DdlStatementType::DROP_TABLE:
    status = working.drop_table(
        static_cast<const DropTableStatement &>(statement));
    break;
  case DdlStatementType::ALTER_TABLE:
    status = working.alter_table(
        static_cast<const AlterTableStatement &>(statement));
    break;
  case DdlStatementType::CREATE_INDEX:
    status = working.create_index(
        static_cast<const CreateIndexStatement &>(statement));
    break;
  case DdlStatementType::DROP_INDEX:
    status = working.drop_index(
        static_cast<const DropIndexStatement &>(statement));
    break;
  }
  SCHEMATA_RETURN_IF_ERROR(status);

  *next = std::move(working);
  return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Tables
// ─────────────────────────────────────────────────────────────────────────────

Status SchemaSnapshot::create_table(const CreateTableStatement &stmt) {
  if (name_in_use(stmt.table_name)) {
    return Status::AlreadyExists("Duplicate name in schema: " +
                                 stmt.table_name);
  }

  TableDef table;
  table.name = stmt.table_name;

  std::unordered_set<std::string> seen;
  for (const auto &column : stmt.columns) {
    if (!seen.insert(column.name).second) {
      return Status::InvalidArgument("Duplicate column name " +
                                     stmt.table_name + "." + column.name);
    }
    table.columns.push_back(column);
  }

  std::unordered_set<std::string> keys;
  for (const auto &part : stmt.primary_key) {
    const ColumnDef *column = table.find_column(part.column);
    if (column == nullptr) {
      return Status::NotFound("Table " + stmt.table_name +
                              " does not have a column named " + part.column);
    }
    if (column->field.is_array()) {
      return Status::InvalidArgument("Column " + part.column +
                                     " of array type cannot be a key");
    }
    if (!keys.insert(part.column).second) {
      return Status::InvalidArgument("Key column " + part.column +
                                     " appears more than once");
    }
  }
  table.primary_key = stmt.primary_key;

  tables_.push_back(std::move(table));
  return Status::Ok();
}

Status SchemaSnapshot::drop_table(const DropTableStatement &stmt) {
  auto it = std::find_if(tables_.begin(), tables_.end(), [&](const TableDef &t) {
    return t.name == stmt.table_name;
  });
  if (it == tables_.end()) {
    return Status::NotFound("Table not found: " + stmt.table_name);
  }
  if (!it->indexes.empty()) {
    return Status::InvalidArgument("Cannot drop table " + stmt.table_name +
                                   " with indexes: " + it->indexes[0].name);
  }
  tables_.erase(it);
  return Status::Ok();
}

Status SchemaSnapshot::alter_table(const AlterTableStatement &stmt) {
  TableDef *table = mutable_table(stmt.table_name);
  if (table == nullptr) {
    return Status::NotFound("Table not found: " + stmt.table_name);
  }
  const std::string &name = stmt.column.name;
  const ColumnDef *existing = table->find_column(name);

  switch (stmt.action) {
  case AlterAction::ADD_COLUMN:
    if (existing != nullptr) {
      return Status::AlreadyExists("Duplicate column name " +
                                   stmt.table_name + "." + name);
    }
    if (!stmt.column.field.nullable()) {
      return Status::InvalidArgument("Cannot add NOT NULL column " +
                                     stmt.table_name + "." + name +
                                     " to existing table");
    }
    table->columns.push_back(stmt.column);
    return Status::Ok();

  case AlterAction::ALTER_COLUMN: {
    if (existing == nullptr) {
      return Status::NotFound("Column not found: " + stmt.table_name + "." +
                              name);
    }
    if (table->is_key_column(name)) {
      return Status::InvalidArgument("Cannot alter key column " +
                                     stmt.table_name + "." + name);
    }
    const Field &from = existing->field;
    const Field &to = stmt.column.field;
    if (from.is_array() != to.is_array() ||
        !compatible_types(from.type(), to.type())) {
      return Status::InvalidArgument("Cannot change type of column " + name +
                                     " from " + from.type_ddl() + " to " +
                                     to.type_ddl());
    }
    if (from.type() != to.type()) {
      for (const auto &index : table->indexes) {
        if (index.has_key_column(name)) {
          return Status::InvalidArgument("Cannot change type of column " +
                                         name + " used by index " +
                                         index.name);
        }
      }
    }
    for (auto &column : table->columns) {
      if (column.name == name) {
        column.field = to;
      }
    }
    return Status::Ok();
  }

  case AlterAction::DROP_COLUMN:
    if (existing == nullptr) {
      return Status::NotFound("Column not found: " + stmt.table_name + "." +
                              name);
    }
    if (table->is_key_column(name)) {
      return Status::InvalidArgument("Cannot drop key column " +
                                     stmt.table_name + "." + name);
    }
    for (const auto &index : table->indexes) {
      if (index.has_key_column(name) || index.stores(name)) {
        return Status::InvalidArgument("Cannot drop column " + name +
                                       " referenced by index " + index.name);
      }
    }
    table->columns.erase(
        std::remove_if(table->columns.begin(), table->columns.end(),
                       [&](const ColumnDef &c) { return c.name == name; }),
        table->columns.end());
    return Status::Ok();
  }
  return Status::Internal("Unhandled ALTER TABLE action");
}

// ─────────────────────────────────────────────────────────────────────────────
// Indexes
// ─────────────────────────────────────────────────────────────────────────────

Status SchemaSnapshot::create_index(const CreateIndexStatement &stmt) {
  if (name_in_use(stmt.index_name)) {
    return Status::AlreadyExists("Duplicate name in schema: " +
                                 stmt.index_name);
  }
  TableDef *table = mutable_table(stmt.table_name);
  if (table == nullptr) {
    return Status::NotFound("Table not found: " + stmt.table_name);
  }

  std::unordered_set<std::string> seen;
  for (const auto &part : stmt.columns) {
    const ColumnDef *column = table->find_column(part.column);
    if (column == nullptr) {
      return Status::NotFound("Index " + stmt.index_name +
                              " references unknown column " + part.column);
    }
    if (column->field.is_array()) {
      return Status::InvalidArgument("Index " + stmt.index_name +
                                     " cannot use array column " + part.column);
    }
    if (!seen.insert(part.column).second) {
      return Status::InvalidArgument("Index " + stmt.index_name +
                                     " repeats column " + part.column);
    }
  }
  for (const auto &name : stmt.storing) {
    if (table->find_column(name) == nullptr) {
      return Status::NotFound("Index " + stmt.index_name +
                              " stores unknown column " + name);
    }
    if (table->is_key_column(name)) {
      return Status::InvalidArgument("Index " + stmt.index_name +
                                     " cannot store key column " + name);
    }
    if (!seen.insert(name).second) {
      return Status::InvalidArgument("Index " + stmt.index_name +
                                     " repeats column " + name);
    }
  }

  IndexDef index;
  index.name = stmt.index_name;
  index.columns = stmt.columns;
  index.storing = stmt.storing;
  index.unique = stmt.unique;
  index.null_filtered = stmt.null_filtered;
  table->indexes.push_back(std::move(index));
  return Status::Ok();
}

Status SchemaSnapshot::drop_index(const DropIndexStatement &stmt) {
  for (auto &table : tables_) {
    auto it = std::find_if(
        table.indexes.begin(), table.indexes.end(),
        [&](const IndexDef &index) { return index.name == stmt.index_name; });
    if (it != table.indexes.end()) {
      table.indexes.erase(it);
      return Status::Ok();
    }
  }
  return Status::NotFound("Index not found: " + stmt.index_name);
}

} // namespace schemata
