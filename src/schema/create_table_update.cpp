/**
 * @file create_table_update.cpp
 * @brief CreateTableUpdate validation and DDL
 */

#include "schema/create_table_update.hpp"

#include <unordered_map>
#include <unordered_set>

namespace schemata {

Status CreateTableUpdate::validate(const Model *model) const {
  if (model != nullptr) {
    return Status::InvalidSchemaChange("Table " + table() + " already exists");
  }
  SCHEMATA_RETURN_IF_ERROR(validate_identifier("Table", table()));

  if (columns_.empty()) {
    return Status::InvalidSchemaChange("Table " + table() +
                                       " must have at least one column");
  }

  std::unordered_map<std::string, const Field *> declared;
  for (const auto &column : columns_) {
    SCHEMATA_RETURN_IF_ERROR(validate_identifier("Column", column.name));
    SCHEMATA_RETURN_IF_ERROR(validate_field(column.name, column.field));
    if (!declared.emplace(column.name, &column.field).second) {
      return Status::InvalidSchemaChange("Duplicate column " + column.name +
                                         " in " + table());
    }
  }

  if (primary_keys_.empty()) {
    return Status::InvalidSchemaChange("Table " + table() +
                                       " must have a primary key");
  }

  std::unordered_set<std::string> seen;
  for (const auto &key : primary_keys_) {
    auto it = declared.find(key);
    if (it == declared.end()) {
      return Status::InvalidSchemaChange("Primary key column " + key +
                                         " is not a column of " + table());
    }
    if (!seen.insert(key).second) {
      return Status::InvalidSchemaChange("Primary key column " + key +
                                         " listed twice");
    }
    if (it->second->is_array()) {
      return Status::InvalidSchemaChange("Primary key column " + key +
                                         " cannot be an array");
    }
  }
  return Status::Ok();
}

Status CreateTableUpdate::validate_names(const ModelMap &models) const {
  const Model *owner = find_name_owner(models, table());
  if (owner != nullptr && owner->table() != table()) {
    return Status::InvalidSchemaChange("Name " + table() +
                                       " is already used by an index on " +
                                       owner->table());
  }
  return Status::Ok();
}

std::string CreateTableUpdate::ddl(const Model * /*model*/) const {
  std::string sql = "CREATE TABLE " + table() + " (";
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (i > 0) {
      sql += ", ";
    }
    sql += columns_[i].name + " " + columns_[i].field.ddl();
  }
  sql += ") PRIMARY KEY (";
  for (size_t i = 0; i < primary_keys_.size(); ++i) {
    if (i > 0) {
      sql += ", ";
    }
    sql += primary_keys_[i];
  }
  sql += ")";
  return sql;
}

} // namespace schemata
