/**
 * @file index_update.cpp
 * @brief Index update validation and DDL
 */

#include "schema/index_update.hpp"

#include <unordered_set>

#include "common/config.hpp"

namespace schemata {

namespace {

std::string join(const std::vector<std::string> &names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += names[i];
  }
  return out;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CreateIndex
// ─────────────────────────────────────────────────────────────────────────────

Status CreateIndex::validate(const Model *model) const {
  SCHEMATA_RETURN_IF_ERROR(check_model(model));
  SCHEMATA_RETURN_IF_ERROR(validate_identifier("Index", index()));

  if (index() == config::kPrimaryKeyIndexName) {
    return Status::InvalidSchemaChange("Index name " + index() +
                                       " is reserved");
  }
  if (model->find_index(index()) != nullptr) {
    return Status::InvalidSchemaChange("Index " + index() +
                                       " already exists on " + table());
  }
  if (columns_.empty()) {
    return Status::InvalidSchemaChange("Index " + index() +
                                       " must have at least one column");
  }

  std::unordered_set<std::string> keys;
  for (const auto &column : columns_) {
    const Field *field = model->find_column(column);
    if (field == nullptr) {
      return Status::InvalidSchemaChange("Index column " + column +
                                         " does not exist in " + table());
    }
    if (field->is_array()) {
      return Status::InvalidSchemaChange("Array column " + column +
                                         " cannot be an index key");
    }
    if (!keys.insert(column).second) {
      return Status::InvalidSchemaChange("Index column " + column +
                                         " listed twice");
    }
  }

  std::unordered_set<std::string> stored;
  for (const auto &column : options_.storing) {
    if (!model->has_column(column)) {
      return Status::InvalidSchemaChange("Stored column " + column +
                                         " does not exist in " + table());
    }
    if (keys.count(column) > 0 || model->is_primary_key_column(column)) {
      return Status::InvalidSchemaChange("Stored column " + column +
                                         " is already part of the key");
    }
    if (!stored.insert(column).second) {
      return Status::InvalidSchemaChange("Stored column " + column +
                                         " listed twice");
    }
  }
  return Status::Ok();
}

Status CreateIndex::validate_names(const ModelMap &models) const {
  const Model *owner = find_name_owner(models, index());
  if (owner != nullptr) {
    return Status::InvalidSchemaChange("Name " + index() +
                                       " is already used by table " +
                                       owner->table());
  }
  return Status::Ok();
}

std::string CreateIndex::ddl(const Model * /*model*/) const {
  std::string sql = "CREATE ";
  if (options_.unique) {
    sql += "UNIQUE ";
  }
  if (options_.null_filtered) {
    sql += "NULL_FILTERED ";
  }
  sql += "INDEX " + index() + " ON " + table() + " (" + join(columns_) + ")";
  if (!options_.storing.empty()) {
    sql += " STORING (" + join(options_.storing) + ")";
  }
  return sql;
}

// ─────────────────────────────────────────────────────────────────────────────
// DropIndex
// ─────────────────────────────────────────────────────────────────────────────

Status DropIndex::validate(const Model *model) const {
  SCHEMATA_RETURN_IF_ERROR(check_model(model));

  if (index() == config::kPrimaryKeyIndexName) {
    return Status::InvalidSchemaChange("Cannot drop the primary key of " +
                                       table());
  }
  if (model->find_index(index()) == nullptr) {
    return Status::InvalidSchemaChange("Index " + index() +
                                       " does not exist on " + table());
  }
  return Status::Ok();
}

std::string DropIndex::ddl(const Model * /*model*/) const {
  return "DROP INDEX " + index();
}

} // namespace schemata
