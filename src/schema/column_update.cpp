/**
 * @file column_update.cpp
 * @brief Column update validation and DDL
 */

#include "schema/column_update.hpp"

#include <algorithm>

#include "common/status.hpp"

namespace schemata {

namespace {

bool compatible_types(FieldType from, FieldType to) {
  if (from == to) {
    return true;
  }
  return (from == FieldType::STRING && to == FieldType::BYTES) ||
         (from == FieldType::BYTES && to == FieldType::STRING);
}

bool contains(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// AddColumn
// ─────────────────────────────────────────────────────────────────────────────

Status AddColumn::validate(const Model *model) const {
  SCHEMATA_RETURN_IF_ERROR(check_model(model));
  SCHEMATA_RETURN_IF_ERROR(validate_identifier("Column", column()));

  SCHEMATA_RETURN_IF_ERROR(validate_field(column(), field_));
  if (model->has_column(column())) {
    return Status::InvalidSchemaChange("Column " + column() +
                                       " already exists in " + table());
  }
  if (!field_.nullable()) {
    return Status::InvalidSchemaChange("Added column " + column() +
                                       " must be nullable");
  }
  return Status::Ok();
}

std::string AddColumn::ddl(const Model * /*model*/) const {
  return "ALTER TABLE " + table() + " ADD COLUMN " + column() + " " +
         field_.ddl();
}

// ─────────────────────────────────────────────────────────────────────────────
// AlterColumn
// ─────────────────────────────────────────────────────────────────────────────

Status AlterColumn::validate(const Model *model) const {
  SCHEMATA_RETURN_IF_ERROR(check_model(model));

  const Field *current = model->find_column(column());
  if (current == nullptr) {
    return Status::InvalidSchemaChange("Column " + column() +
                                       " does not exist in " + table());
  }
  SCHEMATA_RETURN_IF_ERROR(validate_field(column(), field_));
  if (model->is_primary_key_column(column())) {
    return Status::InvalidSchemaChange("Cannot alter primary key column " +
                                       column());
  }
  if (current->is_array() != field_.is_array() ||
      !compatible_types(current->type(), field_.type())) {
    return Status::InvalidSchemaChange("Cannot change column " + column() +
                                       " from " + current->type_ddl() +
                                       " to " + field_.type_ddl());
  }
  if (*current == field_) {
    return Status::InvalidSchemaChange("Column " + column() +
                                       " already has type " + field_.ddl());
  }
  return Status::Ok();
}

std::string AlterColumn::ddl(const Model * /*model*/) const {
  return "ALTER TABLE " + table() + " ALTER COLUMN " + column() + " " +
         field_.ddl();
}

// ─────────────────────────────────────────────────────────────────────────────
// DropColumn
// ─────────────────────────────────────────────────────────────────────────────

Status DropColumn::validate(const Model *model) const {
  SCHEMATA_RETURN_IF_ERROR(check_model(model));

  if (!model->has_column(column())) {
    return Status::InvalidSchemaChange("Column " + column() +
                                       " does not exist in " + table());
  }
  if (model->is_primary_key_column(column())) {
    return Status::InvalidSchemaChange("Cannot drop primary key column " +
                                       column());
  }
  for (const auto &[index_name, index] : model->indexes()) {
    if (contains(index.columns, column()) ||
        contains(index.stored_columns, column())) {
      return Status::InvalidSchemaChange("Column " + column() +
                                         " is used by index " + index_name);
    }
  }
  return Status::Ok();
}

std::string DropColumn::ddl(const Model * /*model*/) const {
  return "ALTER TABLE " + table() + " DROP COLUMN " + column();
}

} // namespace schemata
