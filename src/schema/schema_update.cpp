/**
 * @file schema_update.cpp
 * @brief SchemaUpdate base implementation
 */

#include "schema/schema_update.hpp"

#include <cctype>

#include "common/config.hpp"

namespace schemata {

const char *schema_update_kind_to_string(SchemaUpdateKind kind) {
  switch (kind) {
  case SchemaUpdateKind::COLUMN:
    return "ColumnUpdate";
  case SchemaUpdateKind::CREATE_TABLE:
    return "CreateTableUpdate";
  case SchemaUpdateKind::INDEX:
    return "IndexUpdate";
  }
  return "Unknown";
}

Status SchemaUpdate::check_model(const Model *model) const {
  if (model == nullptr) {
    return Status::InvalidSchemaChange("No current schema for table " +
                                       table_);
  }
  if (model->table() != table_) {
    return Status::InvalidSchemaChange("Update for table " + table_ +
                                       " validated against table " +
                                       model->table());
  }
  return Status::Ok();
}

Status validate_identifier(std::string_view what, const std::string &name) {
  if (name.empty()) {
    return Status::InvalidSchemaChange(std::string(what) +
                                       " name cannot be empty");
  }
  if (name.size() > config::kMaxIdentifierLength) {
    return Status::InvalidSchemaChange(std::string(what) +
                                       " name is too long: " + name);
  }
  if (!std::isalpha(static_cast<unsigned char>(name.front()))) {
    return Status::InvalidSchemaChange(
        std::string(what) + " name must start with a letter: " + name);
  }
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return Status::InvalidSchemaChange(
          std::string(what) + " name has an illegal character: " + name);
    }
  }
  return Status::Ok();
}

Status SchemaUpdate::validate_names(const ModelMap & /*models*/) const {
  return Status::Ok();
}

const Model *find_name_owner(const ModelMap &models, const std::string &name) {
  for (const auto &[table, model] : models) {
    if (table == name || model.find_index(name) != nullptr) {
      return &model;
    }
  }
  return nullptr;
}

Status validate_field(const std::string &column, const Field &field) {
  if (field.type() == FieldType::INVALID) {
    return Status::InvalidSchemaChange("Column " + column + " has no type");
  }
  if (!field.has_valid_length()) {
    return Status::InvalidSchemaChange("Column " + column +
                                       " has an invalid length for " +
                                       std::string(field_type_name(field.type())));
  }
  return Status::Ok();
}

} // namespace schemata
