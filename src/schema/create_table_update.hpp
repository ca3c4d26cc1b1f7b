#pragma once

/**
 * @file create_table_update.hpp
 * @brief CREATE TABLE request
 */

#include <string>
#include <vector>

#include "catalog/field.hpp"
#include "schema/schema_update.hpp"

namespace schemata {

/**
 * @brief Column definition of a new table, in declaration order
 */
struct ColumnDefinition {
  std::string name;
  Field field;
};

/**
 * @brief CREATE TABLE t (c1 T1, ...) PRIMARY KEY (k1, ...)
 *
 * Validated without a model: the definition must be internally consistent.
 */
class CreateTableUpdate : public SchemaUpdate {
public:
  CreateTableUpdate(std::string table, std::vector<ColumnDefinition> columns,
                    std::vector<std::string> primary_keys)
      : SchemaUpdate(SchemaUpdateKind::CREATE_TABLE, std::move(table)),
        columns_(std::move(columns)), primary_keys_(std::move(primary_keys)) {}

  [[nodiscard]] const std::vector<ColumnDefinition> &columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] const std::vector<std::string> &primary_keys() const noexcept {
    return primary_keys_;
  }

  /// @p model must be nullptr
  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] Status validate_names(const ModelMap &models) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;

private:
  std::vector<ColumnDefinition> columns_;
  std::vector<std::string> primary_keys_;
};

} // namespace schemata
