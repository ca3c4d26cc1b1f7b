#pragma once

/**
 * @file column_update.hpp
 * @brief Schema changes to one column of an existing table
 */

#include <string>

#include "catalog/field.hpp"
#include "schema/schema_update.hpp"

namespace schemata {

/**
 * @brief Base of all column-level changes
 */
class ColumnUpdate : public SchemaUpdate {
public:
  ColumnUpdate(std::string table, std::string column)
      : SchemaUpdate(SchemaUpdateKind::COLUMN, std::move(table)),
        column_(std::move(column)) {}

  [[nodiscard]] const std::string &column() const noexcept { return column_; }

private:
  std::string column_;
};

/**
 * @brief ALTER TABLE t ADD COLUMN c <field>
 *
 * The column must not exist yet and must be nullable, since existing rows
 * have no value for it.
 */
class AddColumn : public ColumnUpdate {
public:
  AddColumn(std::string table, std::string column, Field field)
      : ColumnUpdate(std::move(table), std::move(column)), field_(field) {}

  [[nodiscard]] const Field &field() const noexcept { return field_; }

  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;

private:
  Field field_;
};

/**
 * @brief ALTER TABLE t ALTER COLUMN c <field>
 *
 * Allowed transitions keep the base type (or switch STRING <-> BYTES) and
 * array-ness; nullability may change. Primary key columns cannot be altered.
 */
class AlterColumn : public ColumnUpdate {
public:
  AlterColumn(std::string table, std::string column, Field field)
      : ColumnUpdate(std::move(table), std::move(column)), field_(field) {}

  [[nodiscard]] const Field &field() const noexcept { return field_; }

  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;

private:
  Field field_;
};

/**
 * @brief ALTER TABLE t DROP COLUMN c
 *
 * Primary key columns and columns used by a secondary index cannot be
 * dropped.
 */
class DropColumn : public ColumnUpdate {
public:
  DropColumn(std::string table, std::string column)
      : ColumnUpdate(std::move(table), std::move(column)) {}

  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;
};

} // namespace schemata
